#pragma once
/** @file  InstrumentHandle.hpp
 *  @brief Capability interfaces for the instruments a bench sequence can drive.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// dcbench headers
#include "instruments/InstrumentRole.hpp"

namespace dcbench {
  namespace instruments {

    /// Raised by a handle when an instrument command cannot be completed.
    class DriverError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Raised by ConnectionManager when a handle cannot be brought up.
    class ConnectionError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class InstrumentHandle
 * @brief One connected (or simulated) instrument.
 *
 *  * Owned exclusively by ConnectionManager.
 *  * `open()` performs the handshake; on failure `lastError()` holds the cause.
 *  * Role-specific operations live in OscilloscopeHandle / PowerSupplyHandle and
 *    throw DriverError on failure.
 */
    class InstrumentHandle {
    public:
      explicit InstrumentHandle(std::string address) : address_(std::move(address)) {}
      virtual ~InstrumentHandle() = default;

      //---public API------------------------------------------------------
      virtual InstrumentRole role() const = 0;
      virtual bool simulated() const = 0;

      /** @returns false if the instrument does not answer; see lastError(). */
      virtual bool open() = 0;
      virtual void close() = 0;

      const std::string& address() const { return address_; }
      const std::string& identity() const { return identity_; }
      const std::string& lastError() const { return lastError_; }

      LinkStatus status() const { return status_; }
      void setStatus(LinkStatus s) { status_ = s; }

      //---non-copyable-----------------------------------------------------
      InstrumentHandle(const InstrumentHandle&) = delete;
      InstrumentHandle& operator=(const InstrumentHandle&) = delete;

    protected:
      std::string address_;
      std::string identity_{}; ///< *IDN? reply (or a simulated stand-in)
      std::string lastError_{};
      LinkStatus status_{ LinkStatus::Offline };
    };

    /** Oscilloscope with a built-in signal source. */
    class OscilloscopeHandle : public InstrumentHandle {
    public:
      using InstrumentHandle::InstrumentHandle;

      InstrumentRole role() const final { return InstrumentRole::Oscilloscope; }

      virtual void reset() = 0;
      virtual void setAmplitude(double volts) = 0;
      virtual void setFrequency(double hz) = 0;
      virtual void enableOutput() = 0;
    };

    /** Multi-channel programmable supply. Channels are numbered from 1. */
    class PowerSupplyHandle : public InstrumentHandle {
    public:
      using InstrumentHandle::InstrumentHandle;

      InstrumentRole role() const final { return InstrumentRole::PowerSupply; }

      virtual int channelCount() const = 0;
      virtual void setChannel(double volts, double amps, int channel) = 0;
      virtual void enableOutput(int channel) = 0;
      virtual void disableOutput(int channel) = 0;
    };

  } // namespace instruments
} // namespace dcbench
