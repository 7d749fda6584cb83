#pragma once
/** @file  SimulatedInstruments.hpp
 *  @brief Offline stand-ins for rehearsal: echo the SCPI they would send, never fail.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>

// dcbench headers
#include "instruments/InstrumentHandle.hpp"

namespace dcbench::instruments {

  /**
 * @class SimulatedOscilloscope
 * @brief No network I/O. Keeps the last programmed state and per-call counters
 *        so tests can assert what reached the "instrument".
 */
  class SimulatedOscilloscope : public OscilloscopeHandle {
  public:
    struct CallCounts {
      std::size_t reset{ 0 };
      std::size_t setAmplitude{ 0 };
      std::size_t setFrequency{ 0 };
      std::size_t enableOutput{ 0 };
    };

    /// @param echo  Stream for `[SIM] <addr> > <cmd>` lines; nullptr keeps quiet.
    explicit SimulatedOscilloscope(std::string address, std::ostream* echo = nullptr);

    bool simulated() const override { return true; }
    bool open() override;
    void close() override {}

    void reset() override;
    void setAmplitude(double volts) override;
    void setFrequency(double hz) override;
    void enableOutput() override;

    const CallCounts& calls() const { return calls_; }
    const std::vector<std::string>& history() const { return history_; }
    double amplitude() const { return amplitude_; }
    double frequency() const { return frequency_; }
    bool outputEnabled() const { return outputOn_; }

  private:
    void record(const std::string& scpi);

    std::ostream* echo_;
    CallCounts calls_{};
    std::vector<std::string> history_;
    double amplitude_{ 0.0 };
    double frequency_{ 0.0 };
    bool outputOn_{ false };
  };

  /** Supply counterpart; channel numbers are taken as given (range is a safety-limit concern). */
  class SimulatedPowerSupply : public PowerSupplyHandle {
  public:
    struct ChannelState {
      double volts{ 0.0 };
      double amps{ 0.0 };
      bool enabled{ false };
    };

    struct CallCounts {
      std::size_t setChannel{ 0 };
      std::size_t enableOutput{ 0 };
      std::size_t disableOutput{ 0 };
    };

    SimulatedPowerSupply(std::string address, int channels, std::ostream* echo = nullptr);

    bool simulated() const override { return true; }
    bool open() override;
    void close() override {}

    int channelCount() const override { return channels_; }
    void setChannel(double volts, double amps, int channel) override;
    void enableOutput(int channel) override;
    void disableOutput(int channel) override;

    const CallCounts& calls() const { return calls_; }
    const std::vector<std::string>& history() const { return history_; }
    ChannelState channel(int channel) const;

  private:
    void record(const std::string& scpi);
    ChannelState& slot(int channel);

    std::ostream* echo_;
    int channels_;
    CallCounts calls_{};
    std::vector<std::string> history_;
    std::map<int, ChannelState> state_;
  };

} // namespace dcbench::instruments
