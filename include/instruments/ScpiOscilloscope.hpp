#pragma once
/** @file  ScpiOscilloscope.hpp
 *  @brief DS1000Z-class oscilloscope source driven over a raw SCPI socket.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

// dcbench headers
#include "instruments/InstrumentHandle.hpp"
#include "instruments/ScpiLink.hpp"

namespace dcbench::instruments {

  class ScpiOscilloscope : public OscilloscopeHandle {
  public:
    explicit ScpiOscilloscope(std::string address,
                              std::unique_ptr<io::SocketChannel> channel =
                                  std::make_unique<io::SocketChannel>());

    bool simulated() const override { return false; }
    bool open() override;
    void close() override;

    void reset() override;
    void setAmplitude(double volts) override;
    void setFrequency(double hz) override;
    void enableOutput() override;

  private:
    ScpiLink link_;
  };

} // namespace dcbench::instruments
