#pragma once
/** @file  ScpiPowerSupply.hpp
 *  @brief DP800-class programmable supply driven over a raw SCPI socket.
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

  class ScpiPowerSupply : public PowerSupplyHandle {
  public:
    ScpiPowerSupply(std::string address, int channels,
                    std::unique_ptr<io::SocketChannel> channel =
                        std::make_unique<io::SocketChannel>());

    bool simulated() const override { return false; }
    bool open() override;
    void close() override;

    int channelCount() const override { return channels_; }
    void setChannel(double volts, double amps, int channel) override;
    void enableOutput(int channel) override;
    void disableOutput(int channel) override;

  private:
    void checkChannel(int channel) const; ///< throws DriverError when out of range

    ScpiLink link_;
    int channels_;
  };

} // namespace dcbench::instruments
