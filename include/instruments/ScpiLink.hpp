#pragma once
/** @file  ScpiLink.hpp
 *  @brief SCPI request/reply helper on top of one SocketChannel.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

// dcbench headers
#include "io/SocketChannel.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace dcbench::instruments {

  /**
 * @class ScpiLink
 * @brief Owns the transport of a real instrument and speaks raw-socket SCPI on it.
 *
 *  * `open()` connects and identifies the instrument with `*IDN?`.
 *  * `execute()` sends a setter and drains `:SYST:ERR?`; any non-zero code
 *    or transport failure surfaces as DriverError.
 */
  class ScpiLink {
  public:
    static constexpr std::uint16_t kDefaultPort = 5555; ///< LXI raw socket
    static constexpr std::chrono::milliseconds kConnectTimeout{ 2000 };
    static constexpr std::chrono::milliseconds kReplyTimeout{ 2000 };

    explicit ScpiLink(std::unique_ptr<io::SocketChannel> channel);

    /// "host" or "host:port" → {host, port}. Throws std::invalid_argument on a bad port.
    static std::pair<std::string, std::uint16_t> splitAddress(const std::string& address);

    /** @returns false on failure; cause in lastError(). */
    bool open(const std::string& address);
    void close();

    void send(const protocols::Command& cmd);                   ///< throws DriverError
    protocols::Response query(const protocols::Command& cmd);   ///< throws DriverError
    void execute(const protocols::Command& cmd);                ///< send + error-queue check

    const std::string& identity() const { return identity_; }
    const std::string& lastError() const { return lastError_; }

  private:
    std::unique_ptr<io::SocketChannel> channel_;
    std::string identity_{};
    std::string lastError_{};
  };

} // namespace dcbench::instruments
