#pragma once
/** @file  SocketChannel.hpp
 *  @brief Non-blocking TCP line I/O wrapper (uses poll/BSD sockets under the hood).
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace dcbench {
  namespace io {

    /**
 * @class SocketChannel
 * @brief RAII wrapper around a single connected TCP socket.
 *
 *  * Frames I/O as ASCII lines terminated by `\n` (a trailing `\r` is dropped).
 *  * Every blocking step is bounded by a caller-supplied timeout.
 *  * *Non-copyable*, but move-constructible.
 */

    class SocketChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SocketChannel() = default;
      virtual ~SocketChannel(); // close the socket at destruction

      //---public API-------------------------------------------
      /** @returns false on resolve / refuse / timeout; cause in lastError(). */
      virtual bool open(const std::string& host, std::uint16_t port,
                        std::chrono::milliseconds timeout);
      virtual bool writeLine(const std::string& line); // returns false on EPIPE etc.
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual void close();

      virtual bool isOpen() const { return fd_ >= 0; }
      const std::string& lastError() const { return lastError_; }

      //---non-copyable-----------------------------------------
      SocketChannel(const SocketChannel&) = delete;
      SocketChannel& operator=(const SocketChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SocketChannel(SocketChannel&& other) noexcept;
      SocketChannel& operator=(SocketChannel&& other) noexcept;

    protected:
      void fail(const std::string& what);

      std::string lastError_{};

    private:
      int fd_{ -1 };            ///< socket fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received past the last complete line
    };
  } // namespace io
} // namespace dcbench
