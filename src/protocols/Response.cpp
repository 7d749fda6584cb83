/* @file Response.cpp
 * @brief SCPI reply decoding.
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <charconv>

// dcbench headers
#include "protocols/Response.hpp"

using namespace dcbench::protocols;

namespace {

  std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
      ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
      --e;
    return s.substr(b, e - b);
  }

} // namespace

std::optional<Response> Response::fromWire(const std::string& line) {
  std::string body = trim(line);
  if (body.empty())
    return std::nullopt;
  return Response{ std::move(body) };
}

std::optional<ErrorQueueEntry> Response::asErrorEntry() const {
  auto comma = payload.find(',');
  if (comma == std::string::npos || comma == 0)
    return std::nullopt;

  std::string codeText = trim(payload.substr(0, comma));
  const char* first = codeText.data();
  const char* last = first + codeText.size();
  if (!codeText.empty() && *first == '+')
    ++first; // some firmwares send "+0,..."
  int code = 0;
  auto [ptr, ec] = std::from_chars(first, last, code);
  if (ec != std::errc{} || ptr != last)
    return std::nullopt;

  std::string text = trim(payload.substr(comma + 1));
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"')
    text = text.substr(1, text.size() - 2);
  return ErrorQueueEntry{ code, std::move(text) };
}
