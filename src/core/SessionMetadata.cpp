/* @file SessionMetadata.cpp
 * @brief session identity helpers
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include <algorithm>
#include <cctype>

#include "core/SessionMetadata.hpp"

using namespace dcbench::core;

namespace {

  std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return b < e ? std::string(b, e) : std::string{};
  }

  std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
  }

} // namespace

std::string SessionMetadata::trimmedTechnician() const { return trim(technician); }

std::string SessionMetadata::bannerName() const { return upper(trimmedTechnician()); }

bool SessionMetadata::sameTechnician(const std::string& a, const std::string& b) {
  return upper(trim(a)) == upper(trim(b));
}

std::string SessionMetadata::addressSummary() const {
  std::string out;
  for (const auto& [role, address] : addresses) {
    if (address.empty())
      continue;
    if (!out.empty())
      out += "; ";
    out += std::string(instruments::toString(role)) + "=" + address;
  }
  return out;
}

std::string SessionMetadata::parameterSummary() const {
  std::string out;
  for (const auto& [param, value] : parameters) {
    if (!out.empty())
      out += "; ";
    out += std::string(toString(param)) + "=" + value;
    if (*unitOf(param) != '\0')
      out += std::string(" ") + unitOf(param);
  }
  return out;
}
