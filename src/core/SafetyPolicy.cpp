/* @file SafetyPolicy.cpp
 * @brief safety interlock evaluation
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

// dcbench headers
#include "core/Format.hpp"
#include "core/SafetyPolicy.hpp"

using namespace dcbench::core;
using dcbench::instruments::InstrumentRole;

namespace {

  constexpr const char* kInvalidInput = "invalid input";

  std::string describe(InstrumentRole role, Parameter p, double value) {
    std::string text = std::string(dcbench::instruments::toString(role)) + " " + toString(p) + " " +
                       formatNumber(value);
    if (*unitOf(p) != '\0')
      text += std::string(" ") + unitOf(p);
    return text;
  }

} // namespace

SafetyPolicy::SafetyPolicy(SafetyLimits limits) : limits_(std::move(limits)) {}

Verdict SafetyPolicy::evaluate(InstrumentRole role, Parameter p, const std::string& raw) const {
  std::size_t b = 0, e = raw.size();
  while (b < e && std::isspace(static_cast<unsigned char>(raw[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(raw[e - 1])))
    --e;
  if (b == e)
    return Verdict::reject(kInvalidInput);

  const std::string text = raw.substr(b, e - b);
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE)
    return Verdict::reject(kInvalidInput);

  return evaluate(role, p, value);
}

Verdict SafetyPolicy::evaluate(InstrumentRole role, Parameter p, double value) const {
  if (!std::isfinite(value))
    return Verdict::reject(kInvalidInput);

  switch (p) {
  case Parameter::Frequency:
    if (value <= 0.0)
      return Verdict::reject(describe(role, p, value) + " must be positive");
    break;
  case Parameter::Channel:
    // must survive the conversion to a driver channel number
    if (value < 1.0 || value != std::floor(value) ||
        value > static_cast<double>(std::numeric_limits<int>::max()))
      return Verdict::reject(kInvalidInput);
    break;
  default:
    if (value < 0.0)
      return Verdict::reject(describe(role, p, value) + " must not be negative");
    break;
  }

  if (auto ceiling = limits_.ceiling(role, p); ceiling && value > *ceiling) {
    std::string limitText = formatNumber(*ceiling);
    if (*unitOf(p) != '\0')
      limitText += std::string(" ") + unitOf(p);
    return Verdict::reject(describe(role, p, value) + " exceeds limit " + limitText);
  }
  return Verdict::accept(value);
}
