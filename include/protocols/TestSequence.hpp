#pragma once
/** @file  TestSequence.hpp
 *  @brief Abstract base class for every named bench test sequence.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

// dcbench headers
#include "protocols/SequenceStep.hpp"

namespace dcbench::protocols {

  /**
 * @class TestSequence
 * @brief Turns the session's parameter values into an ordered step list.
 *
 *  * Builds steps only; execution and interlocks belong to SequenceController.
 *  * Missing values are passed through as empty text so the interlock reports them.
 */
  class TestSequence {
  public:
    virtual ~TestSequence() = default;

    virtual std::string name() const = 0;
    virtual std::string summary() const = 0;

    /**
     * @brief Steps for one run, in execution order.
     *
     * @param values  Form values keyed by parameter (may be incomplete).
     */
    virtual std::vector<SequenceStep> build(const ParameterValues& values) const = 0;
  };

} // namespace dcbench::protocols
