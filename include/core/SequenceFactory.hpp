#pragma once
/** @file  SequenceFactory.hpp
 *  @brief Runtime registry that maps sequence names to creators.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dcbench::protocols {
  class TestSequence;
}

namespace dcbench::core {

  /**
 * @class SequenceFactory
 * @brief Register & instantiate test sequences by string key.
 *
 *  * Keeps SessionCoordinator decoupled from concrete sequences.
 *  * Creators are lambdas returning `unique_ptr<TestSequence>`.
 */
  class SequenceFactory {
  public:
    using Creator = std::function<std::unique_ptr<protocols::TestSequence>()>;

    /// Register a sequence under \p name.  Returns false on duplicate.
    bool registerSequence(const std::string &name, Creator maker);

    bool contains(const std::string &name) const { return creators_.count(name) != 0; }

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<protocols::TestSequence> create(const std::string &name) const;

    /// Registered names, sorted.
    std::vector<std::string> names() const;

  private:
    std::map<std::string, Creator> creators_;
  };

} // namespace dcbench::core
