/* @file SequenceFactory.cpp
 * @brief name → sequence registry
 *
 * © 2025 dcbench contributors — MIT-licensed.
 */

#include <stdexcept>

#include "core/SequenceFactory.hpp"
#include "protocols/TestSequence.hpp"

using namespace dcbench::core;

bool SequenceFactory::registerSequence(const std::string &name, Creator maker) {
  if (!maker)
    return false;
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<dcbench::protocols::TestSequence>
SequenceFactory::create(const std::string &name) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[SequenceFactory] unknown sequence: " + name);
  return it->second();
}

std::vector<std::string> SequenceFactory::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto &[name, creator] : creators_)
    out.push_back(name);
  return out;
}
