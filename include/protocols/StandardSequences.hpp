#pragma once
/** @file  StandardSequences.hpp
 *  @brief The sequences a DC/DC bench offers out of the box.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

#include "protocols/TestSequence.hpp"

namespace dcbench::core {
  class SequenceFactory;
}

namespace dcbench::protocols {

  /// Scope source: amplitude → frequency → output on.
  class WaveformSequence : public TestSequence {
  public:
    std::string name() const override { return "waveform"; }
    std::string summary() const override { return "program and enable the scope source"; }
    std::vector<SequenceStep> build(const ParameterValues& values) const override;
  };

  /// Supply: program one channel, then switch it on.
  class SupplySequence : public TestSequence {
  public:
    std::string name() const override { return "supply"; }
    std::string summary() const override { return "program and enable one supply channel"; }
    std::vector<SequenceStep> build(const ParameterValues& values) const override;
  };

  /// Power the converter from the supply, then stimulate it from the scope source.
  class ConverterSequence : public TestSequence {
  public:
    std::string name() const override { return "converter"; }
    std::string summary() const override { return "supply power-up followed by scope waveform"; }
    std::vector<SequenceStep> build(const ParameterValues& values) const override;
  };

  /// Orderly teardown: scope reset, supply channel off.
  class ShutdownSequence : public TestSequence {
  public:
    std::string name() const override { return "shutdown"; }
    std::string summary() const override { return "reset the scope and switch the channel off"; }
    std::vector<SequenceStep> build(const ParameterValues& values) const override;
  };

  /// Register all of the above under their name(). Returns how many were new.
  int registerStandardSequences(core::SequenceFactory& factory);

} // namespace dcbench::protocols
