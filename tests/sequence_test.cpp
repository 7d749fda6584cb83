// dcbench headers
#include "core/ConnectionManager.hpp"
#include "core/SequenceController.hpp"
#include "core/SequenceFactory.hpp"
#include "instruments/SimulatedInstruments.hpp"
#include "protocols/StandardSequences.hpp"

// dcbench fakes
#include "MockInstruments.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace dcbench::test {

  using dcbench::core::ConnectionManager;
  using dcbench::core::ErrorMonitor;
  using dcbench::core::Parameter;
  using dcbench::core::SafetyPolicy;
  using dcbench::core::SequenceController;
  using dcbench::core::SequenceResult;
  using dcbench::core::SessionLog;
  using dcbench::instruments::DriverError;
  using dcbench::instruments::InstrumentHandle;
  using dcbench::instruments::InstrumentRole;
  using dcbench::instruments::LinkStatus;
  using dcbench::instruments::SimulatedOscilloscope;
  using dcbench::instruments::SimulatedPowerSupply;
  using dcbench::protocols::SequenceStep;
  using testing::HasSubstr;
  using testing::NiceMock;
  using testing::Throw;

  class SequenceControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<NiceMock<MockErrorMonitor>>();
      controller = std::make_unique<SequenceController>(
          SafetyPolicy{}, std::static_pointer_cast<ErrorMonitor>(errorMonitor));
    }

    SequenceController::HandleResolver resolver(InstrumentHandle* scopeHandle,
                                                InstrumentHandle* supplyHandle) {
      return [scopeHandle, supplyHandle](InstrumentRole role) -> InstrumentHandle* {
        return role == InstrumentRole::Oscilloscope ? scopeHandle : supplyHandle;
      };
    }

    std::vector<SequenceStep> waveform(const std::string& amplitude) {
      return { SequenceStep::setAmplitude(amplitude), SequenceStep::setFrequency(50000.0),
               SequenceStep::enableOutput() };
    }

    std::shared_ptr<NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<SequenceController> controller;
    SimulatedOscilloscope scope{ "10.0.0.2" };
    SimulatedPowerSupply supply{ "10.0.0.3", 3 };
    SessionLog log;
  };

  TEST_F(SequenceControllerTest, validSequenceLogsEveryStepThenBanner) {
    auto result = controller->run(waveform("5.0"), resolver(&scope, &supply), log);

    EXPECT_EQ(result, SequenceResult::completed(3));
    ASSERT_EQ(log.size(), 4u);
    EXPECT_THAT(log.entries()[0].text, HasSubstr("[step 0] Oscilloscope: set amplitude 5 V - OK"));
    EXPECT_THAT(log.entries()[1].text, HasSubstr("set frequency 50000 Hz"));
    EXPECT_THAT(log.entries()[2].text, HasSubstr("enable output"));
    EXPECT_EQ(log.entries()[3].text, SequenceController::kCompleteBanner);

    EXPECT_DOUBLE_EQ(scope.amplitude(), 5.0);
    EXPECT_DOUBLE_EQ(scope.frequency(), 50000.0);
    EXPECT_TRUE(scope.outputEnabled());
    EXPECT_EQ(scope.status(), LinkStatus::Live);
  }

  TEST_F(SequenceControllerTest, overLimitAmplitudeStopsBeforeAnyCommand) {
    auto result = controller->run(waveform("25"), resolver(&scope, &supply), log);

    EXPECT_EQ(result.outcome(), SequenceResult::Outcome::Rejected);
    EXPECT_EQ(result.stepIndex(), 0u);
    EXPECT_THAT(result.reason(), HasSubstr("exceeds limit 20 V"));
    EXPECT_EQ(scope.calls().setAmplitude, 0u);
    EXPECT_EQ(scope.calls().setFrequency, 0u);
    EXPECT_EQ(scope.calls().enableOutput, 0u);

    ASSERT_EQ(log.size(), 1u);
    EXPECT_THAT(log.entries()[0].text, HasSubstr("SAFETY INTERLOCK at step 0"));
  }

  TEST_F(SequenceControllerTest, rejectionMidSequenceKeepsEarlierStepsOnly) {
    std::vector<SequenceStep> steps{ SequenceStep::setAmplitude(5.0), SequenceStep::setFrequency("abc"),
                                     SequenceStep::enableOutput() };

    auto result = controller->run(steps, resolver(&scope, &supply), log);

    EXPECT_EQ(result, SequenceResult::rejectedAt(1, "invalid input"));
    EXPECT_EQ(scope.calls().setAmplitude, 1u);
    EXPECT_EQ(scope.calls().setFrequency, 0u);
    EXPECT_FALSE(scope.outputEnabled());
    ASSERT_EQ(log.size(), 2u);
    EXPECT_THAT(log.entries()[1].text, HasSubstr("frequency 'abc' rejected, invalid input"));
  }

  TEST_F(SequenceControllerTest, stepWithoutRequiredValueIsInvalidInput) {
    std::vector<SequenceStep> steps{ SequenceStep{ InstrumentRole::Oscilloscope,
                                                   protocols::Operation::SetAmplitude, {} } };

    auto result = controller->run(steps, resolver(&scope, &supply), log);

    EXPECT_EQ(result, SequenceResult::rejectedAt(0, "invalid input"));
    EXPECT_EQ(scope.calls().setAmplitude, 0u);
  }

  TEST_F(SequenceControllerTest, missingInstrumentAbortsWithSingleEntry) {
    auto result = controller->run(waveform("5.0"), resolver(nullptr, nullptr), log);

    EXPECT_EQ(result.outcome(), SequenceResult::Outcome::Aborted);
    EXPECT_EQ(result.missingRole(), InstrumentRole::Oscilloscope);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries()[0].text, "Sequence aborted: no Oscilloscope connected");
  }

  TEST_F(SequenceControllerTest, missingSupplyAbortsBeforeScopeIsTouched) {
    std::vector<SequenceStep> steps{ SequenceStep::setAmplitude(5.0),
                                     SequenceStep::setChannel(12.0, 1.0, 1) };

    auto result = controller->run(steps, resolver(&scope, nullptr), log);

    EXPECT_EQ(result.missingRole(), InstrumentRole::PowerSupply);
    EXPECT_EQ(scope.calls().setAmplitude, 0u);
    EXPECT_EQ(log.size(), 1u);
  }

  TEST_F(SequenceControllerTest, driverFailureEndsRunWithoutRetry) {
    MockOscilloscope mockScope;
    EXPECT_CALL(mockScope, setAmplitude(5.0)).Times(1);
    EXPECT_CALL(mockScope, setFrequency(50000.0))
        .Times(1)
        .WillOnce(Throw(DriverError("no reply to ':SYST:ERR?'")));
    EXPECT_CALL(mockScope, enableOutput()).Times(0);
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("no reply"))).Times(1);

    auto result = controller->run(waveform("5"), resolver(&mockScope, nullptr), log);

    EXPECT_EQ(result, SequenceResult::failedAt(1, "no reply to ':SYST:ERR?'"));
    EXPECT_EQ(mockScope.status(), LinkStatus::Error);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_THAT(log.entries()[1].text, HasSubstr("Command Error at step 1"));
  }

  TEST_F(SequenceControllerTest, supplyStepsReachTheSupply) {
    std::vector<SequenceStep> steps{ SequenceStep::setChannel("12", "1.5", "2"),
                                     SequenceStep::enableChannel(2) };

    auto result = controller->run(steps, resolver(nullptr, &supply), log);

    EXPECT_TRUE(result.ok());
    EXPECT_DOUBLE_EQ(supply.channel(2).volts, 12.0);
    EXPECT_DOUBLE_EQ(supply.channel(2).amps, 1.5);
    EXPECT_TRUE(supply.channel(2).enabled);
    EXPECT_THAT(log.entries()[0].text, HasSubstr("PowerSupply: set channel 12 V 1.5 A CH2 - OK"));
  }

  TEST_F(SequenceControllerTest, oversizedChannelNeverReachesSupply) {
    std::vector<SequenceStep> steps{ SequenceStep::enableChannel(std::string("3000000000")) };

    auto result = controller->run(steps, resolver(nullptr, &supply), log);

    EXPECT_EQ(result, SequenceResult::rejectedAt(0, "invalid input"));
    EXPECT_EQ(supply.calls().enableOutput, 0u);
    EXPECT_TRUE(supply.history().empty());
  }

  TEST_F(SequenceControllerTest, emptySequenceCompletesWithBannerOnly) {
    auto result = controller->run({}, resolver(nullptr, nullptr), log);
    EXPECT_EQ(result, SequenceResult::completed(0));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries()[0].text, SequenceController::kCompleteBanner);
  }

  TEST_F(SequenceControllerTest, eachRunStartsFromIdle) {
    EXPECT_TRUE(controller->run(waveform("5"), resolver(&scope, nullptr), log).ok());
    EXPECT_FALSE(controller->run(waveform("50"), resolver(&scope, nullptr), log).ok());
    EXPECT_TRUE(controller->run(waveform("5"), resolver(&scope, nullptr), log).ok());
  }

  TEST(SequenceControllerStateTest, onlyIdleToRunningToTerminalIsLegal) {
    using S = SequenceController::RunState;
    EXPECT_TRUE(SequenceController::canTransition(S::Idle, S::Running));
    for (auto terminal : { S::Completed, S::Rejected, S::Failed, S::Aborted }) {
      EXPECT_TRUE(SequenceController::canTransition(S::Running, terminal));
      EXPECT_FALSE(SequenceController::canTransition(S::Idle, terminal));
      EXPECT_FALSE(SequenceController::canTransition(terminal, S::Running));
      EXPECT_FALSE(SequenceController::canTransition(terminal, S::Idle));
    }
    EXPECT_FALSE(SequenceController::canTransition(S::Running, S::Idle));
  }

  //---emergency stop---------------------------------------------------------

  class EmergencyStopTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<NiceMock<MockErrorMonitor>>();
      connections = std::make_unique<ConnectionManager>(
          std::static_pointer_cast<ErrorMonitor>(errorMonitor),
          [](InstrumentRole role, const std::string& address,
             bool) -> std::unique_ptr<InstrumentHandle> {
            if (role == InstrumentRole::Oscilloscope)
              return std::make_unique<NiceMock<MockOscilloscope>>(address);
            return std::make_unique<NiceMock<MockPowerSupply>>(address);
          });
      controller = std::make_unique<SequenceController>(
          SafetyPolicy{}, std::static_pointer_cast<ErrorMonitor>(errorMonitor));
    }

    MockOscilloscope& connectScope() {
      connections->connect(InstrumentRole::Oscilloscope, "10.0.0.2", true);
      return *static_cast<MockOscilloscope*>(connections->oscilloscope());
    }

    MockPowerSupply& connectSupply() {
      connections->connect(InstrumentRole::PowerSupply, "10.0.0.3", true);
      return *static_cast<MockPowerSupply*>(connections->powerSupply());
    }

    std::shared_ptr<NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<ConnectionManager> connections;
    std::unique_ptr<SequenceController> controller;
    SessionLog log;
  };

  TEST_F(EmergencyStopTest, withNothingConnectedLogsOneEntry) {
    EXPECT_TRUE(controller->emergencyStop(*connections, log));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_THAT(log.entries()[0].text, HasSubstr("SAFETY STOP"));
  }

  TEST_F(EmergencyStopTest, resetsScopeAndDisablesEverySupplyChannel) {
    auto& scope = connectScope();
    auto& supply = connectSupply();
    EXPECT_CALL(scope, reset()).Times(1);
    EXPECT_CALL(supply, disableOutput(1)).Times(1);
    EXPECT_CALL(supply, disableOutput(2)).Times(1);
    EXPECT_CALL(supply, disableOutput(3)).Times(1);

    EXPECT_TRUE(controller->emergencyStop(*connections, log));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries()[0].text, "SAFETY STOP: Output disabled / Instrument Reset.");
  }

  TEST_F(EmergencyStopTest, oneFailingChannelDoesNotKeepOthersOn) {
    auto& supply = connectSupply();
    EXPECT_CALL(supply, disableOutput(1)).Times(1);
    EXPECT_CALL(supply, disableOutput(2)).WillOnce(Throw(DriverError("timeout")));
    EXPECT_CALL(supply, disableOutput(3)).Times(1);
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("timeout"))).Times(1);

    EXPECT_FALSE(controller->emergencyStop(*connections, log));
    ASSERT_EQ(log.size(), 2u);
    EXPECT_THAT(log.entries()[0].text, HasSubstr("Stop Failed on PowerSupply (CH2 off): timeout"));
    EXPECT_THAT(log.entries()[1].text, HasSubstr("issued with failures"));
    EXPECT_EQ(supply.status(), LinkStatus::Error);
  }

  TEST_F(EmergencyStopTest, canBeRepeated) {
    auto& scope = connectScope();
    EXPECT_CALL(scope, reset()).Times(2);
    EXPECT_TRUE(controller->emergencyStop(*connections, log));
    EXPECT_TRUE(controller->emergencyStop(*connections, log));
    EXPECT_EQ(log.size(), 2u);
  }

  //---standard sequences------------------------------------------------------

  TEST(StandardSequencesTest, converterPowersUpBeforeStimulating) {
    core::SequenceFactory factory;
    ASSERT_EQ(protocols::registerStandardSequences(factory), 4);

    protocols::ParameterValues values{ { Parameter::Amplitude, "5" },
                                       { Parameter::Frequency, "1000" },
                                       { Parameter::Voltage, "12" },
                                       { Parameter::Current, "1" },
                                       { Parameter::Channel, "1" } };
    auto steps = factory.create("converter")->build(values);

    ASSERT_EQ(steps.size(), 5u);
    EXPECT_EQ(steps[0].role, InstrumentRole::PowerSupply);
    EXPECT_EQ(steps[1].op, protocols::Operation::EnableChannel);
    EXPECT_EQ(steps[2].role, InstrumentRole::Oscilloscope);
    EXPECT_EQ(steps[4].op, protocols::Operation::EnableOutput);
  }

  TEST(StandardSequencesTest, absentValueBecomesEmptyTextForTheInterlock) {
    auto steps = protocols::WaveformSequence{}.build({});
    ASSERT_EQ(steps.size(), 3u);
    ASSERT_EQ(steps[0].params.size(), 1u);
    EXPECT_EQ(steps[0].params[0].name, Parameter::Amplitude);
    EXPECT_TRUE(steps[0].params[0].value.empty());
  }

} // namespace dcbench::test
