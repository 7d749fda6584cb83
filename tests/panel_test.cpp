// dcbench headers
#include "core/SessionCoordinator.hpp"
#include "instruments/SimulatedInstruments.hpp"
#include "ui/ConsolePanel.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <sstream>

namespace dcbench::test {

  using dcbench::core::BenchConfig;
  using dcbench::core::ErrorMonitor;
  using dcbench::core::SessionCoordinator;
  using dcbench::instruments::InstrumentHandle;
  using dcbench::instruments::InstrumentRole;
  using dcbench::ui::ConsolePanel;
  using testing::HasSubstr;
  using testing::Not;

  class ConsolePanelTest : public ::testing::Test {
  protected:
    void SetUp() override {
      session = std::make_unique<SessionCoordinator>(
          std::make_shared<ErrorMonitor>(),
          [](InstrumentRole role, const std::string& address,
             bool simulated) -> std::unique_ptr<InstrumentHandle> {
            if (!simulated)
              return nullptr; // no hardware on the test host
            if (role == InstrumentRole::Oscilloscope)
              return std::make_unique<instruments::SimulatedOscilloscope>(address);
            return std::make_unique<instruments::SimulatedPowerSupply>(address, 3);
          });
      BenchConfig cfg;
      cfg.oscilloscopeAddress = "10.0.0.2";
      cfg.powerSupplyAddress = "10.0.0.3";
      cfg.previewInterval = std::chrono::milliseconds{ 1 };
      session->applyConfig(cfg);
    }

    /// Feed \p script through a panel and return everything it printed.
    std::string runScript(const std::string& script) {
      std::istringstream in(script);
      std::ostringstream out;
      {
        ConsolePanel panel(*session, in, out);
        exitCode = panel.run();
      }
      return out.str();
    }

    std::unique_ptr<SessionCoordinator> session;
    int exitCode = -1;
  };

  TEST_F(ConsolePanelTest, technicianConnectRunStatusStop) {
    std::string out = runScript("tech Ada Lovelace\n"
                                "connect scope sim\n"
                                "run\n"
                                "status\n"
                                "stop\n"
                                "quit\n");

    EXPECT_EQ(exitCode, 0);
    EXPECT_THAT(out, HasSubstr("Technician: Ada Lovelace"));
    EXPECT_THAT(out, HasSubstr("Oscilloscope: SIMULATED"));
    EXPECT_THAT(out, HasSubstr("--- SESSION STARTED: ADA LOVELACE ---"));
    EXPECT_THAT(out, HasSubstr("Result: COMPLETED (3 steps)"));
    EXPECT_THAT(out, HasSubstr("Oscilloscope: LIVE 10.0.0.2 (SIMULATED)"));
    EXPECT_THAT(out, HasSubstr("PowerSupply: OFFLINE"));
    EXPECT_THAT(out, HasSubstr("SAFETY STOP: Output disabled / Instrument Reset."));
  }

  TEST_F(ConsolePanelTest, runWithoutTechnicianIsRefused) {
    std::string out = runScript("connect scope sim\nrun\n");
    EXPECT_THAT(out, HasSubstr("Compliance Error: Technician name is required."));
    EXPECT_THAT(out, HasSubstr("Run refused: technician name is required"));
  }

  TEST_F(ConsolePanelTest, overLimitValueIsReportedAsRejected) {
    std::string out = runScript("tech Ada\nconnect scope sim\nset amplitude 30\nrun waveform\n");
    EXPECT_THAT(out, HasSubstr("amplitude = 30"));
    EXPECT_THAT(out, HasSubstr("SAFETY INTERLOCK at step 0"));
    EXPECT_THAT(out, HasSubstr("Result: REJECTED at step 0"));
  }

  TEST_F(ConsolePanelTest, hardwareConnectFailureShowsDisconnected) {
    std::string out = runScript("connect psu 10.0.0.9 hw\n");
    EXPECT_THAT(out, HasSubstr("Handshake Failed"));
    EXPECT_THAT(out, HasSubstr("PowerSupply: DISCONNECTED"));
    EXPECT_THAT(out, HasSubstr("!! FAULT:"));
  }

  TEST_F(ConsolePanelTest, unknownInputIsAnsweredNotExecuted) {
    std::string out = runScript("frobnicate\nset wattage 5\nconnect toaster\n");
    EXPECT_THAT(out, HasSubstr("Unknown command 'frobnicate'. Type 'help'."));
    EXPECT_THAT(out, HasSubstr("Unknown parameter 'wattage'."));
    EXPECT_THAT(out, HasSubstr("Usage: connect <scope|psu>"));
  }

  TEST_F(ConsolePanelTest, sequencesAndHelpAreListed) {
    std::string out = runScript("sequences\nhelp\n");
    EXPECT_THAT(out, HasSubstr("converter - supply power-up followed by scope waveform"));
    EXPECT_THAT(out, HasSubstr("EMERGENCY STOP"));
  }

  TEST_F(ConsolePanelTest, previewDrawsRequestedFrames) {
    std::string out = runScript("preview 2\n");
    EXPECT_THAT(out, HasSubstr("*"));
    EXPECT_THAT(out, HasSubstr("---"));
  }

  TEST_F(ConsolePanelTest, previewIgnoresInfiniteAmplitude) {
    std::string out = runScript("set amplitude inf\npreview 1\n");
    EXPECT_THAT(out, HasSubstr("amplitude = inf"));
    EXPECT_THAT(out, HasSubstr("*"));
    EXPECT_THAT(out, Not(HasSubstr("nan")));
  }

  TEST_F(ConsolePanelTest, inputAfterQuitIsIgnored) {
    std::string out = runScript("quit\ntech Ada\n");
    EXPECT_THAT(out, Not(HasSubstr("Technician: Ada")));
    EXPECT_FALSE(session->metadata().hasTechnician());
  }

  TEST_F(ConsolePanelTest, closedPanelNoLongerMirrorsLog) {
    runScript("tech Ada\n");
    // the panel and its stream are gone; appends must not reach them
    session->log().append("after panel");
    EXPECT_EQ(session->log().entries().back().text, "after panel");
  }

} // namespace dcbench::test
