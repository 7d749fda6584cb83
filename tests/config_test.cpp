// dcbench headers
#include "core/BenchConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/SafetyPolicy.hpp"

// Third-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <filesystem>
#include <fstream>

namespace dcbench::test {

  using dcbench::core::BenchConfig;
  using dcbench::core::ConfigLoader;
  using dcbench::core::Parameter;
  using dcbench::core::SafetyPolicy;
  using dcbench::instruments::InstrumentRole;
  using nlohmann::json;
  namespace fs = std::filesystem;

  TEST(BenchConfigTest, emptyObjectKeepsDefaults) {
    BenchConfig cfg = BenchConfig::fromJson(json::object());
    EXPECT_TRUE(cfg.oscilloscopeAddress.empty());
    EXPECT_EQ(cfg.powerSupplyChannels, 3);
    EXPECT_FALSE(cfg.simulation);
    EXPECT_EQ(cfg.workbookPath, "DCDC_Master_Log.csv");
    EXPECT_EQ(cfg.defaultSequence, "waveform");
    EXPECT_EQ(cfg.previewInterval, std::chrono::milliseconds{ 50 });
    EXPECT_EQ(cfg.defaults.at(Parameter::Amplitude), "5.0");
    EXPECT_EQ(cfg.defaults.at(Parameter::Frequency), "50000");
    EXPECT_EQ(cfg.limits.ceiling(InstrumentRole::Oscilloscope, Parameter::Amplitude), 20.0);
  }

  TEST(BenchConfigTest, mapsEveryKnownKey) {
    json j = json::parse(R"({
      "oscilloscope_ip": "192.168.1.50",
      "power_supply_ip": "192.168.1.51:5025",
      "power_supply_channels": 2,
      "simulation": true,
      "workbook_path": "/data/log.csv",
      "export_directory": "/data/exports",
      "default_sequence": "converter",
      "preview_interval_ms": 100,
      "safety_limits": {
        "oscilloscope": { "amplitude": 10 },
        "power_supply": { "voltage": 24.5, "current": 3 }
      },
      "defaults": { "amplitude": "2.5", "channel": 2 }
    })");

    BenchConfig cfg = BenchConfig::fromJson(j);

    EXPECT_EQ(cfg.oscilloscopeAddress, "192.168.1.50");
    EXPECT_EQ(cfg.powerSupplyAddress, "192.168.1.51:5025");
    EXPECT_EQ(cfg.powerSupplyChannels, 2);
    EXPECT_TRUE(cfg.simulation);
    EXPECT_EQ(cfg.workbookPath, "/data/log.csv");
    EXPECT_EQ(cfg.exportDirectory, "/data/exports");
    EXPECT_EQ(cfg.defaultSequence, "converter");
    EXPECT_EQ(cfg.previewInterval, std::chrono::milliseconds{ 100 });
    EXPECT_EQ(cfg.limits.ceiling(InstrumentRole::Oscilloscope, Parameter::Amplitude), 10.0);
    EXPECT_EQ(cfg.limits.ceiling(InstrumentRole::PowerSupply, Parameter::Voltage), 24.5);
    EXPECT_EQ(cfg.limits.ceiling(InstrumentRole::PowerSupply, Parameter::Current), 3.0);
    EXPECT_EQ(cfg.defaults.at(Parameter::Amplitude), "2.5");
    EXPECT_EQ(cfg.defaults.at(Parameter::Channel), "2");
    EXPECT_EQ(cfg.defaults.at(Parameter::Voltage), "12.0");
  }

  TEST(BenchConfigTest, channelCountBecomesChannelCeiling) {
    BenchConfig cfg;
    cfg.powerSupplyChannels = 2;
    SafetyPolicy policy(cfg.effectiveLimits());
    EXPECT_TRUE(policy.evaluate(InstrumentRole::PowerSupply, Parameter::Channel, "2"));
    EXPECT_FALSE(policy.evaluate(InstrumentRole::PowerSupply, Parameter::Channel, "3"));
  }

  TEST(BenchConfigTest, wrongTypesAndRangesAreRejected) {
    EXPECT_THROW(BenchConfig::fromJson(json::parse(R"({"power_supply_channels": "three"})")),
                 std::invalid_argument);
    EXPECT_THROW(BenchConfig::fromJson(json::parse(R"({"power_supply_channels": 0})")),
                 std::invalid_argument);
    EXPECT_THROW(BenchConfig::fromJson(json::parse(R"({"simulation": "yes"})")), std::invalid_argument);
    EXPECT_THROW(BenchConfig::fromJson(json::parse(R"({"preview_interval_ms": 0})")),
                 std::invalid_argument);
    EXPECT_THROW(
        BenchConfig::fromJson(json::parse(R"({"safety_limits": {"oscilloscope": {"amplitude": "20"}}})")),
        std::invalid_argument);
    EXPECT_THROW(BenchConfig::fromJson(json::parse(R"({"defaults": {"amplitude": true}})")),
                 std::invalid_argument);
    EXPECT_THROW(BenchConfig::fromJson(json::array()), std::invalid_argument);
  }

  class ConfigLoaderTest : public ::testing::Test {
  protected:
    void SetUp() override {
      path = fs::temp_directory_path() /
             (std::string("dcbench_") +
              ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
      fs::remove(path);
    }
    void TearDown() override { fs::remove(path); }

    void writeFile(const std::string& text) {
      std::ofstream out(path);
      out << text;
    }

    fs::path path;
  };

  TEST_F(ConfigLoaderTest, missingFileIsReportedNotParsed) {
    ConfigLoader loader(path.string());
    EXPECT_FALSE(loader.exists());
    EXPECT_THROW(loader.load(), std::runtime_error);
  }

  TEST_F(ConfigLoaderTest, loadsValidJson) {
    writeFile(R"({"oscilloscope_ip": "10.0.0.2", "simulation": true})");
    ConfigLoader loader(path.string());

    ASSERT_TRUE(loader.exists());
    json j = loader.load();
    EXPECT_EQ(j.at("oscilloscope_ip").get<std::string>(), "10.0.0.2");
    EXPECT_TRUE(BenchConfig::fromJson(j).simulation);
  }

  TEST_F(ConfigLoaderTest, malformedJsonThrowsRuntimeError) {
    writeFile(R"({"oscilloscope_ip": )");
    ConfigLoader loader(path.string());
    try {
      loader.load();
      FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
      EXPECT_THAT(e.what(), testing::HasSubstr("not valid JSON"));
    }
  }

} // namespace dcbench::test
