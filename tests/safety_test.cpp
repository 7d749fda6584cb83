// dcbench headers
#include "core/SafetyLimits.hpp"
#include "core/SafetyPolicy.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace dcbench::test {

  using dcbench::core::Parameter;
  using dcbench::core::SafetyLimits;
  using dcbench::core::SafetyPolicy;
  using dcbench::core::Verdict;
  using dcbench::instruments::InstrumentRole;
  using testing::HasSubstr;

  constexpr auto Scope = InstrumentRole::Oscilloscope;
  constexpr auto Supply = InstrumentRole::PowerSupply;

  TEST(SafetyPolicyTest, amplitudeAtCeilingIsAccepted) {
    SafetyPolicy policy;
    Verdict v = policy.evaluate(Scope, Parameter::Amplitude, "20.0");
    EXPECT_TRUE(v);
    EXPECT_DOUBLE_EQ(v.value, 20.0);
    EXPECT_TRUE(policy.evaluate(Scope, Parameter::Amplitude, 20.0));
  }

  TEST(SafetyPolicyTest, amplitudeAboveCeilingIsRejectedWithLimitInReason) {
    SafetyPolicy policy;
    Verdict v = policy.evaluate(Scope, Parameter::Amplitude, "25");
    EXPECT_FALSE(v);
    EXPECT_THAT(v.reason, HasSubstr("exceeds limit 20 V"));
    EXPECT_FALSE(policy.evaluate(Scope, Parameter::Amplitude, 20.0001));
  }

  TEST(SafetyPolicyTest, supplyVoltageCeilingIsInclusive) {
    SafetyPolicy policy;
    EXPECT_TRUE(policy.evaluate(Supply, Parameter::Voltage, "32"));
    Verdict v = policy.evaluate(Supply, Parameter::Voltage, "32.5");
    EXPECT_FALSE(v);
    EXPECT_THAT(v.reason, HasSubstr("exceeds limit 32 V"));
  }

  TEST(SafetyPolicyTest, unboundedParametersAcceptLargeValues) {
    SafetyPolicy policy;
    EXPECT_TRUE(policy.evaluate(Scope, Parameter::Frequency, "1e9"));
    EXPECT_TRUE(policy.evaluate(Supply, Parameter::Current, "100"));
  }

  TEST(SafetyPolicyTest, nonNumericTextIsInvalidInput) {
    SafetyPolicy policy;
    for (const char* raw : { "", "   ", "abc", "5V", "5.0.1", "nan", "inf", "1e999" }) {
      Verdict v = policy.evaluate(Scope, Parameter::Amplitude, raw);
      EXPECT_FALSE(v) << "raw='" << raw << "'";
      EXPECT_EQ(v.reason, "invalid input") << "raw='" << raw << "'";
    }
  }

  TEST(SafetyPolicyTest, surroundingBlanksAreIgnored) {
    SafetyPolicy policy;
    Verdict v = policy.evaluate(Scope, Parameter::Amplitude, "  5.0\t");
    ASSERT_TRUE(v);
    EXPECT_DOUBLE_EQ(v.value, 5.0);
  }

  TEST(SafetyPolicyTest, negativeValuesAreRejected) {
    SafetyPolicy policy;
    Verdict amp = policy.evaluate(Scope, Parameter::Amplitude, "-1");
    EXPECT_FALSE(amp);
    EXPECT_THAT(amp.reason, HasSubstr("must not be negative"));
    EXPECT_FALSE(policy.evaluate(Supply, Parameter::Current, -0.5));
    EXPECT_TRUE(policy.evaluate(Supply, Parameter::Voltage, 0.0));
  }

  TEST(SafetyPolicyTest, frequencyMustBePositive) {
    SafetyPolicy policy;
    Verdict v = policy.evaluate(Scope, Parameter::Frequency, "0");
    EXPECT_FALSE(v);
    EXPECT_THAT(v.reason, HasSubstr("must be positive"));
  }

  TEST(SafetyPolicyTest, channelMustBeAPositiveInteger) {
    SafetyPolicy policy;
    EXPECT_TRUE(policy.evaluate(Supply, Parameter::Channel, "1"));
    EXPECT_EQ(policy.evaluate(Supply, Parameter::Channel, "0").reason, "invalid input");
    EXPECT_EQ(policy.evaluate(Supply, Parameter::Channel, "1.5").reason, "invalid input");
    EXPECT_EQ(policy.evaluate(Supply, Parameter::Channel, "-2").reason, "invalid input");
  }

  TEST(SafetyPolicyTest, channelBeyondIntRangeIsInvalidWithoutCeiling) {
    SafetyPolicy policy; // defaults carry no channel ceiling
    EXPECT_EQ(policy.evaluate(Supply, Parameter::Channel, "3000000000").reason, "invalid input");
    EXPECT_EQ(policy.evaluate(Supply, Parameter::Channel, 1e300).reason, "invalid input");
    EXPECT_TRUE(policy.evaluate(Supply, Parameter::Channel, "2147483647"));
  }

  TEST(SafetyPolicyTest, sameInputGivesSameVerdict) {
    SafetyPolicy policy;
    for (const char* raw : { "5", "20", "20.5", "x", "-3" })
      EXPECT_EQ(policy.evaluate(Scope, Parameter::Amplitude, raw),
                policy.evaluate(Scope, Parameter::Amplitude, raw));
  }

  TEST(SafetyLimitsTest, defaultsCoverAmplitudeAndSupplyVoltageOnly) {
    auto limits = SafetyLimits::defaults();
    EXPECT_EQ(limits.ceiling(Scope, Parameter::Amplitude), core::kDefaultAmplitudeLimitV);
    EXPECT_EQ(limits.ceiling(Supply, Parameter::Voltage), core::kDefaultSupplyVoltageLimitV);
    EXPECT_FALSE(limits.ceiling(Scope, Parameter::Frequency).has_value());
    EXPECT_FALSE(limits.ceiling(Supply, Parameter::Amplitude).has_value());
  }

  TEST(SafetyLimitsTest, overriddenCeilingIsEnforcedAndCanBeCleared) {
    auto limits = SafetyLimits::defaults();
    limits.setCeiling(Scope, Parameter::Amplitude, 10.0);
    EXPECT_FALSE(SafetyPolicy(limits).evaluate(Scope, Parameter::Amplitude, "15"));
    EXPECT_TRUE(SafetyPolicy(limits).evaluate(Scope, Parameter::Amplitude, "10"));

    limits.clearCeiling(Scope, Parameter::Amplitude);
    EXPECT_TRUE(SafetyPolicy(limits).evaluate(Scope, Parameter::Amplitude, "100"));
  }

} // namespace dcbench::test
