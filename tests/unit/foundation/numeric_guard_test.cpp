#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "arc/foundation/numeric_guard.hpp"
#include "mock_logger.hpp"

using namespace arc::foundation;

namespace {

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();
constexpr float kInf = std::numeric_limits<float>::infinity();

} // namespace

class NumericGuardTest : public arc::test::MockLoggerFixture {};

TEST(IsFiniteNumberTest, Classification) {
    EXPECT_TRUE(isFiniteNumber(0.0f));
    EXPECT_TRUE(isFiniteNumber(-12.5f));
    EXPECT_TRUE(isFiniteNumber(std::numeric_limits<float>::max()));
    EXPECT_FALSE(isFiniteNumber(kNaN));
    EXPECT_FALSE(isFiniteNumber(kInf));
    EXPECT_FALSE(isFiniteNumber(-kInf));
}

TEST_F(NumericGuardTest, FiniteValuePassesSilently) {
    EXPECT_FLOAT_EQ(sanitizeFloat(-3.0f, 1.0f, "health"), -3.0f);
    EXPECT_FLOAT_EQ(sanitizeNonNegative(4.0f, 1.0f, "mana"), 4.0f);
    EXPECT_EQ(mockLogger_->count(), 0u);
}

TEST_F(NumericGuardTest, NaNIsReplacedAndReported) {
    EXPECT_FLOAT_EQ(sanitizeFloat(kNaN, 500.0f, "maxHealth"), 500.0f);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, arc::test::log_level::warning);
    EXPECT_NE(records[0].message.find("[Stats]"), std::string::npos);
    EXPECT_NE(records[0].message.find("field=maxHealth"), std::string::npos);
}

TEST_F(NumericGuardTest, NegativeIsReplacedByNonNegativeGuard) {
    EXPECT_FLOAT_EQ(sanitizeNonNegative(-1.0f, 0.0f, "damage"), 0.0f);
    EXPECT_FLOAT_EQ(sanitizeNonNegative(kInf, 2.0f, "damage"), 2.0f);
    EXPECT_EQ(mockLogger_->countContaining("field=damage"), 2u);
}

TEST(RequireFiniteTest, RejectsWithInvalidNumericInput) {
    auto nan = requireFinite(kNaN, "combo.range");
    ASSERT_TRUE(nan.hasError());
    EXPECT_EQ(nan.error().code(), ErrorCode::InvalidNumericInput);
    ASSERT_NE(nan.error().context<std::string>(), nullptr);
    EXPECT_EQ(*nan.error().context<std::string>(), "combo.range");

    auto below = requireFinite(-0.5f, "combo.range", 0.0f);
    EXPECT_TRUE(below.hasError());

    auto ok = requireFinite(0.0f, "combo.range", 0.0f);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_FLOAT_EQ(ok.value(), 0.0f);
}
