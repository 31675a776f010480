/**
 * @file test_normalization.cpp
 * @brief Unit tests for CNPJ normalization and masking
 */

#include <gtest/gtest.h>
#include <normalization/normalization.hpp>

#include <stdexcept>

using namespace cnpj;

TEST(NormalizeTest, StripsPunctuation) {
    EXPECT_EQ(normalize("04.252.011/0001-10"), "04252011000110");
}

TEST(NormalizeTest, PadsWithLeadingZeros) {
    EXPECT_EQ(normalize("1"), "00000000000001");
    EXPECT_EQ(normalize("4.252.011/0001-10"), "04252011000110");
}

TEST(NormalizeTest, AbsentCandidate) {
    EXPECT_FALSE(normalize(std::nullopt).has_value());
}

TEST(NormalizeTest, IsIdempotent) {
    for (const char* candidate : {"1", "04.252.011/0001-10", "11.222.333/0001-81", "99999999999999"}) {
        const auto normalized = normalize(candidate);
        ASSERT_TRUE(normalized.has_value());
        EXPECT_EQ(normalize(normalized), normalized) << candidate;
    }
}

TEST(NormalizeTest, DoesNotVerifyChecksum) {
    EXPECT_EQ(normalize("04.252.011/0001-11"), "04252011000111");
}

TEST(NormalizeTest, WithoutDigitsThrows) {
    EXPECT_THROW(normalize(""), std::invalid_argument);
    EXPECT_THROW(normalize("./-"), std::invalid_argument);
}

TEST(NormalizeTest, RangeBoundary) {
    EXPECT_EQ(normalize("99999999999999"), "99999999999999");
    EXPECT_THROW(normalize("100000000000000"), std::out_of_range);
    EXPECT_THROW(normalize("18446744073709551615"), std::out_of_range);
    EXPECT_THROW(normalize("9999999999999999999999999"), std::out_of_range);
}

TEST(NormalizeTest, LeadingZerosAreInsignificant) {
    EXPECT_EQ(normalize("000000000000000000000001"), "00000000000001");
}

TEST(MaskTest, FormatsNormalizedValue) {
    EXPECT_EQ(mask("04252011000110"), "04.252.011/0001-10");
    EXPECT_EQ(mask("4252011000110"), "04.252.011/0001-10");
    EXPECT_EQ(mask("1"), "00.000.000/0000-01");
}

TEST(MaskTest, PropagatesNormalizeErrors) {
    EXPECT_THROW(mask(""), std::invalid_argument);
    EXPECT_THROW(mask("100000000000000"), std::out_of_range);
}
