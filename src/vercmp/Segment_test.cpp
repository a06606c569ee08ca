#include "vercmp/Segment.hpp"

#include <gtest/gtest.h>

#include <string>

using Vercmp::Segment;

namespace {

int compareTokens(const std::string& left, const std::string& right) {
    return Segment::classify(left).compare(Segment::classify(right));
}

}  // namespace

TEST(SegmentTest, ClassifyNumeric) {
    auto s1 = Segment::classify("42");
    EXPECT_EQ(Segment::kNumeric, s1.type());
    EXPECT_EQ("42", s1.text());
    EXPECT_EQ("42", s1.magnitude());

    auto s2 = Segment::classify("042");
    EXPECT_EQ(Segment::kNumeric, s2.type());
    EXPECT_EQ("042", s2.text());
    EXPECT_EQ("42", s2.magnitude());

    auto s3 = Segment::classify("000");
    EXPECT_EQ(Segment::kNumeric, s3.type());
    EXPECT_EQ("0", s3.magnitude());
}

TEST(SegmentTest, ClassifyAlpha) {
    auto s1 = Segment::classify("SNAPSHOT");
    EXPECT_EQ(Segment::kAlpha, s1.type());
    EXPECT_EQ("SNAPSHOT", s1.text());
    EXPECT_EQ("", s1.magnitude());

    EXPECT_EQ(Segment::kAlpha, Segment::classify("1a").type());
    EXPECT_EQ(Segment::kAlpha, Segment::classify("a1").type());
    EXPECT_EQ(Segment::kAlpha, Segment::classify("Final").type());
}

TEST(SegmentTest, NumericUsesMagnitude) {
    EXPECT_EQ(1, compareTokens("10", "2"));
    EXPECT_EQ(-1, compareTokens("2", "10"));
    EXPECT_EQ(0, compareTokens("7", "7"));
    EXPECT_EQ(1, compareTokens("12", "6"));
}

TEST(SegmentTest, NumericLeadingZeros) {
    EXPECT_EQ(0, compareTokens("042", "42"));
    EXPECT_EQ(0, compareTokens("007", "7"));
    EXPECT_EQ(0, compareTokens("0", "000"));
    EXPECT_EQ(-1, compareTokens("009", "10"));
    EXPECT_EQ(1, compareTokens("0100", "99"));
}

TEST(SegmentTest, NumericBeyondFixedWidth) {
    EXPECT_EQ(1, compareTokens("123456789012345678901234567890", "123456789012345678901234567889"));
    EXPECT_EQ(-1, compareTokens("99999999999999999999", "100000000000000000000"));
    EXPECT_EQ(0, compareTokens("00018446744073709551616", "18446744073709551616"));
}

TEST(SegmentTest, AlphaCaseInsensitive) {
    EXPECT_EQ(-1, compareTokens("c", "d"));
    EXPECT_EQ(-1, compareTokens("C", "d"));
    EXPECT_EQ(1, compareTokens("d", "C"));
    EXPECT_EQ(0, compareTokens("Final", "FINAL"));
    EXPECT_EQ(-1, compareTokens("alpha", "Beta"));
    EXPECT_EQ(-1, compareTokens("Alpha", "beta"));
    EXPECT_EQ(-1, compareTokens("1a", "1b"));
}

TEST(SegmentTest, AlphaPrefixIsLower) {
    EXPECT_EQ(-1, compareTokens("beta", "beta2"));
    EXPECT_EQ(1, compareTokens("rc10", "rc"));
}

TEST(SegmentTest, SnapshotHasNoPrecedence) {
    EXPECT_EQ(1, compareTokens("SNAPSHOT", "Final"));
    EXPECT_EQ(-1, compareTokens("SNAPSHOT", "zeta"));
}

TEST(SegmentTest, MixedFallsBackToText) {
    EXPECT_EQ(-1, compareTokens("3", "b"));
    EXPECT_EQ(1, compareTokens("b", "3"));
    EXPECT_EQ(-1, compareTokens("3", "a"));
    // Text comparison, so "10" sorts before "9a" even though 10 > 9.
    EXPECT_EQ(-1, compareTokens("10", "9a"));
    EXPECT_EQ(-1, compareTokens("9", "9a"));
    // Leading zeros matter once a text comparison is involved.
    EXPECT_EQ(-1, compareTokens("042", "42a"));
}

TEST(SegmentTest, NonAsciiComparesByByte) {
    EXPECT_EQ(1, compareTokens("\xc3\xa9", "z"));
    EXPECT_EQ(0, compareTokens("\xc3\xa9", "\xc3\xa9"));
}
