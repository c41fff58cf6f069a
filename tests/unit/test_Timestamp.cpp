#include <gtest/gtest.h>
#include "util/Clock.hpp"
#include "util/strings.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

using namespace tally::util;
using namespace std::chrono;

TEST(TimestampTest, FormatsWithMicrosecondsAndZulu) {
    const auto ts = parseTimestamp("2026-10-19T08:15:02.123456Z");
    EXPECT_EQ(timestampToString(ts), "2026-10-19T08:15:02.123456Z");
}

TEST(TimestampTest, ParsesWithoutFractionAndWithOffset) {
    EXPECT_EQ(parseTimestamp("2026-10-19T08:15:02Z"), parseTimestamp("2026-10-19T08:15:02.000000Z"));
    EXPECT_EQ(parseTimestamp("2026-10-19T08:15:02.5+00:00"), parseTimestamp("2026-10-19T08:15:02.500000Z"));
}

TEST(TimestampTest, TruncatesBeyondMicroseconds) {
    EXPECT_EQ(parseTimestamp("2026-10-19T08:15:02.1234569Z"), parseTimestamp("2026-10-19T08:15:02.123456Z"));
}

TEST(TimestampTest, RejectsNonUtcAndGarbage) {
    EXPECT_THROW(parseTimestamp("2026-10-19T08:15:02+02:00"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("yesterday"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2026-02-30T00:00:00Z"), std::invalid_argument);
    EXPECT_THROW(parseTimestamp("2026-10-19T25:00:00Z"), std::invalid_argument);
}

TEST(TimestampTest, MicrosRoundTripThroughStorageForm) {
    const auto ts = parseTimestamp("1999-12-31T23:59:59.999999Z");
    EXPECT_EQ(fromMicros(toMicros(ts)), ts);
    EXPECT_EQ(toMicros(kEpoch), 0);
}

TEST(TimestampTest, DatesParseAndPrint) {
    const auto d = parseDate("2024-02-29");
    EXPECT_EQ(dateToString(d), "2024-02-29");
    EXPECT_THROW(parseDate("2023-02-29"), std::invalid_argument);
    EXPECT_EQ(dateToString(parseDate("2026-10-19T08:15:02Z")), "2026-10-19");
}

TEST(TimestampTest, AdvanceStampNeverGoesBackwards) {
    const auto t = parseTimestamp("2026-01-01T00:00:00Z");
    EXPECT_EQ(advanceStamp(t, t + seconds(5)), t + seconds(5));
    EXPECT_EQ(advanceStamp(t, t), t + microseconds(1));
    EXPECT_EQ(advanceStamp(t + seconds(5), t), t + seconds(5) + microseconds(1));
}

TEST(GlobalIdTest, GeneratedIdsAreCanonicalAndUnique) {
    const auto a = generateGlobalId();
    const auto b = generateGlobalId();
    EXPECT_NE(a, b);
    EXPECT_EQ(a.size(), 36u);
    EXPECT_EQ(canonicalGlobalId(a), a);
}

TEST(GlobalIdTest, CanonicalFormLowercasesAndRejectsNil) {
    EXPECT_EQ(canonicalGlobalId("3F2504E0-4F89-11D3-9A0C-0305E82C3301"), "3f2504e0-4f89-11d3-9a0c-0305e82c3301");
    EXPECT_EQ(canonicalGlobalId("00000000-0000-0000-0000-000000000000"), "");
    EXPECT_EQ(canonicalGlobalId("not-a-uuid"), "");
    EXPECT_EQ(canonicalGlobalId(""), "");
    EXPECT_TRUE(isNilGlobalId(""));
}

TEST(StringsTest, NormalizeNameTrimsAndFoldsCase) {
    EXPECT_EQ(normalizeName("  Rent\t"), "rent");
    EXPECT_EQ(normalizeName("Food & Dining"), "food & dining");
    EXPECT_EQ(normalizeName("   "), "");
}
