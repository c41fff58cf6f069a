#include <gtest/gtest.h>
#include "sync/Conflict.hpp"

using namespace tally::sync;
using namespace tally::util;
using namespace std::chrono;

TEST(ConflictTest, NothingStoredMeansInsert) {
    EXPECT_EQ(resolve(std::nullopt, parseTimestamp("2026-01-01T00:00:00Z")), Resolution::Insert);
}

TEST(ConflictTest, StrictlyNewerOverwrites) {
    const auto stored = parseTimestamp("2026-01-01T00:00:00Z");
    EXPECT_EQ(resolve(stored, stored + microseconds(1)), Resolution::Overwrite);
}

TEST(ConflictTest, OlderOrEqualIsDiscarded) {
    const auto stored = parseTimestamp("2026-01-01T00:00:00Z");
    EXPECT_EQ(resolve(stored, stored), Resolution::Discard);
    EXPECT_EQ(resolve(stored, stored - seconds(1)), Resolution::Discard);
}

TEST(ConflictTest, ResolutionNames) {
    EXPECT_STREQ(to_string(Resolution::Insert), "insert");
    EXPECT_STREQ(to_string(Resolution::Overwrite), "overwrite");
    EXPECT_STREQ(to_string(Resolution::Discard), "discard");
}
