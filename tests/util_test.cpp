#include <gtest/gtest.h>
#include "test_support.hpp"
#include <chrono>
#include <set>

using namespace std::chrono;

TEST(Iso8601Test, FormatsUtcWithMicroseconds) {
    auto tp = system_clock::from_time_t(0) + seconds(86400 + 3661) + microseconds(42);
    EXPECT_EQ(format_iso8601(tp), "1970-01-02T01:01:01.000042+00:00");
}

TEST(Iso8601Test, ParsesWhatItFormats) {
    auto now = time_point_cast<microseconds>(system_clock::now());
    auto parsed = parse_iso8601(format_iso8601(now));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(duration_cast<microseconds>(parsed->time_since_epoch()).count(),
              now.time_since_epoch().count());
}

TEST(Iso8601Test, AcceptsZuluNaiveAndOffsets) {
    auto base = parse_iso8601("2025-06-01T12:00:00Z");
    ASSERT_TRUE(base.has_value());
    EXPECT_EQ(parse_iso8601("2025-06-01T12:00:00").value(), *base);
    EXPECT_EQ(parse_iso8601("2025-06-01 12:00:00+00:00").value(), *base);
    EXPECT_EQ(parse_iso8601("2025-06-01T14:00:00+02:00").value(), *base);
    EXPECT_EQ(parse_iso8601("2025-06-01T07:30:00-0430").value(), *base);
    EXPECT_EQ(parse_iso8601("2025-06-01T12:00:00.5Z").value() - *base, milliseconds(500));
}

TEST(Iso8601Test, RejectsGarbage) {
    EXPECT_FALSE(parse_iso8601("").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2025-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601("2025-06-01T12:00:00+5").has_value());
    EXPECT_FALSE(parse_iso8601("2025-06-01T12:00:00.Z").has_value());
    EXPECT_FALSE(parse_iso8601("2025-06-01X12:00:00Z").has_value());
}

TEST(GenIdTest, ProducesDistinctHexIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = gen_id();
        ASSERT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(Sha1Test, HashesFileContents) {
    TempDir dir;
    write_file(dir.file("abc.txt"), "abc");
    EXPECT_EQ(sha1_file(dir.file("abc.txt")), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(sha1_file(dir.file("missing.txt")), "");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(log_level_from_string("debug", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(log_level_from_string("WARN", LogLevel::Info), LogLevel::Warning);
    EXPECT_EQ(log_level_from_string("Critical", LogLevel::Info), LogLevel::Critical);
    EXPECT_EQ(log_level_from_string("chatty", LogLevel::Error), LogLevel::Error);
}
