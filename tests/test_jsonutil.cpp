#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/JsonUtil.h"
#include <chrono>
#include <string>

namespace arp_sweep {
namespace jsonutil {

namespace {
std::chrono::system_clock::time_point at(long long seconds, int millis = 0) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds)) +
           std::chrono::milliseconds(millis);
}
}

TEST(JsonUtilTest, EscapeEmptyString) {
    EXPECT_EQ(escape(""), "");
}

TEST(JsonUtilTest, EscapeNormalString) {
    EXPECT_EQ(escape("Acme Networks, Inc."), "Acme Networks, Inc.");
}

TEST(JsonUtilTest, EscapeQuoteAndBackslash) {
    EXPECT_EQ(escape("He said \"Hello\""), "He said \\\"Hello\\\"");
    EXPECT_EQ(escape("C:\\path"), "C:\\\\path");
}

TEST(JsonUtilTest, EscapeWhitespaceControls) {
    EXPECT_EQ(escape("a\nb\rc\td"), "a\\nb\\rc\\td");
    EXPECT_EQ(escape("\b\f"), "\\b\\f");
}

TEST(JsonUtilTest, EscapeOtherControlCharacters) {
    EXPECT_EQ(escape(std::string("x\x01\x1f", 3)), "x\\u0001\\u001f");
    EXPECT_EQ(escape(std::string("\0", 1)), "\\u0000");
}

TEST(JsonUtilTest, EscapeLeavesUtf8Alone) {
    std::string vendor = "Fran\xc3\xa7" "ais";
    EXPECT_EQ(escape(vendor), vendor);
}

TEST(JsonUtilTest, TimeToIsoSeconds) {
    EXPECT_EQ(time_to_iso(at(1703507445)), "2023-12-25T12:30:45Z");
    EXPECT_EQ(time_to_iso(at(1703507445, 999)), "2023-12-25T12:30:45Z");
}

TEST(JsonUtilTest, TimeToIsoEpochIsUnset) {
    EXPECT_EQ(time_to_iso(std::chrono::system_clock::time_point{}), "");
    EXPECT_EQ(time_to_iso(at(1)), "1970-01-01T00:00:01Z");
}

TEST(JsonUtilTest, TimeToIsoMilliseconds) {
    EXPECT_EQ(time_to_iso_ms(at(1703507445, 123)), "2023-12-25T12:30:45.123Z");
    EXPECT_EQ(time_to_iso_ms(at(1703507445, 7)), "2023-12-25T12:30:45.007Z");
    EXPECT_EQ(time_to_iso_ms(at(1703507445)), "2023-12-25T12:30:45.000Z");
}

TEST(JsonUtilTest, TimeToIsoMsNow) {
    std::string s = time_to_iso_ms(std::chrono::system_clock::now());
    ASSERT_EQ(s.size(), 24u);
    EXPECT_EQ(s[10], 'T');
    EXPECT_EQ(s[19], '.');
    EXPECT_EQ(s.back(), 'Z');
}

} // namespace jsonutil
} // namespace arp_sweep

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
