#include <gtest/gtest.h>
#include "projection/VirtualPath.hpp"

using namespace rw::projection;

class VirtualPathTest : public ::testing::Test {
protected:
    static void expectInvalid(const std::string& path) {
        EXPECT_FALSE(parseVirtualPath(path).has_value()) << "accepted: '" << path << "'";
    }
};

TEST_F(VirtualPathTest, TimestampRoot) {
    const auto vp = parseVirtualPath("/2000");
    ASSERT_TRUE(vp.has_value());
    EXPECT_EQ(vp->timestamp, 2000);
    EXPECT_EQ(vp->relPath, "");
    EXPECT_TRUE(vp->isTimestampRoot());
}

TEST_F(VirtualPathTest, FileAtTopLevel) {
    EXPECT_EQ(parseVirtualPath("/2000/file.txt"), (VirtualPath{2000, "file.txt"}));
}

TEST_F(VirtualPathTest, NestedFile) {
    const auto vp = parseVirtualPath("/2000/dir/file.txt");
    ASSERT_TRUE(vp.has_value());
    EXPECT_EQ(*vp, (VirtualPath{2000, "dir/file.txt"}));
    EXPECT_FALSE(vp->isTimestampRoot());
}

TEST_F(VirtualPathTest, FractionalTimestampIsTruncated) {
    EXPECT_EQ(parseVirtualPath("/2000.20/dir/file.txt"), (VirtualPath{2000, "dir/file.txt"}));
    EXPECT_EQ(parseVirtualPath("/2000.99"), (VirtualPath{2000, ""}));
    EXPECT_EQ(parseVirtualPath("/0.5"), (VirtualPath{0, ""}));
}

TEST_F(VirtualPathTest, ZeroIsValid) {
    EXPECT_EQ(parseVirtualPath("/0/a"), (VirtualPath{0, "a"}));
}

TEST_F(VirtualPathTest, RejectsNegativeTimestamp) {
    expectInvalid("/-2000.20/dir/file.txt");
    expectInvalid("/-1");
}

TEST_F(VirtualPathTest, RejectsEmptyAndBareSeparator) {
    expectInvalid("");
    expectInvalid("/");
}

TEST_F(VirtualPathTest, RejectsMissingLeadingSeparator) {
    expectInvalid("foo");
    expectInvalid("foo/");
    expectInvalid("2000/file.txt");
}

TEST_F(VirtualPathTest, RejectsNonNumericTimestamp) {
    expectInvalid("/a/dir/file.txt");
    expectInvalid("/a200/dir/file.txt");
    expectInvalid("/200a/dir/file.txt");
    expectInvalid("/nan/file.txt");
    expectInvalid("/inf");
    expectInvalid("/0x10");
    expectInvalid("/./file.txt");
}

TEST_F(VirtualPathTest, RejectsTrailingSeparator) {
    expectInvalid("/200/dir/");
    expectInvalid("/200/");
}

TEST_F(VirtualPathTest, RejectsEmptySegmentAfterTimestamp) {
    expectInvalid("//file.txt");
    expectInvalid("/120//file.txt");
}

TEST_F(VirtualPathTest, RelativePathSegmentsAreNotInspected) {
    EXPECT_EQ(parseVirtualPath("/5/a//b"), (VirtualPath{5, "a//b"}));
    EXPECT_EQ(parseVirtualPath("/5/../x"), (VirtualPath{5, "../x"}));
}

TEST_F(VirtualPathTest, TimestampToken) {
    EXPECT_EQ(parseTimestampToken("1449064800"), 1449064800);
    EXPECT_EQ(parseTimestampToken("+42"), 42);
    EXPECT_EQ(parseTimestampToken("1e3"), 1000);
    EXPECT_EQ(parseTimestampToken(".5"), 0);
    EXPECT_EQ(parseTimestampToken("7."), 7);

    EXPECT_FALSE(parseTimestampToken("").has_value());
    EXPECT_FALSE(parseTimestampToken(".").has_value());
    EXPECT_FALSE(parseTimestampToken("1e").has_value());
    EXPECT_FALSE(parseTimestampToken(" 1").has_value());
    EXPECT_FALSE(parseTimestampToken("1e400").has_value());
}

TEST_F(VirtualPathTest, UnderflowingTimestampIsZero) {
    EXPECT_EQ(parseTimestampToken("1e-400"), 0);
    EXPECT_EQ(parseTimestampToken("0.0000000001e-320"), 0);
    EXPECT_EQ(parseVirtualPath("/1e-400/f"), (VirtualPath{0, "f"}));

    // overflow stays invalid
    EXPECT_FALSE(parseTimestampToken("1e400").has_value());
}
