#include <gtest/gtest.h>
#include <boost/filesystem/fstream.hpp>
#include "fake_runtime.h"
#include "util.h"

namespace sandboxd {
namespace {

TEST(UtilTest, ParseMemorySize) {
  EXPECT_EQ(int64_t(5) << 30, *ParseMemorySize("5g"));
  EXPECT_EQ(int64_t(512) << 20, *ParseMemorySize("512M"));
  EXPECT_EQ(int64_t(64) << 10, *ParseMemorySize(" 64k "));
  EXPECT_EQ(4096, *ParseMemorySize("4096"));
  EXPECT_FALSE(ParseMemorySize(""));
  EXPECT_FALSE(ParseMemorySize("g"));
  EXPECT_FALSE(ParseMemorySize("lots"));
  EXPECT_FALSE(ParseMemorySize("-1g"));
  EXPECT_FALSE(ParseMemorySize("99999999999999999999"));
}

TEST(UtilTest, UrlEncode) {
  EXPECT_EQ("abc-_.~123", UrlEncode("abc-_.~123"));
  EXPECT_EQ("%2Fworkspace%2Fa%20b", UrlEncode("/workspace/a b"));
  EXPECT_EQ("", UrlEncode(""));
}

TEST(UtilTest, SplitList) {
  EXPECT_EQ((std::vector<std::string>{"python", "javascript"}),
            SplitList(" python, javascript ,,"));
  EXPECT_TRUE(SplitList("").empty());
}

TEST(UtilTest, RandomIdIsUnique) {
  std::string first = RandomId();
  EXPECT_EQ(36u, first.size());
  EXPECT_NE(first, RandomId());
  EXPECT_EQ(8u, ShortId().size());
}

TEST(UtilTest, FileHelpers) {
  testing::ScratchDir scratch;
  Path dir = scratch.path() / "a" / "b";
  ASSERT_TRUE(MakeDirs(dir).ok());
  ASSERT_TRUE(MakeDirs(dir).ok());
  Path file = dir / "code.py";
  ASSERT_TRUE(WriteFile(file, "print(1)\n").ok());
  boost::filesystem::ifstream source(file);
  std::string content((std::istreambuf_iterator<char>(source)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ("print(1)\n", content);
  EXPECT_TRUE(RemoveFile(file).ok());
  EXPECT_FALSE(boost::filesystem::exists(file));
  EXPECT_TRUE(RemoveFile(file).ok());
  EXPECT_TRUE(RemoveDir(scratch.path() / "a").ok());
  EXPECT_FALSE(boost::filesystem::exists(dir));
  EXPECT_TRUE(WriteFile(scratch.path() / "missing" / "x", "").Is(errc::runtime));
}

}
}
