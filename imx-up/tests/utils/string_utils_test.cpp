#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "utils/string/string_utils.hpp"

namespace imxup {
TEST(StringUtilsTest, NaturalOrderComparesDigitRunsByValue) {
  std::vector<std::string> names = {"img10.jpg", "IMG2.jpg", "img1.jpg", "img002.jpg",
                                    "a.jpg",     "img2b.jpg"};
  std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
    return strutil::NaturalLess(a, b);
  });
  // Equal values: fewer leading zeros first
  EXPECT_EQ(names, (std::vector<std::string>{"a.jpg", "img1.jpg", "IMG2.jpg", "img2b.jpg",
                                             "img002.jpg", "img10.jpg"}));

  EXPECT_TRUE(strutil::NaturalLess("9", "10"));
  EXPECT_FALSE(strutil::NaturalLess("10", "9"));
  EXPECT_TRUE(strutil::NaturalLess("x99999999999999999999", "x100000000000000000000"));
  EXPECT_FALSE(strutil::NaturalLess("same", "same"));
}

TEST(StringUtilsTest, TemplateLeavesUnknownPlaceholders) {
  EXPECT_EQ(strutil::FormatTemplate("https://{server}/up/{filename}?t={token}",
                                    {{"server", "s1.host"}, {"filename", "a%20b.zip"}}),
            "https://s1.host/up/a%20b.zip?t={token}");
  EXPECT_EQ(strutil::FormatTemplate("{x}{x}", {{"x", "ab"}}), "abab");
}

TEST(StringUtilsTest, SplitTrimAndReplace) {
  EXPECT_EQ(strutil::Split("user:pass:word", ':'),
            (std::vector<std::string>{"user", "pass", "word"}));
  EXPECT_EQ(strutil::Split("", ','), std::vector<std::string>{""});
  EXPECT_EQ(strutil::Split("a,,b", ','), (std::vector<std::string>{"a", "", "b"}));

  EXPECT_EQ(strutil::Trim("  \t value \n"), "value");
  EXPECT_EQ(strutil::Trim("   "), "");
  EXPECT_EQ(strutil::ToLower("MiXeD.JPG"), "mixed.jpg");
  EXPECT_EQ(strutil::ReplaceAll("aaa", "a", "aa"), "aaaaaa");
  EXPECT_EQ(strutil::ReplaceAll("abc", "", "x"), "abc");
}
}  // namespace imxup
