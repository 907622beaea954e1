#include <gtest/gtest.h>

#include "weft/common/name_util.hpp"

namespace weft::common {
namespace {

TEST(NameUtilTest, Keywords) {
  EXPECT_TRUE(IsKeyword("type"));
  EXPECT_TRUE(IsKeyword("ref"));
  EXPECT_TRUE(IsKeyword("Self"));
  EXPECT_TRUE(IsKeyword("yield"));
  EXPECT_FALSE(IsKeyword("types"));
  EXPECT_FALSE(IsKeyword("Type"));
  EXPECT_FALSE(IsKeyword(""));
}

TEST(NameUtilTest, MangleKeywords) {
  EXPECT_EQ(MangleKeywords("type"), "type_");
  EXPECT_EQ(MangleKeywords("in"), "in_");
  EXPECT_EQ(MangleKeywords("width"), "width");
  // Mangled names are not keywords themselves.
  EXPECT_EQ(MangleKeywords(MangleKeywords("match")), "match_");
}

TEST(NameUtilTest, ShortName) {
  EXPECT_EQ(ShortName("Gio.AsyncReadyCallback"), "AsyncReadyCallback");
  EXPECT_EQ(ShortName("Demo.Widget.Kind"), "Kind");
  EXPECT_EQ(ShortName("utf8"), "utf8");
}

}  // namespace
}  // namespace weft::common
