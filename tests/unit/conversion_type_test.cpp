#include <gtest/gtest.h>

#include <cstdint>
#include <optional>

#include "test_library.hpp"
#include "weft/analysis/conversion_type.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {
namespace {

using test::Fundamental;
using test::TypeKind;

class ConversionTypeTest : public ::testing::Test {
 protected:
  auto Classify(library::TypeId type) -> ConversionType {
    return ClassifyConversion(lib_.GetEnv(), type);
  }

  test::TestLibrary lib_;
};

TEST_F(ConversionTypeTest, Fundamentals) {
  EXPECT_EQ(Classify(lib_.Basic(Fundamental::kInt)), ConversionType::kDirect);
  EXPECT_EQ(Classify(lib_.Basic(Fundamental::kDouble)), ConversionType::kDirect);
  EXPECT_EQ(Classify(lib_.Basic(Fundamental::kSize)), ConversionType::kDirect);
  EXPECT_EQ(Classify(lib_.Basic(Fundamental::kBoolean)), ConversionType::kScalar);
  EXPECT_EQ(Classify(lib_.Basic(Fundamental::kUniChar)), ConversionType::kScalar);
  EXPECT_EQ(Classify(lib_.Basic(Fundamental::kType)), ConversionType::kScalar);
  EXPECT_EQ(Classify(lib_.Basic(Fundamental::kUtf8)), ConversionType::kPointer);
  EXPECT_EQ(
      Classify(lib_.Basic(Fundamental::kFilename)), ConversionType::kPointer);
  EXPECT_EQ(
      Classify(lib_.Basic(Fundamental::kPointer)), ConversionType::kPointer);
  EXPECT_EQ(Classify(lib_.Basic(Fundamental::kNone)), ConversionType::kUnknown);
  EXPECT_EQ(
      Classify(lib_.Basic(Fundamental::kVarArgs)), ConversionType::kUnknown);
  EXPECT_EQ(
      Classify(lib_.Basic(Fundamental::kUnsupported)), ConversionType::kUnknown);
}

TEST_F(ConversionTypeTest, NamedKinds) {
  EXPECT_EQ(
      Classify(lib_.Named(TypeKind::kEnumeration, "Demo.Mode", "DemoMode")),
      ConversionType::kScalar);
  EXPECT_EQ(
      Classify(lib_.Named(TypeKind::kBitfield, "Demo.Flags", "DemoFlags")),
      ConversionType::kScalar);
  EXPECT_EQ(
      Classify(lib_.Named(TypeKind::kCallback, "Demo.Func", "DemoFunc")),
      ConversionType::kDirect);
  EXPECT_EQ(
      Classify(lib_.Class("Demo.Widget", "DemoWidget")),
      ConversionType::kPointer);
  EXPECT_EQ(
      Classify(lib_.Record("Demo.Rect", "DemoRect")), ConversionType::kPointer);
  EXPECT_EQ(
      Classify(lib_.Named(TypeKind::kInterface, "Demo.Shape", "DemoShape")),
      ConversionType::kPointer);
}

TEST_F(ConversionTypeTest, Containers) {
  auto element = lib_.Basic(Fundamental::kInt);
  EXPECT_EQ(Classify(lib_.CArray(element)), ConversionType::kPointer);
  EXPECT_EQ(
      Classify(lib_.Container(TypeKind::kList, element)),
      ConversionType::kPointer);
  EXPECT_EQ(
      Classify(lib_.Container(TypeKind::kPtrArray, element)),
      ConversionType::kPointer);
}

TEST_F(ConversionTypeTest, AliasFollowsTarget) {
  auto inner = lib_.Alias("Demo.Handle", "DemoHandle", lib_.Basic(Fundamental::kUInt));
  auto outer = lib_.Alias("Demo.Id", "DemoId", inner);
  EXPECT_EQ(Classify(outer), ConversionType::kDirect);
}

TEST_F(ConversionTypeTest, QuarkAliasIsScalar) {
  auto quark = lib_.Alias("GLib.Quark", "GQuark", lib_.Basic(Fundamental::kUInt32));
  EXPECT_EQ(Classify(quark), ConversionType::kScalar);
}

TEST_F(ConversionTypeTest, ConfiguredConversionWins) {
  lib_.Configure(R"(
[[object]]
name = "Demo.Rect"
conversion_type = "borrow"

[[object]]
name = "Demo.Id"
conversion_type = "scalar"
)");
  auto rect = lib_.Record("Demo.Rect", "DemoRect");
  EXPECT_EQ(Classify(rect), ConversionType::kBorrow);

  // An override on any link of an alias chain applies.
  auto id = lib_.Alias("Demo.Id", "DemoId", lib_.Basic(Fundamental::kInt));
  auto wrapper = lib_.Alias("Demo.WrappedId", "DemoWrappedId", id);
  EXPECT_EQ(Classify(wrapper), ConversionType::kScalar);
}

TEST_F(ConversionTypeTest, ClassificationIsIdempotent) {
  lib_.Configure(R"(
[[object]]
name = "Demo.Rect"
conversion_type = "borrow"

[[object]]
name = "Demo.Id"
conversion_type = "scalar"
)");
  lib_.Record("Demo.Rect", "DemoRect");
  lib_.Class("Demo.Widget", "DemoWidget");
  lib_.Named(TypeKind::kEnumeration, "Demo.Mode", "DemoMode");
  auto id = lib_.Alias("Demo.Id", "DemoId", lib_.Basic(Fundamental::kInt));
  lib_.Alias("Demo.WrappedId", "DemoWrappedId", id);
  lib_.Alias("GLib.Quark", "GQuark", lib_.Basic(Fundamental::kUInt32));
  lib_.CArray(lib_.Basic(Fundamental::kUtf8));
  lib_.Lib().InternContainer(
      TypeKind::kHashTable,
      library::HashTableInfo{
          .key = lib_.Basic(Fundamental::kUtf8),
          .value = lib_.Basic(Fundamental::kPointer)});

  // Every registered type, fundamentals included.
  const auto count = static_cast<uint32_t>(lib_.Lib().TypeCount());
  ASSERT_GT(count, 0U);
  for (uint32_t i = 0; i < count; ++i) {
    library::TypeId type{i};
    ConversionType first = Classify(type);
    EXPECT_EQ(Classify(type), first) << lib_.Lib().FullName(type);
  }
}

TEST_F(ConversionTypeTest, OutOfRangeIdIsUnknown) {
  EXPECT_EQ(Classify(library::TypeId{100000}), ConversionType::kUnknown);
}

TEST(ConversionTypeNameTest, ParseRoundTrip) {
  EXPECT_EQ(ParseConversionType("pointer"), ConversionType::kPointer);
  EXPECT_EQ(ParseConversionType("borrow"), ConversionType::kBorrow);
  EXPECT_FALSE(ParseConversionType("bogus").has_value());
  EXPECT_STREQ(ToString(ConversionType::kScalar), "scalar");
  EXPECT_TRUE(IsValueConversion(ConversionType::kDirect));
  EXPECT_FALSE(IsValueConversion(ConversionType::kPointer));
}

}  // namespace
}  // namespace weft::analysis
