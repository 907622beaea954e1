#include <gtest/gtest.h>

#include <vector>

#include "test_library.hpp"
#include "weft/analysis/out_parameters.hpp"
#include "weft/analysis/override_string_type.hpp"
#include "weft/analysis/target_type.hpp"
#include "weft/config/config.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {
namespace {

using library::ParameterDirection;
using test::Fundamental;
using test::MakeParameter;
using test::TypeKind;

class TargetTypeTest : public ::testing::Test {
 protected:
  auto Spell(library::TypeId type) -> std::string {
    return TargetTypeString(lib_.GetEnv(), type);
  }

  test::TestLibrary lib_;
};

// ============================================================================
// Spelling
// ============================================================================

TEST_F(TargetTypeTest, Fundamentals) {
  EXPECT_EQ(Spell(lib_.Basic(Fundamental::kUInt)), "u32");
  EXPECT_EQ(Spell(lib_.Basic(Fundamental::kInt)), "i32");
  EXPECT_EQ(Spell(lib_.Basic(Fundamental::kSize)), "usize");
  EXPECT_EQ(Spell(lib_.Basic(Fundamental::kSSize)), "isize");
  EXPECT_EQ(Spell(lib_.Basic(Fundamental::kUInt8)), "u8");
  EXPECT_EQ(Spell(lib_.Basic(Fundamental::kBoolean)), "bool");
  EXPECT_EQ(Spell(lib_.Basic(Fundamental::kUtf8)), "glib::GString");
  EXPECT_EQ(Spell(lib_.Basic(Fundamental::kFilename)), "std::path::PathBuf");
}

TEST_F(TargetTypeTest, NamedTypesUseModulePrefixOutsideNamespace) {
  EXPECT_EQ(Spell(lib_.Class("Demo.Widget", "DemoWidget")), "Widget");
  EXPECT_EQ(
      Spell(lib_.Class("Gio.Cancellable", "GCancellable")),
      "gio::Cancellable");
}

TEST_F(TargetTypeTest, Containers) {
  auto widget = lib_.Class("Demo.Widget", "DemoWidget");
  EXPECT_EQ(Spell(lib_.Container(TypeKind::kList, widget)), "Vec<Widget>");
  EXPECT_EQ(
      Spell(lib_.CArray(lib_.Basic(Fundamental::kUtf8))),
      "Vec<glib::GString>");

  auto fixed = lib_.Lib().InternContainer(
      TypeKind::kFixedArray,
      library::FixedArrayInfo{
          .element = lib_.Basic(Fundamental::kUInt8), .size = 4});
  EXPECT_EQ(Spell(fixed), "[u8; 4]");

  auto table = lib_.Lib().InternContainer(
      TypeKind::kHashTable,
      library::HashTableInfo{
          .key = lib_.Basic(Fundamental::kUtf8),
          .value = lib_.Basic(Fundamental::kInt)});
  EXPECT_EQ(Spell(table), "std::collections::HashMap<glib::GString, i32>");
}

TEST_F(TargetTypeTest, UnsupportedShapesAreMarked) {
  Env env = lib_.GetEnv();
  auto callback = lib_.Named(TypeKind::kCallback, "Demo.Func", "DemoFunc");
  auto name = TargetTypeName(env, callback);
  ASSERT_FALSE(name.has_value());
  EXPECT_EQ(name.error().primary.kind, DiagKind::kError);
  EXPECT_EQ(Spell(callback), "/*Unimplemented*/Demo.Func");

  EXPECT_EQ(
      Spell(lib_.Basic(Fundamental::kVarArgs)), "/*Unimplemented*/va_list");
  // A container inherits the failure of its element.
  EXPECT_FALSE(TargetTypeName(env, lib_.CArray(callback)).has_value());
}

// ============================================================================
// Out parameters as return values
// ============================================================================

TEST_F(TargetTypeTest, ValuesCanBeReturned) {
  Env env = lib_.GetEnv();
  auto out = ParameterDirection::kOut;
  EXPECT_TRUE(CanAsReturn(
      env, MakeParameter("width", lib_.Basic(Fundamental::kInt), "gint*", out)));
  EXPECT_TRUE(CanAsReturn(
      env, MakeParameter(
               "mode", lib_.Named(TypeKind::kEnumeration, "Demo.Mode", "DemoMode"),
               "DemoMode*", out)));
  EXPECT_TRUE(CanAsReturn(
      env, MakeParameter(
               "rect", lib_.Record("Demo.Rect", "DemoRect"), "DemoRect*", out)));
  EXPECT_FALSE(CanAsReturn(
      env, MakeParameter(
               "args", lib_.Basic(Fundamental::kVarArgs), "va_list", out)));
}

TEST_F(TargetTypeTest, PlainBufferNeedsLength) {
  Env env = lib_.GetEnv();
  auto bytes = lib_.CArray(lib_.Basic(Fundamental::kUInt8));
  auto par = MakeParameter("data", bytes, "guint8**", ParameterDirection::kOut);
  EXPECT_FALSE(CanAsReturn(env, par));

  par.array_length = 1;
  EXPECT_TRUE(CanAsReturn(env, par));

  // Strings are not plain values and carry their own terminator.
  auto strings = lib_.CArray(lib_.Basic(Fundamental::kUtf8));
  EXPECT_TRUE(CanAsReturn(
      env, MakeParameter("names", strings, "gchar***", ParameterDirection::kOut)));
}

TEST_F(TargetTypeTest, BorrowedTypesStayParameters) {
  lib_.Configure(R"(
[[object]]
name = "Demo.Iter"
conversion_type = "borrow"
)");
  auto iter = lib_.Record("Demo.Iter", "DemoIter");
  EXPECT_FALSE(CanAsReturn(
      lib_.GetEnv(),
      MakeParameter("iter", iter, "DemoIter*", ParameterDirection::kOut)));
}

// ============================================================================
// String overrides
// ============================================================================

class OverrideStringTypeTest : public ::testing::Test {
 protected:
  auto Override(library::TypeId type, const char* parameter) -> library::TypeId {
    Env env = lib_.GetEnv();
    auto functions = config::MatchedFunctions(env.config->functions, "open");
    auto configured = config::MatchedParameters(functions, parameter);
    return OverrideStringTypeParameter(env, type, configured);
  }

  test::TestLibrary lib_;
};

TEST_F(OverrideStringTypeTest, ReplacesStringFundamental) {
  lib_.Configure(R"(
[[function]]
name = "open"
  [[function.parameter]]
  name = "path"
  string = "filename"
)");
  auto utf8 = lib_.Basic(Fundamental::kUtf8);
  EXPECT_EQ(Override(utf8, "path"), lib_.Basic(Fundamental::kFilename));
  EXPECT_EQ(Override(utf8, "mode"), utf8);

  auto gint = lib_.Basic(Fundamental::kInt);
  EXPECT_EQ(Override(gint, "path"), gint);
}

TEST_F(OverrideStringTypeTest, StringArrayNeedsExistingContainer) {
  lib_.Configure(R"(
[[function]]
name = "open"
  [[function.parameter]]
  pattern = "s$"
  string = "filename"
)");
  auto names = lib_.CArray(lib_.Basic(Fundamental::kUtf8));
  EXPECT_EQ(Override(names, "paths"), names);

  auto paths = lib_.CArray(lib_.Basic(Fundamental::kFilename));
  EXPECT_EQ(Override(names, "paths"), paths);
}

TEST_F(OverrideStringTypeTest, FirstConfiguredStringWins) {
  lib_.Configure(R"(
[[function]]
name = "open"
  [[function.parameter]]
  name = "path"
  nullable = true

  [[function.parameter]]
  name = "path"
  string = "os_string"

  [[function.parameter]]
  pattern = "^pa"
  string = "utf8"
)");
  EXPECT_EQ(
      Override(lib_.Basic(Fundamental::kFilename), "path"),
      lib_.Basic(Fundamental::kOsString));
}

}  // namespace
}  // namespace weft::analysis
