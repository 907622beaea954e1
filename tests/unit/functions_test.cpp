#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "weft/analysis/dumper.hpp"
#include "weft/analysis/env.hpp"
#include "weft/analysis/functions.hpp"
#include "weft/analysis/parameter_set.hpp"
#include "weft/analysis/special_functions.hpp"
#include "weft/analysis/verify.hpp"
#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/common/diagnostic/diagnostic_sink.hpp"
#include "weft/config/config.hpp"
#include "weft/library/library.hpp"
#include "weft/library/manifest_loader.hpp"

namespace weft::analysis {
namespace {

constexpr const char* kManifest = R"(namespace: Demo
types:
  - {name: Widget, kind: class, c_type: DemoWidget}
  - {name: Label, kind: class, c_type: DemoLabel, final: true}
  - {name: Shape, kind: interface, c_type: DemoShape}
  - {name: Mode, kind: enum, c_type: DemoMode}
  - {name: Name, kind: alias, c_type: DemoName, target: utf8}
  - {name: Gio.AsyncReadyCallback, kind: callback, c_type: GAsyncReadyCallback}
  - {name: Gio.Cancellable, kind: class, c_type: GCancellable}
  - {name: Gio.AsyncResult, kind: interface, c_type: GAsyncResult}
functions:
  - name: load_async
    c_identifier: demo_widget_load_async
    owner: Widget
    finish_func: load_finish
    parameters:
      - {name: self, type: Widget, c_type: DemoWidget*, instance: true}
      - {name: cancellable, type: Gio.Cancellable, c_type: GCancellable*, nullable: true}
      - {name: callback, type: Gio.AsyncReadyCallback, scope: async, closure: 3}
      - {name: user_data, type: gpointer}
  - name: load_finish
    c_identifier: demo_widget_load_finish
    owner: Widget
    throws: true
    parameters:
      - {name: self, type: Widget, c_type: DemoWidget*, instance: true}
      - {name: result, type: Gio.AsyncResult, c_type: GAsyncResult*}
    return: {type: gboolean}
  - name: reload
    c_identifier: demo_widget_reload
    owner: Widget
    finish_func: reload_finish
    parameters:
      - {name: self, type: Widget, c_type: DemoWidget*, instance: true}
  - name: set_text
    c_identifier: demo_label_set_text
    owner: Label
    parameters:
      - {name: self, type: Label, c_type: DemoLabel*, instance: true}
      - {name: text, type: utf8, c_type: const gchar*}
      - {name: text_len, type: gssize}
  - name: area
    c_identifier: demo_shape_area
    owner: Shape
    parameters:
      - {name: self, type: Shape, c_type: DemoShape*, instance: true}
    return: {type: gdouble}
  - name: to_string
    c_identifier: demo_mode_to_string
    owner: Mode
    parameters:
      - {name: mode, type: Mode}
    return: {type: Name}
  - name: init
    c_identifier: demo_init
    parameters:
      - {name: argv, type: {c_array: utf8}, c_type: gchar**, array_length: 1}
      - {name: argc, type: gint}
)";

class FunctionsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto library = library::ParseManifest(kManifest, "demo.yaml");
    ASSERT_TRUE(library.has_value()) << library.error().primary.message;
    library_.emplace(std::move(*library));
  }

  void Configure(const std::string& toml) {
    auto parsed = config::ParseConfig(toml, "weft.toml");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().primary.message;
    config_ = std::move(*parsed);
  }

  auto GetEnv() const -> Env {
    return Env{.library = &*library_, .config = &config_};
  }

  auto FindFunction(const std::string& name) const -> const library::Function& {
    for (const library::Function& function : library_->Functions()) {
      if (function.name == name) {
        return function;
      }
    }
    throw std::runtime_error("no function " + name);
  }

  auto Analyze(const std::string& name) -> FunctionInfo {
    return AnalyzeFunction(GetEnv(), FindFunction(name));
  }

  static auto Messages(const DiagnosticSink& sink) -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const Diagnostic& diag : sink.GetDiagnostics()) {
      result.push_back(diag.primary.message);
    }
    return result;
  }

  std::optional<library::Library> library_;
  config::Config config_;
};

// ============================================================================
// Function classification
// ============================================================================

TEST_F(FunctionsTest, Paths) {
  EXPECT_EQ(FunctionPath(GetEnv(), FindFunction("load_async")), "Demo.Widget.load_async");
  EXPECT_EQ(FunctionPath(GetEnv(), FindFunction("init")), "Demo.init");
}

TEST_F(FunctionsTest, AsyncDetection) {
  EXPECT_TRUE(IsAsyncFunction(GetEnv(), FindFunction("load_async")));
  EXPECT_FALSE(IsAsyncFunction(GetEnv(), FindFunction("load_finish")));
  EXPECT_FALSE(IsAsyncFunction(GetEnv(), FindFunction("set_text")));
  // A declared finish function marks the function async without a callback.
  EXPECT_TRUE(IsAsyncFunction(GetEnv(), FindFunction("reload")));
}

TEST_F(FunctionsTest, FinishAndThrowsAreRecorded) {
  FunctionInfo load = Analyze("load_async");
  EXPECT_EQ(load.finish_func, std::optional<std::string>("load_finish"));
  EXPECT_FALSE(load.throws);

  FunctionInfo finish = Analyze("load_finish");
  EXPECT_TRUE(finish.throws);
  EXPECT_FALSE(finish.is_async);
  EXPECT_FALSE(finish.finish_func.has_value());
}

TEST_F(FunctionsTest, TraitMembership) {
  Env env = GetEnv();
  EXPECT_TRUE(IsInTrait(env, FindFunction("load_async")));
  EXPECT_FALSE(IsInTrait(env, FindFunction("set_text")));
  EXPECT_TRUE(IsInTrait(env, FindFunction("area")));
  EXPECT_FALSE(IsInTrait(env, FindFunction("init")));
  EXPECT_FALSE(IsInTrait(env, FindFunction("to_string")));
}

TEST_F(FunctionsTest, TraitDisabledOrFinalByConfig) {
  Configure(R"(
[[object]]
name = "Demo.Widget"
trait = false
)");
  EXPECT_FALSE(IsInTrait(GetEnv(), FindFunction("load_async")));

  Configure(R"(
[[object]]
name = "Demo.Widget"
final_type = true
)");
  EXPECT_FALSE(IsInTrait(GetEnv(), FindFunction("load_async")));
}

TEST_F(FunctionsTest, StaticStringify) {
  EXPECT_EQ(
      DetectSpecialFunction(GetEnv(), FindFunction("to_string")),
      std::optional<FunctionType>(FunctionType::kStaticStringify));
  EXPECT_FALSE(DetectSpecialFunction(GetEnv(), FindFunction("area")).has_value());
  EXPECT_STREQ(ToString(FunctionType::kStaticStringify), "static_stringify");
}

TEST_F(FunctionsTest, NullableStringifyIsNotSpecial) {
  library::Function function = FindFunction("to_string");
  function.ret->nullable = true;
  EXPECT_FALSE(DetectSpecialFunction(GetEnv(), function).has_value());
}

// ============================================================================
// Analysis
// ============================================================================

TEST_F(FunctionsTest, AsyncFunction) {
  FunctionInfo info = Analyze("load_async");
  EXPECT_TRUE(info.is_async);
  EXPECT_TRUE(info.in_trait);
  EXPECT_FALSE(info.special.has_value());

  const ParameterSet& set = info.parameters;
  ASSERT_EQ(set.native.size(), 4U);
  ASSERT_EQ(set.surface.size(), 3U);
  EXPECT_EQ(set.surface[2].name, "callback");
  EXPECT_EQ(set.native[2].user_data_index, std::optional<uint32_t>(3));

  auto callback = set.TransformationsFor(2);
  ASSERT_EQ(callback.size(), 1U);
  EXPECT_TRUE(std::holds_alternative<ToSome>(callback[0]->kind));

  auto user_data = set.TransformationsFor(3);
  ASSERT_EQ(user_data.size(), 1U);
  EXPECT_TRUE(std::holds_alternative<IntoRaw>(user_data[0]->kind));
  EXPECT_FALSE(user_data[0]->surface_index.has_value());

  auto cancellable = set.TransformationsFor(1);
  ASSERT_EQ(cancellable.size(), 1U);
  const auto* pointer = std::get_if<ToNativePointer>(&cancellable[0]->kind);
  ASSERT_NE(pointer, nullptr);
  EXPECT_TRUE(pointer->nullable);
  EXPECT_EQ(pointer->to_native_extra, ".as_ref()");
  EXPECT_TRUE(pointer->in_trait);

  EXPECT_TRUE(VerifyParameterSet(set, 4).has_value());
}

TEST_F(FunctionsTest, FinalOwnerFoldsLength) {
  FunctionInfo info = Analyze("set_text");
  EXPECT_FALSE(info.in_trait);
  ASSERT_EQ(info.parameters.surface.size(), 2U);
  auto steps = info.parameters.TransformationsFor(2);
  ASSERT_EQ(steps.size(), 1U);
  const auto* link = std::get_if<LengthLink>(&steps[0]->kind);
  ASSERT_NE(link, nullptr);
  EXPECT_EQ(link->array_name, "text");
  EXPECT_EQ(link->length_type, "isize");
  EXPECT_TRUE(VerifyParameterSet(info.parameters, 3).has_value());
}

TEST_F(FunctionsTest, ConfiguredDisableLengthDetect) {
  Configure(R"(
[[object]]
name = "Demo.Label"
  [[object.function]]
  pattern = "^set_"
  disable_length_detect = true
)");
  FunctionInfo info = Analyze("set_text");
  EXPECT_TRUE(info.disable_length_detect);
  EXPECT_EQ(info.parameters.surface.size(), 3U);
}

TEST_F(FunctionsTest, FreeFunctionUsesTopLevelConfig) {
  Configure(R"(
[[function]]
name = "init"
  [[function.parameter]]
  name = "argv"
  nullable = true
)");
  FunctionInfo info = Analyze("init");
  EXPECT_FALSE(info.owner.IsValid());
  EXPECT_TRUE(info.parameters.native[0].nullable);
  // argc is folded through the back link of argv.
  EXPECT_EQ(info.parameters.surface.size(), 1U);
}

TEST_F(FunctionsTest, LibraryWarnings) {
  Configure(R"(
[[object]]
name = "Demo.Missing"

[[object]]
name = "Demo.Widget"
  [[object.function]]
  name = "load_async"
    [[object.function.parameter]]
    name = "io_priority"

  [[object.function]]
  name = "unload"

[[function]]
name = "shutdown"
)");
  DiagnosticSink sink;
  auto functions = AnalyzeLibrary(GetEnv(), &sink);

  EXPECT_EQ(functions.size(), library_->Functions().size());
  EXPECT_FALSE(sink.HasErrors());
  auto messages = Messages(sink);
  ASSERT_EQ(messages.size(), 4U);
  EXPECT_EQ(messages[0], "configured parameter 'io_priority' matches no parameter");
  EXPECT_EQ(messages[1], "configured object is not part of the library");
  EXPECT_EQ(messages[2], "configured function 'unload' matches no function");
  EXPECT_EQ(messages[3], "configured function 'shutdown' matches no function");

  const auto& diagnostics = sink.GetDiagnostics();
  EXPECT_EQ(diagnostics[1].primary.span, DiagSpan(ElementPath{"Demo.Missing"}));
  EXPECT_EQ(diagnostics[3].primary.span, DiagSpan(ElementPath{"Demo"}));
}

TEST_F(FunctionsTest, UnknownConversionWarns) {
  library::Library library("Demo");
  library::Function function{
      .name = "log",
      .c_identifier = "demo_log",
  };
  library::Parameter args;
  args.name = "args";
  args.typ = library.FundamentalType(library::Fundamental::kVarArgs);
  args.c_type = "va_list";
  function.parameters.push_back(args);
  library.AddFunction(function);

  Env env{.library = &library, .config = &config_};
  DiagnosticSink sink;
  FunctionInfo info = AnalyzeFunction(env, library.Functions().front(), &sink);

  EXPECT_TRUE(std::holds_alternative<ToNativeUnknown>(
      info.parameters.transformations[0].kind));
  ASSERT_EQ(sink.GetDiagnostics().size(), 1U);
  EXPECT_EQ(
      sink.GetDiagnostics()[0].primary.message,
      "parameter 'args' of type 'va_list' has no known conversion");
}

// ============================================================================
// Verification
// ============================================================================

class VerifyTest : public ::testing::Test {
 protected:
  static auto Slot(const char* name) -> NativeParameter {
    NativeParameter par;
    par.name = name;
    return par;
  }

  static auto Message(const Result<void>& result) -> std::string {
    return result ? std::string() : result.error().primary.message;
  }
};

TEST_F(VerifyTest, DescriptorCountMismatch) {
  ParameterSet set;
  set.native.push_back(Slot("a"));
  auto result = VerifyParameterSet(set, 2, "Demo.f");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().primary.span, DiagSpan(ElementPath{"Demo.f"}));
  EXPECT_NE(Message(result).find("descriptor count"), std::string::npos);
}

TEST_F(VerifyTest, SurfaceMustReferBackToSlot) {
  ParameterSet set;
  set.native = {Slot("a"), Slot("b")};
  set.surface.push_back(SurfaceParameter{.native_index = 0, .name = "a"});
  set.transformations.push_back(
      Transformation{
          .native_index = 1,
          .surface_index = 0,
          .kind = ToNativeDirect{.name = "b"}});
  EXPECT_NE(
      Message(VerifyParameterSet(set, 2)).find("surface 0 belongs to native 0"),
      std::string::npos);

  set.transformations[0].surface_index = 4;
  EXPECT_NE(
      Message(VerifyParameterSet(set, 2)).find("out of range"),
      std::string::npos);
}

TEST_F(VerifyTest, OnePrimaryStepPerSlot) {
  ParameterSet set;
  set.native = {Slot("a")};
  set.transformations.push_back(
      Transformation{.native_index = 0, .kind = ToNativeDirect{.name = "a"}});
  set.transformations.push_back(
      Transformation{.native_index = 0, .kind = ToNativeDirect{.name = "a"}});
  EXPECT_NE(
      Message(VerifyParameterSet(set, 1)).find("2 primary steps"),
      std::string::npos);
}

TEST_F(VerifyTest, FoldedSlotHasNoSurface) {
  ParameterSet set;
  set.native = {Slot("data"), Slot("len")};
  set.surface.push_back(SurfaceParameter{.native_index = 1, .name = "len"});
  set.transformations.push_back(
      Transformation{
          .native_index = 1,
          .kind = LengthLink{.array_name = "data", .length_name = "len"}});
  EXPECT_NE(
      Message(VerifyParameterSet(set, 2)).find("folded as a length"),
      std::string::npos);

  // A return length link may share a surfaced slot.
  std::get<LengthLink>(set.transformations[0].kind).array_name.clear();
  EXPECT_TRUE(VerifyParameterSet(set, 2).has_value());
}

// ============================================================================
// Dumper
// ============================================================================

TEST_F(FunctionsTest, DumpIsDeterministic) {
  Env env = GetEnv();
  std::vector<FunctionInfo> functions = AnalyzeLibrary(env);

  std::ostringstream first;
  Dumper(&env, &first).Dump(functions);
  std::ostringstream second;
  Dumper(&env, &second).Dump(functions);
  EXPECT_EQ(first.str(), second.str());

  const std::string text = first.str();
  EXPECT_NE(
      text.find("fn load_async (demo_widget_load_async) on Demo.Widget async "
                "in_trait finish=load_finish {"),
      std::string::npos);
  EXPECT_NE(
      text.find("fn load_finish (demo_widget_load_finish) on Demo.Widget "
                "throws in_trait {"),
      std::string::npos);
  EXPECT_NE(
      text.find("fn to_string (demo_mode_to_string) on Demo.Mode "
                "special=static_stringify {"),
      std::string::npos);
  EXPECT_NE(text.find("fn init (demo_init) {"), std::string::npos);
}

}  // namespace
}  // namespace weft::analysis
