#include "weft/analysis/dumper.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>

#include <fmt/core.h>

#include "weft/analysis/env.hpp"
#include "weft/common/overloaded.hpp"
#include "weft/library/parameter.hpp"

namespace weft::analysis {

namespace {

auto BoolString(bool value) -> const char* {
  return value ? "true" : "false";
}

auto OptionalIndex(const std::optional<uint32_t>& index) -> std::string {
  return index ? fmt::format("{}", *index) : std::string("-");
}

}  // namespace

Dumper::Dumper(const Env* env, std::ostream* out) : env_(env), out_(out) {
}

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  assert(indent_ > 0);
  --indent_;
}

auto Dumper::TypeString(library::TypeId id) const -> std::string {
  if (!id.IsValid() || id.value >= env_->library->TypeCount()) {
    return "<invalid>";
  }
  return env_->library->FullName(id);
}

void Dumper::Dump(std::span<const FunctionInfo> functions) {
  for (size_t i = 0; i < functions.size(); ++i) {
    if (i != 0) {
      *out_ << "\n";
    }
    Dump(functions[i]);
  }
}

void Dumper::Dump(const FunctionInfo& function) {
  PrintIndent();
  *out_ << fmt::format("fn {} ({})", function.name, function.c_identifier);
  if (function.owner.IsValid()) {
    *out_ << fmt::format(" on {}", TypeString(function.owner));
  }
  if (function.is_async) {
    *out_ << " async";
  }
  if (function.throws) {
    *out_ << " throws";
  }
  if (function.in_trait) {
    *out_ << " in_trait";
  }
  if (function.finish_func) {
    *out_ << fmt::format(" finish={}", *function.finish_func);
  }
  if (function.special) {
    *out_ << fmt::format(" special={}", ToString(*function.special));
  }
  *out_ << " {\n";
  Indent();
  Dump(function.parameters);
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

void Dumper::Dump(const ParameterSet& set) {
  PrintIndent();
  *out_ << "native {\n";
  Indent();
  for (size_t i = 0; i < set.native.size(); ++i) {
    const NativeParameter& par = set.native[i];
    PrintIndent();
    *out_ << fmt::format(
        "{}: {} : {} c_type=\"{}\" {} transfer={} nullable={} "
        "caller_allocates={} ref_mode={}",
        i, par.name, TypeString(par.typ), par.c_type,
        library::ToString(par.direction), library::ToString(par.transfer),
        BoolString(par.nullable), BoolString(par.caller_allocates),
        ToString(par.ref_mode));
    if (par.instance_parameter) {
      *out_ << " instance";
    }
    if (par.is_error) {
      *out_ << " error";
    }
    if (par.user_data_index) {
      *out_ << fmt::format(" user_data={}", *par.user_data_index);
    }
    if (par.destroy_index) {
      *out_ << fmt::format(" destroy={}", *par.destroy_index);
    }
    *out_ << "\n";
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";

  PrintIndent();
  *out_ << "surface {\n";
  Indent();
  for (size_t i = 0; i < set.surface.size(); ++i) {
    const SurfaceParameter& par = set.surface[i];
    PrintIndent();
    *out_ << fmt::format(
        "{}: {} : {} native={}", i, par.name, TypeString(par.typ),
        par.native_index);
    if (par.allow_none) {
      *out_ << " allow_none";
    }
    *out_ << "\n";
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";

  PrintIndent();
  *out_ << "transformations {\n";
  Indent();
  for (const Transformation& step : set.transformations) {
    Dump(step);
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

void Dumper::Dump(const Transformation& step) {
  PrintIndent();
  *out_ << fmt::format(
      "[{} <- {}] {}", step.native_index, OptionalIndex(step.surface_index),
      KindName(step.kind));

  std::string detail = std::visit(
      Overloaded{
          [](const ToNativeDirect& t) { return fmt::format(" {}", t.name); },
          [](const ToNativeScalar& t) {
            return fmt::format(
                " {} nullable={}", t.name, BoolString(t.nullable));
          },
          [](const ToNativePointer& t) {
            std::string text = fmt::format(
                " {} transfer={} ref_mode={} nullable={}", t.name,
                library::ToString(t.transfer), ToString(t.ref_mode),
                BoolString(t.nullable));
            if (t.instance_parameter) {
              text += " instance";
            }
            if (t.in_trait) {
              text += " in_trait";
            }
            if (!t.to_native_extra.empty()) {
              text += fmt::format(" extra=\"{}\"", t.to_native_extra);
            }
            return text;
          },
          [](const ToNativeBorrow&) { return std::string(); },
          [](const ToNativeUnknown& t) { return fmt::format(" {}", t.name); },
          [](const LengthLink& t) {
            return fmt::format(
                " {} of {} : {}", t.length_name,
                t.array_name.empty() ? "<return>" : t.array_name,
                t.length_type);
          },
          [](const ToSome& t) { return fmt::format(" {}", t.name); },
          [](const IntoRaw& t) { return fmt::format(" {}", t.name); },
      },
      step.kind);
  *out_ << detail << "\n";
}

}  // namespace weft::analysis
