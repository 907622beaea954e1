#pragma once

namespace weft {

// Builds one visitor out of several lambdas, one per variant alternative:
//   std::visit(Overloaded{[](const ToSome&) {...}, [](const auto&) {...}}, kind);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace weft
