#pragma once

namespace chatlog::util {

// std::visit helper: Overloaded{[](const A&) {...}, [](const B&) {...}}
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace chatlog::util
