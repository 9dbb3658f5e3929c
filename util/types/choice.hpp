#ifndef UTIL_TYPES_CHOICE_HPP
#define UTIL_TYPES_CHOICE_HPP

#include <concepts>
#include <cstddef>
#include <ostream>
#include <utility>
#include <variant>

namespace util {

namespace choice_internal {
template <class T>
concept OstreamPrintable = requires(T const& t, std::ostream& os) {
  { os << t } -> std::same_as<std::ostream&>;
};
}  // namespace choice_internal

// Builds a single callable out of a set of lambdas, for use with
// std::visit or ChoiceBase::visit.
template <class... Ts>
struct Visitor : Ts... {
  using Ts::operator()...;
};

// A base type used to create closed sum types. A choice type is declared as:
//
//   class Shape : public util::ChoiceBase<Shape, Circle, Square> {
//     using ChoiceBase::ChoiceBase;
//   };
//
// The alternatives are accessed with has<T>(), as<T>() and try_get<T>(), or
// exhaustively with visit().
template <class Derived, class... Types>
class ChoiceBase {
 public:
  template <class T, class... Args>
  static Derived Make(Args&&... args) {
    return Derived(std::in_place_type<T>, std::forward<Args>(args)...);
  }

  ChoiceBase() = default;
  ChoiceBase(ChoiceBase const&) = default;
  ChoiceBase(ChoiceBase&&) = default;
  ChoiceBase& operator=(ChoiceBase const&) = default;
  ChoiceBase& operator=(ChoiceBase&&) = default;

  template <class T>
  ChoiceBase(T&& value) : value_(std::forward<T>(value)) {}

  template <class T>
  T const& as() const {
    return std::get<T>(value_);
  }

  template <class T>
  T& as() {
    return std::get<T>(value_);
  }

  template <class T>
  T const* try_get() const {
    return std::get_if<T>(&value_);
  }

  template <class T>
  T* try_get() {
    return std::get_if<T>(&value_);
  }

  template <class T>
  bool has() const {
    return std::holds_alternative<T>(value_);
  }

  // Position of the held alternative in the type list.
  std::size_t index() const { return value_.index(); }

  template <class... Fs>
  decltype(auto) visit(Fs&&... fs) const& {
    return std::visit(Visitor<Fs...>{std::forward<Fs>(fs)...}, value_);
  }

  template <class... Fs>
  decltype(auto) visit(Fs&&... fs) & {
    return std::visit(Visitor<Fs...>{std::forward<Fs>(fs)...}, value_);
  }

  template <class... Fs>
  decltype(auto) visit(Fs&&... fs) && {
    return std::visit(Visitor<Fs...>{std::forward<Fs>(fs)...},
                      std::move(value_));
  }

 protected:
  template <class T, class... Args>
  ChoiceBase(std::in_place_type_t<T>, Args&&... args)
      : value_(std::in_place_type<T>, std::forward<Args>(args)...) {}

 private:
  std::variant<Types...> value_;

  friend std::ostream& operator<<(std::ostream& os, Derived const& choice)
    requires(choice_internal::OstreamPrintable<Types> && ...)
  {
    return choice.visit(
        [&os](auto const& value) -> std::ostream& { return (os << value); });
  }
};

}  // namespace util
#endif
