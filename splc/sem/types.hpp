#ifndef SPLC_SEM_TYPES_HPP
#define SPLC_SEM_TYPES_HPP

#include <optional>
#include <string_view>

namespace sem {

// The static type of an expression. Variables only ever hold NUMERIC values;
// BOOLEAN values exist only while a condition is evaluated.
enum class Type {
  UNKNOWN,
  NUMERIC,
  BOOLEAN,
};

// Lower case name for messages, e.g. "numeric".
std::string_view TypeName(Type type);

// Returns the common type of `a` and `b`. UNKNOWN unifies with anything.
// Returns nullopt if both are known and differ.
std::optional<Type> Unify(Type a, Type b);

}  // namespace sem

#endif
