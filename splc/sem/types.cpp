#include "splc/sem/types.hpp"

#include <optional>
#include <string_view>

namespace sem {

std::string_view TypeName(Type type) {
  switch (type) {
    case Type::UNKNOWN:
      return "unknown";
    case Type::NUMERIC:
      return "numeric";
    case Type::BOOLEAN:
      return "boolean";
  }
  return "invalid";
}

std::optional<Type> Unify(Type a, Type b) {
  if (a == Type::UNKNOWN) return b;
  if (b == Type::UNKNOWN) return a;
  if (a != b) return std::nullopt;
  return a;
}

}  // namespace sem
