#include "splc/codegen/names.hpp"

#include <string>
#include <string_view>

#include "absl/strings/str_cat.h"

namespace codegen {

Label NameGenerator::NewLabel(std::string_view prefix) {
  return Label(std::string(prefix), next_label_++);
}

std::string NameGenerator::FreshParam(std::string_view base) {
  return absl::StrCat("P", next_var_++,
                      absl::string_view(base.data(), base.size()));
}

std::string NameGenerator::FreshLocal(std::string_view base) {
  return absl::StrCat("L", next_var_++,
                      absl::string_view(base.data(), base.size()));
}

}  // namespace codegen
