#ifndef SPLC_CODEGEN_NAMES_HPP
#define SPLC_CODEGEN_NAMES_HPP

#include <string>
#include <string_view>

#include "splc/codegen/instr.hpp"

namespace codegen {

// Hands out the labels and synthetic variable names of one compilation. The
// code generator and the inliner share a single instance, so every name it
// returns is unique within the compilation.
//
// Synthetic variables start with an upper case letter, which no source
// identifier can.
class NameGenerator {
 public:
  NameGenerator() = default;
  NameGenerator(NameGenerator const&) = delete;
  NameGenerator& operator=(NameGenerator const&) = delete;

  Label NewLabel(std::string_view prefix);

  // "P<n><base>", the renamed copy of a parameter.
  std::string FreshParam(std::string_view base);
  // "L<n><base>", the renamed copy of a local.
  std::string FreshLocal(std::string_view base);

  int labels_issued() const { return next_label_ - 1; }
  int vars_issued() const { return next_var_ - 1; }

 private:
  int next_label_ = 1;
  int next_var_ = 1;
};

}  // namespace codegen

#endif
