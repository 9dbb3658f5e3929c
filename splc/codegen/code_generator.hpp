#ifndef SPLC_CODEGEN_CODE_GENERATOR_HPP
#define SPLC_CODEGEN_CODE_GENERATOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/statusor.h"
#include "splc/ast/ast.hpp"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/names.hpp"

namespace codegen {

// The code of one procedure or function. Each call site is expanded from a
// renamed copy of it.
struct Routine {
  std::string name;
  std::vector<std::string> params;
  std::vector<std::string> locals;
  InstrList body;
  // The return atom. Set for functions only.
  std::optional<Operand> result;
};

// The generated code of a whole program. `main` may still contain calls.
struct ModuleCode {
  InstrList main;
  absl::btree_map<std::string, Routine> procs;
  absl::btree_map<std::string, Routine> funcs;
};

// Lowers a type checked program into instruction streams. Labels are taken
// from `names`.
//
// The program must be free of scope and type errors. Finding a boolean where
// a number is required, or the reverse, fails with an internal error.
absl::StatusOr<ModuleCode> GenerateCode(ast::Program const& program,
                                        NameGenerator* names);

// Lowers a single algorithm into `out`. Exposed for testing.
absl::Status GenerateAlgorithm(ast::Algorithm const& algorithm,
                               NameGenerator* names, InstrList* out);

}  // namespace codegen

#endif
