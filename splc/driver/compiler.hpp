#ifndef SPLC_DRIVER_COMPILER_HPP
#define SPLC_DRIVER_COMPILER_HPP

#include <memory>

#include "absl/status/statusor.h"
#include "splc/ast/ast.hpp"
#include "splc/codegen/linearizer.hpp"
#include "splc/codegen/text_sink.hpp"
#include "splc/diagnostics/diagnostics.hpp"
#include "splc/sem/symbol_table.hpp"
#include "splc/sem/type_checker.hpp"

namespace driver {

struct CompileOptions {
  codegen::LinearizerOptions linearizer;
  // Report the progress of each phase as INFO diagnostics.
  bool verbose = false;
  // If set, receives the call free instruction stream before numbering.
  codegen::TextSink* intermediate_listing = nullptr;
  // If set, receives the typed tree after type checking.
  codegen::TextSink* tree_listing = nullptr;
};

// The results of the analysis phases. Both refer into the analyzed program.
struct Analysis {
  std::unique_ptr<sem::SymbolTable> symbols;
  sem::TypeTable types;
};

// Runs scope resolution and then type checking. Each phase reports all of
// its errors to `sink`; if a phase reports any, the next is not run and an
// InvalidArgument error is returned.
absl::StatusOr<Analysis> Analyze(ast::Program const& program,
                                 diag::DiagnosticsSink* sink,
                                 bool verbose = false);

// Runs the whole pipeline: analysis, code generation, inlining and
// linearization.
//
// User errors are reported to `sink` and fail the compilation with an
// InvalidArgument error. Internal faults are returned as Internal or
// FailedPrecondition errors.
absl::StatusOr<codegen::NumberedProgram> Compile(
    ast::Program const& program, CompileOptions const& options,
    diag::DiagnosticsSink* sink);

}  // namespace driver

#endif
