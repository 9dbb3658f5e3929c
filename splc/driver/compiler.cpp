#include "splc/driver/compiler.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "splc/ast/ast.hpp"
#include "splc/ast/ast_printer.hpp"
#include "splc/codegen/code_generator.hpp"
#include "splc/codegen/inliner.hpp"
#include "splc/codegen/linearizer.hpp"
#include "splc/codegen/listing.hpp"
#include "splc/codegen/names.hpp"
#include "splc/diagnostics/diagnostics.hpp"
#include "splc/sem/scope_resolver.hpp"
#include "splc/sem/type_checker.hpp"
#include "splc/sem/types.hpp"
#include "util/status/status_macros.hpp"

namespace driver {
namespace {

absl::Status PhaseGate(std::string_view phase,
                       diag::ErrorCountingSink const& counter) {
  if (counter.error_count() == 0) {
    return absl::OkStatus();
  }
  return absl::InvalidArgumentError(
      absl::StrFormat("compilation failed with %d error(s) during %s",
                      counter.error_count(), phase));
}

}  // namespace

absl::StatusOr<Analysis> Analyze(ast::Program const& program,
                                 diag::DiagnosticsSink* sink, bool verbose) {
  diag::ErrorCountingSink scope_errors(sink);
  auto symbols = sem::ResolveScopes(program, &scope_errors);
  if (verbose) {
    sink->Info("scope resolution: %d error(s)", scope_errors.error_count());
  }
  RETURN_IF_ERROR(PhaseGate("scope resolution", scope_errors));

  diag::ErrorCountingSink type_errors(sink);
  auto types = sem::CheckTypes(program, *symbols, &type_errors);
  if (verbose) {
    sink->Info("type checking: %d error(s)", type_errors.error_count());
  }
  RETURN_IF_ERROR(PhaseGate("type checking", type_errors));

  return Analysis{.symbols = std::move(symbols), .types = std::move(types)};
}

absl::StatusOr<codegen::NumberedProgram> Compile(ast::Program const& program,
                                                 CompileOptions const& options,
                                                 diag::DiagnosticsSink* sink) {
  ASSIGN_OR_RETURN(auto analysis, Analyze(program, sink, options.verbose));
  if (options.tree_listing) {
    std::string tree =
        ast::FormatTree(program, [&analysis](ast::Term const& term) {
          return sem::TypeName(analysis.types.TypeOf(term));
        });
    if (!options.tree_listing->Write(tree)) {
      return absl::UnavailableError("could not write the tree listing");
    }
  }

  codegen::NameGenerator names;
  ASSIGN_OR_RETURN(auto module, codegen::GenerateCode(program, &names));
  if (options.verbose) {
    sink->Info("code generation: %d instruction(s) in main, %d routine(s)",
               module.main.size(), module.procs.size() + module.funcs.size());
  }

  diag::ErrorCountingSink inline_errors(sink);
  ASSIGN_OR_RETURN(auto instrs,
                   codegen::InlineCalls(module, &names, &inline_errors));
  if (options.verbose) {
    sink->Info("inlining: %d instruction(s), %d fresh name(s)", instrs.size(),
               names.vars_issued());
  }
  RETURN_IF_ERROR(PhaseGate("inlining", inline_errors));

  if (options.intermediate_listing &&
      !codegen::WriteInstrListing(instrs, options.intermediate_listing)) {
    return absl::UnavailableError("could not write the intermediate listing");
  }

  ASSIGN_OR_RETURN(auto numbered,
                   codegen::Linearize(instrs, options.linearizer));
  if (options.verbose) {
    sink->Info("linearization: %d line(s), %d label(s)", numbered.lines().size(),
               numbered.labels().size());
  }
  return numbered;
}

}  // namespace driver
