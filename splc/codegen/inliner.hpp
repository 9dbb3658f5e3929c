#ifndef SPLC_CODEGEN_INLINER_HPP
#define SPLC_CODEGEN_INLINER_HPP

#include "absl/status/statusor.h"
#include "splc/codegen/code_generator.hpp"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/names.hpp"
#include "splc/diagnostics/diagnostics.hpp"

namespace codegen {

// Replaces every call in `module.main` with a copy of the callee's body, and
// returns the resulting call free stream.
//
// At each call site every parameter and local of the callee gets a fresh name
// from `names`, and every label in the callee gets a fresh label. Globals keep
// their names. Calls inside the copied body are expanded the same way.
//
// A call to an unknown routine, or a call that would recursively expand a
// routine already being expanded, is reported to `sink` and left in the
// stream unexpanded. Internal inconsistencies, such as an argument count
// that does not match the callee, are returned as errors.
absl::StatusOr<InstrList> InlineCalls(ModuleCode const& module,
                                      NameGenerator* names,
                                      diag::DiagnosticsSink* sink);

}  // namespace codegen

#endif
