#include "splc/codegen/inliner.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "splc/codegen/code_generator.hpp"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/names.hpp"
#include "splc/diagnostics/diagnostics.hpp"
#include "util/status/status_macros.hpp"

namespace codegen {
namespace {

using VarMap = absl::flat_hash_map<std::string, std::string>;

class Inliner {
 public:
  Inliner(ModuleCode const* module, NameGenerator* names,
          diag::DiagnosticsSink* sink)
      : module_(module), names_(names), sink_(sink) {}

  absl::Status Run(InstrList* out) {
    return Expand(module_->main, VarMap(), /*fresh_labels=*/false, out);
  }

 private:
  // Copies `body` into `out`, renaming variables through `vars`. Labels are
  // replaced with fresh ones if `fresh_labels` is set.
  absl::Status Expand(InstrList const& body, VarMap const& vars,
                      bool fresh_labels, InstrList* out) {
    absl::flat_hash_map<Label, Label> label_map;
    auto rename_var = [&](std::string const& name) {
      auto it = vars.find(name);
      return it == vars.end() ? name : it->second;
    };
    auto rename_label = [&](Label const& label) {
      if (!fresh_labels) {
        return label;
      }
      auto it = label_map.find(label);
      if (it == label_map.end()) {
        it = label_map.emplace(label, names_->NewLabel(label.prefix())).first;
      }
      return it->second;
    };
    auto rename_target = [&](JumpTarget const& target) {
      if (auto const* label = target.try_get<Label>()) {
        return JumpTarget(rename_label(*label));
      }
      return target;
    };

    for (auto const& instr : body) {
      if (auto const* call = instr.try_get<CallInstr>()) {
        RETURN_IF_ERROR(ExpandCall(module_->procs, "procedure", call->callee(),
                                   RenameArgs(call->args(), rename_var),
                                   std::nullopt, out));
      } else if (auto const* call_assign = instr.try_get<CallAssignInstr>()) {
        RETURN_IF_ERROR(ExpandCall(
            module_->funcs, "function", call_assign->callee(),
            RenameArgs(call_assign->args(), rename_var),
            rename_var(call_assign->target()), out));
      } else {
        out->push_back(
            RewriteInstr(instr, rename_var, rename_label, rename_target));
      }
    }
    return absl::OkStatus();
  }

  static std::vector<Operand> RenameArgs(std::vector<Operand> const& args,
                                         VarMapper vars) {
    std::vector<Operand> result;
    result.reserve(args.size());
    for (auto const& arg : args) {
      result.push_back(RewriteOperand(arg, vars));
    }
    return result;
  }

  // Keeps a call that could not be expanded in the output.
  static void KeepCall(std::string const& callee, std::vector<Operand> args,
                       std::optional<std::string> target, InstrList* out) {
    if (target) {
      out->push_back(Instr::Make<CallAssignInstr>(std::move(*target), callee,
                                                  std::move(args)));
    } else {
      out->push_back(Instr::Make<CallInstr>(callee, std::move(args)));
    }
  }

  absl::Status ExpandCall(absl::btree_map<std::string, Routine> const& routines,
                          char const* kind, std::string const& callee,
                          std::vector<Operand> args,
                          std::optional<std::string> target, InstrList* out) {
    auto it = routines.find(callee);
    if (it == routines.end()) {
      sink_->Error(diag::ErrorCategory::UNDECLARED_REFERENCE,
                   "Call to unknown %s '%s'", kind, callee);
      KeepCall(callee, std::move(args), std::move(target), out);
      return absl::OkStatus();
    }
    Routine const& routine = it->second;

    if (std::find(active_.begin(), active_.end(), callee) != active_.end()) {
      std::vector<std::string> cycle(
          std::find(active_.begin(), active_.end(), callee), active_.end());
      cycle.push_back(callee);
      sink_->Error(diag::ErrorCategory::RECURSIVE_CALL,
                   "Recursive call cycle %s cannot be inlined",
                   absl::StrJoin(cycle, " -> "));
      KeepCall(callee, std::move(args), std::move(target), out);
      return absl::OkStatus();
    }

    if (args.size() != routine.params.size()) {
      return absl::InternalError(
          absl::StrFormat("%s '%s' expects %d args, got %d at inlining", kind,
                          callee, routine.params.size(), args.size()));
    }
    if (target && !routine.result) {
      return absl::InternalError(
          absl::StrFormat("'%s' has no result to assign", callee));
    }

    VarMap vars;
    for (std::size_t i = 0; i < routine.params.size(); ++i) {
      std::string fresh = names_->FreshParam(routine.params[i]);
      out->push_back(
          Instr::Make<AssignInstr>(fresh, NumExpr(std::move(args[i]))));
      vars.emplace(routine.params[i], std::move(fresh));
    }
    for (auto const& local : routine.locals) {
      vars.emplace(local, names_->FreshLocal(local));
    }

    active_.push_back(callee);
    RETURN_IF_ERROR(Expand(routine.body, vars, /*fresh_labels=*/true, out));
    active_.pop_back();

    if (target) {
      Operand result = RewriteOperand(
          *routine.result, [&](std::string const& name) {
            auto found = vars.find(name);
            return found == vars.end() ? name : found->second;
          });
      out->push_back(Instr::Make<AssignInstr>(std::move(*target),
                                              NumExpr(std::move(result))));
    }
    return absl::OkStatus();
  }

  ModuleCode const* module_;
  NameGenerator* names_;
  diag::DiagnosticsSink* sink_;
  // The routines being expanded, outermost first.
  std::vector<std::string> active_;
};

}  // namespace

absl::StatusOr<InstrList> InlineCalls(ModuleCode const& module,
                                      NameGenerator* names,
                                      diag::DiagnosticsSink* sink) {
  InstrList out;
  Inliner inliner(&module, names, sink);
  RETURN_IF_ERROR(inliner.Run(&out));
  return out;
}

}  // namespace codegen
