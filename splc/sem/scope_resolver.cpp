#include "splc/sem/scope_resolver.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_set.h"
#include "splc/ast/ast.hpp"
#include "splc/diagnostics/diagnostics.hpp"
#include "splc/sem/symbol_table.hpp"

namespace sem {
namespace {

using diag::ErrorCategory;

class ScopeResolver {
 public:
  ScopeResolver(SymbolTable* table, diag::DiagnosticsSink* sink)
      : table_(table), sink_(sink) {}

  void Run(ast::Program const& program) {
    for (auto const& global : program.globals()) {
      DeclareVariable(table_->global(), global, "variable");
    }

    std::vector<std::pair<Scope*, ast::Body const*>> bodies;
    for (auto const& proc : program.procs()) {
      auto result = table_->Declare(table_->proc_group(), proc.name(),
                                    ProcedureInfo(&proc));
      if (!result.ok()) {
        sink_->LineError(ErrorCategory::NAME_RULE_VIOLATION, proc.name().line(),
                         "Duplicate procedure name '%s'", *proc.name());
      }
      Scope* local = table_->AddLocalScope(table_->proc_group(), *proc.name());
      DeclareParamsAndLocals(local, proc.params(), proc.body().locals());
      bodies.emplace_back(local, &proc.body());
    }

    std::vector<std::pair<Scope*, ast::FuncDef const*>> funcs;
    for (auto const& func : program.funcs()) {
      auto result = table_->Declare(table_->func_group(), func.name(),
                                    FunctionInfo(&func));
      if (!result.ok()) {
        sink_->LineError(ErrorCategory::NAME_RULE_VIOLATION, func.name().line(),
                         "Duplicate function name '%s'", *func.name());
      }
      Scope* local = table_->AddLocalScope(table_->func_group(), *func.name());
      DeclareParamsAndLocals(local, func.params(), func.body().locals());
      funcs.emplace_back(local, &func);
    }

    for (auto const& var : program.main().locals()) {
      DeclareVariable(table_->main(), var, "variable");
    }

    CheckEverywhereRule();

    for (auto const& [scope, body] : bodies) {
      ResolveAlgorithm(scope, body->algorithm());
    }
    for (auto const& [scope, func] : funcs) {
      ResolveAlgorithm(scope, func->body().algorithm());
      ResolveAtom(scope, func->return_value());
    }
    ResolveAlgorithm(table_->main(), program.main().algorithm());
  }

 private:
  void DeclareVariable(Scope* scope, ast::NameNode const& name,
                       std::string_view what) {
    auto result = table_->Declare(scope, name, VariableInfo());
    if (!result.ok()) {
      sink_->LineError(ErrorCategory::NAME_RULE_VIOLATION, name.line(),
                       "Duplicate %s name '%s' in same scope", what, *name);
    }
  }

  void DeclareParamsAndLocals(Scope* scope,
                              std::vector<ast::NameNode> const& params,
                              std::vector<ast::NameNode> const& locals) {
    for (auto const& param : params) {
      DeclareVariable(scope, param, "parameter");
    }
    absl::flat_hash_set<std::string_view> param_names;
    for (auto const& param : params) {
      param_names.insert(*param);
    }
    for (auto const& local : locals) {
      if (param_names.contains(*local)) {
        sink_->LineError(ErrorCategory::NAME_RULE_VIOLATION, local.line(),
                         "Local variable '%s' shadows parameter", *local);
        continue;
      }
      DeclareVariable(scope, local, "variable");
    }
  }

  // No name may denote more than one of variable, procedure and function
  // anywhere in the program.
  void CheckEverywhereRule() {
    struct Uses {
      Symbol const* variable = nullptr;
      Symbol const* procedure = nullptr;
      Symbol const* function = nullptr;
    };
    absl::btree_map<std::string, Uses> uses;
    for (Scope const* scope : table_->scopes()) {
      for (Symbol const* symbol : scope->symbols()) {
        auto& entry = uses[symbol->name()];
        Symbol const** slot = nullptr;
        switch (symbol->category()) {
          case SymbolCategory::VARIABLE:
            slot = &entry.variable;
            break;
          case SymbolCategory::PROCEDURE:
            slot = &entry.procedure;
            break;
          case SymbolCategory::FUNCTION:
            slot = &entry.function;
            break;
        }
        if (*slot == nullptr) {
          *slot = symbol;
        }
      }
    }

    for (auto const& [name, entry] : uses) {
      if (entry.variable && entry.procedure) {
        sink_->LineError(ErrorCategory::NAME_RULE_VIOLATION,
                         entry.procedure->line(),
                         "Variable name '%s' conflicts with procedure name",
                         name);
      }
      if (entry.variable && entry.function) {
        sink_->LineError(ErrorCategory::NAME_RULE_VIOLATION,
                         entry.function->line(),
                         "Variable name '%s' conflicts with function name",
                         name);
      }
      if (entry.procedure && entry.function) {
        sink_->LineError(ErrorCategory::NAME_RULE_VIOLATION,
                         entry.function->line(),
                         "Procedure name '%s' conflicts with function name",
                         name);
      }
    }
  }

  void ResolveVariable(Scope const* scope, ast::NameNode const& use) {
    auto const* symbol = table_->LookupVariable(scope, *use);
    if (!symbol) {
      sink_->LineError(ErrorCategory::UNDECLARED_REFERENCE, use.line(),
                       "Undeclared variable '%s'", *use);
      return;
    }
    table_->BindUse(&use, symbol);
  }

  void ResolveAtom(Scope const* scope, ast::Atom const& atom) {
    if (auto const* var = atom.try_get<ast::VarAtom>()) {
      ResolveVariable(scope, var->name());
    }
  }

  void ResolveArgs(Scope const* scope, std::vector<ast::Atom> const& args) {
    for (auto const& arg : args) {
      ResolveAtom(scope, arg);
    }
  }

  // Call names resolve against the procedure and function groups only. A
  // name found in the other group is still bound, so that the type checker
  // can report the call kind mismatch.
  void ResolveCallee(ast::NameNode const& callee, Scope const* primary,
                     Scope const* secondary, std::string_view what) {
    auto const* symbol = primary->LookupLocal(*callee);
    if (!symbol) {
      symbol = secondary->LookupLocal(*callee);
    }
    if (!symbol) {
      sink_->LineError(ErrorCategory::UNDECLARED_REFERENCE, callee.line(),
                       "Undeclared %s '%s'", what, *callee);
      return;
    }
    table_->BindUse(&callee, symbol);
  }

  void ResolveTerm(Scope const* scope, ast::Term const& term) {
    term.visit(
        [&](ast::AtomTerm const& atom) { ResolveAtom(scope, atom.atom()); },
        [&](ast::UnaryTerm const& unary) {
          ResolveTerm(scope, unary.operand());
        },
        [&](ast::BinaryTerm const& binary) {
          ResolveTerm(scope, binary.lhs());
          ResolveTerm(scope, binary.rhs());
        });
  }

  void ResolveAlgorithm(Scope const* scope, ast::Algorithm const& algorithm) {
    for (auto const& instr : algorithm) {
      ResolveInstruction(scope, *instr);
    }
  }

  void ResolveInstruction(Scope const* scope, ast::Instruction const& instr) {
    instr.visit(
        [&](ast::HaltInstr const&) {},
        [&](ast::PrintInstr const& print) {
          if (auto const* atom = print.output().try_get<ast::Atom>()) {
            ResolveAtom(scope, *atom);
          }
        },
        [&](ast::CallInstr const& call) {
          ResolveCallee(call.callee(), table_->proc_group(),
                        table_->func_group(), "procedure");
          ResolveArgs(scope, call.args());
        },
        [&](ast::AssignCallInstr const& call) {
          ResolveVariable(scope, call.target());
          ResolveCallee(call.callee(), table_->func_group(),
                        table_->proc_group(), "function");
          ResolveArgs(scope, call.args());
        },
        [&](ast::AssignTermInstr const& assign) {
          ResolveVariable(scope, assign.target());
          ResolveTerm(scope, assign.value());
        },
        [&](ast::WhileInstr const& loop) {
          ResolveTerm(scope, loop.condition());
          ResolveAlgorithm(scope, loop.body());
        },
        [&](ast::DoUntilInstr const& loop) {
          ResolveAlgorithm(scope, loop.body());
          ResolveTerm(scope, loop.condition());
        },
        [&](ast::IfInstr const& branch) {
          ResolveTerm(scope, branch.condition());
          ResolveAlgorithm(scope, branch.then_body());
        },
        [&](ast::IfElseInstr const& branch) {
          ResolveTerm(scope, branch.condition());
          ResolveAlgorithm(scope, branch.then_body());
          ResolveAlgorithm(scope, branch.else_body());
        });
  }

  SymbolTable* table_;
  diag::DiagnosticsSink* sink_;
};

}  // namespace

std::unique_ptr<SymbolTable> ResolveScopes(ast::Program const& program,
                                           diag::DiagnosticsSink* sink) {
  auto table = std::make_unique<SymbolTable>();
  ScopeResolver resolver(table.get(), sink);
  resolver.Run(program);
  return table;
}

}  // namespace sem
