#include "splc/sem/type_checker.hpp"

#include <string_view>
#include <vector>

#include "splc/ast/ast.hpp"
#include "splc/diagnostics/diagnostics.hpp"
#include "splc/sem/symbol_table.hpp"
#include "splc/sem/types.hpp"

namespace sem {

Type TypeTable::TypeOf(ast::Term const& term) const {
  auto it = terms_.find(&term);
  return it == terms_.end() ? Type::UNKNOWN : it->second;
}

Type TypeTable::TypeOf(ast::Atom const& atom) const {
  auto it = atoms_.find(&atom);
  return it == atoms_.end() ? Type::UNKNOWN : it->second;
}

namespace {

using diag::ErrorCategory;

class TypeChecker {
 public:
  TypeChecker(SymbolTable const* symbols, TypeTable* types,
              diag::DiagnosticsSink* sink)
      : symbols_(symbols), types_(types), sink_(sink) {}

  void Run(ast::Program const& program) {
    for (auto const& proc : program.procs()) {
      CheckAlgorithm(proc.body().algorithm());
    }
    for (auto const& func : program.funcs()) {
      CheckAlgorithm(func.body().algorithm());
      Type ret = CheckAtom(func.return_value());
      if (!Unify(ret, Type::NUMERIC)) {
        sink_->LineError(ErrorCategory::INVALID_RETURN_TYPE,
                         func.return_value().line(),
                         "function return must be numeric, got %s",
                         TypeName(ret));
      }
    }
    CheckAlgorithm(program.main().algorithm());
  }

 private:
  Type CheckAtom(ast::Atom const& atom) {
    Type type = atom.visit(
        [&](ast::VarAtom const& var) {
          auto const* symbol = symbols_->LookupUse(&var.name());
          if (!symbol) {
            return Type::UNKNOWN;
          }
          auto const* info = symbol->details().try_get<VariableInfo>();
          return info ? info->type() : Type::UNKNOWN;
        },
        [](ast::NumAtom const&) { return Type::NUMERIC; });
    types_->SetType(atom, type);
    return type;
  }

  Type CheckTerm(ast::Term const& term) {
    Type type = term.visit(
        [&](ast::AtomTerm const& atom) { return CheckAtom(atom.atom()); },
        [&](ast::UnaryTerm const& unary) { return CheckUnary(unary); },
        [&](ast::BinaryTerm const& binary) { return CheckBinary(binary); });
    types_->SetType(term, type);
    return type;
  }

  Type CheckUnary(ast::UnaryTerm const& unary) {
    Type expected =
        unary.op().value() == ast::UnaryOp::NEG ? Type::NUMERIC : Type::BOOLEAN;
    Type operand = CheckTerm(unary.operand());
    if (!Unify(operand, expected)) {
      sink_->LineError(ErrorCategory::TYPE_MISMATCH, unary.op().line(),
                       "Unary operator %s expects %s operand, got %s",
                       ast::OpName(unary.op().value()), TypeName(expected),
                       TypeName(operand));
    }
    return expected;
  }

  Type CheckBinary(ast::BinaryTerm const& binary) {
    ast::BinaryOp op = binary.op().value();
    Type operand_type = ast::IsBoolean(op) ? Type::BOOLEAN : Type::NUMERIC;
    Type result_type = ast::IsArithmetic(op) ? Type::NUMERIC : Type::BOOLEAN;

    Type lhs = CheckTerm(binary.lhs());
    Type rhs = CheckTerm(binary.rhs());
    if (!Unify(lhs, operand_type) || !Unify(rhs, operand_type)) {
      sink_->LineError(ErrorCategory::TYPE_MISMATCH, binary.op().line(),
                       "Binary operator %s expects %s operands, got %s and %s",
                       ast::OpName(op), TypeName(operand_type), TypeName(lhs),
                       TypeName(rhs));
    }
    return result_type;
  }

  void CheckCondition(ast::Term const& condition, std::string_view what) {
    Type type = CheckTerm(condition);
    if (!Unify(type, Type::BOOLEAN)) {
      sink_->LineError(ErrorCategory::INVALID_CONDITION_TYPE, condition.line(),
                       "%s-condition must be boolean, got %s", what,
                       TypeName(type));
    }
  }

  void CheckNumericAtom(ast::Atom const& atom, std::string_view what) {
    Type type = CheckAtom(atom);
    if (!Unify(type, Type::NUMERIC)) {
      sink_->LineError(ErrorCategory::TYPE_MISMATCH, atom.line(),
                       "%s must be numeric, got %s", what, TypeName(type));
    }
  }

  // Checks that `callee` names a symbol of `category` taking as many
  // parameters as `args` supplies, then types the arguments.
  void CheckCall(ast::NameNode const& callee,
                 std::vector<ast::Atom> const& args, SymbolCategory category) {
    for (auto const& arg : args) {
      CheckNumericAtom(arg, "call argument");
    }

    auto const* symbol = symbols_->LookupUse(&callee);
    if (!symbol) {
      return;
    }
    if (symbol->category() != category) {
      sink_->LineError(ErrorCategory::UNDECLARED_REFERENCE, callee.line(),
                       "'%s' is not a %s", *callee, CategoryName(category));
      return;
    }
    std::size_t expected = symbol->params().size();
    if (expected != args.size()) {
      sink_->LineError(ErrorCategory::ARITY_MISMATCH, callee.line(),
                       "%s '%s' expects %d args, got %d",
                       CategoryName(category), *callee, expected, args.size());
    }
  }

  void CheckAlgorithm(ast::Algorithm const& algorithm) {
    for (auto const& instr : algorithm) {
      CheckInstruction(*instr);
    }
  }

  void CheckInstruction(ast::Instruction const& instr) {
    instr.visit(
        [&](ast::HaltInstr const&) {},
        [&](ast::PrintInstr const& print) {
          if (auto const* atom = print.output().try_get<ast::Atom>()) {
            CheckNumericAtom(*atom, "print atom");
          }
        },
        [&](ast::CallInstr const& call) {
          CheckCall(call.callee(), call.args(), SymbolCategory::PROCEDURE);
        },
        [&](ast::AssignCallInstr const& call) {
          CheckCall(call.callee(), call.args(), SymbolCategory::FUNCTION);
        },
        [&](ast::AssignTermInstr const& assign) {
          Type type = CheckTerm(assign.value());
          if (!Unify(type, Type::NUMERIC)) {
            sink_->LineError(ErrorCategory::TYPE_MISMATCH,
                             assign.target().line(),
                             "assignment RHS must be numeric, got %s",
                             TypeName(type));
          }
        },
        [&](ast::WhileInstr const& loop) {
          CheckCondition(loop.condition(), "while");
          CheckAlgorithm(loop.body());
        },
        [&](ast::DoUntilInstr const& loop) {
          CheckAlgorithm(loop.body());
          CheckCondition(loop.condition(), "until");
        },
        [&](ast::IfInstr const& branch) {
          CheckCondition(branch.condition(), "if");
          CheckAlgorithm(branch.then_body());
        },
        [&](ast::IfElseInstr const& branch) {
          CheckCondition(branch.condition(), "if");
          CheckAlgorithm(branch.then_body());
          CheckAlgorithm(branch.else_body());
        });
  }

  SymbolTable const* symbols_;
  TypeTable* types_;
  diag::DiagnosticsSink* sink_;
};

}  // namespace

TypeTable CheckTypes(ast::Program const& program, SymbolTable const& symbols,
                     diag::DiagnosticsSink* sink) {
  TypeTable types;
  TypeChecker checker(&symbols, &types, sink);
  checker.Run(program);
  return types;
}

}  // namespace sem
