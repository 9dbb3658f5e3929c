#include "splc/codegen/code_generator.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "splc/ast/ast.hpp"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/names.hpp"
#include "util/status/status_macros.hpp"

namespace codegen {
namespace {

Operand LowerAtom(ast::Atom const& atom) {
  return atom.visit(
      [](ast::VarAtom const& var) { return Operand(VarRef(*var.name())); },
      [](ast::NumAtom const& num) { return Operand(NumLit(*num.value())); });
}

std::vector<Operand> LowerArgs(std::vector<ast::Atom> const& args) {
  std::vector<Operand> result;
  result.reserve(args.size());
  for (auto const& arg : args) {
    result.push_back(LowerAtom(arg));
  }
  return result;
}

// Returns nullopt for the boolean and comparison operators.
std::optional<ArithOp> ToArithOp(ast::BinaryOp op) {
  switch (op) {
    case ast::BinaryOp::PLUS:
      return ArithOp::ADD;
    case ast::BinaryOp::MINUS:
      return ArithOp::SUB;
    case ast::BinaryOp::MULT:
      return ArithOp::MUL;
    case ast::BinaryOp::DIV:
      return ArithOp::DIV;
    case ast::BinaryOp::AND:
    case ast::BinaryOp::OR:
    case ast::BinaryOp::EQ:
    case ast::BinaryOp::GT:
      return std::nullopt;
  }
  return std::nullopt;
}

std::vector<std::string> NamesOf(std::vector<ast::NameNode> const& nodes) {
  std::vector<std::string> names;
  names.reserve(nodes.size());
  for (auto const& node : nodes) {
    names.push_back(node.value());
  }
  return names;
}

class CodeGenerator {
 public:
  CodeGenerator(NameGenerator* names, InstrList* out)
      : names_(names), out_(out) {}

  absl::Status GenAlgorithm(ast::Algorithm const& algorithm) {
    for (auto const& instr : algorithm) {
      RETURN_IF_ERROR(GenInstruction(*instr));
    }
    return absl::OkStatus();
  }

 private:
  template <class T, class... Args>
  void Emit(Args&&... args) {
    out_->push_back(Instr::Make<T>(std::forward<Args>(args)...));
  }

  void EmitLabel(Label const& label) { Emit<LabelInstr>(label); }
  void EmitGoto(Label const& label) { Emit<GotoInstr>(JumpTarget(label)); }

  absl::StatusOr<NumExpr> LowerNumeric(ast::Term const& term) {
    return term.visit(
        [&](ast::AtomTerm const& atom) -> absl::StatusOr<NumExpr> {
          return NumExpr(LowerAtom(atom.atom()));
        },
        [&](ast::UnaryTerm const& unary) -> absl::StatusOr<NumExpr> {
          if (unary.op().value() != ast::UnaryOp::NEG) {
            return BooleanInNumericContext(ast::OpName(unary.op().value()),
                                           unary.op().line());
          }
          ASSIGN_OR_RETURN(auto operand, LowerNumeric(unary.operand()));
          return NumExpr::Make<NegExpr>(
              std::make_unique<NumExpr>(std::move(operand)));
        },
        [&](ast::BinaryTerm const& binary) -> absl::StatusOr<NumExpr> {
          ast::BinaryOp op = binary.op().value();
          std::optional<ArithOp> arith_op = ToArithOp(op);
          if (!arith_op) {
            return BooleanInNumericContext(ast::OpName(op), binary.op().line());
          }
          ASSIGN_OR_RETURN(auto lhs, LowerNumeric(binary.lhs()));
          ASSIGN_OR_RETURN(auto rhs, LowerNumeric(binary.rhs()));
          return NumExpr::Make<ArithExpr>(
              *arith_op, std::make_unique<NumExpr>(std::move(lhs)),
              std::make_unique<NumExpr>(std::move(rhs)));
        });
  }

  static absl::Status BooleanInNumericContext(std::string_view op, int line) {
    return absl::InternalError(absl::StrFormat(
        "line %d: boolean operator '%s' in a numeric context", line, op));
  }

  static absl::Status NumericInBooleanContext(ast::Term const& term) {
    return absl::InternalError(absl::StrFormat(
        "line %d: numeric term in a boolean context", term.line()));
  }

  absl::StatusOr<Comparison> LowerComparison(ast::BinaryTerm const& binary) {
    ASSIGN_OR_RETURN(auto lhs, LowerNumeric(binary.lhs()));
    ASSIGN_OR_RETURN(auto rhs, LowerNumeric(binary.rhs()));
    CompareOp op = binary.op().value() == ast::BinaryOp::EQ ? CompareOp::EQ
                                                            : CompareOp::GT;
    return Comparison(op, std::move(lhs), std::move(rhs));
  }

  // Emits code that jumps to `target` if `cond` holds and falls through
  // otherwise. Operands of `and` and `or` are only evaluated as needed.
  absl::Status JumpIfTrue(ast::Term const& cond, Label const& target) {
    auto const* binary = cond.try_get<ast::BinaryTerm>();
    if (auto const* unary = cond.try_get<ast::UnaryTerm>()) {
      if (unary->op().value() != ast::UnaryOp::NOT) {
        return NumericInBooleanContext(cond);
      }
      return JumpIfFalse(unary->operand(), target);
    }
    if (!binary) {
      return NumericInBooleanContext(cond);
    }

    switch (binary->op().value()) {
      case ast::BinaryOp::EQ:
      case ast::BinaryOp::GT: {
        ASSIGN_OR_RETURN(auto comparison, LowerComparison(*binary));
        Emit<IfGotoInstr>(std::move(comparison), JumpTarget(target));
        return absl::OkStatus();
      }
      case ast::BinaryOp::AND: {
        Label skip = names_->NewLabel("S");
        RETURN_IF_ERROR(JumpIfFalse(binary->lhs(), skip));
        RETURN_IF_ERROR(JumpIfTrue(binary->rhs(), target));
        EmitLabel(skip);
        return absl::OkStatus();
      }
      case ast::BinaryOp::OR:
        RETURN_IF_ERROR(JumpIfTrue(binary->lhs(), target));
        return JumpIfTrue(binary->rhs(), target);
      default:
        return NumericInBooleanContext(cond);
    }
  }

  // Emits code that jumps to `target` if `cond` does not hold and falls
  // through otherwise.
  absl::Status JumpIfFalse(ast::Term const& cond, Label const& target) {
    auto const* binary = cond.try_get<ast::BinaryTerm>();
    if (auto const* unary = cond.try_get<ast::UnaryTerm>()) {
      if (unary->op().value() != ast::UnaryOp::NOT) {
        return NumericInBooleanContext(cond);
      }
      return JumpIfTrue(unary->operand(), target);
    }
    if (!binary) {
      return NumericInBooleanContext(cond);
    }

    switch (binary->op().value()) {
      case ast::BinaryOp::EQ:
      case ast::BinaryOp::GT: {
        // There is no negated comparison, so jump over the exit instead.
        Label holds = names_->NewLabel("C");
        ASSIGN_OR_RETURN(auto comparison, LowerComparison(*binary));
        Emit<IfGotoInstr>(std::move(comparison), JumpTarget(holds));
        EmitGoto(target);
        EmitLabel(holds);
        return absl::OkStatus();
      }
      case ast::BinaryOp::AND:
        RETURN_IF_ERROR(JumpIfFalse(binary->lhs(), target));
        return JumpIfFalse(binary->rhs(), target);
      case ast::BinaryOp::OR: {
        Label done = names_->NewLabel("S");
        RETURN_IF_ERROR(JumpIfTrue(binary->lhs(), done));
        RETURN_IF_ERROR(JumpIfFalse(binary->rhs(), target));
        EmitLabel(done);
        return absl::OkStatus();
      }
      default:
        return NumericInBooleanContext(cond);
    }
  }

  absl::Status GenInstruction(ast::Instruction const& instr) {
    return instr.visit(
        [&](ast::HaltInstr const&) {
          Emit<HaltInstr>();
          return absl::OkStatus();
        },
        [&](ast::PrintInstr const& print) {
          print.output().visit(
              [&](ast::Atom const& atom) {
                Emit<PrintInstr>(PrintArg(LowerAtom(atom)));
              },
              [&](ast::StringOutput const& text) {
                Emit<PrintInstr>(PrintArg(StringLit(*text.text())));
              });
          return absl::OkStatus();
        },
        [&](ast::CallInstr const& call) {
          Emit<CallInstr>(*call.callee(), LowerArgs(call.args()));
          return absl::OkStatus();
        },
        [&](ast::AssignCallInstr const& call) {
          Emit<CallAssignInstr>(*call.target(), *call.callee(),
                                LowerArgs(call.args()));
          return absl::OkStatus();
        },
        [&](ast::AssignTermInstr const& assign) -> absl::Status {
          ASSIGN_OR_RETURN(auto value, LowerNumeric(assign.value()));
          Emit<AssignInstr>(*assign.target(), std::move(value));
          return absl::OkStatus();
        },
        [&](ast::WhileInstr const& loop) -> absl::Status {
          Label start = names_->NewLabel("W");
          Label body = names_->NewLabel("B");
          Label exit = names_->NewLabel("X");
          EmitLabel(start);
          RETURN_IF_ERROR(JumpIfTrue(loop.condition(), body));
          EmitGoto(exit);
          EmitLabel(body);
          RETURN_IF_ERROR(GenAlgorithm(loop.body()));
          EmitGoto(start);
          EmitLabel(exit);
          return absl::OkStatus();
        },
        [&](ast::DoUntilInstr const& loop) -> absl::Status {
          Label start = names_->NewLabel("D");
          Label exit = names_->NewLabel("X");
          EmitLabel(start);
          RETURN_IF_ERROR(GenAlgorithm(loop.body()));
          RETURN_IF_ERROR(JumpIfTrue(loop.condition(), exit));
          EmitGoto(start);
          EmitLabel(exit);
          return absl::OkStatus();
        },
        [&](ast::IfInstr const& branch) -> absl::Status {
          Label then = names_->NewLabel("T");
          Label exit = names_->NewLabel("X");
          RETURN_IF_ERROR(JumpIfTrue(branch.condition(), then));
          EmitGoto(exit);
          EmitLabel(then);
          RETURN_IF_ERROR(GenAlgorithm(branch.then_body()));
          EmitLabel(exit);
          return absl::OkStatus();
        },
        [&](ast::IfElseInstr const& branch) -> absl::Status {
          Label then = names_->NewLabel("T");
          Label exit = names_->NewLabel("X");
          RETURN_IF_ERROR(JumpIfTrue(branch.condition(), then));
          RETURN_IF_ERROR(GenAlgorithm(branch.else_body()));
          EmitGoto(exit);
          EmitLabel(then);
          RETURN_IF_ERROR(GenAlgorithm(branch.then_body()));
          EmitLabel(exit);
          return absl::OkStatus();
        });
  }

  NameGenerator* names_;
  InstrList* out_;
};

}  // namespace

absl::Status GenerateAlgorithm(ast::Algorithm const& algorithm,
                               NameGenerator* names, InstrList* out) {
  CodeGenerator generator(names, out);
  return generator.GenAlgorithm(algorithm);
}

absl::StatusOr<ModuleCode> GenerateCode(ast::Program const& program,
                                        NameGenerator* names) {
  ModuleCode module;
  for (auto const& proc : program.procs()) {
    Routine routine{.name = *proc.name(),
                    .params = NamesOf(proc.params()),
                    .locals = NamesOf(proc.body().locals())};
    RETURN_IF_ERROR(
        GenerateAlgorithm(proc.body().algorithm(), names, &routine.body));
    module.procs.emplace(routine.name, std::move(routine));
  }
  for (auto const& func : program.funcs()) {
    Routine routine{.name = *func.name(),
                    .params = NamesOf(func.params()),
                    .locals = NamesOf(func.body().locals()),
                    .result = LowerAtom(func.return_value())};
    RETURN_IF_ERROR(
        GenerateAlgorithm(func.body().algorithm(), names, &routine.body));
    module.funcs.emplace(routine.name, std::move(routine));
  }
  RETURN_IF_ERROR(
      GenerateAlgorithm(program.main().algorithm(), names, &module.main));
  return module;
}

}  // namespace codegen
