#include "splc/codegen/instr.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"

namespace codegen {

std::string Label::name() const {
  return absl::StrFormat("%s%04d", prefix_, id_);
}

Operand RewriteOperand(Operand const& operand, VarMapper vars) {
  return operand.visit(
      [&](VarRef const& var) { return Operand(VarRef(vars(var.name()))); },
      [](NumLit const& num) { return Operand(num); });
}

NumExpr RewriteExpr(NumExpr const& expr, VarMapper vars) {
  return expr.visit(
      [&](Operand const& operand) {
        return NumExpr(RewriteOperand(operand, vars));
      },
      [&](NegExpr const& neg) {
        return NumExpr::Make<NegExpr>(
            std::make_unique<NumExpr>(RewriteExpr(neg.operand(), vars)));
      },
      [&](ArithExpr const& arith) {
        return NumExpr::Make<ArithExpr>(
            arith.op(),
            std::make_unique<NumExpr>(RewriteExpr(arith.lhs(), vars)),
            std::make_unique<NumExpr>(RewriteExpr(arith.rhs(), vars)));
      });
}

namespace {

std::vector<Operand> RewriteArgs(std::vector<Operand> const& args,
                                 VarMapper vars) {
  std::vector<Operand> result;
  result.reserve(args.size());
  for (auto const& arg : args) {
    result.push_back(RewriteOperand(arg, vars));
  }
  return result;
}

}  // namespace

Instr RewriteInstr(Instr const& instr, VarMapper vars, LabelMapper labels,
                   TargetMapper targets) {
  return instr.visit(
      [&](AssignInstr const& assign) {
        return Instr::Make<AssignInstr>(vars(assign.target()),
                                        RewriteExpr(assign.value(), vars));
      },
      [&](PrintInstr const& print) {
        return print.arg().visit(
            [&](Operand const& operand) {
              return Instr::Make<PrintInstr>(
                  PrintArg(RewriteOperand(operand, vars)));
            },
            [](StringLit const& text) {
              return Instr::Make<PrintInstr>(PrintArg(text));
            });
      },
      [](HaltInstr const&) { return Instr::Make<HaltInstr>(); },
      [&](CallInstr const& call) {
        return Instr::Make<CallInstr>(call.callee(),
                                      RewriteArgs(call.args(), vars));
      },
      [&](CallAssignInstr const& call) {
        return Instr::Make<CallAssignInstr>(vars(call.target()), call.callee(),
                                            RewriteArgs(call.args(), vars));
      },
      [&](IfGotoInstr const& jump) {
        Comparison const& cond = jump.condition();
        return Instr::Make<IfGotoInstr>(
            Comparison(cond.op(), RewriteExpr(cond.lhs(), vars),
                       RewriteExpr(cond.rhs(), vars)),
            targets(jump.target()));
      },
      [&](GotoInstr const& jump) {
        return Instr::Make<GotoInstr>(targets(jump.target()));
      },
      [&](LabelInstr const& label) {
        return Instr::Make<LabelInstr>(labels(label.label()));
      });
}

Instr CloneInstr(Instr const& instr) {
  return RewriteInstr(
      instr, [](std::string const& name) { return name; },
      [](Label const& label) { return label; },
      [](JumpTarget const& target) { return target; });
}

InstrList CloneInstrs(InstrList const& instrs) {
  InstrList result;
  result.reserve(instrs.size());
  for (auto const& instr : instrs) {
    result.push_back(CloneInstr(instr));
  }
  return result;
}

}  // namespace codegen
