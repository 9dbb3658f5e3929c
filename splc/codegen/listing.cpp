#include "splc/codegen/listing.hpp"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/text_sink.hpp"

namespace codegen {
namespace {

char const* ArithSymbol(ArithOp op) {
  switch (op) {
    case ArithOp::ADD:
      return "+";
    case ArithOp::SUB:
      return "-";
    case ArithOp::MUL:
      return "*";
    case ArithOp::DIV:
      return "/";
  }
  return "?";
}

char const* CompareSymbol(CompareOp op) {
  switch (op) {
    case CompareOp::EQ:
      return "=";
    case CompareOp::GT:
      return ">";
  }
  return "?";
}

std::string FormatArgs(std::vector<Operand> const& args) {
  std::vector<std::string> parts;
  parts.reserve(args.size());
  for (auto const& arg : args) {
    parts.push_back(FormatOperand(arg));
  }
  return absl::StrJoin(parts, ", ");
}

}  // namespace

std::string FormatOperand(Operand const& operand) {
  return operand.visit([](VarRef const& var) { return var.name(); },
                       [](NumLit const& num) { return absl::StrCat(num.value()); });
}

std::string FormatExpr(NumExpr const& expr) {
  return expr.visit(
      [](Operand const& operand) { return FormatOperand(operand); },
      [](NegExpr const& neg) {
        return absl::StrCat("-(", FormatExpr(neg.operand()), ")");
      },
      [](ArithExpr const& arith) {
        return absl::StrCat("(", FormatExpr(arith.lhs()), " ",
                            ArithSymbol(arith.op()), " ",
                            FormatExpr(arith.rhs()), ")");
      });
}

std::string FormatComparison(Comparison const& comparison) {
  return absl::StrCat(FormatExpr(comparison.lhs()), " ",
                      CompareSymbol(comparison.op()), " ",
                      FormatExpr(comparison.rhs()));
}

std::string FormatTarget(JumpTarget const& target) {
  return target.visit([](Label const& label) { return label.name(); },
                      [](Address const& address) {
                        return absl::StrCat(address.value());
                      });
}

std::string FormatInstr(Instr const& instr) {
  return instr.visit(
      [](AssignInstr const& assign) {
        return absl::StrCat(assign.target(), " = ", FormatExpr(assign.value()));
      },
      [](PrintInstr const& print) {
        return print.arg().visit(
            [](Operand const& operand) {
              return absl::StrCat("PRINT ", FormatOperand(operand));
            },
            [](StringLit const& text) {
              return absl::StrFormat("PRINT \"%s\"", text.text());
            });
      },
      [](HaltInstr const&) { return std::string("STOP"); },
      [](CallInstr const& call) {
        return absl::StrCat("CALL ", call.callee(), "(", FormatArgs(call.args()),
                            ")");
      },
      [](CallAssignInstr const& call) {
        return absl::StrCat(call.target(), " = CALL ", call.callee(), "(",
                            FormatArgs(call.args()), ")");
      },
      [](IfGotoInstr const& jump) {
        return absl::StrCat("IF ", FormatComparison(jump.condition()), " THEN ",
                            FormatTarget(jump.target()));
      },
      [](GotoInstr const& jump) {
        return absl::StrCat("GOTO ", FormatTarget(jump.target()));
      },
      [](LabelInstr const& label) {
        return absl::StrCat("REM ", label.label().name());
      });
}

bool WriteInstrListing(InstrList const& instrs, TextSink* sink) {
  for (auto const& instr : instrs) {
    if (!sink->WriteLine("%s", FormatInstr(instr))) {
      return false;
    }
  }
  return true;
}

}  // namespace codegen
