#include "splc/codegen/listing.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/names.hpp"
#include "splc/codegen/text_sink.hpp"

namespace codegen {
namespace {

NumExpr Var(std::string name) { return NumExpr(Operand(VarRef(std::move(name)))); }
NumExpr Lit(int value) { return NumExpr(Operand(NumLit(value))); }
NumExpr Arith(ArithOp op, NumExpr lhs, NumExpr rhs) {
  return NumExpr::Make<ArithExpr>(op, std::make_unique<NumExpr>(std::move(lhs)),
                                  std::make_unique<NumExpr>(std::move(rhs)));
}
NumExpr Neg(NumExpr operand) {
  return NumExpr::Make<NegExpr>(std::make_unique<NumExpr>(std::move(operand)));
}

TEST(ListingTest, FormatsExpressionsFullyParenthesized) {
  EXPECT_EQ(FormatExpr(Lit(5)), "5");
  EXPECT_EQ(FormatExpr(Arith(ArithOp::ADD, Var("a"),
                             Arith(ArithOp::MUL, Var("b"), Lit(2)))),
            "(a + (b * 2))");
  EXPECT_EQ(FormatExpr(Neg(Arith(ArithOp::SUB, Var("a"), Lit(1)))),
            "-((a - 1))");
  EXPECT_EQ(FormatExpr(Arith(ArithOp::DIV, Neg(Var("x")), Lit(3))),
            "(-(x) / 3)");
}

TEST(ListingTest, FormatsEachInstruction) {
  Label label("T", 7);
  EXPECT_EQ(label.name(), "T0007");
  EXPECT_EQ(FormatInstr(Instr::Make<AssignInstr>("x", Lit(5))), "x = 5");
  EXPECT_EQ(FormatInstr(Instr::Make<PrintInstr>(PrintArg(Operand(VarRef("x"))))),
            "PRINT x");
  EXPECT_EQ(FormatInstr(Instr::Make<PrintInstr>(PrintArg(StringLit("Hi")))),
            "PRINT \"Hi\"");
  EXPECT_EQ(FormatInstr(Instr::Make<HaltInstr>()), "STOP");
  EXPECT_EQ(FormatInstr(Instr::Make<CallInstr>(
                "p", std::vector<Operand>{Operand(VarRef("x")),
                                          Operand(NumLit(1))})),
            "CALL p(x, 1)");
  EXPECT_EQ(FormatInstr(Instr::Make<CallAssignInstr>(
                "y", "f", std::vector<Operand>{Operand(VarRef("x"))})),
            "y = CALL f(x)");
  EXPECT_EQ(FormatInstr(Instr::Make<IfGotoInstr>(
                Comparison(CompareOp::GT, Var("x"), Lit(0)), JumpTarget(label))),
            "IF x > 0 THEN T0007");
  EXPECT_EQ(FormatInstr(Instr::Make<IfGotoInstr>(
                Comparison(CompareOp::EQ, Var("x"), Var("y")),
                JumpTarget(Address(40)))),
            "IF x = y THEN 40");
  EXPECT_EQ(FormatInstr(Instr::Make<GotoInstr>(JumpTarget(Address(10)))),
            "GOTO 10");
  EXPECT_EQ(FormatInstr(Instr::Make<LabelInstr>(label)), "REM T0007");
}

TEST(ListingTest, WritesOneLinePerInstruction) {
  InstrList instrs;
  instrs.push_back(Instr::Make<AssignInstr>("x", Lit(1)));
  instrs.push_back(Instr::Make<HaltInstr>());
  std::string text;
  auto sink = TextSink::String(&text);
  ASSERT_TRUE(WriteInstrListing(instrs, sink.get()));
  EXPECT_EQ(text, "x = 1\nSTOP\n");
}

TEST(NameGeneratorTest, NamesAreUniqueAndPrefixed) {
  NameGenerator names;
  EXPECT_EQ(names.NewLabel("T").name(), "T0001");
  EXPECT_EQ(names.NewLabel("X").name(), "X0002");
  EXPECT_EQ(names.FreshParam("a"), "P1a");
  EXPECT_EQ(names.FreshLocal("a"), "L2a");
  EXPECT_EQ(names.FreshParam("a"), "P3a");
  EXPECT_EQ(names.labels_issued(), 2);
  EXPECT_EQ(names.vars_issued(), 3);
}

TEST(RewriteTest, RenamesVariablesLabelsAndTargets) {
  Instr jump = Instr::Make<IfGotoInstr>(
      Comparison(CompareOp::GT, Arith(ArithOp::ADD, Var("a"), Var("g")),
                 Lit(0)),
      JumpTarget(Label("T", 1)));
  auto vars = [](std::string const& name) {
    return name == "a" ? std::string("P9a") : name;
  };
  auto labels = [](Label const& label) { return Label(label.prefix(), 42); };
  auto targets = [](JumpTarget const& target) {
    return target.has<Label>()
               ? JumpTarget(Label(target.as<Label>().prefix(), 42))
               : target;
  };
  EXPECT_EQ(FormatInstr(RewriteInstr(jump, vars, labels, targets)),
            "IF (P9a + g) > 0 THEN T0042");
  EXPECT_EQ(FormatInstr(RewriteInstr(Instr::Make<LabelInstr>(Label("X", 3)),
                                     vars, labels, targets)),
            "REM X0042");
  EXPECT_EQ(FormatInstr(RewriteInstr(
                Instr::Make<CallAssignInstr>(
                    "a", "f", std::vector<Operand>{Operand(VarRef("a"))}),
                vars, labels, targets)),
            "P9a = CALL f(P9a)");
}

TEST(RewriteTest, CloneIsStructurallyEqual) {
  InstrList instrs;
  instrs.push_back(Instr::Make<AssignInstr>(
      "x", Neg(Arith(ArithOp::MUL, Var("y"), Lit(3)))));
  instrs.push_back(Instr::Make<GotoInstr>(JumpTarget(Label("W", 1))));
  InstrList copy = CloneInstrs(instrs);
  ASSERT_EQ(copy.size(), 2u);
  EXPECT_EQ(FormatInstr(copy[0]), "x = -((y * 3))");
  EXPECT_EQ(FormatInstr(copy[1]), "GOTO W0001");
}

TEST(TextSinkTest, NullSinkAcceptsEverything) {
  auto sink = TextSink::Null();
  EXPECT_TRUE(sink->Write("anything"));
  EXPECT_TRUE(sink->WriteLine("%d", 3));
}

}  // namespace
}  // namespace codegen
