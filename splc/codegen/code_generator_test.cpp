#include "splc/codegen/code_generator.hpp"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "splc/ast/ast.hpp"
#include "splc/ast/test_helpers.hpp"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/listing.hpp"
#include "splc/codegen/names.hpp"
#include "util/status/status_matchers.hpp"

namespace codegen {
namespace {

using ::ast::test::Algo;
using ::ast::test::And;
using ::ast::test::Assign;
using ::ast::test::AssignCall;
using ::ast::test::Binary;
using ::ast::test::Call;
using ::ast::test::Div;
using ::ast::test::DoUntil;
using ::ast::test::Eq;
using ::ast::test::Func;
using ::ast::test::Gt;
using ::ast::test::Halt;
using ::ast::test::If;
using ::ast::test::IfElse;
using ::ast::test::Minus;
using ::ast::test::Mult;
using ::ast::test::Neg;
using ::ast::test::Not;
using ::ast::test::Num;
using ::ast::test::NumA;
using ::ast::test::Or;
using ::ast::test::Plus;
using ::ast::test::Print;
using ::ast::test::PrintStr;
using ::ast::test::Proc;
using ::ast::test::ProgramBuilder;
using ::ast::test::Var;
using ::ast::test::VarA;
using ::ast::test::While;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::util::status::StatusIs;

std::vector<std::string> Listing(InstrList const& instrs) {
  std::vector<std::string> lines;
  for (auto const& instr : instrs) {
    lines.push_back(FormatInstr(instr));
  }
  return lines;
}

class CodeGeneratorTest : public ::testing::Test {
 protected:
  std::vector<std::string> Lower(ast::Algorithm const& algorithm) {
    InstrList out;
    EXPECT_OK(GenerateAlgorithm(algorithm, &names_, &out));
    return Listing(out);
  }

  NameGenerator names_;
};

TEST_F(CodeGeneratorTest, StraightLineCode) {
  auto algo = Algo(Assign("x", Mult(Neg(Plus(Var("a"), Num(2))), Var("b"))),
                   Print(VarA("x")), PrintStr("done"), Halt());
  EXPECT_THAT(Lower(algo),
              ElementsAre("x = (-((a + 2)) * b)", "PRINT x", "PRINT \"done\"",
                          "STOP"));
  EXPECT_EQ(names_.labels_issued(), 0);
}

TEST_F(CodeGeneratorTest, IfJumpsOverThenBody) {
  auto algo = Algo(If(Gt(Var("x"), Num(0)), Algo(Print(VarA("x")))));
  EXPECT_THAT(Lower(algo),
              ElementsAre("IF x > 0 THEN T0001", "GOTO X0002", "REM T0001",
                          "PRINT x", "REM X0002"));
}

TEST_F(CodeGeneratorTest, IfElsePlacesElseBodyFirst) {
  auto algo = Algo(IfElse(Eq(Num(1), Num(1)), Algo(PrintStr("T")),
                          Algo(PrintStr("F"))),
                   Halt());
  EXPECT_THAT(Lower(algo),
              ElementsAre("IF 1 = 1 THEN T0001", "PRINT \"F\"", "GOTO X0002",
                          "REM T0001", "PRINT \"T\"", "REM X0002", "STOP"));
}

TEST_F(CodeGeneratorTest, WhileTestsBeforeBody) {
  auto algo = Algo(While(Gt(Var("x"), Num(0)),
                         Algo(Assign("x", Minus(Var("x"), Num(1))))));
  EXPECT_THAT(Lower(algo),
              ElementsAre("REM W0001", "IF x > 0 THEN B0002", "GOTO X0003",
                          "REM B0002", "x = (x - 1)", "GOTO W0001",
                          "REM X0003"));
}

TEST_F(CodeGeneratorTest, DoUntilRunsBodyFirst) {
  auto algo = Algo(DoUntil(Algo(Assign("x", Plus(Var("x"), Num(1)))),
                           Gt(Var("x"), Num(9))));
  EXPECT_THAT(Lower(algo),
              ElementsAre("REM D0001", "x = (x + 1)", "IF x > 9 THEN X0002",
                          "GOTO D0001", "REM X0002"));
}

TEST_F(CodeGeneratorTest, AndSkipsSecondOperandWhenFirstFails) {
  auto algo = Algo(
      If(And(Gt(Var("a"), Num(0)), Gt(Var("b"), Num(0))), Algo(Halt())));
  EXPECT_THAT(Lower(algo),
              ElementsAre("IF a > 0 THEN C0004", "GOTO S0003", "REM C0004",
                          "IF b > 0 THEN T0001", "REM S0003", "GOTO X0002",
                          "REM T0001", "STOP", "REM X0002"));
}

TEST_F(CodeGeneratorTest, OrJumpsOnFirstTrueOperand) {
  auto algo = Algo(
      If(Or(Gt(Var("a"), Num(0)), Eq(Var("b"), Num(1))), Algo(Halt())));
  EXPECT_THAT(Lower(algo),
              ElementsAre("IF a > 0 THEN T0001", "IF b = 1 THEN T0001",
                          "GOTO X0002", "REM T0001", "STOP", "REM X0002"));
}

TEST_F(CodeGeneratorTest, NotSwapsJumpSense) {
  auto algo = Algo(If(Not(Eq(Var("a"), Num(0))), Algo(Halt())));
  EXPECT_THAT(Lower(algo),
              ElementsAre("IF a = 0 THEN C0003", "GOTO T0001", "REM C0003",
                          "GOTO X0002", "REM T0001", "STOP", "REM X0002"));
}

TEST_F(CodeGeneratorTest, CallsAreKeptForTheInliner) {
  auto algo = Algo(Call("p", {VarA("x"), NumA(1)}),
                   AssignCall("y", "f", {VarA("x")}));
  EXPECT_THAT(Lower(algo), ElementsAre("CALL p(x, 1)", "y = CALL f(x)"));
}

TEST_F(CodeGeneratorTest, BooleanInNumericContextIsInternalError) {
  auto algo = Algo(
      Assign("x", Binary(ast::BinaryOp::GT, Var("a"), Num(1), /*line=*/7)));
  InstrList out;
  EXPECT_THAT(GenerateAlgorithm(algo, &names_, &out),
              StatusIs(absl::StatusCode::kInternal,
                       "line 7: boolean operator 'gt' in a numeric context"));
}

TEST_F(CodeGeneratorTest, EachArithmeticOperatorKeepsItsMeaning) {
  auto algo = Algo(Assign(
      "x", Minus(Plus(Var("a"), Var("b")),
                 Mult(Var("c"), Div(Var("d"), Num(2))))));
  EXPECT_THAT(Lower(algo), ElementsAre("x = ((a + b) - (c * (d / 2)))"));
}

TEST_F(CodeGeneratorTest, LogicalOperatorInArithmeticIsInternalError) {
  auto algo = Algo(Assign(
      "x", Plus(Var("a"), Binary(ast::BinaryOp::OR, Gt(Var("a"), Num(0)),
                                 Eq(Var("b"), Num(0)), /*line=*/4))));
  InstrList out;
  EXPECT_THAT(GenerateAlgorithm(algo, &names_, &out),
              StatusIs(absl::StatusCode::kInternal,
                       "line 4: boolean operator 'or' in a numeric context"));
}

TEST_F(CodeGeneratorTest, NumericConditionIsInternalError) {
  auto algo = Algo(While(Plus(Var("a"), Num(1)), Algo(Halt())));
  InstrList out;
  EXPECT_THAT(GenerateAlgorithm(algo, &names_, &out),
              StatusIs(absl::StatusCode::kInternal,
                       HasSubstr("boolean context")));
}

TEST(GenerateCodeTest, LowersRoutinesSeparately) {
  auto program =
      ProgramBuilder()
          .Globals({"g"})
          .AddProc(Proc("p", {"a"}, {"t"},
                        Algo(Assign("t", Plus(Var("a"), Var("g"))),
                             Print(VarA("t")))))
          .AddFunc(Func("f", {"a", "b"}, {"r"},
                        Algo(Assign("r", Mult(Var("a"), Var("b")))),
                        VarA("r")))
          .MainVars({"x"})
          .Build(Algo(Call("p", {VarA("x")}),
                      AssignCall("x", "f", {VarA("x"), NumA(2)}), Halt()));
  NameGenerator names;
  ASSERT_OK_AND_ASSIGN(auto module, GenerateCode(program, &names));

  EXPECT_THAT(Listing(module.main),
              ElementsAre("CALL p(x)", "x = CALL f(x, 2)", "STOP"));

  ASSERT_EQ(module.procs.size(), 1u);
  Routine const& proc = module.procs.at("p");
  EXPECT_THAT(proc.params, ElementsAre("a"));
  EXPECT_THAT(proc.locals, ElementsAre("t"));
  EXPECT_THAT(Listing(proc.body), ElementsAre("t = (a + g)", "PRINT t"));
  EXPECT_FALSE(proc.result.has_value());

  ASSERT_EQ(module.funcs.size(), 1u);
  Routine const& func = module.funcs.at("f");
  EXPECT_THAT(func.params, ElementsAre("a", "b"));
  EXPECT_THAT(Listing(func.body), ElementsAre("r = (a * b)"));
  ASSERT_TRUE(func.result.has_value());
  EXPECT_EQ(FormatOperand(*func.result), "r");
}

TEST(GenerateCodeTest, EmptyProgram) {
  auto program = ProgramBuilder().Build(Algo());
  NameGenerator names;
  ASSERT_OK_AND_ASSIGN(auto module, GenerateCode(program, &names));
  EXPECT_THAT(module.main, IsEmpty());
  EXPECT_TRUE(module.procs.empty());
  EXPECT_TRUE(module.funcs.empty());
}

}  // namespace
}  // namespace codegen
