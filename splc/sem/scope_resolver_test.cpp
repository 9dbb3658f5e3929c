#include "splc/sem/scope_resolver.hpp"

#include <memory>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "splc/ast/ast.hpp"
#include "splc/ast/test_helpers.hpp"
#include "splc/diagnostics/diagnostics.hpp"
#include "splc/sem/symbol_table.hpp"

namespace sem {
namespace {

using ::ast::test::Algo;
using ::ast::test::Assign;
using ::ast::test::AssignCall;
using ::ast::test::Call;
using ::ast::test::Func;
using ::ast::test::Halt;
using ::ast::test::Num;
using ::ast::test::NumA;
using ::ast::test::Plus;
using ::ast::test::Print;
using ::ast::test::Proc;
using ::ast::test::ProgramBuilder;
using ::ast::test::Var;
using ::ast::test::VarA;
using ::diag::ErrorCategory;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Property;

class ScopeResolverTest : public ::testing::Test {
 protected:
  std::unique_ptr<SymbolTable> Resolve(ast::Program const& program) {
    return ResolveScopes(program, &diags_);
  }

  diag::DiagnosticsCollector diags_;
};

TEST_F(ScopeResolverTest, CleanProgramHasNoErrors) {
  auto program = ProgramBuilder()
                     .Globals({"g"})
                     .AddProc(Proc("p", {"a"}, {"t"},
                                   Algo(Assign("t", Plus(Var("a"), Var("g"))))))
                     .AddFunc(Func("f", {"a", "b"}, {}, Algo(), VarA("a")))
                     .MainVars({"x"})
                     .Build(Algo(Call("p", {VarA("x")}),
                                 AssignCall("x", "f", {NumA(1), VarA("g")}),
                                 Halt()));
  auto table = Resolve(program);
  EXPECT_EQ(diags_.error_count(), 0u);
  ASSERT_NE(table->global()->LookupLocal("g"), nullptr);
  ASSERT_NE(table->proc_group()->LookupLocal("p"), nullptr);
  ASSERT_NE(table->func_group()->LookupLocal("f"), nullptr);
  ASSERT_NE(table->main()->LookupLocal("x"), nullptr);
  // EVERYWHERE, GLOBAL, PROC_GROUP, FUNC_GROUP, MAIN and two LOCAL scopes.
  EXPECT_EQ(table->scopes().size(), 7u);
}

TEST_F(ScopeResolverTest, DuplicateGlobal) {
  auto program = ProgramBuilder().Globals({"x", "x"}).Build(Algo(Halt()));
  Resolve(program);
  EXPECT_THAT(diags_.ErrorsOf(ErrorCategory::NAME_RULE_VIOLATION),
              ElementsAre(Property(&diag::Diagnostic::message,
                                   "Duplicate variable name 'x' in same "
                                   "scope")));
}

TEST_F(ScopeResolverTest, EachDuplicateOccurrenceIsReported) {
  auto program =
      ProgramBuilder().MainVars({"a", "a", "a"}).Build(Algo(Halt()));
  Resolve(program);
  EXPECT_EQ(diags_.CountOf(ErrorCategory::NAME_RULE_VIOLATION), 2u);
}

TEST_F(ScopeResolverTest, DuplicateProcedureAndParameter) {
  auto program = ProgramBuilder()
                     .AddProc(Proc("p", {"a", "a"}, {}, Algo()))
                     .AddProc(Proc("p", {}, {}, Algo()))
                     .Build(Algo(Halt()));
  Resolve(program);
  EXPECT_THAT(
      diags_.ErrorsOf(ErrorCategory::NAME_RULE_VIOLATION),
      ElementsAre(
          Property(&diag::Diagnostic::message,
                   "Duplicate parameter name 'a' in same scope"),
          Property(&diag::Diagnostic::message, "Duplicate procedure name 'p'")));
}

TEST_F(ScopeResolverTest, LocalShadowingParameterIsAnError) {
  auto program = ProgramBuilder()
                     .AddFunc(Func("f", {"a"}, {"a"}, Algo(), VarA("a")))
                     .Build(Algo(Halt()));
  Resolve(program);
  EXPECT_THAT(diags_.ErrorsOf(ErrorCategory::NAME_RULE_VIOLATION),
              ElementsAre(Property(&diag::Diagnostic::message,
                                   "Local variable 'a' shadows parameter")));
}

TEST_F(ScopeResolverTest, EverywhereRuleCatchesCrossCategoryClashes) {
  auto program = ProgramBuilder()
                     .Globals({"p"})
                     .AddProc(Proc("p", {}, {}, Algo()))
                     .AddProc(Proc("q", {}, {}, Algo()))
                     .AddFunc(Func("q", {}, {}, Algo(), NumA(0)))
                     .AddFunc(Func("f", {}, {"f"}, Algo(), NumA(0)))
                     .Build(Algo(Halt()));
  Resolve(program);
  EXPECT_THAT(
      diags_.ErrorsOf(ErrorCategory::NAME_RULE_VIOLATION),
      ElementsAre(
          Property(&diag::Diagnostic::message,
                   "Variable name 'f' conflicts with function name"),
          Property(&diag::Diagnostic::message,
                   "Variable name 'p' conflicts with procedure name"),
          Property(&diag::Diagnostic::message,
                   "Procedure name 'q' conflicts with function name")));
}

TEST_F(ScopeResolverTest, UndeclaredReferencesDoNotStopThePass) {
  auto program = ProgramBuilder()
                     .MainVars({"x"})
                     .Build(Algo(Assign("y", Var("z")), Call("nope", {}),
                                 AssignCall("x", "gone", {}), Print(VarA("w")),
                                 Halt()));
  Resolve(program);
  EXPECT_THAT(diags_.ErrorsOf(ErrorCategory::UNDECLARED_REFERENCE),
              ElementsAre(Property(&diag::Diagnostic::message,
                                   "Undeclared variable 'y'"),
                          Property(&diag::Diagnostic::message,
                                   "Undeclared variable 'z'"),
                          Property(&diag::Diagnostic::message,
                                   "Undeclared procedure 'nope'"),
                          Property(&diag::Diagnostic::message,
                                   "Undeclared function 'gone'"),
                          Property(&diag::Diagnostic::message,
                                   "Undeclared variable 'w'")));
}

TEST_F(ScopeResolverTest, LocalsAreNotVisibleFromMain) {
  auto program = ProgramBuilder()
                     .AddProc(Proc("p", {"a"}, {"t"}, Algo()))
                     .Build(Algo(Assign("t", Num(1)), Halt()));
  Resolve(program);
  EXPECT_THAT(diags_.ErrorsOf(ErrorCategory::UNDECLARED_REFERENCE),
              ElementsAre(Property(&diag::Diagnostic::message,
                                   HasSubstr("'t'"))));
}

TEST_F(ScopeResolverTest, ParameterBindsBeforeGlobal) {
  auto program = ProgramBuilder()
                     .Globals({"a"})
                     .AddProc(Proc("p", {"a"}, {}, Algo(Assign("a", Num(1)))))
                     .Build(Algo(Assign("a", Num(2)), Halt()));
  auto table = Resolve(program);
  ASSERT_EQ(diags_.error_count(), 0u);

  auto const& proc_assign = program.procs()[0]
                                .body()
                                .algorithm()[0]
                                ->as<ast::AssignTermInstr>();
  auto const* proc_target = table->LookupUse(&proc_assign.target());
  ASSERT_NE(proc_target, nullptr);
  EXPECT_EQ(proc_target->scope().kind(), ScopeKind::LOCAL);
  EXPECT_EQ(proc_target->scope().owner(), "p");

  auto const& main_assign =
      program.main().algorithm()[0]->as<ast::AssignTermInstr>();
  auto const* main_target = table->LookupUse(&main_assign.target());
  ASSERT_NE(main_target, nullptr);
  EXPECT_EQ(main_target->scope().kind(), ScopeKind::GLOBAL);
}

TEST_F(ScopeResolverTest, AssigningToRoutineNameIsUndeclaredVariable) {
  auto program = ProgramBuilder()
                     .AddProc(Proc("p", {}, {}, Algo()))
                     .AddFunc(Func("f", {}, {}, Algo(), NumA(1)))
                     .Build(Algo(Assign("p", Num(1)), AssignCall("f", "f", {}),
                                 Halt()));
  auto table = Resolve(program);
  EXPECT_THAT(diags_.ErrorsOf(ErrorCategory::UNDECLARED_REFERENCE),
              ElementsAre(Property(&diag::Diagnostic::message,
                                   "Undeclared variable 'p'"),
                          Property(&diag::Diagnostic::message,
                                   "Undeclared variable 'f'")));
  auto const& assign = program.main().algorithm()[0]->as<ast::AssignTermInstr>();
  EXPECT_EQ(table->LookupUse(&assign.target()), nullptr);
}

TEST_F(ScopeResolverTest, CallOfWrongKindStillBinds) {
  auto program = ProgramBuilder()
                     .AddFunc(Func("f", {}, {}, Algo(), NumA(1)))
                     .Build(Algo(Call("f", {}), Halt()));
  auto table = Resolve(program);
  EXPECT_EQ(diags_.error_count(), 0u);
  auto const& call = program.main().algorithm()[0]->as<ast::CallInstr>();
  auto const* symbol = table->LookupUse(&call.callee());
  ASSERT_NE(symbol, nullptr);
  EXPECT_EQ(symbol->category(), SymbolCategory::FUNCTION);
}

}  // namespace
}  // namespace sem
