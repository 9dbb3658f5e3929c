#include "splc/sem/symbol_table.hpp"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "splc/ast/ast.hpp"
#include "splc/ast/test_helpers.hpp"
#include "util/status/status_matchers.hpp"

namespace sem {
namespace {

using ::ast::test::Name;
using ::testing::ElementsAre;
using ::util::status::StatusIs;

TEST(SymbolTableTest, FixedScopesFormATree) {
  SymbolTable table;
  EXPECT_EQ(table.everywhere()->kind(), ScopeKind::EVERYWHERE);
  EXPECT_EQ(table.everywhere()->parent(), nullptr);
  EXPECT_EQ(table.global()->parent(), table.everywhere());
  EXPECT_EQ(table.proc_group()->parent(), table.global());
  EXPECT_EQ(table.func_group()->parent(), table.global());
  EXPECT_EQ(table.main()->parent(), table.global());
  EXPECT_EQ(table.scopes().size(), 5u);
}

TEST(SymbolTableTest, DeclareAndLookupVariable) {
  SymbolTable table;
  auto name = Name("alpha", 3);
  ASSERT_OK_AND_ASSIGN(auto const* symbol,
                       table.Declare(table.global(), name, VariableInfo()));
  EXPECT_EQ(symbol->name(), "alpha");
  EXPECT_EQ(symbol->line(), 3);
  EXPECT_EQ(symbol->category(), SymbolCategory::VARIABLE);
  EXPECT_EQ(&symbol->scope(), table.global());
  EXPECT_EQ(table.global()->LookupLocal("alpha"), symbol);
  EXPECT_EQ(table.global()->LookupLocal("beta"), nullptr);
}

TEST(SymbolTableTest, DuplicateInSameScopeFails) {
  SymbolTable table;
  ASSERT_OK(table.Declare(table.global(), Name("x"), VariableInfo()));
  EXPECT_THAT(table.Declare(table.global(), Name("x"), VariableInfo()),
              StatusIs(absl::StatusCode::kAlreadyExists));
  // The same name in a different scope is fine.
  EXPECT_OK(table.Declare(table.main(), Name("x"), VariableInfo()));
}

TEST(SymbolTableTest, LookupVariableSearchesEnclosingScopes) {
  SymbolTable table;
  ASSERT_OK_AND_ASSIGN(auto const* global,
                       table.Declare(table.global(), Name("g"), VariableInfo()));
  Scope* local = table.AddLocalScope(table.proc_group(), "p");
  ASSERT_OK_AND_ASSIGN(auto const* shadow,
                       table.Declare(local, Name("s"), VariableInfo()));
  ASSERT_OK(table.Declare(table.global(), Name("s"), VariableInfo()));

  EXPECT_EQ(table.LookupVariable(local, "g"), global);
  EXPECT_EQ(table.LookupVariable(local, "s"), shadow);
  EXPECT_EQ(table.LookupVariable(table.main(), "g"), global);
  EXPECT_EQ(table.LookupVariable(table.main(), "nothere"), nullptr);
  EXPECT_EQ(local->owner(), "p");
  EXPECT_EQ(local->kind(), ScopeKind::LOCAL);
}

TEST(SymbolTableTest, LookupVariableSkipsProcedures) {
  ast::ProcDef proc(Name("p"), {}, ast::Body({}, {}));
  SymbolTable table;
  ASSERT_OK(table.Declare(table.proc_group(), proc.name(), ProcedureInfo(&proc)));
  Scope* local = table.AddLocalScope(table.proc_group(), "p");
  EXPECT_EQ(table.LookupVariable(local, "p"), nullptr);
}

TEST(SymbolTableTest, ProcedureParamsComeFromDefinition) {
  ast::ProcDef proc(Name("p"), ast::test::Names({"a", "b"}),
                    ast::Body({}, {}));
  SymbolTable table;
  ASSERT_OK_AND_ASSIGN(
      auto const* symbol,
      table.Declare(table.proc_group(), proc.name(), ProcedureInfo(&proc)));
  EXPECT_EQ(symbol->category(), SymbolCategory::PROCEDURE);
  EXPECT_THAT(symbol->params(), ElementsAre("a", "b"));
}

TEST(SymbolTableTest, BindsUses) {
  SymbolTable table;
  auto decl = Name("x");
  auto use = Name("x", 9);
  ASSERT_OK_AND_ASSIGN(auto const* symbol,
                       table.Declare(table.global(), decl, VariableInfo()));
  EXPECT_EQ(table.LookupUse(&use), nullptr);
  table.BindUse(&use, symbol);
  EXPECT_EQ(table.LookupUse(&use), symbol);
  EXPECT_EQ(table.bound_use_count(), 1u);
}

}  // namespace
}  // namespace sem
