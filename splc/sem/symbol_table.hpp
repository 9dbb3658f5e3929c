#ifndef SPLC_SEM_SYMBOL_TABLE_HPP
#define SPLC_SEM_SYMBOL_TABLE_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "splc/ast/ast.hpp"
#include "splc/sem/types.hpp"
#include "util/types/choice.hpp"

namespace sem {

enum class ScopeKind {
  // The program-wide root. Holds no symbols of its own.
  EVERYWHERE,
  GLOBAL,
  PROC_GROUP,
  FUNC_GROUP,
  MAIN,
  // The parameters and locals of one procedure or function.
  LOCAL,
};

enum class SymbolCategory {
  VARIABLE,
  PROCEDURE,
  FUNCTION,
};

std::string_view CategoryName(SymbolCategory category);

class VariableInfo {
 public:
  VariableInfo() = default;

  Type type() const { return Type::NUMERIC; }
};

class ProcedureInfo {
 public:
  explicit ProcedureInfo(ast::ProcDef const* def) : def_(def) {}

  ast::ProcDef const& def() const { return *def_; }

 private:
  ast::ProcDef const* def_;
};

class FunctionInfo {
 public:
  explicit FunctionInfo(ast::FuncDef const* def) : def_(def) {}

  ast::FuncDef const& def() const { return *def_; }

 private:
  ast::FuncDef const* def_;
};

class SymbolDetails : public util::ChoiceBase<SymbolDetails, VariableInfo,
                                              ProcedureInfo, FunctionInfo> {
  using ChoiceBase::ChoiceBase;
};

class Scope;

class Symbol {
 public:
  Symbol(std::string name, int line, Scope const* scope, SymbolDetails details)
      : name_(std::move(name)),
        line_(line),
        scope_(scope),
        details_(std::move(details)) {}

  std::string const& name() const { return name_; }
  int line() const { return line_; }
  Scope const& scope() const { return *scope_; }
  SymbolDetails const& details() const { return details_; }

  SymbolCategory category() const;

  // The parameter names of a procedure or function. Empty for variables.
  std::vector<std::string> params() const;

 private:
  std::string name_;
  int line_;
  Scope const* scope_;
  SymbolDetails details_;
};

class Scope {
 public:
  Scope(ScopeKind kind, Scope const* parent, std::string owner)
      : kind_(kind), parent_(parent), owner_(std::move(owner)) {}

  ScopeKind kind() const { return kind_; }
  Scope const* parent() const { return parent_; }
  // The procedure or function name for LOCAL scopes, empty otherwise.
  std::string const& owner() const { return owner_; }

  // Looks up a name in this scope only.
  Symbol const* LookupLocal(std::string_view name) const;

  std::vector<Symbol const*> symbols() const;

 private:
  friend class SymbolTable;

  ScopeKind kind_;
  Scope const* parent_;
  std::string owner_;
  std::map<std::string, std::unique_ptr<Symbol>, std::less<>> symbols_;
};

// The scope tree of one program, plus the binding of every name use in the
// AST to the symbol it refers to.
class SymbolTable {
 public:
  SymbolTable();
  SymbolTable(SymbolTable const&) = delete;
  SymbolTable& operator=(SymbolTable const&) = delete;

  Scope const* everywhere() const { return everywhere_; }
  Scope* global() { return global_; }
  Scope const* global() const { return global_; }
  Scope* proc_group() { return proc_group_; }
  Scope const* proc_group() const { return proc_group_; }
  Scope* func_group() { return func_group_; }
  Scope const* func_group() const { return func_group_; }
  Scope* main() { return main_; }
  Scope const* main() const { return main_; }

  // Creates the LOCAL scope for a procedure or function. `group` is the
  // PROC_GROUP or FUNC_GROUP scope.
  Scope* AddLocalScope(Scope const* group, std::string owner);

  // Every scope in creation order, starting with EVERYWHERE.
  std::vector<Scope const*> scopes() const;

  // Adds a symbol to `scope`. Fails with AlreadyExists if the scope already
  // has a symbol with the same name, returning nothing in that case.
  absl::StatusOr<Symbol const*> Declare(Scope* scope, ast::NameNode const& name,
                                        SymbolDetails details);

  // Finds the variable `name` visible from `scope`, searching enclosing
  // scopes. Procedure and function symbols are skipped.
  Symbol const* LookupVariable(Scope const* scope, std::string_view name) const;

  void BindUse(ast::NameNode const* use, Symbol const* symbol);
  // Returns the symbol a name use was resolved to, or null if unresolved.
  Symbol const* LookupUse(ast::NameNode const* use) const;
  std::size_t bound_use_count() const { return uses_.size(); }

 private:
  Scope* NewScope(ScopeKind kind, Scope const* parent, std::string owner);

  std::vector<std::unique_ptr<Scope>> scopes_;
  Scope* everywhere_;
  Scope* global_;
  Scope* proc_group_;
  Scope* func_group_;
  Scope* main_;
  absl::flat_hash_map<ast::NameNode const*, Symbol const*> uses_;
};

}  // namespace sem

#endif
