#include "splc/sem/symbol_table.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

namespace sem {

std::string_view CategoryName(SymbolCategory category) {
  switch (category) {
    case SymbolCategory::VARIABLE:
      return "variable";
    case SymbolCategory::PROCEDURE:
      return "procedure";
    case SymbolCategory::FUNCTION:
      return "function";
  }
  return "symbol";
}

namespace {

std::vector<std::string> ParamNames(std::vector<ast::NameNode> const& params) {
  std::vector<std::string> names;
  names.reserve(params.size());
  for (auto const& param : params) {
    names.push_back(param.value());
  }
  return names;
}

}  // namespace

SymbolCategory Symbol::category() const {
  return details_.visit(
      [](VariableInfo const&) { return SymbolCategory::VARIABLE; },
      [](ProcedureInfo const&) { return SymbolCategory::PROCEDURE; },
      [](FunctionInfo const&) { return SymbolCategory::FUNCTION; });
}

std::vector<std::string> Symbol::params() const {
  return details_.visit(
      [](VariableInfo const&) { return std::vector<std::string>(); },
      [](ProcedureInfo const& proc) { return ParamNames(proc.def().params()); },
      [](FunctionInfo const& func) { return ParamNames(func.def().params()); });
}

Symbol const* Scope::LookupLocal(std::string_view name) const {
  auto it = symbols_.find(name);
  if (it == symbols_.end()) {
    return nullptr;
  }
  return it->second.get();
}

std::vector<Symbol const*> Scope::symbols() const {
  std::vector<Symbol const*> result;
  result.reserve(symbols_.size());
  for (auto const& [name, symbol] : symbols_) {
    result.push_back(symbol.get());
  }
  return result;
}

SymbolTable::SymbolTable() {
  everywhere_ = NewScope(ScopeKind::EVERYWHERE, nullptr, "");
  global_ = NewScope(ScopeKind::GLOBAL, everywhere_, "");
  proc_group_ = NewScope(ScopeKind::PROC_GROUP, global_, "");
  func_group_ = NewScope(ScopeKind::FUNC_GROUP, global_, "");
  main_ = NewScope(ScopeKind::MAIN, global_, "");
}

Scope* SymbolTable::NewScope(ScopeKind kind, Scope const* parent,
                             std::string owner) {
  scopes_.push_back(std::make_unique<Scope>(kind, parent, std::move(owner)));
  return scopes_.back().get();
}

Scope* SymbolTable::AddLocalScope(Scope const* group, std::string owner) {
  return NewScope(ScopeKind::LOCAL, group, std::move(owner));
}

std::vector<Scope const*> SymbolTable::scopes() const {
  std::vector<Scope const*> result;
  result.reserve(scopes_.size());
  for (auto const& scope : scopes_) {
    result.push_back(scope.get());
  }
  return result;
}

absl::StatusOr<Symbol const*> SymbolTable::Declare(Scope* scope,
                                                   ast::NameNode const& name,
                                                   SymbolDetails details) {
  if (scope->LookupLocal(name.value()) != nullptr) {
    return absl::AlreadyExistsError(
        absl::StrFormat("'%s' is already declared in this scope", *name));
  }
  auto symbol = std::make_unique<Symbol>(name.value(), name.line(), scope,
                                         std::move(details));
  auto const* result = symbol.get();
  scope->symbols_.emplace(name.value(), std::move(symbol));
  return result;
}

Symbol const* SymbolTable::LookupVariable(Scope const* scope,
                                          std::string_view name) const {
  for (Scope const* current = scope; current != nullptr;
       current = current->parent()) {
    auto const* symbol = current->LookupLocal(name);
    if (symbol && symbol->category() == SymbolCategory::VARIABLE) {
      return symbol;
    }
  }
  return nullptr;
}

void SymbolTable::BindUse(ast::NameNode const* use, Symbol const* symbol) {
  uses_[use] = symbol;
}

Symbol const* SymbolTable::LookupUse(ast::NameNode const* use) const {
  auto it = uses_.find(use);
  if (it == uses_.end()) {
    return nullptr;
  }
  return it->second;
}

}  // namespace sem
