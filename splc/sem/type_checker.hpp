#ifndef SPLC_SEM_TYPE_CHECKER_HPP
#define SPLC_SEM_TYPE_CHECKER_HPP

#include <cstddef>

#include "absl/container/flat_hash_map.h"
#include "splc/ast/ast.hpp"
#include "splc/diagnostics/diagnostics.hpp"
#include "splc/sem/symbol_table.hpp"
#include "splc/sem/types.hpp"

namespace sem {

// The types assigned to the terms and atoms of a program. Nodes are keyed by
// address, so the table is only valid while the AST is alive.
class TypeTable {
 public:
  // UNKNOWN for nodes that were never typed.
  Type TypeOf(ast::Term const& term) const;
  Type TypeOf(ast::Atom const& atom) const;

  void SetType(ast::Term const& term, Type type) { terms_[&term] = type; }
  void SetType(ast::Atom const& atom, Type type) { atoms_[&atom] = type; }

  std::size_t term_count() const { return terms_.size(); }

 private:
  absl::flat_hash_map<ast::Term const*, Type> terms_;
  absl::flat_hash_map<ast::Atom const*, Type> atoms_;
};

// Types every term in `program` and checks every contextual type rule, call
// kind and call arity. `symbols` must come from ResolveScopes() on the same
// program.
//
// The whole tree is walked and every error is reported to `sink`.
TypeTable CheckTypes(ast::Program const& program, SymbolTable const& symbols,
                     diag::DiagnosticsSink* sink);

}  // namespace sem

#endif
