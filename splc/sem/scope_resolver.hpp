#ifndef SPLC_SEM_SCOPE_RESOLVER_HPP
#define SPLC_SEM_SCOPE_RESOLVER_HPP

#include <memory>

#include "splc/ast/ast.hpp"
#include "splc/diagnostics/diagnostics.hpp"
#include "splc/sem/symbol_table.hpp"

namespace sem {

// Builds the scope tree for `program`, declares every variable, procedure and
// function, and binds every name use to its symbol.
//
// All name rule violations and unresolved references are reported to `sink`;
// none of them stops the pass. The table is returned even if errors were
// reported, with the offending uses left unbound.
std::unique_ptr<SymbolTable> ResolveScopes(ast::Program const& program,
                                           diag::DiagnosticsSink* sink);

}  // namespace sem

#endif
