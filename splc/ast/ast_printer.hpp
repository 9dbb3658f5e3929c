#ifndef SPLC_AST_AST_PRINTER_HPP
#define SPLC_AST_AST_PRINTER_HPP

#include <string>
#include <string_view>

#include "absl/functional/function_ref.h"
#include "splc/ast/ast.hpp"

namespace ast {

// Returns the annotation to print after a term, or an empty string for none.
using TermAnnotator = absl::FunctionRef<std::string_view(Term const&)>;

// Renders the tree as indented text, one node per line. Each term is followed
// by " :: <annotation>" when `annotate` returns one.
std::string FormatTree(Program const& program, TermAnnotator annotate);
std::string FormatTree(Program const& program);

}  // namespace ast

#endif
