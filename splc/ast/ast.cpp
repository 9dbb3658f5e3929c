#include "splc/ast/ast.hpp"

#include <string_view>

namespace ast {

int Atom::line() const {
  return visit([](VarAtom const& var) { return var.name().line(); },
               [](NumAtom const& num) { return num.value().line(); });
}

int Term::line() const {
  return visit([](AtomTerm const& atom) { return atom.atom().line(); },
               [](UnaryTerm const& unary) { return unary.op().line(); },
               [](BinaryTerm const& binary) { return binary.op().line(); });
}

std::string_view OpName(UnaryOp op) {
  switch (op) {
    case UnaryOp::NEG:
      return "neg";
    case UnaryOp::NOT:
      return "not";
  }
  return "?";
}

std::string_view OpName(BinaryOp op) {
  switch (op) {
    case BinaryOp::PLUS:
      return "plus";
    case BinaryOp::MINUS:
      return "minus";
    case BinaryOp::MULT:
      return "mult";
    case BinaryOp::DIV:
      return "div";
    case BinaryOp::AND:
      return "and";
    case BinaryOp::OR:
      return "or";
    case BinaryOp::EQ:
      return "eq";
    case BinaryOp::GT:
      return "gt";
  }
  return "?";
}

bool IsArithmetic(BinaryOp op) {
  switch (op) {
    case BinaryOp::PLUS:
    case BinaryOp::MINUS:
    case BinaryOp::MULT:
    case BinaryOp::DIV:
      return true;
    default:
      return false;
  }
}

bool IsBoolean(BinaryOp op) {
  return op == BinaryOp::AND || op == BinaryOp::OR;
}

bool IsComparison(BinaryOp op) {
  return op == BinaryOp::EQ || op == BinaryOp::GT;
}

}  // namespace ast
