#ifndef SPLC_AST_AST_HPP
#define SPLC_AST_AST_HPP

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "util/types/choice.hpp"

namespace ast {

// A value that carries the source line it was read from. This is used to
// attach positions to diagnostics.
template <class T>
class TokenNode {
 public:
  TokenNode(T value, int line) : value_(std::move(value)), line_(line) {}

  T const& value() const { return value_; }
  int line() const { return line_; }

  T const& operator*() const { return value_; }
  T const* operator->() const { return &value_; }

 private:
  T value_;
  int line_;
};

using NameNode = TokenNode<std::string>;

// AST Nodes for the SPL language parse tree. The tree is built once by the
// parser and is read-only afterwards. Nodes are move-only.

// Atoms

class VarAtom {
 public:
  VarAtom(NameNode name) : name_(std::move(name)) {}

  NameNode const& name() const { return name_; }

 private:
  NameNode name_;
};

class NumAtom {
 public:
  NumAtom(TokenNode<int> value) : value_(std::move(value)) {}

  TokenNode<int> const& value() const { return value_; }

 private:
  TokenNode<int> value_;
};

class Atom : public util::ChoiceBase<Atom, VarAtom, NumAtom> {
  using ChoiceBase::ChoiceBase;

 public:
  int line() const;
};

// Terms

enum class UnaryOp {
  NEG,
  NOT,
};

enum class BinaryOp {
  PLUS,
  MINUS,
  MULT,
  DIV,
  AND,
  OR,
  EQ,
  GT,
};

// The source spelling of an operator, e.g. "plus" or "neg".
std::string_view OpName(UnaryOp op);
std::string_view OpName(BinaryOp op);

bool IsArithmetic(BinaryOp op);
bool IsBoolean(BinaryOp op);
bool IsComparison(BinaryOp op);

class Term;

class AtomTerm {
 public:
  AtomTerm(Atom atom) : atom_(std::move(atom)) {}

  Atom const& atom() const { return atom_; }

 private:
  Atom atom_;
};

class UnaryTerm {
 public:
  UnaryTerm(TokenNode<UnaryOp> op, std::unique_ptr<Term> operand)
      : op_(std::move(op)), operand_(std::move(operand)) {}

  TokenNode<UnaryOp> const& op() const { return op_; }
  Term const& operand() const { return *operand_; }

 private:
  TokenNode<UnaryOp> op_;
  std::unique_ptr<Term> operand_;
};

class BinaryTerm {
 public:
  BinaryTerm(TokenNode<BinaryOp> op, std::unique_ptr<Term> lhs,
             std::unique_ptr<Term> rhs)
      : op_(std::move(op)), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

  TokenNode<BinaryOp> const& op() const { return op_; }
  Term const& lhs() const { return *lhs_; }
  Term const& rhs() const { return *rhs_; }

 private:
  TokenNode<BinaryOp> op_;
  std::unique_ptr<Term> lhs_;
  std::unique_ptr<Term> rhs_;
};

class Term : public util::ChoiceBase<Term, AtomTerm, UnaryTerm, BinaryTerm> {
  using ChoiceBase::ChoiceBase;

 public:
  int line() const;
};

// Outputs

class StringOutput {
 public:
  StringOutput(TokenNode<std::string> text) : text_(std::move(text)) {}

  TokenNode<std::string> const& text() const { return text_; }

 private:
  TokenNode<std::string> text_;
};

class Output : public util::ChoiceBase<Output, Atom, StringOutput> {
  using ChoiceBase::ChoiceBase;
};

// Instructions

class Instruction;

// An ordered list of instructions.
using Algorithm = std::vector<std::unique_ptr<Instruction>>;

class HaltInstr {
 public:
  explicit HaltInstr(int line) : line_(line) {}

  int line() const { return line_; }

 private:
  int line_;
};

class PrintInstr {
 public:
  PrintInstr(Output output, int line)
      : output_(std::move(output)), line_(line) {}

  Output const& output() const { return output_; }
  int line() const { return line_; }

 private:
  Output output_;
  int line_;
};

// A procedure call used as a statement.
class CallInstr {
 public:
  CallInstr(NameNode callee, std::vector<Atom> args)
      : callee_(std::move(callee)), args_(std::move(args)) {}

  NameNode const& callee() const { return callee_; }
  std::vector<Atom> const& args() const { return args_; }

 private:
  NameNode callee_;
  std::vector<Atom> args_;
};

// `target = callee(args...)`, a function call in assignment position.
class AssignCallInstr {
 public:
  AssignCallInstr(NameNode target, NameNode callee, std::vector<Atom> args)
      : target_(std::move(target)),
        callee_(std::move(callee)),
        args_(std::move(args)) {}

  NameNode const& target() const { return target_; }
  NameNode const& callee() const { return callee_; }
  std::vector<Atom> const& args() const { return args_; }

 private:
  NameNode target_;
  NameNode callee_;
  std::vector<Atom> args_;
};

class AssignTermInstr {
 public:
  AssignTermInstr(NameNode target, Term value)
      : target_(std::move(target)), value_(std::move(value)) {}

  NameNode const& target() const { return target_; }
  Term const& value() const { return value_; }

 private:
  NameNode target_;
  Term value_;
};

class WhileInstr {
 public:
  WhileInstr(Term condition, Algorithm body)
      : condition_(std::move(condition)), body_(std::move(body)) {}

  Term const& condition() const { return condition_; }
  Algorithm const& body() const { return body_; }

 private:
  Term condition_;
  Algorithm body_;
};

class DoUntilInstr {
 public:
  DoUntilInstr(Algorithm body, Term condition)
      : body_(std::move(body)), condition_(std::move(condition)) {}

  Algorithm const& body() const { return body_; }
  Term const& condition() const { return condition_; }

 private:
  Algorithm body_;
  Term condition_;
};

class IfInstr {
 public:
  IfInstr(Term condition, Algorithm then_body)
      : condition_(std::move(condition)), then_body_(std::move(then_body)) {}

  Term const& condition() const { return condition_; }
  Algorithm const& then_body() const { return then_body_; }

 private:
  Term condition_;
  Algorithm then_body_;
};

class IfElseInstr {
 public:
  IfElseInstr(Term condition, Algorithm then_body, Algorithm else_body)
      : condition_(std::move(condition)),
        then_body_(std::move(then_body)),
        else_body_(std::move(else_body)) {}

  Term const& condition() const { return condition_; }
  Algorithm const& then_body() const { return then_body_; }
  Algorithm const& else_body() const { return else_body_; }

 private:
  Term condition_;
  Algorithm then_body_;
  Algorithm else_body_;
};

class Instruction
    : public util::ChoiceBase<Instruction, HaltInstr, PrintInstr, CallInstr,
                              AssignCallInstr, AssignTermInstr, WhileInstr,
                              DoUntilInstr, IfInstr, IfElseInstr> {
  using ChoiceBase::ChoiceBase;
};

// Definitions

// The local variable list and algorithm shared by procedure and function
// definitions.
class Body {
 public:
  Body(std::vector<NameNode> locals, Algorithm algorithm)
      : locals_(std::move(locals)), algorithm_(std::move(algorithm)) {}

  std::vector<NameNode> const& locals() const { return locals_; }
  Algorithm const& algorithm() const { return algorithm_; }

 private:
  std::vector<NameNode> locals_;
  Algorithm algorithm_;
};

class ProcDef {
 public:
  ProcDef(NameNode name, std::vector<NameNode> params, Body body)
      : name_(std::move(name)),
        params_(std::move(params)),
        body_(std::move(body)) {}

  NameNode const& name() const { return name_; }
  std::vector<NameNode> const& params() const { return params_; }
  Body const& body() const { return body_; }

 private:
  NameNode name_;
  std::vector<NameNode> params_;
  Body body_;
};

class FuncDef {
 public:
  FuncDef(NameNode name, std::vector<NameNode> params, Body body,
          Atom return_value)
      : name_(std::move(name)),
        params_(std::move(params)),
        body_(std::move(body)),
        return_value_(std::move(return_value)) {}

  NameNode const& name() const { return name_; }
  std::vector<NameNode> const& params() const { return params_; }
  Body const& body() const { return body_; }
  Atom const& return_value() const { return return_value_; }

 private:
  NameNode name_;
  std::vector<NameNode> params_;
  Body body_;
  Atom return_value_;
};

class MainProg {
 public:
  MainProg(std::vector<NameNode> locals, Algorithm algorithm)
      : locals_(std::move(locals)), algorithm_(std::move(algorithm)) {}

  std::vector<NameNode> const& locals() const { return locals_; }
  Algorithm const& algorithm() const { return algorithm_; }

 private:
  std::vector<NameNode> locals_;
  Algorithm algorithm_;
};

// The root of the tree: `glob { ... } proc { ... } func { ... } main { ... }`.
class Program {
 public:
  Program(std::vector<NameNode> globals, std::vector<ProcDef> procs,
          std::vector<FuncDef> funcs, MainProg main)
      : globals_(std::move(globals)),
        procs_(std::move(procs)),
        funcs_(std::move(funcs)),
        main_(std::move(main)) {}

  std::vector<NameNode> const& globals() const { return globals_; }
  std::vector<ProcDef> const& procs() const { return procs_; }
  std::vector<FuncDef> const& funcs() const { return funcs_; }
  MainProg const& main() const { return main_; }

 private:
  std::vector<NameNode> globals_;
  std::vector<ProcDef> procs_;
  std::vector<FuncDef> funcs_;
  MainProg main_;
};

}  // namespace ast

#endif
