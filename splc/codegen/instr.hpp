// The intermediate instruction stream (IIS): a flat list of instruction
// records produced by the code generator and rewritten by the inliner and
// linearizer. Only the linearizer renders it as text.

#ifndef SPLC_CODEGEN_INSTR_HPP
#define SPLC_CODEGEN_INSTR_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/function_ref.h"
#include "util/types/choice.hpp"

namespace codegen {

// A symbolic jump target, rendered as the prefix followed by a four digit
// serial number, e.g. "T0003".
class Label {
 public:
  Label(std::string prefix, int id) : prefix_(std::move(prefix)), id_(id) {}

  std::string const& prefix() const { return prefix_; }
  int id() const { return id_; }
  std::string name() const;

  friend bool operator==(Label const&, Label const&) = default;

  template <class H>
  friend H AbslHashValue(H h, Label const& label) {
    return H::combine(std::move(h), label.prefix_, label.id_);
  }

 private:
  std::string prefix_;
  int id_;
};

// A jump target that has been resolved to an instruction address.
class Address {
 public:
  explicit Address(int value) : value_(value) {}

  int value() const { return value_; }

  friend bool operator==(Address const&, Address const&) = default;

 private:
  int value_;
};

class JumpTarget : public util::ChoiceBase<JumpTarget, Label, Address> {
  using ChoiceBase::ChoiceBase;
};

// Operands and expressions

class VarRef {
 public:
  explicit VarRef(std::string name) : name_(std::move(name)) {}

  std::string const& name() const { return name_; }

 private:
  std::string name_;
};

class NumLit {
 public:
  explicit NumLit(int value) : value_(value) {}

  int value() const { return value_; }

 private:
  int value_;
};

class Operand : public util::ChoiceBase<Operand, VarRef, NumLit> {
  using ChoiceBase::ChoiceBase;
};

enum class ArithOp {
  ADD,
  SUB,
  MUL,
  DIV,
};

enum class CompareOp {
  EQ,
  GT,
};

class NumExpr;

class NegExpr {
 public:
  explicit NegExpr(std::unique_ptr<NumExpr> operand)
      : operand_(std::move(operand)) {}

  NumExpr const& operand() const { return *operand_; }

 private:
  std::unique_ptr<NumExpr> operand_;
};

class ArithExpr {
 public:
  ArithExpr(ArithOp op, std::unique_ptr<NumExpr> lhs,
            std::unique_ptr<NumExpr> rhs)
      : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

  ArithOp op() const { return op_; }
  NumExpr const& lhs() const { return *lhs_; }
  NumExpr const& rhs() const { return *rhs_; }

 private:
  ArithOp op_;
  std::unique_ptr<NumExpr> lhs_;
  std::unique_ptr<NumExpr> rhs_;
};

// A numeric expression tree. Boolean values never appear in one.
class NumExpr : public util::ChoiceBase<NumExpr, Operand, NegExpr, ArithExpr> {
  using ChoiceBase::ChoiceBase;
};

class Comparison {
 public:
  Comparison(CompareOp op, NumExpr lhs, NumExpr rhs)
      : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

  CompareOp op() const { return op_; }
  NumExpr const& lhs() const { return lhs_; }
  NumExpr const& rhs() const { return rhs_; }

 private:
  CompareOp op_;
  NumExpr lhs_;
  NumExpr rhs_;
};

class StringLit {
 public:
  explicit StringLit(std::string text) : text_(std::move(text)) {}

  std::string const& text() const { return text_; }

 private:
  std::string text_;
};

class PrintArg : public util::ChoiceBase<PrintArg, Operand, StringLit> {
  using ChoiceBase::ChoiceBase;
};

// Instructions

class AssignInstr {
 public:
  AssignInstr(std::string target, NumExpr value)
      : target_(std::move(target)), value_(std::move(value)) {}

  std::string const& target() const { return target_; }
  NumExpr const& value() const { return value_; }

 private:
  std::string target_;
  NumExpr value_;
};

class PrintInstr {
 public:
  explicit PrintInstr(PrintArg arg) : arg_(std::move(arg)) {}

  PrintArg const& arg() const { return arg_; }

 private:
  PrintArg arg_;
};

class HaltInstr {};

class CallInstr {
 public:
  CallInstr(std::string callee, std::vector<Operand> args)
      : callee_(std::move(callee)), args_(std::move(args)) {}

  std::string const& callee() const { return callee_; }
  std::vector<Operand> const& args() const { return args_; }

 private:
  std::string callee_;
  std::vector<Operand> args_;
};

class CallAssignInstr {
 public:
  CallAssignInstr(std::string target, std::string callee,
                  std::vector<Operand> args)
      : target_(std::move(target)),
        callee_(std::move(callee)),
        args_(std::move(args)) {}

  std::string const& target() const { return target_; }
  std::string const& callee() const { return callee_; }
  std::vector<Operand> const& args() const { return args_; }

 private:
  std::string target_;
  std::string callee_;
  std::vector<Operand> args_;
};

class IfGotoInstr {
 public:
  IfGotoInstr(Comparison condition, JumpTarget target)
      : condition_(std::move(condition)), target_(std::move(target)) {}

  Comparison const& condition() const { return condition_; }
  JumpTarget const& target() const { return target_; }

 private:
  Comparison condition_;
  JumpTarget target_;
};

class GotoInstr {
 public:
  explicit GotoInstr(JumpTarget target) : target_(std::move(target)) {}

  JumpTarget const& target() const { return target_; }

 private:
  JumpTarget target_;
};

class LabelInstr {
 public:
  explicit LabelInstr(Label label) : label_(std::move(label)) {}

  Label const& label() const { return label_; }

 private:
  Label label_;
};

class Instr
    : public util::ChoiceBase<Instr, AssignInstr, PrintInstr, HaltInstr,
                              CallInstr, CallAssignInstr, IfGotoInstr,
                              GotoInstr, LabelInstr> {
  using ChoiceBase::ChoiceBase;
};

using InstrList = std::vector<Instr>;

// Rewriting. Instruction records are move-only, so copies are made by
// rewriting with the identity mapping.

using VarMapper = absl::FunctionRef<std::string(std::string const&)>;
using TargetMapper = absl::FunctionRef<JumpTarget(JumpTarget const&)>;
using LabelMapper = absl::FunctionRef<Label(Label const&)>;

Operand RewriteOperand(Operand const& operand, VarMapper vars);
NumExpr RewriteExpr(NumExpr const& expr, VarMapper vars);

// Returns a copy of `instr` with every variable name passed through `vars`,
// every label marker through `labels` and every jump target through
// `targets`.
Instr RewriteInstr(Instr const& instr, VarMapper vars, LabelMapper labels,
                   TargetMapper targets);

Instr CloneInstr(Instr const& instr);
InstrList CloneInstrs(InstrList const& instrs);

}  // namespace codegen

#endif
