#include "splc/ast/ast_printer.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "splc/ast/ast.hpp"

namespace ast {
namespace {

std::string JoinNames(std::vector<NameNode> const& names) {
  return absl::StrJoin(names, ", ", [](std::string* out, NameNode const& name) {
    out->append(name.value());
  });
}

std::string FormatAtom(Atom const& atom) {
  return atom.visit([](VarAtom const& var) { return var.name().value(); },
                    [](NumAtom const& num) {
                      return absl::StrCat(num.value().value());
                    });
}

class TreePrinter {
 public:
  explicit TreePrinter(TermAnnotator annotate) : annotate_(annotate) {}

  std::string Print(Program const& program) {
    Line(0, "program");
    if (!program.globals().empty()) {
      Line(1, absl::StrCat("glob ", JoinNames(program.globals())));
    }
    for (auto const& proc : program.procs()) {
      Line(1, absl::StrCat("proc ", proc.name().value(), "(",
                           JoinNames(proc.params()), ")"));
      PrintBody(2, proc.body());
    }
    for (auto const& func : program.funcs()) {
      Line(1, absl::StrCat("func ", func.name().value(), "(",
                           JoinNames(func.params()), ")"));
      PrintBody(2, func.body());
      Line(2, absl::StrCat("return ", FormatAtom(func.return_value())));
    }
    Line(1, "main");
    if (!program.main().locals().empty()) {
      Line(2, absl::StrCat("var ", JoinNames(program.main().locals())));
    }
    PrintAlgorithm(2, program.main().algorithm());
    return std::move(out_);
  }

 private:
  void Line(int depth, std::string_view text) {
    out_.append(2 * depth, ' ');
    absl::StrAppend(&out_, absl::string_view(text.data(), text.size()), "\n");
  }

  void PrintBody(int depth, Body const& body) {
    if (!body.locals().empty()) {
      Line(depth, absl::StrCat("local ", JoinNames(body.locals())));
    }
    PrintAlgorithm(depth, body.algorithm());
  }

  void PrintAlgorithm(int depth, Algorithm const& algorithm) {
    for (auto const& instr : algorithm) {
      PrintInstruction(depth, *instr);
    }
  }

  void PrintTerm(int depth, Term const& term) {
    std::string text = term.visit(
        [](AtomTerm const& atom) { return FormatAtom(atom.atom()); },
        [](UnaryTerm const& unary) {
          return std::string(OpName(unary.op().value()));
        },
        [](BinaryTerm const& binary) {
          return std::string(OpName(binary.op().value()));
        });
    std::string_view annotation = annotate_(term);
    if (!annotation.empty()) {
      absl::StrAppend(&text, " :: ",
                      absl::string_view(annotation.data(), annotation.size()));
    }
    Line(depth, text);

    if (auto const* unary = term.try_get<UnaryTerm>()) {
      PrintTerm(depth + 1, unary->operand());
    } else if (auto const* binary = term.try_get<BinaryTerm>()) {
      PrintTerm(depth + 1, binary->lhs());
      PrintTerm(depth + 1, binary->rhs());
    }
  }

  std::string FormatArgs(std::vector<Atom> const& args) {
    return absl::StrJoin(args, ", ", [](std::string* out, Atom const& atom) {
      out->append(FormatAtom(atom));
    });
  }

  void PrintInstruction(int depth, Instruction const& instr) {
    instr.visit(
        [&](HaltInstr const&) { Line(depth, "halt"); },
        [&](PrintInstr const& print) {
          Line(depth,
               print.output().visit(
                   [](Atom const& atom) {
                     return absl::StrCat("print ", FormatAtom(atom));
                   },
                   [](StringOutput const& text) {
                     return absl::StrCat("print \"", text.text().value(),
                                         "\"");
                   }));
        },
        [&](CallInstr const& call) {
          Line(depth, absl::StrCat("call ", call.callee().value(), "(",
                                   FormatArgs(call.args()), ")"));
        },
        [&](AssignCallInstr const& call) {
          Line(depth, absl::StrCat("assign ", call.target().value(), " = ",
                                   call.callee().value(), "(",
                                   FormatArgs(call.args()), ")"));
        },
        [&](AssignTermInstr const& assign) {
          Line(depth, absl::StrCat("assign ", assign.target().value()));
          PrintTerm(depth + 1, assign.value());
        },
        [&](WhileInstr const& loop) {
          Line(depth, "while");
          PrintTerm(depth + 1, loop.condition());
          Line(depth, "do");
          PrintAlgorithm(depth + 1, loop.body());
        },
        [&](DoUntilInstr const& loop) {
          Line(depth, "do");
          PrintAlgorithm(depth + 1, loop.body());
          Line(depth, "until");
          PrintTerm(depth + 1, loop.condition());
        },
        [&](IfInstr const& branch) {
          Line(depth, "if");
          PrintTerm(depth + 1, branch.condition());
          Line(depth, "then");
          PrintAlgorithm(depth + 1, branch.then_body());
        },
        [&](IfElseInstr const& branch) {
          Line(depth, "if");
          PrintTerm(depth + 1, branch.condition());
          Line(depth, "then");
          PrintAlgorithm(depth + 1, branch.then_body());
          Line(depth, "else");
          PrintAlgorithm(depth + 1, branch.else_body());
        });
  }

  TermAnnotator annotate_;
  std::string out_;
};

}  // namespace

std::string FormatTree(Program const& program, TermAnnotator annotate) {
  TreePrinter printer(annotate);
  return printer.Print(program);
}

std::string FormatTree(Program const& program) {
  return FormatTree(program, [](Term const&) { return std::string_view(); });
}

}  // namespace ast
