#ifndef SPLC_CODEGEN_LISTING_HPP
#define SPLC_CODEGEN_LISTING_HPP

#include <string>

#include "splc/codegen/instr.hpp"
#include "splc/codegen/text_sink.hpp"

namespace codegen {

// Textual forms of IIS records. Expressions are fully parenthesized:
// "(a + (b * 2))", "-(x)".
std::string FormatOperand(Operand const& operand);
std::string FormatExpr(NumExpr const& expr);
// "a = b" or "a > b".
std::string FormatComparison(Comparison const& comparison);
// The label name, or the address for resolved targets.
std::string FormatTarget(JumpTarget const& target);

// One instruction, e.g. "x = (a + 1)", "IF x > 0 THEN T0001", "GOTO 40",
// "REM X0002", "CALL p(x, 1)" or "y = CALL f(x)".
std::string FormatInstr(Instr const& instr);

// Writes the instruction stream one instruction per line, before numbering.
bool WriteInstrListing(InstrList const& instrs, TextSink* sink);

}  // namespace codegen

#endif
