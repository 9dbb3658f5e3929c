#ifndef SPLC_CODEGEN_LINEARIZER_HPP
#define SPLC_CODEGEN_LINEARIZER_HPP

#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/statusor.h"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/text_sink.hpp"

namespace codegen {

struct LinearizerOptions {
  // Address of the first instruction. Must be >= 0.
  int start = 10;
  // Distance between consecutive addresses. Must be > 0.
  int step = 10;
  // Leave jumps to labels that are never marked as symbolic names rather than
  // failing.
  bool keep_unresolved_labels = false;
};

struct NumberedInstr {
  int address;
  Instr instr;
};

// The final program: every instruction with its address, and the address of
// every label marker.
class NumberedProgram {
 public:
  NumberedProgram(std::vector<NumberedInstr> lines,
                  absl::btree_map<std::string, int> labels)
      : lines_(std::move(lines)), labels_(std::move(labels)) {}

  std::vector<NumberedInstr> const& lines() const { return lines_; }
  absl::btree_map<std::string, int> const& labels() const { return labels_; }

  // A copy of the instruction stream, with jumps already resolved.
  InstrList instrs() const;

  // One "<address> <instruction>" line per instruction. Label markers are
  // rendered as "REM".
  std::vector<std::string> RenderLines() const;
  std::string ToString() const;

 private:
  std::vector<NumberedInstr> lines_;
  absl::btree_map<std::string, int> labels_;
};

// Numbers `instrs` as start, start + step, ... in stream order and rewrites
// every jump to the address of its label's marker.
//
// The stream must be call free and mark each label at most once. Fails with
// InvalidArgument if the options are out of range or the last address does
// not fit in an int.
absl::StatusOr<NumberedProgram> Linearize(
    InstrList const& instrs, LinearizerOptions const& options = {});

bool WriteProgram(NumberedProgram const& program, TextSink* sink);

}  // namespace codegen

#endif
