#include "splc/codegen/linearizer.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "splc/codegen/instr.hpp"
#include "splc/codegen/listing.hpp"
#include "splc/codegen/text_sink.hpp"

namespace codegen {

InstrList NumberedProgram::instrs() const {
  InstrList result;
  result.reserve(lines_.size());
  for (auto const& line : lines_) {
    result.push_back(CloneInstr(line.instr));
  }
  return result;
}

std::vector<std::string> NumberedProgram::RenderLines() const {
  std::vector<std::string> result;
  result.reserve(lines_.size());
  for (auto const& line : lines_) {
    if (line.instr.has<LabelInstr>()) {
      result.push_back(absl::StrCat(line.address, " REM"));
    } else {
      result.push_back(
          absl::StrCat(line.address, " ", FormatInstr(line.instr)));
    }
  }
  return result;
}

std::string NumberedProgram::ToString() const {
  auto lines = RenderLines();
  if (lines.empty()) {
    return "";
  }
  return absl::StrCat(absl::StrJoin(lines, "\n"), "\n");
}

absl::StatusOr<NumberedProgram> Linearize(InstrList const& instrs,
                                          LinearizerOptions const& options) {
  if (options.start < 0) {
    return absl::InvalidArgumentError(
        absl::StrFormat("start address must be >= 0, got %d", options.start));
  }
  if (options.step <= 0) {
    return absl::InvalidArgumentError(
        absl::StrFormat("address step must be > 0, got %d", options.step));
  }
  if (!instrs.empty()) {
    std::int64_t last_index = static_cast<std::int64_t>(instrs.size()) - 1;
    if (last_index > std::numeric_limits<int>::max() ||
        options.start + last_index * options.step >
            std::numeric_limits<int>::max()) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "%d instruction(s) starting at %d in steps of %d exceed the largest "
          "address %d",
          instrs.size(), options.start, options.step,
          std::numeric_limits<int>::max()));
    }
  }
  auto address_of = [&options](std::size_t index) {
    return options.start + static_cast<int>(index) * options.step;
  };

  absl::btree_map<std::string, int> labels;
  for (std::size_t i = 0; i < instrs.size(); ++i) {
    Instr const& instr = instrs[i];
    if (auto const* call = instr.try_get<CallInstr>()) {
      return absl::FailedPreconditionError(absl::StrFormat(
          "call to '%s' must be inlined before linearization", call->callee()));
    }
    if (auto const* call = instr.try_get<CallAssignInstr>()) {
      return absl::FailedPreconditionError(absl::StrFormat(
          "call to '%s' must be inlined before linearization", call->callee()));
    }
    if (auto const* marker = instr.try_get<LabelInstr>()) {
      int address = address_of(i);
      auto [it, inserted] = labels.emplace(marker->label().name(), address);
      if (!inserted) {
        return absl::InternalError(absl::StrFormat(
            "label %s is marked more than once", marker->label().name()));
      }
    }
  }

  absl::Status status = absl::OkStatus();
  auto resolve = [&](JumpTarget const& target) {
    auto const* label = target.try_get<Label>();
    if (!label) {
      return target;
    }
    auto it = labels.find(label->name());
    if (it != labels.end()) {
      return JumpTarget(Address(it->second));
    }
    if (!options.keep_unresolved_labels && status.ok()) {
      status = absl::FailedPreconditionError(
          absl::StrFormat("jump to unresolved label %s", label->name()));
    }
    return target;
  };

  std::vector<NumberedInstr> lines;
  lines.reserve(instrs.size());
  for (std::size_t i = 0; i < instrs.size(); ++i) {
    lines.push_back(NumberedInstr{
        .address = address_of(i),
        .instr = RewriteInstr(
            instrs[i], [](std::string const& name) { return name; },
            [](Label const& label) { return label; }, resolve)});
  }
  if (!status.ok()) {
    return status;
  }
  return NumberedProgram(std::move(lines), std::move(labels));
}

bool WriteProgram(NumberedProgram const& program, TextSink* sink) {
  for (auto const& line : program.RenderLines()) {
    if (!sink->WriteLine("%s", line)) {
      return false;
    }
  }
  return true;
}

}  // namespace codegen
