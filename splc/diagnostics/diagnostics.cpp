#include "splc/diagnostics/diagnostics.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace diag {

std::string_view CategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::NONE:
      return "None";
    case ErrorCategory::NAME_RULE_VIOLATION:
      return "Name-Rule-Violation";
    case ErrorCategory::UNDECLARED_REFERENCE:
      return "Undeclared-Reference";
    case ErrorCategory::TYPE_MISMATCH:
      return "Type-Mismatch";
    case ErrorCategory::INVALID_CONDITION_TYPE:
      return "Invalid-Condition-Type";
    case ErrorCategory::INVALID_RETURN_TYPE:
      return "Invalid-Return-Type";
    case ErrorCategory::ARITY_MISMATCH:
      return "Arity-Mismatch";
    case ErrorCategory::RECURSIVE_CALL:
      return "Recursive-Call";
  }
  return "Unknown";
}

std::string Diagnostic::ToString() const {
  std::string result;
  if (line_) {
    absl::StrAppendFormat(&result, "line %d: ", *line_);
  }
  switch (kind_) {
    case ERROR:
      result += "error: ";
      break;
    case INFO:
      result += "info: ";
      break;
  }
  result += message_;
  if (category_ != ErrorCategory::NONE) {
    std::string_view category = CategoryName(category_);
    absl::StrAppend(&result, " [",
                    absl::string_view(category.data(), category.size()), "]");
  }
  return result;
}

void DiagnosticsCollector::AddDiagnostic(Diagnostic diagnostic) {
  if (diagnostic.kind() == ERROR) {
    ++error_count_;
  }
  diagnostics_.push_back(std::move(diagnostic));
}

std::size_t DiagnosticsCollector::CountOf(ErrorCategory category) const {
  std::size_t count = 0;
  for (auto const& diagnostic : diagnostics_) {
    if (diagnostic.kind() == ERROR && diagnostic.category() == category) {
      ++count;
    }
  }
  return count;
}

std::vector<Diagnostic> DiagnosticsCollector::ErrorsOf(
    ErrorCategory category) const {
  std::vector<Diagnostic> result;
  for (auto const& diagnostic : diagnostics_) {
    if (diagnostic.kind() == ERROR && diagnostic.category() == category) {
      result.push_back(diagnostic);
    }
  }
  return result;
}

void StreamDiagnosticsSink::AddDiagnostic(Diagnostic diagnostic) {
  *out_ << diagnostic << "\n";
}

void ErrorCountingSink::AddDiagnostic(Diagnostic diagnostic) {
  if (diagnostic.kind() == ERROR) {
    ++error_count_;
  }
  next_->AddDiagnostic(std::move(diagnostic));
}

}  // namespace diag
