// Types for providing error messages as output from the compiler.
//
// This abstracts the error representation from the way it's eventually used.

#ifndef SPLC_DIAGNOSTICS_DIAGNOSTICS_HPP
#define SPLC_DIAGNOSTICS_DIAGNOSTICS_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"

namespace diag {

enum DiagnosticKind {
  ERROR,
  INFO,
};

// The class of user error a diagnostic reports. Informational diagnostics
// use NONE.
enum class ErrorCategory {
  NONE,
  NAME_RULE_VIOLATION,
  UNDECLARED_REFERENCE,
  TYPE_MISMATCH,
  INVALID_CONDITION_TYPE,
  INVALID_RETURN_TYPE,
  ARITY_MISMATCH,
  RECURSIVE_CALL,
};

// E.g. "Name-Rule-Violation".
std::string_view CategoryName(ErrorCategory category);

class Diagnostic {
 public:
  using Kind = DiagnosticKind;

  Diagnostic(Kind kind, ErrorCategory category, std::string message,
             std::optional<int> line)
      : kind_(kind),
        category_(category),
        message_(std::move(message)),
        line_(line) {}

  Kind kind() const { return kind_; }
  ErrorCategory category() const { return category_; }
  std::string const& message() const { return message_; }
  std::optional<int> const& line() const { return line_; }

  // Renders as "line 3: error: <message> [Category]".
  std::string ToString() const;

  template <class... Args>
  static Diagnostic LineError(ErrorCategory category, int line,
                              absl::FormatSpec<Args...> const& spec,
                              Args const&... args) {
    return Diagnostic(ERROR, category, absl::StrFormat(spec, args...), line);
  }

  template <class... Args>
  static Diagnostic Error(ErrorCategory category,
                          absl::FormatSpec<Args...> const& spec,
                          Args const&... args) {
    return Diagnostic(ERROR, category, absl::StrFormat(spec, args...),
                      std::nullopt);
  }

  template <class... Args>
  static Diagnostic Info(absl::FormatSpec<Args...> const& spec,
                         Args const&... args) {
    return Diagnostic(INFO, ErrorCategory::NONE,
                      absl::StrFormat(spec, args...), std::nullopt);
  }

 private:
  Kind kind_;
  ErrorCategory category_;
  std::string message_;
  std::optional<int> line_;

  friend std::ostream& operator<<(std::ostream& os, Diagnostic const& diag) {
    return os << diag.ToString();
  }
};

class DiagnosticsSink {
 public:
  virtual ~DiagnosticsSink() = default;

  virtual void AddDiagnostic(Diagnostic diagnostic) = 0;

  template <class... Args>
  void LineError(ErrorCategory category, int line,
                 absl::FormatSpec<Args...> const& format, Args const&... args) {
    AddDiagnostic(Diagnostic::LineError(category, line, format, args...));
  }

  template <class... Args>
  void Error(ErrorCategory category, absl::FormatSpec<Args...> const& format,
             Args const&... args) {
    AddDiagnostic(Diagnostic::Error(category, format, args...));
  }

  template <class... Args>
  void Info(absl::FormatSpec<Args...> const& format, Args const&... args) {
    AddDiagnostic(Diagnostic::Info(format, args...));
  }
};

// Keeps every diagnostic in memory, in the order reported.
class DiagnosticsCollector : public DiagnosticsSink {
 public:
  void AddDiagnostic(Diagnostic diagnostic) override;

  std::vector<Diagnostic> const& diagnostics() const { return diagnostics_; }
  std::size_t error_count() const { return error_count_; }
  std::size_t CountOf(ErrorCategory category) const;
  std::vector<Diagnostic> ErrorsOf(ErrorCategory category) const;

 private:
  std::vector<Diagnostic> diagnostics_;
  std::size_t error_count_ = 0;
};

// Writes each diagnostic as a line to a stream. The stream must outlive the
// sink.
class StreamDiagnosticsSink : public DiagnosticsSink {
 public:
  explicit StreamDiagnosticsSink(std::ostream* out) : out_(out) {}

  void AddDiagnostic(Diagnostic diagnostic) override;

 private:
  std::ostream* out_;
};

// Counts the errors passing through it on their way to another sink. Used to
// gate a pipeline phase on the errors that phase alone reported.
class ErrorCountingSink : public DiagnosticsSink {
 public:
  explicit ErrorCountingSink(DiagnosticsSink* next) : next_(next) {}

  void AddDiagnostic(Diagnostic diagnostic) override;

  std::size_t error_count() const { return error_count_; }

 private:
  DiagnosticsSink* next_;
  std::size_t error_count_ = 0;
};

}  // namespace diag

#endif
