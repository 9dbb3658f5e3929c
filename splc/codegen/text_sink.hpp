#ifndef SPLC_CODEGEN_TEXT_SINK_HPP
#define SPLC_CODEGEN_TEXT_SINK_HPP

#include <memory>
#include <string>
#include <string_view>

#include "absl/strings/str_format.h"

namespace codegen {

// A destination for listings and program text.
class TextSink {
 public:
  static std::unique_ptr<TextSink> Null();
  // Appends to `*out`, which must outlive the sink.
  static std::unique_ptr<TextSink> String(std::string* out);

  virtual ~TextSink() = default;

  virtual bool Write(std::string_view text) = 0;

  template <class... Args>
  bool WriteLine(absl::FormatSpec<Args...> const& format, Args const&... args) {
    return Write(absl::StrFormat(format, args...)) && Write("\n");
  }
};

}  // namespace codegen

#endif
