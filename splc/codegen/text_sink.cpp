#include "splc/codegen/text_sink.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace codegen {
namespace {

class NullTextSink : public TextSink {
 public:
  bool Write(std::string_view) override { return true; }
};

class StringTextSink : public TextSink {
 public:
  explicit StringTextSink(std::string* out) : out_(out) {}

  bool Write(std::string_view text) override {
    out_->append(text);
    return true;
  }

 private:
  std::string* out_;
};

}  // namespace

std::unique_ptr<TextSink> TextSink::Null() {
  return std::make_unique<NullTextSink>();
}

std::unique_ptr<TextSink> TextSink::String(std::string* out) {
  return std::make_unique<StringTextSink>(out);
}

}  // namespace codegen
