#pragma once

#include <cmath>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::core {

// Streaming JSON writer with string escaping and optional pretty printing.
// Used for tree dumps and per-frame observation files.
//
// Doubles are written with round-trip precision; NaN and infinities become null.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = true, int indentSpaces = 2)
      : out_(out), pretty_(pretty), indentSpaces_(indentSpaces) {}

  void beginObject() { open(Scope::Object); }
  void endObject() { close(Scope::Object); }

  void beginArray() { open(Scope::Array); }
  void endArray() { close(Scope::Array); }

  void key(std::string_view k) {
    separate();
    writeString(k);
    out_ << (pretty_ ? ": " : ":");
    pendingKey_ = true;
  }

  void value(std::string_view s) {
    beforeValue();
    writeString(s);
  }
  void value(const char* s) {
    if (!s) {
      nullValue();
      return;
    }
    value(std::string_view(s));
  }
  void value(const std::string& s) { value(std::string_view(s)); }

  void value(double v) {
    beforeValue();
    if (!std::isfinite(v)) {
      out_ << "null";
      return;
    }
    const auto oldPrecision = out_.precision(std::numeric_limits<double>::max_digits10);
    out_ << v;
    out_.precision(oldPrecision);
  }
  void value(long long v) {
    beforeValue();
    out_ << v;
  }
  void value(unsigned long long v) {
    beforeValue();
    out_ << v;
  }
  void value(int v) { value(static_cast<long long>(v)); }
  void value(long v) { value(static_cast<long long>(v)); }
  void value(unsigned v) { value(static_cast<unsigned long long>(v)); }
  void value(unsigned long v) { value(static_cast<unsigned long long>(v)); }
  void value(bool v) {
    beforeValue();
    out_ << (v ? "true" : "false");
  }
  void nullValue() {
    beforeValue();
    out_ << "null";
  }

  // key + value in one call.
  template <typename T>
  void field(std::string_view k, const T& v) {
    key(k);
    value(v);
  }

  // [x, y, z] on one line, also in pretty mode.
  void triple(double x, double y, double z) {
    beforeValue();
    const bool pretty = pretty_;
    pretty_ = false;
    out_ << '[';
    stack_.push_back(Frame{Scope::Array, true});
    value(x);
    value(y);
    value(z);
    stack_.pop_back();
    out_ << ']';
    pretty_ = pretty;
  }

  bool balanced() const { return stack_.empty(); }

private:
  enum class Scope { Object, Array };
  struct Frame {
    Scope scope{Scope::Object};
    bool first{true};
  };

  void open(Scope s) {
    beforeValue();
    out_ << (s == Scope::Object ? '{' : '[');
    stack_.push_back(Frame{s, true});
    if (pretty_) out_ << "\n";
  }

  void close(Scope s) {
    if (stack_.empty() || stack_.back().scope != s) return;

    const bool wasEmpty = stack_.back().first;
    stack_.pop_back();

    if (pretty_) {
      if (!wasEmpty) out_ << "\n";
      indent();
    }
    out_ << (s == Scope::Object ? '}' : ']');
  }

  // A value directly after key() shares its line; otherwise it is a new element.
  void beforeValue() {
    if (pendingKey_) {
      pendingKey_ = false;
      return;
    }
    separate();
  }

  void separate() {
    if (stack_.empty()) return;
    auto& f = stack_.back();
    if (!f.first) {
      out_ << ',';
      if (pretty_) out_ << "\n";
    }
    if (pretty_) indent();
    f.first = false;
  }

  void indent() {
    const int depth = static_cast<int>(stack_.size());
    for (int i = 0; i < depth * indentSpaces_; ++i) out_ << ' ';
  }

  void writeString(std::string_view s) {
    out_ << '"';
    for (char c : s) {
      switch (c) {
        case '"': out_ << "\\\""; break;
        case '\\': out_ << "\\\\"; break;
        case '\b': out_ << "\\b"; break;
        case '\f': out_ << "\\f"; break;
        case '\n': out_ << "\\n"; break;
        case '\r': out_ << "\\r"; break;
        case '\t': out_ << "\\t"; break;
        default:
          if (static_cast<unsigned char>(c) < 0x20) {
            static const char* hex = "0123456789abcdef";
            const auto uc = static_cast<unsigned char>(c);
            out_ << "\\u00" << hex[(uc >> 4) & 0xF] << hex[uc & 0xF];
          } else {
            out_ << c;
          }
          break;
      }
    }
    out_ << '"';
  }

  std::ostream& out_;
  bool pretty_{true};
  int indentSpaces_{2};
  bool pendingKey_{false};
  std::vector<Frame> stack_;
};

} // namespace orrery::core
