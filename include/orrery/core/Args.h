#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orrery::core {

// Small argument parser for the orrery command line.
//
//   orrery <command> [--key value | --key=value | --flag | -abc] [positional...]
//
// The first positional token is the command. Options that are declared as
// flags never consume the next token, so `--svg out` keeps `out` positional.
class Args {
public:
  Args() = default;

  void declareFlag(std::string_view key) { flagKeys_.emplace_back(key); }

  void parse(int argc, const char* const* argv) {
    program_.clear();
    command_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (startsWith(a, "--")) {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        if (isDeclaredFlag(key) || i + 1 >= argc || !argv[i + 1] || looksLikeSwitch(argv[i + 1])) {
          flags_.push_back(key);
        } else {
          kv_[key].push_back(std::string(argv[++i]));
        }
        continue;
      }

      // Short flags (-v, -q, -vq). A lone "-" or a negative number is positional.
      if (a.size() >= 2 && a[0] == '-' && !isNumber(a)) {
        for (std::size_t j = 1; j < a.size(); ++j) {
          const char c = a[j];
          if (std::isalnum(static_cast<unsigned char>(c))) flags_.emplace_back(1, c);
        }
        continue;
      }

      if (command_.empty() && positional_.empty()) {
        command_ = a;
      } else {
        positional_.push_back(a);
      }
    }
  }

  const std::string& program() const { return program_; }
  const std::string& command() const { return command_; }
  const std::vector<std::string>& positional() const { return positional_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  // Every key given with a value, for rejecting typos.
  std::vector<std::string> keys() const {
    std::vector<std::string> out;
    out.reserve(kv_.size());
    for (const auto& [k, v] : kv_) out.push_back(k);
    return out;
  }

  // Typed getters: true only if the key is present and the whole value parsed.
  bool getU64(std::string_view key, unsigned long long& out) const {
    const auto v = last(key);
    if (!v || v->empty() || (*v)[0] == '-') return false;
    char* end = nullptr;
    const auto val = std::strtoull(v->c_str(), &end, 10);
    if (*end != '\0') return false;
    out = val;
    return true;
  }

  bool getI64(std::string_view key, long long& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const auto val = std::strtoll(v->c_str(), &end, 10);
    if (*end != '\0') return false;
    out = val;
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const auto val = std::strtod(v->c_str(), &end);
    if (*end != '\0') return false;
    out = val;
    return true;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

private:
  static bool startsWith(const std::string& s, const char* prefix) {
    const std::size_t n = std::char_traits<char>::length(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
  }

  static bool isNumber(const std::string& s) {
    char* end = nullptr;
    std::strtod(s.c_str(), &end);
    return end != s.c_str() && *end == '\0';
  }

  static bool looksLikeSwitch(const char* s) {
    if (!s || s[0] != '-' || s[1] == '\0') return false;
    return !isNumber(s);
  }

  bool isDeclaredFlag(const std::string& key) const {
    for (const auto& f : flagKeys_) {
      if (f == key) return true;
    }
    return false;
  }

  std::string program_;
  std::string command_;
  std::vector<std::string> flagKeys_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace orrery::core
