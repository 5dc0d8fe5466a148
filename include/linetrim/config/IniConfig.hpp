#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace linetrim {

// INI parser for run configuration:
// - Sections: [section]
// - Key: key = value
// - Comments: lines starting with '#' or ';', or " #" / " ;" after a value
// - Values: raw strings; surrounding quotes (single/double) are stripped
//   (inline comment stripping does not apply inside quotes).

class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    std::ifstream ifs(file_);
    if (!ifs) {
      throw std::runtime_error(err_prefix_() + "failed to open config");
    }
    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    parse_(text);
  }

  // In-memory config (tests, embedding). Relative paths resolve against `base_dir`.
  static IniConfig from_string(const std::string& text,
                               const std::filesystem::path& base_dir = std::filesystem::path(".")) {
    IniConfig cfg;
    cfg.file_ = base_dir / "<memory>";
    cfg.parse_(text);
    return cfg;
  }

  const std::filesystem::path& file_path() const { return file_; }
  std::filesystem::path base_dir() const { return file_.parent_path(); }

  bool has_section(const std::string& section) const {
    return data_.find(section) != data_.end();
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (auto v = get_raw_(section, key)) return *v;
    if (def) return *def;
    throw std::runtime_error(err_prefix_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  std::int64_t get_int64(const std::string& section, const std::string& key,
                         const std::optional<std::int64_t>& def = std::nullopt) const {
    std::string s = get_string(section, key, def ? std::optional<std::string>(std::to_string(*def)) : std::nullopt);
    try {
      std::size_t pos = 0;
      long long v = std::stoll(s, &pos);
      if (pos != s.size()) throw std::invalid_argument("trailing chars");
      return static_cast<std::int64_t>(v);
    } catch (const std::exception&) {
      throw std::runtime_error(err_prefix_() + "failed to parse int64 for " + section + "." + key + " from value: '" + s + "'");
    }
  }

  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    std::string s = get_string(section, key, def ? std::optional<std::string>(to_string_prec_(*def)) : std::nullopt);
    return parse_double_(s, section + "." + key);
  }

  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    auto s = get_string(section, key, def ? std::optional<std::string>(*def ? "true" : "false") : std::nullopt);
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw std::runtime_error(err_prefix_() + "failed to parse bool for " + section + "." + key + " from value: '" + s + "'");
  }

  // Comma-separated list. Whitespace around items is trimmed, empty items dropped.
  std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                    const std::optional<std::string>& def = std::nullopt) const {
    std::string s = get_string(section, key, def);
    std::vector<std::string> out;
    std::string cur;
    for (char ch : s) {
      if (ch == ',') {
        auto t = trim_(cur);
        if (!t.empty()) out.push_back(t);
        cur.clear();
      } else {
        cur.push_back(ch);
      }
    }
    auto t = trim_(cur);
    if (!t.empty()) out.push_back(t);
    return out;
  }

  std::vector<double> get_double_list(const std::string& section, const std::string& key) const {
    const auto items = get_list(section, key);
    std::vector<double> out;
    out.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
      out.push_back(parse_double_(items[i], section + "." + key + "[" + std::to_string(i) + "]"));
    }
    return out;
  }

  // Path value; relative paths are resolved against the config file directory.
  std::filesystem::path get_path(const std::string& section, const std::string& key,
                                 const std::optional<std::string>& def = std::nullopt) const {
    std::filesystem::path p(get_string(section, key, def));
    if (p.empty() || p.is_absolute()) return p;
    return (base_dir() / p).lexically_normal();
  }

  // Fail fast on misspelled keys: every key of `section` must be in `known`.
  void require_known_keys(const std::string& section, std::initializer_list<const char*> known) const {
    auto it = data_.find(section);
    if (it == data_.end()) return;
    std::vector<std::string> unknown;
    for (const auto& kv : it->second) {
      bool ok = false;
      for (const char* k : known) {
        if (kv.first == k) { ok = true; break; }
      }
      if (!ok) unknown.push_back(kv.first);
    }
    if (unknown.empty()) return;
    std::sort(unknown.begin(), unknown.end());
    std::string msg = err_prefix_() + "unknown key(s) in section [" + section + "]:";
    for (const auto& u : unknown) msg += " '" + u + "'";
    throw std::runtime_error(msg);
  }

private:
  IniConfig() = default;

  std::filesystem::path file_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;

  static std::string trim_(const std::string& s) {
    auto is_ws = [](unsigned char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    std::size_t b = 0;
    while (b < s.size() && is_ws(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && is_ws(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
  }

  static std::string strip_quotes_(const std::string& s) {
    if (s.size() >= 2) {
      const char a = s.front();
      const char b = s.back();
      if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
        return s.substr(1, s.size() - 2);
      }
    }
    return s;
  }

  static std::string strip_inline_comment_(const std::string& v) {
    if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
      const auto close = v.find(v.front(), 1);
      if (close == std::string::npos) return v;
      return v.substr(0, close + 1);
    }
    for (std::size_t i = 1; i < v.size(); ++i) {
      if ((v[i] == '#' || v[i] == ';') && (v[i - 1] == ' ' || v[i - 1] == '\t')) {
        return trim_(v.substr(0, i));
      }
    }
    return v;
  }

  static std::string to_string_prec_(double x) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", x);
    return std::string(buf);
  }

  double parse_double_(const std::string& s, const std::string& what) const {
    try {
      std::size_t pos = 0;
      double v = std::stod(s, &pos);
      if (pos != s.size()) throw std::invalid_argument("trailing chars");
      return v;
    } catch (const std::exception&) {
      throw std::runtime_error(err_prefix_() + "failed to parse double for " + what + " from value: '" + s + "'");
    }
  }

  std::string err_prefix_() const {
    return std::string("IniConfig[") + file_.string() + "]: ";
  }

  std::optional<std::string> get_raw_(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return std::nullopt;
    auto it2 = it->second.find(key);
    if (it2 == it->second.end()) return std::nullopt;
    return it2->second;
  }

  void parse_(const std::string& text) {
    std::string section;
    std::size_t lineno = 0;
    std::size_t pos = 0;

    while (pos <= text.size()) {
      std::size_t nl = text.find('\n', pos);
      if (nl == std::string::npos) nl = text.size();
      const std::string line = text.substr(pos, nl - pos);
      pos = nl + 1;
      ++lineno;

      std::string s = trim_(line);
      if (s.empty()) continue;
      if (s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[' && s.back() == ']') {
        section = trim_(s.substr(1, s.size() - 2));
        if (section.empty()) {
          throw std::runtime_error(err_prefix_() + "empty section header at line " + std::to_string(lineno));
        }
        (void)data_[section];
        continue;
      }

      auto eq = s.find('=');
      if (eq == std::string::npos) {
        throw std::runtime_error(err_prefix_() + "expected key=value at line " + std::to_string(lineno) + ": " + s);
      }

      std::string key = trim_(s.substr(0, eq));
      std::string val = strip_quotes_(strip_inline_comment_(trim_(s.substr(eq + 1))));
      if (key.empty()) {
        throw std::runtime_error(err_prefix_() + "empty key at line " + std::to_string(lineno));
      }
      if (section.empty()) {
        throw std::runtime_error(err_prefix_() + "key outside any section at line " + std::to_string(lineno) + ": " + key);
      }
      data_[section][key] = val;
    }
  }
};

} // namespace linetrim
