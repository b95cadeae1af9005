/*
  GML loader.

  Two stages: a tokenizer/parser that turns the document into a tree of
  (key, value) entries, where a value is a number, a string or a nested list,
  and an interpreter that extracts the `graph` list into CostDiGraph arrays.
  Line numbers are carried on every entry for error messages.
*/
#include "trafficeq/core/gml_loader.hpp"
#include "trafficeq/core/error.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trafficeq::core {

namespace {

struct GmlEntry;

struct GmlValue {
  enum class Kind { Number, String, List };
  Kind kind {Kind::Number};
  double number {0.0};
  std::string text;             // String payload, or the raw token of a Number
  std::vector<GmlEntry> list;
};

struct GmlEntry {
  std::string key;
  GmlValue value;
  int line {0};
};

[[noreturn]] void fail(int line, const std::string& msg) {
  throw GraphLoadError("GML line " + std::to_string(line) + ": " + msg);
}

class GmlParser {
public:
  explicit GmlParser(std::string_view text) : s_(text) {}

  std::vector<GmlEntry> parse_document() {
    auto entries = parse_list(/*nested=*/false);
    return entries;
  }

private:
  std::string_view s_;
  std::size_t pos_ {0};
  int line_ {1};

  void skip_space() {
    while (pos_ < s_.size()) {
      char c = s_[pos_];
      if (c == '\n') { ++line_; ++pos_; }
      else if (std::isspace(static_cast<unsigned char>(c))) { ++pos_; }
      else if (c == '#') { while (pos_ < s_.size() && s_[pos_] != '\n') ++pos_; }
      else break;
    }
  }

  std::vector<GmlEntry> parse_list(bool nested) {
    std::vector<GmlEntry> out;
    for (;;) {
      skip_space();
      if (pos_ >= s_.size()) {
        if (nested) fail(line_, "unexpected end of input, missing ']'");
        return out;
      }
      if (s_[pos_] == ']') {
        if (!nested) fail(line_, "unbalanced ']'");
        ++pos_;
        return out;
      }
      GmlEntry entry;
      entry.line = line_;
      entry.key = parse_key();
      skip_space();
      entry.value = parse_value(entry.key);
      out.push_back(std::move(entry));
    }
  }

  std::string parse_key() {
    std::size_t start = pos_;
    if (!std::isalpha(static_cast<unsigned char>(s_[pos_])) && s_[pos_] != '_') {
      fail(line_, std::string("expected a key, found '") + s_[pos_] + "'");
    }
    while (pos_ < s_.size() &&
           (std::isalnum(static_cast<unsigned char>(s_[pos_])) || s_[pos_] == '_')) {
      ++pos_;
    }
    return std::string(s_.substr(start, pos_ - start));
  }

  GmlValue parse_value(const std::string& key) {
    GmlValue v;
    if (pos_ >= s_.size()) fail(line_, "missing value for key '" + key + "'");
    char c = s_[pos_];
    if (c == '[') {
      ++pos_;
      v.kind = GmlValue::Kind::List;
      v.list = parse_list(/*nested=*/true);
      return v;
    }
    if (c == '"') {
      ++pos_;
      std::size_t start = pos_;
      while (pos_ < s_.size() && s_[pos_] != '"') {
        if (s_[pos_] == '\n') ++line_;
        ++pos_;
      }
      if (pos_ >= s_.size()) fail(line_, "unterminated string for key '" + key + "'");
      v.kind = GmlValue::Kind::String;
      v.text = std::string(s_.substr(start, pos_ - start));
      ++pos_;
      return v;
    }
    std::size_t start = pos_;
    while (pos_ < s_.size() && !std::isspace(static_cast<unsigned char>(s_[pos_])) &&
           s_[pos_] != '[' && s_[pos_] != ']') {
      ++pos_;
    }
    v.text = std::string(s_.substr(start, pos_ - start));
    char* end = nullptr;
    v.number = std::strtod(v.text.c_str(), &end);
    if (v.text.empty() || end == nullptr || *end != '\0') {
      fail(line_, "value '" + v.text + "' of key '" + key + "' is not a number or string");
    }
    v.kind = GmlValue::Kind::Number;
    return v;
  }
};

const GmlEntry* find_key(const std::vector<GmlEntry>& list, std::string_view key) {
  for (auto const& e : list) if (e.key == key) return &e;
  return nullptr;
}

double require_number(const GmlEntry& owner, std::string_view key) {
  const GmlEntry* e = find_key(owner.value.list, key);
  if (!e) fail(owner.line, owner.key + " is missing '" + std::string(key) + "'");
  if (e->value.kind != GmlValue::Kind::Number) {
    fail(e->line, "'" + std::string(key) + "' must be numeric");
  }
  return e->value.number;
}

std::int64_t require_integer(const GmlEntry& owner, std::string_view key) {
  double d = require_number(owner, key);
  if (!std::isfinite(d) || std::floor(d) != d) {
    fail(owner.line, "'" + std::string(key) + "' must be an integer");
  }
  return static_cast<std::int64_t>(d);
}

} // namespace

CostDiGraph parse_gml(std::string_view text) {
  GmlParser parser(text);
  auto doc = parser.parse_document();

  const GmlEntry* graph = find_key(doc, "graph");
  if (!graph || graph->value.kind != GmlValue::Kind::List) {
    throw GraphLoadError("GML document has no 'graph [ ... ]' block");
  }
  const GmlEntry* directed = find_key(graph->value.list, "directed");
  if (!directed || directed->value.kind != GmlValue::Kind::Number || directed->value.number != 1.0) {
    fail(graph->line, "graph is not directed (expected 'directed 1')");
  }

  std::vector<std::string> names;
  std::unordered_map<std::int64_t, NodeId> id_to_node;
  std::unordered_map<std::string, int> name_line;
  std::vector<NodeId> src;
  std::vector<NodeId> dst;
  std::vector<double> a;
  std::vector<double> b;

  for (auto const& e : graph->value.list) {
    if (e.key != "node") continue;
    if (e.value.kind != GmlValue::Kind::List) fail(e.line, "'node' must be a list");
    std::int64_t id = require_integer(e, "id");
    std::string name = std::to_string(id);
    if (const GmlEntry* label = find_key(e.value.list, "label")) {
      name = label->value.kind == GmlValue::Kind::List ? name : label->value.text;
    }
    if (!id_to_node.emplace(id, static_cast<NodeId>(names.size())).second) {
      fail(e.line, "duplicate node id " + std::to_string(id));
    }
    if (!name_line.emplace(name, e.line).second) {
      fail(e.line, "duplicate node label '" + name + "' (first on line " +
                   std::to_string(name_line[name]) + ")");
    }
    names.push_back(std::move(name));
  }

  for (auto const& e : graph->value.list) {
    if (e.key != "edge") continue;
    if (e.value.kind != GmlValue::Kind::List) fail(e.line, "'edge' must be a list");
    auto lookup = [&](std::string_view key) {
      std::int64_t id = require_integer(e, key);
      auto it = id_to_node.find(id);
      if (it == id_to_node.end()) {
        fail(e.line, "edge " + std::string(key) + " " + std::to_string(id) + " is not a declared node");
      }
      return it->second;
    };
    NodeId u = lookup("source");
    NodeId v = lookup("target");
    double ca = require_number(e, "a");
    double cb = require_number(e, "b");
    if (!std::isfinite(ca) || !std::isfinite(cb) || ca < 0.0 || cb < 0.0) {
      fail(e.line, "edge cost coefficients must be finite and non-negative (a=" +
                   std::to_string(ca) + ", b=" + std::to_string(cb) + ")");
    }
    src.push_back(u);
    dst.push_back(v);
    a.push_back(ca);
    b.push_back(cb);
  }

  return CostDiGraph::from_arrays(std::move(names), src, dst, a, b);
}

CostDiGraph load_gml(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw GraphLoadError("cannot open graph file '" + path + "'");
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad()) {
    throw GraphLoadError("error reading graph file '" + path + "'");
  }
  return parse_gml(buf.str());
}

} // namespace trafficeq::core
