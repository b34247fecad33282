// ndflow kernel: reader for the TOML subset used by plugin metadata blocks
//
// Supported: comments, [table] headers with dotted/quoted keys, dotted keys,
// basic/literal strings (single and multi-line), integers, floats, booleans,
// arrays (multi-line, nested, trailing comma) and inline tables. Dates and
// arrays of tables are rejected. The result is a YAML::Node tree so the rest
// of the kernel works with one document type.
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

#include "kernel/metadata_extractor.hpp"

namespace nf {

namespace {

class TomlReader {
public:
  explicit TomlReader(const std::string& text) : text_(text) {}

  YAML::Node parse() {
    YAML::Node root(YAML::NodeType::Map);
    YAML::Node table;
    table.reset(root);
    while (true) {
      skip_ws_comments_newlines();
      if (eof()) break;
      if (peek() == '[') {
        ++pos_;
        if (peek() == '[') fail("arrays of tables are not supported");
        skip_ws();
        auto path = parse_key();
        skip_ws();
        expect(']');
        table.reset(descend(root, path, path.size()));
      } else {
        parse_keyval(table);
      }
      skip_ws();
      skip_comment();
      if (!eof() && peek() != '\n' && peek() != '\r') fail("expected end of line");
    }
    return root;
  }

private:
  const std::string& text_;
  std::size_t pos_ = 0;
  int line_ = 1;

  bool eof() const { return pos_ >= text_.size(); }
  char peek() const { return eof() ? '\0' : text_[pos_]; }
  char peek_at(std::size_t off) const {
    return pos_ + off < text_.size() ? text_[pos_ + off] : '\0';
  }
  char get() {
    char c = text_[pos_++];
    if (c == '\n') ++line_;
    return c;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    throw FlowError(FlowErrc::Syntax, "TOML line " + std::to_string(line_) + ": " + msg);
  }

  void expect(char c) {
    if (peek() != c) fail(std::string("expected '") + c + "'");
    get();
  }

  void skip_ws() {
    while (!eof() && (peek() == ' ' || peek() == '\t')) get();
  }
  void skip_comment() {
    if (peek() == '#') {
      while (!eof() && peek() != '\n') get();
    }
  }
  void skip_ws_comments_newlines() {
    while (!eof()) {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        get();
      } else if (c == '#') {
        skip_comment();
      } else {
        break;
      }
    }
  }

  static bool is_bare(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::vector<std::string> parse_key() {
    std::vector<std::string> parts;
    while (true) {
      skip_ws();
      if (peek() == '"') {
        parts.push_back(parse_basic_string());
      } else if (peek() == '\'') {
        parts.push_back(parse_literal_string());
      } else {
        std::string bare;
        while (!eof() && is_bare(peek())) bare.push_back(get());
        if (bare.empty()) fail("expected a key");
        parts.push_back(bare);
      }
      skip_ws();
      if (peek() != '.') break;
      get();
    }
    return parts;
  }

  // Walk (and create) nested tables for parts[0..count).
  YAML::Node descend(YAML::Node base, const std::vector<std::string>& parts,
                     std::size_t count) {
    YAML::Node node;
    node.reset(base);
    for (std::size_t i = 0; i < count; ++i) {
      if (!node[parts[i]]) node[parts[i]] = YAML::Node(YAML::NodeType::Map);
      YAML::Node child = node[parts[i]];
      if (!child.IsMap()) fail("key '" + parts[i] + "' is not a table");
      node.reset(child);
    }
    return node;
  }

  void parse_keyval(YAML::Node table) {
    auto path = parse_key();
    skip_ws();
    expect('=');
    skip_ws();
    YAML::Node value = parse_value();
    YAML::Node parent = descend(table, path, path.size() - 1);
    if (parent[path.back()]) fail("duplicate key '" + path.back() + "'");
    parent[path.back()] = value;
  }

  YAML::Node parse_value() {
    char c = peek();
    if (c == '"') return YAML::Node(parse_basic_string());
    if (c == '\'') return YAML::Node(parse_literal_string());
    if (c == '[') return parse_array();
    if (c == '{') return parse_inline_table();
    if (text_.compare(pos_, 4, "true") == 0 && !is_bare(peek_at(4))) {
      pos_ += 4;
      return YAML::Node(true);
    }
    if (text_.compare(pos_, 5, "false") == 0 && !is_bare(peek_at(5))) {
      pos_ += 5;
      return YAML::Node(false);
    }
    return parse_number();
  }

  YAML::Node parse_number() {
    std::string token;
    while (!eof() && (is_bare(peek()) || peek() == '+' || peek() == '.' || peek() == ':')) {
      token.push_back(get());
    }
    if (token.empty()) fail("expected a value");
    std::string digits;
    bool is_float = false;
    for (std::size_t i = 0; i < token.size(); ++i) {
      char c = token[i];
      if (c == '_') continue;
      if (c == '.' || c == 'e' || c == 'E') is_float = true;
      digits.push_back(c);
    }
    try {
      std::size_t used = 0;
      if (is_float) {
        double d = std::stod(digits, &used);
        if (used == digits.size()) return YAML::Node(d);
      } else {
        long long v = std::stoll(digits, &used, 10);
        if (used == digits.size()) return YAML::Node(v);
      }
    } catch (const std::invalid_argument&) {
      fail("unsupported value '" + token + "'");
    } catch (const std::out_of_range&) {
      fail("number out of range '" + token + "'");
    }
    fail("unsupported value '" + token + "'");
  }

  YAML::Node parse_array() {
    expect('[');
    YAML::Node seq(YAML::NodeType::Sequence);
    while (true) {
      skip_ws_comments_newlines();
      if (peek() == ']') {
        get();
        break;
      }
      seq.push_back(parse_value());
      skip_ws_comments_newlines();
      if (peek() == ',') {
        get();
        continue;
      }
      if (peek() == ']') {
        get();
        break;
      }
      fail("expected ',' or ']' in array");
    }
    return seq;
  }

  YAML::Node parse_inline_table() {
    expect('{');
    YAML::Node map(YAML::NodeType::Map);
    skip_ws();
    if (peek() == '}') {
      get();
      return map;
    }
    while (true) {
      parse_keyval(map);
      skip_ws();
      if (peek() == ',') {
        get();
        continue;
      }
      expect('}');
      break;
    }
    return map;
  }

  void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  char parse_escape(std::string& out) {
    char e = get();
    switch (e) {
      case 'b': out.push_back('\b'); break;
      case 't': out.push_back('\t'); break;
      case 'n': out.push_back('\n'); break;
      case 'f': out.push_back('\f'); break;
      case 'r': out.push_back('\r'); break;
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case 'u':
      case 'U': {
        std::size_t len = e == 'u' ? 4 : 8;
        if (pos_ + len > text_.size()) fail("truncated unicode escape");
        std::string hex = text_.substr(pos_, len);
        for (char h : hex) {
          if (!std::isxdigit(static_cast<unsigned char>(h))) fail("bad unicode escape");
        }
        pos_ += len;
        append_utf8(out, std::stoul(hex, nullptr, 16));
        break;
      }
      default:
        fail(std::string("invalid escape '\\") + e + "'");
    }
    return e;
  }

  std::string parse_basic_string() {
    expect('"');
    std::string out;
    if (peek() == '"' && peek_at(1) == '"') {
      get();
      get();
      if (peek() == '\n') get();
      while (true) {
        if (eof()) fail("unterminated multi-line string");
        if (peek() == '"' && peek_at(1) == '"' && peek_at(2) == '"') {
          pos_ += 3;
          return out;
        }
        char c = get();
        if (c == '\\') {
          if (peek() == '\n') {
            while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) get();
            continue;
          }
          parse_escape(out);
        } else {
          out.push_back(c);
        }
      }
    }
    while (true) {
      if (eof() || peek() == '\n') fail("unterminated string");
      char c = get();
      if (c == '"') return out;
      if (c == '\\') {
        parse_escape(out);
      } else {
        out.push_back(c);
      }
    }
  }

  std::string parse_literal_string() {
    expect('\'');
    std::string out;
    if (peek() == '\'' && peek_at(1) == '\'') {
      get();
      get();
      if (peek() == '\n') get();
      while (true) {
        if (eof()) fail("unterminated multi-line string");
        if (peek() == '\'' && peek_at(1) == '\'' && peek_at(2) == '\'') {
          pos_ += 3;
          return out;
        }
        out.push_back(get());
      }
    }
    while (true) {
      if (eof() || peek() == '\n') fail("unterminated string");
      char c = get();
      if (c == '\'') return out;
      out.push_back(c);
    }
  }
};

}  // namespace

YAML::Node parse_toml_document(const std::string& text) {
  return TomlReader(text).parse();
}

}  // namespace nf
