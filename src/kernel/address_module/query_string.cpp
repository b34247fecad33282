// ndflow kernel: query string decoding/encoding for addresses
#include <array>
#include <cctype>
#include <string>

#include "kernel/address.hpp"

namespace nf {

namespace {

// Comparison operators recognised in `field<op>value` pairs.
constexpr std::array<const char*, 3> kOperators = {">=", "<=", "!="};

const std::string kOrSeparator = "||";

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool has_operator_suffix(const std::string& key, std::string* field, std::string* op) {
  for (const char* candidate : kOperators) {
    std::string o(candidate);
    if (key.size() > o.size() && key.compare(key.size() - o.size(), o.size(), o) == 0) {
      if (field) *field = key.substr(0, key.size() - o.size());
      if (op) *op = o;
      return true;
    }
  }
  return false;
}

}  // namespace

std::string percent_decode(const std::string& text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size()) {
      int hi = hex_value(text[i + 1]);
      int lo = hex_value(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out.push_back(' ');
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::string percent_encode(const std::string& text, const std::string& keep) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
        keep.find(static_cast<char>(c)) != std::string::npos) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

// Split `a=1&b>=2&a=3` into {a: "1||3", "b>=": "2"}.
// Operators are detected after percent-decoding so that `b%3E%3D2` is
// equivalent to `b>=2`.
std::map<std::string, std::string> parse_query_string(const std::string& query) {
  std::map<std::string, std::string> result;
  std::size_t start = 0;
  while (start <= query.size()) {
    auto amp = query.find('&', start);
    std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos
                                                                     : amp - start);
    start = (amp == std::string::npos) ? query.size() + 1 : amp + 1;
    if (pair.empty()) continue;

    std::string decoded = percent_decode(pair, /*plus_as_space*/ true);
    std::string key;
    std::string value;
    auto eq = decoded.find('=');
    if (eq == std::string::npos) {
      key = decoded;
    } else {
      key = decoded.substr(0, eq);
      value = decoded.substr(eq + 1);
      if (eq >= 2) {
        char prev = decoded[eq - 1];
        if (prev == '>' || prev == '<' || prev == '!') key.push_back('=');
      }
    }
    if (key.empty()) continue;

    auto it = result.find(key);
    if (it == result.end()) {
      result.emplace(key, value);
    } else {
      it->second += kOrSeparator + value;
    }
  }
  return result;
}

std::string encode_query(const std::map<std::string, std::string>& params) {
  std::string out;
  for (const auto& [key, value] : params) {
    if (!out.empty()) out += "&";
    std::string field;
    std::string op;
    if (has_operator_suffix(key, &field, &op)) {
      out += percent_encode(field) + op + percent_encode(value, "|");
    } else {
      out += percent_encode(key) + "=" + percent_encode(value, "|");
    }
  }
  return out;
}

}  // namespace nf
