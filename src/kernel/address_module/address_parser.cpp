// ndflow kernel: address grammar parser
#include "kernel/address.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace nf {

namespace {

constexpr std::array<const char*, 3> kCompressionSuffixes = {"gz", "bz2", "xz"};

std::string trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(s.rbegin(), s.rend(),
                              [](unsigned char c) { return std::isspace(c); })
                 .base();
  return begin < end ? std::string(begin, end) : std::string();
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_format_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// Expand `format.variant` shorthand into named parameters.
std::map<std::string, std::string> expand_shorthand(const std::string& format,
                                                    const std::string& variant) {
  if (format == "table") return {{"tablefmt", variant}};
  return {};
}

// Locate the `~format` marker, or npos when the address carries none.
std::string::size_type find_format_marker(const std::string& raw, bool is_protocol) {
  if (is_protocol) {
    auto tilde = raw.rfind('~');
    if (tilde == std::string::npos) return tilde;
    // A '~' followed by a path separator belongs to the URL (e.g. /~user/).
    auto segment = raw.substr(tilde + 1);
    segment = segment.substr(0, segment.find('?'));
    if (segment.find('/') != std::string::npos) return std::string::npos;
    return tilde;
  }
  auto query = raw.find('?');
  auto head = raw.substr(0, query);
  return head.rfind('~');
}

AddressKind determine_kind(const std::string& base) {
  if (base == "-" || base == "stdin" || base == "stdout") return AddressKind::Stdio;
  if (!base.empty() && base[0] == '@') {
    return base.find('/') != std::string::npos ? AddressKind::Profile
                                               : AddressKind::Plugin;
  }
  if (base.find("://") != std::string::npos) return AddressKind::Protocol;
  return AddressKind::File;
}

void validate(const std::string& raw, const std::string& base, AddressKind kind) {
  if (base.empty()) {
    throw FlowError(FlowErrc::Syntax, "Base address cannot be empty: '" + raw + "'");
  }
  switch (kind) {
    case AddressKind::Profile: {
      auto ref = base.substr(1);
      auto slash = ref.find('/');
      auto ns = ref.substr(0, slash);
      auto component = ref.substr(slash + 1);
      if (component.find('/') != std::string::npos) {
        throw FlowError(FlowErrc::Syntax,
                        "Profile reference must be @namespace/component: '" + base + "'");
      }
      if (ns.empty() || component.empty()) {
        throw FlowError(FlowErrc::Syntax,
                        "Profile namespace and component cannot be empty: '" + base + "'");
      }
      break;
    }
    case AddressKind::Plugin:
      if (base.size() == 1) {
        throw FlowError(FlowErrc::Syntax, "Plugin name cannot be empty: '" + base + "'");
      }
      break;
    case AddressKind::Protocol:
      if (base.find("://") == 0) {
        throw FlowError(FlowErrc::Syntax, "Protocol cannot be empty: '" + base + "'");
      }
      break;
    default:
      break;
  }
}

}  // namespace

const char* address_kind_name(AddressKind kind) {
  switch (kind) {
    case AddressKind::File: return "file";
    case AddressKind::Protocol: return "protocol";
    case AddressKind::Profile: return "profile";
    case AddressKind::Plugin: return "plugin";
    case AddressKind::Stdio: return "stdio";
  }
  return "file";
}

std::string Address::full_base() const {
  return compression ? base + "." + *compression : base;
}

std::string Address::scheme() const {
  if (kind != AddressKind::Protocol) return {};
  return base.substr(0, base.find("://"));
}

std::string Address::reference_namespace() const {
  if (kind != AddressKind::Profile && kind != AddressKind::Plugin) return {};
  auto ref = base.substr(1);
  return ref.substr(0, ref.find('/'));
}

bool operator==(const Address& a, const Address& b) {
  return a.base == b.base && a.format_override == b.format_override &&
         a.parameters == b.parameters && a.kind == b.kind &&
         a.compression == b.compression;
}

Address parse_address(const std::string& input) {
  const std::string raw = trim(input);
  if (raw.empty()) throw FlowError(FlowErrc::Syntax, "Address cannot be empty");

  const bool is_protocol = raw.find("://") != std::string::npos;

  Address addr;
  addr.raw = raw;

  auto tilde = find_format_marker(raw, is_protocol);
  if (tilde != std::string::npos) {
    // Everything after the marker is addressing syntax, nested '?' included.
    std::string format_part = raw.substr(tilde + 1);
    std::string format_str = format_part;
    auto q = format_part.find('?');
    if (q != std::string::npos) {
      format_str = format_part.substr(0, q);
      addr.parameters = parse_query_string(format_part.substr(q + 1));
    }
    if (format_str.empty()) {
      throw FlowError(FlowErrc::Syntax, "Format override cannot be empty: '" + raw + "'");
    }
    std::string format = format_str;
    auto dot = format_str.find('.');
    if (dot != std::string::npos) {
      format = format_str.substr(0, dot);
      for (auto& kv : expand_shorthand(format, format_str.substr(dot + 1))) {
        addr.parameters[kv.first] = kv.second;
      }
    }
    if (format.empty() || !std::all_of(format.begin(), format.end(), is_format_char)) {
      throw FlowError(FlowErrc::Syntax,
                      "Invalid format name: '" + format_str +
                          "'. Format names are simple identifiers like 'csv', 'json', 'table'");
    }
    addr.format_override = format;
    addr.base = raw.substr(0, tilde);
  } else if (!is_protocol && raw.find('?') != std::string::npos) {
    auto q = raw.find('?');
    addr.base = raw.substr(0, q);
    addr.parameters = parse_query_string(raw.substr(q + 1));
  } else {
    // Protocol URLs keep their query string.
    addr.base = raw;
  }

  for (const char* ext : kCompressionSuffixes) {
    std::string suffix = std::string(".") + ext;
    if (addr.base.size() > suffix.size() && ends_with(addr.base, suffix)) {
      addr.compression = ext;
      addr.base.erase(addr.base.size() - suffix.size());
      break;
    }
  }

  addr.kind = determine_kind(addr.base);
  validate(raw, addr.base, addr.kind);
  return addr;
}

std::string to_string(const Address& address) {
  std::string out = address.full_base();
  if (address.format_override) out += "~" + *address.format_override;
  if (!address.parameters.empty()) out += "?" + encode_query(address.parameters);
  return out;
}

}  // namespace nf
