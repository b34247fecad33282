// ndflow kernel: Address value and the address grammar parser
#pragma once

#include <map>
#include <optional>
#include <string>

#include "nf_types.hpp"

namespace nf {

enum class AddressKind { File, Protocol, Profile, Plugin, Stdio };

const char* address_kind_name(AddressKind kind);

// Parsed form of `base[~format[.variant]][?query]`.
// Created once per invocation by parse_address() and never mutated afterwards.
struct Address {
  std::string raw;
  std::string base;
  std::optional<std::string> format_override;
  std::map<std::string, std::string> parameters;
  AddressKind kind = AddressKind::File;
  std::optional<std::string> compression;  // "gz", "bz2" or "xz"

  // Base with its compression suffix re-attached (the on-disk name / full URL).
  std::string full_base() const;
  // "scheme" part of a protocol address, empty otherwise.
  std::string scheme() const;
  // Namespace of @ns/component, or the name of @name.
  std::string reference_namespace() const;
};

bool operator==(const Address& a, const Address& b);
inline bool operator!=(const Address& a, const Address& b) { return !(a == b); }

// Parse a raw address. Throws FlowError(FlowErrc::Syntax) on malformed input.
Address parse_address(const std::string& raw);

// Canonical string form; parse_address(to_string(a)) is equivalent to a.
std::string to_string(const Address& address);

// Query string helpers, shared with the profile service.
std::map<std::string, std::string> parse_query_string(const std::string& query);
std::string percent_decode(const std::string& text, bool plus_as_space);
std::string percent_encode(const std::string& text, const std::string& keep = "");
std::string encode_query(const std::map<std::string, std::string>& params);

}  // namespace nf
