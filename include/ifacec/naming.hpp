// naming.hpp - identifier casing helpers shared by the classifier and argument resolver
#pragma once
#include <string>

namespace ifacec {

// Strips a raw identifier prefix: "r#type" -> "type".
std::string unraw(const std::string& ident);

// snake_case -> camelCase. A leading underscore survives as a single '_';
// one-letter parts after the first are upper-cased whole.
std::string to_camel_case(const std::string& s);

// Names starting with "__" are reserved for introspection.
inline bool has_reserved_prefix(const std::string& name){ return name.rfind("__", 0) == 0; }

} // namespace ifacec
