#pragma once
#include "ifacec/types.hpp"
#include <string>
#include <string_view>

namespace ifacec::syntax {

struct TypeParseResult {
    bool success{false};
    TypeExpr type;
    std::string error_message; // if !success
    int column{0};
};

struct ReceiverSyntax {
    enum class Kind { SharedRef, MutRef, Owned, Typed } kind{Kind::Owned};
    std::string lifetime;  // &'a self
    bool mut_binding{false}; // mut self
    TypeExpr typed;        // self: Box<Self>
};

struct ReceiverParseResult {
    bool success{false};
    ReceiverSyntax receiver;
    std::string error_message;
    int column{0};
};

struct PatternSyntax {
    enum class Kind { Ident, Wildcard, Destructure } kind{Kind::Destructure};
    std::string ident; // Ident only, as written (raw prefix kept)
    bool mut_binding{false};
    std::string text;
};

// Parse a type such as "&'a Option<&'a Human>" or "Vec<(i32, String)>".
TypeParseResult parse_type(std::string_view src);
// Parse a method receiver: "&self", "&'a mut self", "mut self", "self: Box<Self>".
ReceiverParseResult parse_receiver(std::string_view src);
// "&'a self", "mut self", "self: Box<Self>"
std::string to_string(const ReceiverSyntax& r);
// Classify an argument pattern; anything but a bare (optionally mut/ref) identifier is a destructuring pattern.
PatternSyntax parse_pattern(std::string_view src);

} // namespace ifacec::syntax
