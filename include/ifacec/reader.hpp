// reader.hpp - EDN declaration documents -> ContractDeclaration / ImplBlockDeclaration
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/edn.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ifacec {

// Structural problem in a declaration form (unknown declaration key, bad value shape,
// unparseable type). Thrown by the form readers, collected by read_document.
struct declaration_error : std::runtime_error {
    declaration_error(const std::string& msg, SourceLoc at) : std::runtime_error(msg), loc(at) {}
    SourceLoc loc;
};

struct ReadFailure { std::string message; SourceLoc loc; };

using DeclarationItem = std::variant<ContractDeclaration, ImplBlockDeclaration>;

struct ReadResult {
    bool success{true};
    std::vector<DeclarationItem> items;   // in document order
    std::vector<ReadFailure> failures;
};

// Reads every top-level (interface ...) and (impl ...) form. A failing form is reported and
// skipped; the remaining forms are still read.
ReadResult read_document(std::string_view src);

ContractDeclaration read_contract_form(const edn::node_ptr& form);
ImplBlockDeclaration read_impl_form(const edn::node_ptr& form);

// Parse and read a single (interface ...) form; throws edn::parse_error or declaration_error.
ContractDeclaration read_contract(std::string_view src);
ImplBlockDeclaration read_impl(std::string_view src);

} // namespace ifacec
