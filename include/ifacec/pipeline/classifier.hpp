// classifier.hpp - sorts trait methods into fields and downcast operators
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/diagnostics.hpp"
#include "ifacec/model.hpp"
#include <optional>
#include <vector>

namespace ifacec {

// A method marked `:downcast` whose shape was accepted; not yet attached to an implementer.
struct DowncastCandidate {
    std::string method;
    TypeExpr target;                 // T of Option<&T>
    std::optional<TypeExpr> context; // referent of the optional &Context parameter
    SourceLoc loc;
};

struct ClassifiedMethods {
    std::vector<FieldDefinition> fields;       // declaration order
    std::vector<DowncastCandidate> downcasts;  // declaration order
};

// Every rejected method is reported and dropped; classification continues with the next one.
ClassifiedMethods classify_methods(const ContractDeclaration& decl, DiagnosticSink& sink);

std::optional<DowncastCandidate> parse_downcast(const MethodDecl& m, DiagnosticSink& sink);
std::optional<FieldDefinition> parse_field(const MethodDecl& m, const MethodOptions& opts, bool internal, DiagnosticSink& sink);

} // namespace ifacec
