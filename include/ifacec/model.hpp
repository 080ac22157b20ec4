// model.hpp - compiled contract model and dispatch artifact
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ifacec {

// ------ Arguments ------
struct ContextArgument { TypeExpr type; };
struct ExecutorArgument {};
struct RegularArgument {
    std::string name;
    TypeExpr type;
    std::optional<std::string> description;
    std::optional<std::string> default_value; // EDN text
};
using ArgumentDefinition = std::variant<ContextArgument, ExecutorArgument, RegularArgument>;

inline const TypeExpr* context_type_of(const ArgumentDefinition& a){
    if(auto c = std::get_if<ContextArgument>(&a)) return &c->type;
    return nullptr;
}

struct FieldDefinition {
    std::string name;
    TypeExpr type; // lifetimes erased
    std::optional<std::string> description;
    std::optional<Deprecation> deprecation;
    std::vector<ArgumentDefinition> arguments;
    std::string method;
    bool is_async{false};
};

// ------ Implementers ------
struct ByMethod { std::string method; bool with_context{false}; };
struct ByExternalFunction { std::string function; };
using DowncastBinding = std::variant<ByMethod, ByExternalFunction>;

struct ImplementerDefinition {
    TypeExpr type;
    std::optional<DowncastBinding> downcast;
    std::optional<TypeExpr> context; // required by a method downcast
    SourceLoc loc;
};

// ------ Scalar parameter ------
struct ConcreteScalar { TypeExpr type; };
struct ExplicitGenericScalar { std::string param; };
struct ImplicitGenericScalar { std::string param; TypeExpr default_type; };
using ScalarParameterKind = std::variant<ConcreteScalar, ExplicitGenericScalar, ImplicitGenericScalar>;

struct AsyncMarking {
    bool is_async{false};
    std::vector<std::string> extra_bounds; // capability bounds attached to the contract
};

struct ContractModel {
    std::string name;
    std::string trait_ident;
    std::string dispatch_ident;
    std::string visibility;
    std::optional<std::string> description;
    std::optional<TypeExpr> context;
    ScalarParameterKind scalar;
    std::vector<std::string> generics;
    std::vector<FieldDefinition> fields;
    std::vector<ImplementerDefinition> implementers;
    AsyncMarking async;
};

// ------ Dispatch artifacts ------
struct OpenDispatch {
    std::string alias;
    std::string trait_ident;
    std::vector<std::string> alias_generics; // contract generics followed by the scalar param if generic
    TypeExpr scalar;
    TypeExpr context; // () when the contract has none
    std::vector<std::string> where_bounds; // "S: ScalarValue"
    std::vector<std::string> bounds; // auto bounds of the dynamic handle
    std::string lifetime;
};

struct MethodParam { std::string name; TypeExpr type; };
struct MethodSignature {
    std::string ident;
    std::string receiver; // "&self", empty when absent
    std::vector<MethodParam> params;
    TypeExpr ret;
    bool is_async{false};
};

struct ClosedVariant { std::string name; TypeExpr type; };

struct ClosedDispatch {
    std::string ident;
    std::string trait_ident;
    std::vector<std::string> generics;
    std::vector<std::string> where_bounds;
    std::vector<ClosedVariant> variants; // one per implementer, registry order
    std::vector<std::string> assoc_types;
    std::vector<AssocConstDecl> assoc_consts;
    std::vector<MethodSignature> methods;
    bool is_async{false};
};

using DispatchArtifact = std::variant<OpenDispatch, ClosedDispatch>;

// ------ Implementer block adaptation ------
struct ImplAdaptation {
    TypeExpr trait_path;   // scalar appended unless explicitly generic
    TypeExpr self_type;
    std::vector<std::string> generics;
    std::vector<std::string> where_bounds;
    ScalarParameterKind scalar;
    bool is_async{false};
};

} // namespace ifacec
