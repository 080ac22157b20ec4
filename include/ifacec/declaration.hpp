// declaration.hpp - structured contract declarations handed to the compiler by the directive reader
#pragma once
#include "ifacec/edn.hpp"
#include "ifacec/syntax.hpp"
#include "ifacec/types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ifacec {

template<typename T>
struct Spanned { T value; SourceLoc loc; };

// A directive bag that could not be extracted; reported by the stage consuming the bag.
struct DirectiveError { std::string message; SourceLoc loc; };

template<typename T>
using Extracted = std::variant<T, DirectiveError>;

template<typename T>
inline const T* options_of(const Extracted<T>& e){ return std::get_if<T>(&e); }
template<typename T>
inline const DirectiveError* extraction_error(const Extracted<T>& e){ return std::get_if<DirectiveError>(&e); }

struct ArgumentOptions {
    std::optional<Spanned<std::string>> name;
    std::optional<Spanned<std::string>> description;
    std::optional<Spanned<std::string>> default_value; // EDN text of the default
    std::optional<SourceLoc> context;
    std::optional<SourceLoc> executor;
};

struct Deprecation { std::optional<std::string> reason; };

struct MethodOptions {
    std::optional<Spanned<std::string>> name;
    std::optional<Spanned<std::string>> description;
    std::optional<Spanned<Deprecation>> deprecated;
    std::optional<SourceLoc> ignore;
    std::optional<SourceLoc> downcast;
};

struct ParamDecl {
    syntax::PatternSyntax pattern;
    TypeExpr type;
    Extracted<ArgumentOptions> options{ArgumentOptions{}};
    SourceLoc loc;
};

struct Receiver { syntax::ReceiverSyntax syntax; SourceLoc loc; };

struct MethodDecl {
    std::string ident;
    std::optional<Receiver> receiver;
    std::vector<ParamDecl> params;
    std::optional<TypeExpr> ret; // none means ()
    bool is_async{false};
    bool has_default_body{false};
    Extracted<MethodOptions> options{MethodOptions{}};
    SourceLoc loc;
};

struct AssocTypeDecl { std::string ident; SourceLoc loc; };
struct AssocConstDecl { std::string ident; TypeExpr type; SourceLoc loc; };

using TraitItem = std::variant<MethodDecl, AssocTypeDecl, AssocConstDecl>;

enum class DispatchMode { Unspecified, Open, Closed };

struct DispatchOption {
    DispatchMode mode{DispatchMode::Unspecified};
    std::string ident; // alias (open) or enum name (closed)
    SourceLoc loc;
};

struct ExternalDowncast {
    TypeExpr target;
    std::string function; // path of the downcasting function
    SourceLoc loc;
};

struct ContractOptions {
    std::optional<Spanned<std::string>> name;
    std::optional<Spanned<std::string>> description;
    std::optional<Spanned<TypeExpr>> scalar;
    std::vector<Spanned<TypeExpr>> implementers;
    std::vector<ExternalDowncast> external_downcasts;
    std::optional<Spanned<TypeExpr>> context;
    std::optional<SourceLoc> async;
    DispatchOption dispatch;
    bool internal{false};
};

struct ContractDeclaration {
    std::string ident;
    std::string visibility;
    std::vector<std::string> generics; // type parameters only
    std::vector<TraitItem> items;
    ContractOptions options;
    SourceLoc loc;
};

struct ImplMethodDecl { std::string ident; bool is_async{false}; SourceLoc loc; };

// (impl Trait :for Type ...) block whose trait path and generics get adapted to the scalar parameter.
struct ImplBlockDeclaration {
    TypeExpr trait_path;
    TypeExpr self_type;
    std::vector<std::string> generics;
    std::optional<Spanned<TypeExpr>> scalar;
    std::optional<SourceLoc> async;
    std::vector<ImplMethodDecl> methods;
    SourceLoc loc;
};

} // namespace ifacec
