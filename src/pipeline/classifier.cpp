#include "ifacec/pipeline/classifier.hpp"
#include "ifacec/pipeline/arguments.hpp"
#include "ifacec/naming.hpp"

namespace ifacec {

namespace {

const char* kDowncastReturnShape = "expects trait method return type to be `Option<&ImplementerType>` only";
const char* kDowncastInputShape = "expects trait method to accept `&self` only and, optionally, `&Context`";

// Option<&T> -> T
std::optional<TypeExpr> downcast_target(const std::optional<TypeExpr>& ret){
    if(!ret || !ret->is_path() || ret->last_ident()!="Option" || ret->args.size()!=1) return std::nullopt;
    const TypeExpr& inner = ret->args.front();
    if(!inner.is_reference() || inner.is_mut) return std::nullopt;
    return inner.elem();
}

// &self [, &Context] -> Context (outer nullopt on a bad shape)
std::optional<std::optional<TypeExpr>> downcast_context(const MethodDecl& m){
    if(!m.receiver || m.receiver->syntax.kind!=syntax::ReceiverSyntax::Kind::SharedRef) return std::nullopt;
    if(m.params.size()>1) return std::nullopt;
    if(m.params.empty()) return std::optional<TypeExpr>{};
    const TypeExpr& ty = m.params.front().type;
    if(!ty.is_reference() || ty.is_mut) return std::nullopt;
    return std::optional<TypeExpr>{ty.elem()};
}

void reserved_name(DiagnosticSink& sink, const std::string& what, const std::string& name, const SourceLoc& at){
    sink.report(DiagKind::ReservedNamePrefix,
                what+" `"+name+"` must not begin with `__`",
                "names beginning with `__` are reserved for the introspection system", at);
}

// true when the receiver is `&self`; reports otherwise
bool check_field_receiver(const MethodDecl& m, DiagnosticSink& sink){
    using RK = syntax::ReceiverSyntax::Kind;
    const char* invalid = "trait method receiver can only be a shared reference `&self`";
    const char* missing = "trait method should have a shared reference receiver `&self`";
    if(m.receiver){
        switch(m.receiver->syntax.kind){
            case RK::SharedRef: return true;
            case RK::MutRef:
            case RK::Owned:
                sink.report(DiagKind::InvalidReceiverShape, invalid, "declare the receiver as `&self`", m.receiver->loc);
                return false;
            case RK::Typed:
                sink.report(DiagKind::MissingReceiver, missing, "declare the receiver as `&self`", m.receiver->loc);
                return false;
        }
    }
    if(!m.params.empty()){
        const auto& first = m.params.front();
        if(first.pattern.kind==syntax::PatternSyntax::Kind::Ident && unraw(first.pattern.ident)!="self"){
            sink.report(DiagKind::InvalidReceiverShape, invalid, "declare the receiver as `&self`", first.loc);
            return false;
        }
        sink.report(DiagKind::MissingReceiver, missing, "add `:receiver \"&self\"` to the method", first.loc);
        return false;
    }
    sink.report(DiagKind::MissingReceiver, missing, "add `:receiver \"&self\"` to the method", m.loc);
    return false;
}

} // namespace

std::optional<DowncastCandidate> parse_downcast(const MethodDecl& m, DiagnosticSink& sink){
    auto target = downcast_target(m.ret);
    if(!target){
        sink.report(DiagKind::InvalidDowncastSignature, kDowncastReturnShape,
                    "declare `"+m.ident+"` as returning `Option<&ImplementerType>`", m.loc);
        return std::nullopt;
    }
    auto context = downcast_context(m);
    if(!context){
        sink.report(DiagKind::InvalidDowncastSignature, kDowncastInputShape,
                    "declare `"+m.ident+"` with `&self` and at most one `&Context` parameter",
                    m.receiver ? m.receiver->loc : m.loc);
        return std::nullopt;
    }
    if(m.is_async){
        sink.report(DiagKind::UnsupportedAsyncDowncast, "async downcast to interface implementer is not supported",
                    "remove `:async` from `"+m.ident+"`", m.loc);
        return std::nullopt;
    }
    return DowncastCandidate{m.ident, std::move(*target), std::move(*context), m.loc};
}

std::optional<FieldDefinition> parse_field(const MethodDecl& m, const MethodOptions& opts, bool internal, DiagnosticSink& sink){
    std::string name = opts.name ? opts.name->value : to_camel_case(unraw(m.ident));
    if(!internal && has_reserved_prefix(name)){
        reserved_name(sink, "field name", name, opts.name ? opts.name->loc : m.loc);
        return std::nullopt;
    }
    if(!check_field_receiver(m, sink)) return std::nullopt;

    FieldDefinition f;
    f.name = std::move(name);
    // the receiver is not a parameter; a leading `self` param was rejected above
    f.arguments = resolve_arguments(m.params, internal, sink);
    f.type = erase_lifetimes(m.ret ? *m.ret : TypeExpr::unit());
    if(opts.description) f.description = opts.description->value;
    if(opts.deprecated) f.deprecation = opts.deprecated->value;
    f.method = m.ident;
    f.is_async = m.is_async;
    return f;
}

ClassifiedMethods classify_methods(const ContractDeclaration& decl, DiagnosticSink& sink){
    ClassifiedMethods out;
    for(const auto& item: decl.items){
        const MethodDecl* m = std::get_if<MethodDecl>(&item);
        if(!m) continue;
        if(auto err = extraction_error(m->options)){
            sink.report(DiagKind::DirectiveParseFailure, err->message, "", err->loc);
            continue;
        }
        const MethodOptions& opts = *options_of(m->options);
        if(opts.ignore) continue;
        if(opts.downcast){
            if(auto d = parse_downcast(*m, sink)) out.downcasts.push_back(std::move(*d));
            continue;
        }
        if(auto f = parse_field(*m, opts, decl.options.internal, sink)) out.fields.push_back(std::move(*f));
    }
    return out;
}

} // namespace ifacec
