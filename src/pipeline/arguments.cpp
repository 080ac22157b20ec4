#include "ifacec/pipeline/arguments.hpp"
#include "ifacec/naming.hpp"

namespace ifacec {

namespace {

// Special-role arguments are not exposed, so naming/description/default directives make no sense on them.
bool ensure_no_regular_directives(const ArgumentOptions& opts, const char* role, DiagnosticSink& sink){
    auto reject = [&](const char* directive, const SourceLoc& at){
        sink.report(DiagKind::DisallowedDirectiveCombination,
                    std::string("directive `:")+directive+"` is not allowed here",
                    std::string("a ")+role+" argument is not exposed as a field argument", at);
        return false;
    };
    if(opts.name) return reject("name", opts.name->loc);
    if(opts.description) return reject("description", opts.description->loc);
    if(opts.default_value) return reject("default", opts.default_value->loc);
    return true;
}

std::optional<ArgumentDefinition> special_role(const ParamDecl& p, const ArgumentOptions& opts, bool context, DiagnosticSink& sink){
    if(!ensure_no_regular_directives(opts, context ? "context" : "executor", sink)) return std::nullopt;
    if(context) return ArgumentDefinition{ContextArgument{unreferenced(p.type)}};
    return ArgumentDefinition{ExecutorArgument{}};
}

const char* role_name(const ArgumentDefinition& a){
    return std::holds_alternative<ContextArgument>(a) ? "context" : "executor";
}

} // namespace

std::optional<ArgumentDefinition> resolve_argument(const ParamDecl& p, bool internal, DiagnosticSink& sink){
    if(auto err = extraction_error(p.options)){
        sink.report(DiagKind::DirectiveParseFailure, err->message, "", err->loc);
        return std::nullopt;
    }
    const ArgumentOptions& opts = *options_of(p.options);

    if(opts.context && opts.executor){
        sink.report(DiagKind::DisallowedDirectiveCombination,
                    "directive `:executor` is not allowed together with `:context`",
                    "an argument is either the context or the executor", *opts.executor);
        return std::nullopt;
    }
    if(opts.context) return special_role(p, opts, true, sink);
    if(opts.executor) return special_role(p, opts, false, sink);

    using PK = syntax::PatternSyntax::Kind;
    if(p.pattern.kind==PK::Ident){
        std::string id = unraw(p.pattern.ident);
        if(id=="context" || id=="ctx") return special_role(p, opts, true, sink);
        if(id=="executor") return special_role(p, opts, false, sink);
    }

    std::string name;
    if(opts.name) name = opts.name->value;
    else if(p.pattern.kind==PK::Ident) name = to_camel_case(unraw(p.pattern.ident));
    else {
        auto& d = sink.report(DiagKind::MalformedArgumentPattern,
                              "trait method argument should be declared as a single identifier",
                              "", p.loc);
        add_note(d, "use `:name \"...\"` directive to specify custom argument's name without requiring it being a single identifier", p.loc);
        return std::nullopt;
    }
    if(!internal && has_reserved_prefix(name)){
        sink.report(DiagKind::ReservedNamePrefix, "argument name `"+name+"` must not begin with `__`",
                    "names beginning with `__` are reserved for the introspection system",
                    opts.name ? opts.name->loc : p.loc);
        return std::nullopt;
    }

    RegularArgument r;
    r.name = std::move(name);
    r.type = p.type;
    if(opts.description) r.description = opts.description->value;
    if(opts.default_value) r.default_value = opts.default_value->value;
    return ArgumentDefinition{std::move(r)};
}

std::vector<ArgumentDefinition> resolve_arguments(const std::vector<ParamDecl>& params, bool internal, DiagnosticSink& sink){
    std::vector<ArgumentDefinition> out;
    const ParamDecl* first_context = nullptr;
    const ParamDecl* first_executor = nullptr;
    for(const auto& p: params){
        auto a = resolve_argument(p, internal, sink);
        if(!a) continue;
        if(!std::holds_alternative<RegularArgument>(*a)){
            const ParamDecl*& first = std::holds_alternative<ContextArgument>(*a) ? first_context : first_executor;
            if(first){
                std::string role = role_name(*a);
                auto& d = sink.report(DiagKind::DuplicateArgumentRole,
                                      "field method declares more than one "+role+" argument",
                                      "keep a single "+role+" argument", p.loc);
                add_note(d, "first "+role+" argument `"+first->pattern.text+"` declared here", first->loc);
                continue;
            }
            first = &p;
        }
        out.push_back(std::move(*a));
    }
    return out;
}

} // namespace ifacec
