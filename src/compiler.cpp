#include "ifacec/compiler.hpp"
#include "ifacec/diagnostics_json.hpp"
#include "ifacec/naming.hpp"
#include "ifacec/pipeline/async_marker.hpp"
#include "ifacec/pipeline/classifier.hpp"
#include "ifacec/pipeline/dispatch.hpp"
#include "ifacec/pipeline/implementers.hpp"
#include "ifacec/pipeline/scalar.hpp"

namespace ifacec {

namespace {

CompileResult aborted(const CompileEnv& env, const char* phase, DiagnosticSink& sink){
    trace(env, "compile", "aborted after %s phase with %zu diagnostic(s)", phase, sink.items().size());
    CompileResult r;
    r.success = false;
    r.diagnostics = sink.take();
    maybe_print_json(env, false, r.diagnostics);
    return r;
}

// explicit option, else the first Context argument, else the first method downcast's context
std::optional<TypeExpr> resolve_context(const ContractDeclaration& decl,
                                        const std::vector<FieldDefinition>& fields,
                                        const std::vector<ImplementerDefinition>& impls){
    if(decl.options.context) return decl.options.context->value;
    for(const auto& f: fields)
        for(const auto& a: f.arguments)
            if(auto t = context_type_of(a)) return *t;
    for(const auto& i: impls)
        if(i.context) return i.context;
    return std::nullopt;
}

} // namespace

CompileResult ContractCompiler::compile(const ContractDeclaration& decl) const {
    DiagnosticSink sink;
    trace(env_, "compile", "contract %s", decl.ident.c_str());

    // Declaration level
    std::string name = decl.options.name ? decl.options.name->value : unraw(decl.ident);
    if(!decl.options.internal && has_reserved_prefix(name)){
        sink.report(DiagKind::ReservedNamePrefix, "interface name `"+name+"` must not begin with `__`",
                    "names beginning with `__` are reserved for the introspection system",
                    decl.options.name ? decl.options.name->loc : decl.loc);
    }
    ImplementerRegistry registry;
    registry.seed(decl.options.implementers);
    registry.apply_external(decl.options.external_downcasts, sink);
    trace(env_, "implementers", "%zu implementer(s), %zu external downcast(s)",
          registry.implementers().size(), decl.options.external_downcasts.size());
    if(sink.dirty()) return aborted(env_, "declaration", sink);

    // Method level
    ClassifiedMethods methods = classify_methods(decl, sink);
    trace(env_, "classify", "%zu field(s), %zu downcast method(s)", methods.fields.size(), methods.downcasts.size());
    for(const auto& d: methods.downcasts) registry.apply_method(d, sink);
    if(sink.dirty()) return aborted(env_, "method", sink);

    ContractModel model;
    model.name = std::move(name);
    model.trait_ident = decl.ident;
    model.dispatch_ident = dispatch_ident(decl);
    model.visibility = decl.visibility;
    if(decl.options.description) model.description = decl.options.description->value;
    model.implementers = registry.take();
    model.context = resolve_context(decl, methods.fields, model.implementers);
    model.fields = std::move(methods.fields);
    model.scalar = resolve_scalar(decl.options.scalar, decl.generics, env_);
    model.generics = decl.generics;
    model.async = mark_async(decl);
    trace(env_, "scalar", "%s", scalar_bound(model.scalar).c_str());
    trace(env_, "async", "async=%d bounds=%zu", model.async.is_async ? 1 : 0, model.async.extra_bounds.size());

    DispatchArtifact artifact = select_dispatch(decl, model);
    trace(env_, "dispatch", "%s %s", is_open(artifact) ? "open" : "closed", model.dispatch_ident.c_str());

    CompileResult r;
    r.success = true;
    r.model = std::move(model);
    r.artifact = std::move(artifact);
    maybe_print_json(env_, true, r.diagnostics);
    return r;
}

ImplAdaptation ContractCompiler::adapt(const ImplBlockDeclaration& block) const {
    return adapt_impl_block(block, env_);
}

} // namespace ifacec
