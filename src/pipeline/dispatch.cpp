#include "ifacec/pipeline/dispatch.hpp"
#include "ifacec/pipeline/scalar.hpp"
#include "ifacec/syntax.hpp"

namespace ifacec {

std::string dispatch_ident(const ContractDeclaration& decl){
    const auto& d = decl.options.dispatch;
    if(d.mode==DispatchMode::Open) return decl.ident;
    if(d.mode==DispatchMode::Closed && !d.ident.empty()) return d.ident;
    return decl.ident + "Value";
}

namespace {

MethodSignature signature_of(const MethodDecl& m){
    MethodSignature s;
    s.ident = m.ident;
    if(m.receiver) s.receiver = syntax::to_string(m.receiver->syntax);
    for(const auto& p: m.params) s.params.push_back(MethodParam{p.pattern.text, p.type});
    s.ret = m.ret ? *m.ret : TypeExpr::unit();
    s.is_async = m.is_async;
    return s;
}

OpenDispatch open_dispatch(const ContractDeclaration& decl, const ContractModel& model){
    OpenDispatch o;
    o.alias = decl.options.dispatch.ident;
    o.trait_ident = decl.ident;
    o.alias_generics = signature_generics(decl.generics, model.scalar);
    o.where_bounds = {scalar_bound(model.scalar)};
    o.scalar = scalar_type(model.scalar);
    o.context = model.context ? *model.context : TypeExpr::unit();
    o.bounds = {"Send", "Sync"};
    o.lifetime = "a";
    return o;
}

ClosedDispatch closed_dispatch(const ContractDeclaration& decl, const ContractModel& model){
    ClosedDispatch c;
    c.ident = model.dispatch_ident;
    c.trait_ident = decl.ident;
    c.generics = signature_generics(decl.generics, model.scalar);
    c.where_bounds = {scalar_bound(model.scalar)};
    for(const auto& impl: model.implementers) c.variants.push_back(ClosedVariant{impl.type.last_ident(), impl.type});
    for(const auto& item: decl.items){
        if(auto t = std::get_if<AssocTypeDecl>(&item)) c.assoc_types.push_back(t->ident);
        else if(auto k = std::get_if<AssocConstDecl>(&item)) c.assoc_consts.push_back(*k);
        else c.methods.push_back(signature_of(std::get<MethodDecl>(item)));
    }
    c.is_async = model.async.is_async;
    return c;
}

} // namespace

DispatchArtifact select_dispatch(const ContractDeclaration& decl, const ContractModel& model){
    if(decl.options.dispatch.mode==DispatchMode::Open) return open_dispatch(decl, model);
    return closed_dispatch(decl, model);
}

} // namespace ifacec
