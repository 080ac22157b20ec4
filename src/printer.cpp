#include "ifacec/printer.hpp"

namespace ifacec {
using namespace edn;

namespace {

node_ptr ty(const TypeExpr& t){ return n_str(to_string(t)); }

node_ptr form(const std::string& head, node_ptr first){ return node_list({n_sym(head), std::move(first)}); }

node_ptr strings(const std::vector<std::string>& xs){
    std::vector<node_ptr> v;
    for(auto& x: xs) v.push_back(n_str(x));
    return node_vec(std::move(v));
}

node_ptr argument_to_edn(const ArgumentDefinition& a){
    if(auto c = std::get_if<ContextArgument>(&a)) return form("context", ty(c->type));
    if(std::holds_alternative<ExecutorArgument>(a)) return node_list({n_sym("executor")});
    const auto& r = std::get<RegularArgument>(a);
    auto out = form("argument", n_str(r.name));
    append_kv(out, "type", ty(r.type));
    if(r.description) append_kv(out, "description", n_str(*r.description));
    if(r.default_value) append_kv(out, "default", n_str(*r.default_value));
    return out;
}

node_ptr field_to_edn(const FieldDefinition& f){
    auto out = form("field", n_str(f.name));
    append_kv(out, "type", ty(f.type));
    append_kv(out, "method", n_sym(f.method));
    append_kv(out, "async", n_bool(f.is_async));
    if(f.description) append_kv(out, "description", n_str(*f.description));
    if(f.deprecation) append_kv(out, "deprecated", f.deprecation->reason ? n_str(*f.deprecation->reason) : n_bool(true));
    std::vector<node_ptr> args;
    for(auto& a: f.arguments) args.push_back(argument_to_edn(a));
    append_kv(out, "arguments", node_vec(std::move(args)));
    return out;
}

node_ptr implementer_to_edn(const ImplementerDefinition& i){
    auto out = form("implementer", ty(i.type));
    if(i.downcast){
        if(auto m = std::get_if<ByMethod>(&*i.downcast)){
            auto b = form("by-method", n_sym(m->method));
            append_kv(b, "with-context", n_bool(m->with_context));
            append_kv(out, "downcast", b);
        } else {
            append_kv(out, "downcast", form("by-external", n_str(std::get<ByExternalFunction>(*i.downcast).function)));
        }
    }
    if(i.context) append_kv(out, "context", ty(*i.context));
    return out;
}

node_ptr signature_to_edn(const MethodSignature& s){
    auto out = form("fn", n_sym(s.ident));
    if(!s.receiver.empty()) append_kv(out, "receiver", n_str(s.receiver));
    std::vector<node_ptr> ps;
    for(auto& p: s.params) ps.push_back(node_list({n_sym("param"), n_str(p.name), ty(p.type)}));
    append_kv(out, "params", node_vec(std::move(ps)));
    append_kv(out, "ret", ty(s.ret));
    append_kv(out, "async", n_bool(s.is_async));
    return out;
}

} // namespace

node_ptr scalar_to_edn(const ScalarParameterKind& k){
    if(auto c = std::get_if<ConcreteScalar>(&k)) return form("concrete", ty(c->type));
    if(auto e = std::get_if<ExplicitGenericScalar>(&k)) return form("explicit-generic", n_sym(e->param));
    const auto& i = std::get<ImplicitGenericScalar>(k);
    auto out = form("implicit-generic", n_sym(i.param));
    append_kv(out, "default", ty(i.default_type));
    return out;
}

node_ptr model_to_edn(const ContractModel& m){
    auto out = form("contract", n_sym(m.trait_ident));
    append_kv(out, "name", n_str(m.name));
    append_kv(out, "dispatch-ident", n_sym(m.dispatch_ident));
    append_kv(out, "visibility", n_str(m.visibility));
    if(m.description) append_kv(out, "description", n_str(*m.description));
    if(m.context) append_kv(out, "context", ty(*m.context));
    append_kv(out, "scalar", scalar_to_edn(m.scalar));
    append_kv(out, "generics", strings(m.generics));
    append_kv(out, "async", n_bool(m.async.is_async));
    append_kv(out, "bounds", strings(m.async.extra_bounds));
    std::vector<node_ptr> fs;
    for(auto& f: m.fields) fs.push_back(field_to_edn(f));
    append_kv(out, "fields", node_vec(std::move(fs)));
    std::vector<node_ptr> is;
    for(auto& i: m.implementers) is.push_back(implementer_to_edn(i));
    append_kv(out, "implementers", node_vec(std::move(is)));
    return out;
}

node_ptr artifact_to_edn(const DispatchArtifact& a){
    if(auto o = std::get_if<OpenDispatch>(&a)){
        auto out = form("open-dispatch", n_sym(o->alias));
        append_kv(out, "trait", n_sym(o->trait_ident));
        append_kv(out, "generics", strings(o->alias_generics));
        append_kv(out, "where", strings(o->where_bounds));
        append_kv(out, "scalar", ty(o->scalar));
        append_kv(out, "context", ty(o->context));
        append_kv(out, "bounds", strings(o->bounds));
        append_kv(out, "lifetime", n_str("'" + o->lifetime));
        return out;
    }
    const auto& c = std::get<ClosedDispatch>(a);
    auto out = form("closed-dispatch", n_sym(c.ident));
    append_kv(out, "trait", n_sym(c.trait_ident));
    append_kv(out, "generics", strings(c.generics));
    append_kv(out, "where", strings(c.where_bounds));
    append_kv(out, "async", n_bool(c.is_async));
    std::vector<node_ptr> vs;
    for(auto& v: c.variants) vs.push_back(node_list({n_sym("variant"), n_sym(v.name), ty(v.type)}));
    append_kv(out, "variants", node_vec(std::move(vs)));
    append_kv(out, "types", strings(c.assoc_types));
    std::vector<node_ptr> ks;
    for(auto& k: c.assoc_consts) ks.push_back(node_list({n_sym("const"), n_sym(k.ident), ty(k.type)}));
    append_kv(out, "consts", node_vec(std::move(ks)));
    std::vector<node_ptr> ms;
    for(auto& s: c.methods) ms.push_back(signature_to_edn(s));
    append_kv(out, "methods", node_vec(std::move(ms)));
    return out;
}

node_ptr adaptation_to_edn(const ImplAdaptation& a){
    auto out = form("impl-adaptation", ty(a.trait_path));
    append_kv(out, "for", ty(a.self_type));
    append_kv(out, "generics", strings(a.generics));
    append_kv(out, "where", strings(a.where_bounds));
    append_kv(out, "scalar", scalar_to_edn(a.scalar));
    append_kv(out, "async", n_bool(a.is_async));
    return out;
}

std::string render_contract(const ContractModel& m, const DispatchArtifact& a){
    return to_pretty_string(model_to_edn(m)) + "\n" + to_pretty_string(artifact_to_edn(a)) + "\n";
}

} // namespace ifacec
