// reader.cpp - reads declaration forms into option bags
#include "ifacec/reader.hpp"
#include "ifacec/syntax.hpp"
#include <set>

namespace ifacec {
using namespace edn;

namespace {

[[noreturn]] void fail(const std::string& msg, const node_ptr& at){
    throw declaration_error(msg, at ? at->loc : SourceLoc{});
}

struct KeyValue { std::string key; node_ptr key_node; node_ptr value; };

// Trailing ":k v" pairs of a form starting at `start`.
std::vector<KeyValue> keyword_pairs(const list& l, size_t start){
    std::vector<KeyValue> out;
    for(size_t i=start;i<l.elems.size(); i+=2){
        auto kw = as_keyword(*l.elems[i]);
        if(!kw) fail("expected a keyword, found `"+to_string(l.elems[i])+"`", l.elems[i]);
        if(i+1>=l.elems.size()) fail("missing value for `:"+kw->name+"`", l.elems[i]);
        out.push_back(KeyValue{kw->name, l.elems[i], l.elems[i+1]});
    }
    return out;
}

std::string ident_from(const node_ptr& n, const std::string& what){
    std::string s = text_of(n);
    if(s.empty()) fail("expected "+what+", found `"+to_string(n)+"`", n);
    return s;
}

TypeExpr type_from(const node_ptr& n, const std::string& what){
    std::string text = text_of(n);
    if(text.empty()) fail("expected "+what+" type, found `"+to_string(n)+"`", n);
    auto r = syntax::parse_type(text);
    if(!r.success) fail("invalid "+what+" type `"+text+"`: "+r.error_message, n);
    return r.type;
}

bool flag_from(const KeyValue& kv){
    auto b = as_bool(*kv.value);
    if(!b) fail("`:"+kv.key+"` expects true or false", kv.value);
    return *b;
}

std::string string_from(const KeyValue& kv){
    auto s = as_string(*kv.value);
    if(!s) fail("`:"+kv.key+"` expects a string literal", kv.value);
    return *s;
}

const std::vector<node_ptr>& vector_from(const KeyValue& kv){
    auto v = as_vector(*kv.value);
    if(!v) fail("`:"+kv.key+"` expects a vector", kv.value);
    return v->elems;
}

const list& form_of(const node_ptr& n, const std::string& head){
    auto l = as_list(*n);
    if(!l || head_of(*n)!=head) fail("expected a ("+head+" ...) form, found `"+to_string(n)+"`", n);
    return *l;
}

// Directive bags keep the first failure and stop recording once one is seen.
struct DirectiveCollector {
    std::optional<DirectiveError> error;
    std::set<std::string> seen;
    bool first(const KeyValue& kv){
        if(seen.insert(kv.key).second) return true;
        reject("duplicated directive `:"+kv.key+"`", kv.key_node);
        return false;
    }
    void reject(std::string msg, const node_ptr& at){
        if(!error) error = DirectiveError{std::move(msg), at->loc};
    }
    std::optional<Spanned<std::string>> text(const KeyValue& kv){
        if(auto s = as_string(*kv.value)) return Spanned<std::string>{*s, kv.value->loc};
        reject("directive `:"+kv.key+"` expects a string literal", kv.value);
        return std::nullopt;
    }
    std::optional<SourceLoc> marker(const KeyValue& kv){
        auto b = as_bool(*kv.value);
        if(!b){ reject("directive `:"+kv.key+"` expects true", kv.value); return std::nullopt; }
        if(!*b) return std::nullopt;
        return kv.key_node->loc;
    }
};

ParamDecl read_param(const node_ptr& n){
    const auto& l = form_of(n, "arg");
    if(l.elems.size()<3) fail("(arg pattern type ...) requires a pattern and a type", n);
    ParamDecl p;
    p.loc = n->loc;
    p.pattern = syntax::parse_pattern(ident_from(l.elems[1], "argument pattern"));
    p.type = type_from(l.elems[2], "argument");

    ArgumentOptions opts;
    DirectiveCollector dc;
    for(auto& kv: keyword_pairs(l, 3)){
        if(!dc.first(kv)) continue;
        if(kv.key=="name") opts.name = dc.text(kv);
        else if(kv.key=="description") opts.description = dc.text(kv);
        else if(kv.key=="default") opts.default_value = Spanned<std::string>{to_string(kv.value), kv.value->loc};
        else if(kv.key=="context") opts.context = dc.marker(kv);
        else if(kv.key=="executor") opts.executor = dc.marker(kv);
        else dc.reject("unknown argument directive `:"+kv.key+"`", kv.key_node);
    }
    if(dc.error) p.options = *dc.error;
    else p.options = std::move(opts);
    return p;
}

bool is_signature_key(const std::string& key){
    return key=="receiver" || key=="params" || key=="ret" || key=="async" || key=="default-body";
}

MethodDecl read_method(const node_ptr& n){
    const auto& l = form_of(n, "fn");
    if(l.elems.size()<2) fail("(fn ident ...) requires a method identifier", n);
    MethodDecl m;
    m.loc = n->loc;
    m.ident = ident_from(l.elems[1], "method identifier");

    MethodOptions opts;
    DirectiveCollector dc;
    std::set<std::string> signature;
    for(auto& kv: keyword_pairs(l, 2)){
        // signature
        if(is_signature_key(kv.key) && !signature.insert(kv.key).second)
            fail("duplicated signature key `:"+kv.key+"`", kv.key_node);
        if(kv.key=="receiver"){
            std::string text = ident_from(kv.value, "receiver");
            auto r = syntax::parse_receiver(text);
            if(!r.success) fail("invalid receiver `"+text+"`: "+r.error_message, kv.value);
            m.receiver = Receiver{r.receiver, kv.value->loc};
            continue;
        }
        if(kv.key=="params"){
            for(auto& p: vector_from(kv)) m.params.push_back(read_param(p));
            continue;
        }
        if(kv.key=="ret"){ m.ret = type_from(kv.value, "return"); continue; }
        if(kv.key=="async"){ m.is_async = flag_from(kv); continue; }
        if(kv.key=="default-body"){ m.has_default_body = flag_from(kv); continue; }

        // directives
        if(!dc.first(kv)) continue;
        if(kv.key=="name") opts.name = dc.text(kv);
        else if(kv.key=="description") opts.description = dc.text(kv);
        else if(kv.key=="deprecated"){
            if(auto s = as_string(*kv.value)) opts.deprecated = Spanned<Deprecation>{Deprecation{*s}, kv.value->loc};
            else if(auto b = as_bool(*kv.value)){ if(*b) opts.deprecated = Spanned<Deprecation>{Deprecation{}, kv.value->loc}; }
            else dc.reject("directive `:deprecated` expects a reason string or true", kv.value);
        }
        else if(kv.key=="ignore") opts.ignore = dc.marker(kv);
        else if(kv.key=="downcast") opts.downcast = dc.marker(kv);
        else dc.reject("unknown method directive `:"+kv.key+"`", kv.key_node);
    }
    if(dc.error) m.options = *dc.error;
    else m.options = std::move(opts);
    return m;
}

TraitItem read_item(const node_ptr& n){
    std::string head = head_of(*n);
    if(head=="fn") return read_method(n);
    if(head=="type"){
        const auto& l = form_of(n, "type");
        if(l.elems.size()!=2) fail("(type Ident) takes exactly one identifier", n);
        return AssocTypeDecl{ident_from(l.elems[1], "associated type identifier"), n->loc};
    }
    if(head=="const"){
        const auto& l = form_of(n, "const");
        if(l.elems.size()!=3) fail("(const IDENT type) takes an identifier and a type", n);
        return AssocConstDecl{ident_from(l.elems[1], "associated const identifier"), type_from(l.elems[2], "const"), n->loc};
    }
    fail("expected (fn ...), (type ...) or (const ...) trait item, found `"+to_string(n)+"`", n);
}

DispatchOption read_dispatch(const node_ptr& n){
    auto l = as_list(*n);
    std::string head = head_of(*n);
    if(!l || l->elems.size()!=2 || (head!="enum" && head!="dyn"))
        fail("`:dispatch` expects (enum Ident) or (dyn Ident)", n);
    DispatchOption d;
    d.mode = head=="dyn" ? DispatchMode::Open : DispatchMode::Closed;
    d.ident = ident_from(l->elems[1], "dispatch identifier");
    d.loc = n->loc;
    return d;
}

std::vector<std::string> read_generics(const KeyValue& kv){
    std::vector<std::string> out;
    for(auto& g: vector_from(kv)){
        std::string id = ident_from(g, "generic parameter");
        for(auto& seen: out) if(seen==id) fail("duplicated generic parameter `"+id+"`", g);
        out.push_back(std::move(id));
    }
    return out;
}

} // namespace

ContractDeclaration read_contract_form(const node_ptr& form){
    const auto& l = form_of(form, "interface");
    if(l.elems.size()<2) fail("(interface Ident ...) requires a trait identifier", form);
    ContractDeclaration d;
    d.loc = form->loc;
    d.ident = ident_from(l.elems[1], "trait identifier");

    std::set<std::string> seen;
    for(auto& kv: keyword_pairs(l, 2)){
        if(!seen.insert(kv.key).second) fail("duplicated attribute `:"+kv.key+"`", kv.key_node);
        auto& o = d.options;
        if(kv.key=="name") o.name = Spanned<std::string>{string_from(kv), kv.value->loc};
        else if(kv.key=="description") o.description = Spanned<std::string>{string_from(kv), kv.value->loc};
        else if(kv.key=="visibility") d.visibility = ident_from(kv.value, "visibility");
        else if(kv.key=="generics") d.generics = read_generics(kv);
        else if(kv.key=="scalar") o.scalar = Spanned<TypeExpr>{type_from(kv.value, "scalar"), kv.value->loc};
        else if(kv.key=="context") o.context = Spanned<TypeExpr>{type_from(kv.value, "context"), kv.value->loc};
        else if(kv.key=="async"){ if(flag_from(kv)) o.async = kv.key_node->loc; }
        else if(kv.key=="internal") o.internal = flag_from(kv);
        else if(kv.key=="dispatch") o.dispatch = read_dispatch(kv.value);
        else if(kv.key=="for"){
            for(auto& t: vector_from(kv)){
                TypeExpr ty = type_from(t, "implementer");
                for(auto& prev: o.implementers)
                    if(prev.value==ty) fail("duplicated implementer type `"+to_string(ty)+"`", t);
                o.implementers.push_back(Spanned<TypeExpr>{std::move(ty), t->loc});
            }
        }
        else if(kv.key=="external-downcasts"){
            for(auto& b: vector_from(kv)){
                const auto& bl = form_of(b, "downcast");
                if(bl.elems.size()!=3) fail("(downcast Type function) takes a type and a function path", b);
                ExternalDowncast ed{type_from(bl.elems[1], "downcast target"), ident_from(bl.elems[2], "downcast function"), b->loc};
                for(auto& prev: o.external_downcasts)
                    if(prev.target==ed.target) fail("duplicated external downcast into `"+to_string(ed.target)+"`", b);
                o.external_downcasts.push_back(std::move(ed));
            }
        }
        else if(kv.key=="items"){
            for(auto& it: vector_from(kv)) d.items.push_back(read_item(it));
        }
        else fail("unknown interface attribute `:"+kv.key+"`", kv.key_node);
    }
    return d;
}

ImplBlockDeclaration read_impl_form(const node_ptr& form){
    const auto& l = form_of(form, "impl");
    if(l.elems.size()<2) fail("(impl Trait ...) requires a trait path", form);
    ImplBlockDeclaration b;
    b.loc = form->loc;
    b.trait_path = type_from(l.elems[1], "trait");
    if(!b.trait_path.is_path()) fail("impl target must be a trait path", l.elems[1]);

    bool has_self = false;
    std::set<std::string> seen;
    for(auto& kv: keyword_pairs(l, 2)){
        if(!seen.insert(kv.key).second) fail("duplicated attribute `:"+kv.key+"`", kv.key_node);
        if(kv.key=="for"){ b.self_type = type_from(kv.value, "implementer"); has_self = true; }
        else if(kv.key=="generics") b.generics = read_generics(kv);
        else if(kv.key=="scalar") b.scalar = Spanned<TypeExpr>{type_from(kv.value, "scalar"), kv.value->loc};
        else if(kv.key=="async"){ if(flag_from(kv)) b.async = kv.key_node->loc; }
        else if(kv.key=="items"){
            for(auto& it: vector_from(kv)){
                const auto& ml = form_of(it, "fn");
                if(ml.elems.size()<2) fail("(fn ident ...) requires a method identifier", it);
                ImplMethodDecl m{ident_from(ml.elems[1], "method identifier"), false, it->loc};
                std::set<std::string> method_keys;
                for(auto& mkv: keyword_pairs(ml, 2)){
                    if(!method_keys.insert(mkv.key).second) fail("duplicated impl method key `:"+mkv.key+"`", mkv.key_node);
                    if(mkv.key=="async") m.is_async = flag_from(mkv);
                    else fail("unknown impl method key `:"+mkv.key+"`", mkv.key_node);
                }
                b.methods.push_back(std::move(m));
            }
        }
        else fail("unknown impl attribute `:"+kv.key+"`", kv.key_node);
    }
    if(!has_self) fail("(impl ...) requires `:for Type`", form);
    return b;
}

ReadResult read_document(std::string_view src){
    ReadResult r;
    std::vector<node_ptr> forms;
    try {
        forms = parse_all(src);
    } catch (const parse_error& e) {
        SourceLoc at; at.line = e.line; at.col = e.col;
        r.failures.push_back(ReadFailure{e.what(), at});
        r.success = false;
        return r;
    }
    for(auto& f: forms){
        try {
            std::string head = head_of(*f);
            if(head=="interface") r.items.emplace_back(read_contract_form(f));
            else if(head=="impl") r.items.emplace_back(read_impl_form(f));
            else fail("expected an (interface ...) or (impl ...) form, found `"+to_string(f)+"`", f);
        } catch (const declaration_error& e) {
            r.failures.push_back(ReadFailure{e.what(), e.loc});
            r.success = false;
        }
    }
    return r;
}

ContractDeclaration read_contract(std::string_view src){ return read_contract_form(parse(src)); }
ImplBlockDeclaration read_impl(std::string_view src){ return read_impl_form(parse(src)); }

} // namespace ifacec
