#include "ifacec/types.hpp"
#include "ifacec/naming.hpp"

namespace ifacec {

std::string TypeExpr::last_ident() const {
    if(kind!=Kind::Path || segments.empty()) return {};
    return unraw(segments.back());
}

bool TypeExpr::is_ident(const std::string& ident) const {
    return kind==Kind::Path && !global && segments.size()==1 && args.empty() && unraw(segments[0])==ident;
}

bool operator==(const TypeExpr& a, const TypeExpr& b){
    if(a.kind!=b.kind) return false;
    switch(a.kind){
        case TypeExpr::Kind::Path:
            return a.global==b.global && a.segments==b.segments && a.args==b.args;
        case TypeExpr::Kind::Reference:
            return a.is_mut==b.is_mut && a.lifetime==b.lifetime && a.args==b.args;
        case TypeExpr::Kind::Lifetime:
            return a.lifetime==b.lifetime;
        case TypeExpr::Kind::Tuple:
        case TypeExpr::Kind::Slice:
            return a.args==b.args;
    }
    return false;
}

std::string to_string(const TypeExpr& t){
    std::string out;
    switch(t.kind){
        case TypeExpr::Kind::Path: {
            if(t.global) out += "::";
            for(size_t i=0;i<t.segments.size(); ++i){ if(i) out += "::"; out += t.segments[i]; }
            if(!t.args.empty()){
                out += '<';
                for(size_t i=0;i<t.args.size(); ++i){ if(i) out += ", "; out += to_string(t.args[i]); }
                out += '>';
            }
            return out;
        }
        case TypeExpr::Kind::Reference:
            out = "&";
            if(!t.lifetime.empty()) out += "'" + t.lifetime + " ";
            if(t.is_mut) out += "mut ";
            return out + to_string(t.elem());
        case TypeExpr::Kind::Tuple:
            out = "(";
            for(size_t i=0;i<t.args.size(); ++i){ if(i) out += ", "; out += to_string(t.args[i]); }
            if(t.args.size()==1) out += ',';
            return out + ")";
        case TypeExpr::Kind::Slice:
            return "[" + to_string(t.elem()) + "]";
        case TypeExpr::Kind::Lifetime:
            return "'" + t.lifetime;
    }
    return out;
}

TypeExpr erase_lifetimes(const TypeExpr& t){
    TypeExpr out = t;
    out.args.clear();
    for(auto& a : t.args){
        if(a.kind==TypeExpr::Kind::Lifetime) continue;
        out.args.push_back(erase_lifetimes(a));
    }
    if(out.kind==TypeExpr::Kind::Reference) out.lifetime.clear();
    return out;
}

const TypeExpr& unreferenced(const TypeExpr& t){
    return t.is_reference() ? t.elem() : t;
}

} // namespace ifacec
