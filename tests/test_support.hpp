#pragma once
#include "ifacec/compiler.hpp"
#include "ifacec/reader.hpp"
#include "ifacec/syntax.hpp"
#include <string>
#include <string_view>

namespace ifacec::test {

// Fixed configuration so tests do not depend on the process environment.
inline CompileEnv test_env(){ return CompileEnv{}; }

inline CompileResult compile_text(std::string_view src, CompileEnv env = test_env()){
    return ContractCompiler(std::move(env)).compile(read_contract(src));
}

inline const MethodDecl& method_at(const ContractDeclaration& d, size_t i){
    return std::get<MethodDecl>(d.items.at(i));
}

inline TypeExpr type_of(const char* src){ return syntax::parse_type(src).type; }

inline ParamDecl param(const char* pattern, const char* type, ArgumentOptions opts = {}){
    ParamDecl p;
    p.pattern = syntax::parse_pattern(pattern);
    p.type = type_of(type);
    p.options = std::move(opts);
    return p;
}

inline size_t count_kind(const std::vector<Diagnostic>& ds, DiagKind k){
    size_t n = 0;
    for(auto& d: ds) if(d.kind==k) ++n;
    return n;
}

} // namespace ifacec::test
