#include "ifacec/pipeline/scalar.hpp"

namespace ifacec {

ScalarParameterKind resolve_scalar(const std::optional<Spanned<TypeExpr>>& override_ty,
                                   const std::vector<std::string>& generics,
                                   const CompileEnv& env){
    if(!override_ty) return ImplicitGenericScalar{env.scalarParam, TypeExpr::path(env.defaultScalar)};
    for(const auto& g: generics){
        if(override_ty->value==TypeExpr::path(g)) return ExplicitGenericScalar{g};
    }
    return ConcreteScalar{override_ty->value};
}

TypeExpr scalar_type(const ScalarParameterKind& k){
    if(auto c = std::get_if<ConcreteScalar>(&k)) return c->type;
    if(auto e = std::get_if<ExplicitGenericScalar>(&k)) return TypeExpr::path(e->param);
    return TypeExpr::path(std::get<ImplicitGenericScalar>(k).param);
}

std::string scalar_bound(const ScalarParameterKind& k){
    return to_string(scalar_type(k)) + ": ScalarValue";
}

std::vector<std::string> signature_generics(const std::vector<std::string>& generics, const ScalarParameterKind& k){
    std::vector<std::string> out = generics;
    if(auto i = std::get_if<ImplicitGenericScalar>(&k)) out.push_back(i->param + " = " + to_string(i->default_type));
    return out;
}

} // namespace ifacec
