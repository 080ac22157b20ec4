#include "ifacec/compiler.hpp"
#include "ifacec/pipeline/scalar.hpp"

namespace ifacec {

ImplAdaptation adapt_impl_block(const ImplBlockDeclaration& block, const CompileEnv& env){
    ImplAdaptation a;
    a.scalar = resolve_scalar(block.scalar, block.generics, env);
    a.self_type = block.self_type;
    a.generics = block.generics;
    a.trait_path = block.trait_path;

    TypeExpr scalar = scalar_type(a.scalar);
    if(is_implicit_generic(a.scalar)) a.generics.push_back(to_string(scalar));
    if(is_generic(a.scalar)) a.where_bounds.push_back(to_string(scalar) + ": ScalarValue + Send + Sync");
    // generic arguments belong to the last path segment
    if(!is_explicit_generic(a.scalar)) a.trait_path.args.push_back(scalar);

    a.is_async = block.async.has_value();
    for(const auto& m: block.methods) if(m.is_async) a.is_async = true;
    trace(env, "impl", "%s for %s", to_string(a.trait_path).c_str(), to_string(a.self_type).c_str());
    return a;
}

} // namespace ifacec
