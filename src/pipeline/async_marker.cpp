#include "ifacec/pipeline/async_marker.hpp"

namespace ifacec {

AsyncMarking mark_async(const ContractDeclaration& decl){
    bool any_async = false;
    bool default_async = false;
    for(const auto& item: decl.items){
        const MethodDecl* m = std::get_if<MethodDecl>(&item);
        if(!m || !m->is_async) continue;
        any_async = true;
        if(m->has_default_body) default_async = true;
    }
    AsyncMarking out;
    out.is_async = decl.options.async.has_value() || any_async;
    if(out.is_async && default_async) out.extra_bounds.push_back("Sync");
    return out;
}

} // namespace ifacec
