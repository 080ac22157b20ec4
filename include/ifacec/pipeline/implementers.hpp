// implementers.hpp - registry of implementer types and their downcast bindings
#pragma once
#include "ifacec/declaration.hpp"
#include "ifacec/diagnostics.hpp"
#include "ifacec/model.hpp"
#include "ifacec/pipeline/classifier.hpp"
#include <vector>

namespace ifacec {

// Keyed by implementer type in declaration order. External bindings must be applied
// before method bindings so that conflicts are always reported at the method.
class ImplementerRegistry {
public:
    void seed(const std::vector<Spanned<TypeExpr>>& declared);
    void apply_external(const std::vector<ExternalDowncast>& bindings, DiagnosticSink& sink);
    void apply_method(const DowncastCandidate& d, DiagnosticSink& sink);

    ImplementerDefinition* find(const TypeExpr& ty);
    const std::vector<ImplementerDefinition>& implementers() const { return items_; }
    std::vector<ImplementerDefinition> take(){ return std::move(items_); }
private:
    std::vector<ImplementerDefinition> items_;
    std::vector<SourceLoc> binding_locs_; // parallel to items_
};

} // namespace ifacec
