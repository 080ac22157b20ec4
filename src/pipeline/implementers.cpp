#include "ifacec/pipeline/implementers.hpp"

namespace ifacec {

namespace {

void not_an_implementer(DiagnosticSink& sink, const TypeExpr& ty, const SourceLoc& at){
    sink.report(DiagKind::NonImplementerDowncastTarget, "downcasting is possible only to interface implementers",
                "add `"+to_string(ty)+"` to the `:for` list", at);
}

} // namespace

void ImplementerRegistry::seed(const std::vector<Spanned<TypeExpr>>& declared){
    for(const auto& d: declared){
        ImplementerDefinition impl;
        impl.type = d.value;
        impl.loc = d.loc;
        items_.push_back(std::move(impl));
        binding_locs_.push_back(SourceLoc{});
    }
}

ImplementerDefinition* ImplementerRegistry::find(const TypeExpr& ty){
    for(auto& i: items_) if(i.type==ty) return &i;
    return nullptr;
}

void ImplementerRegistry::apply_external(const std::vector<ExternalDowncast>& bindings, DiagnosticSink& sink){
    for(const auto& b: bindings){
        ImplementerDefinition* impl = find(b.target);
        if(!impl){ not_an_implementer(sink, b.target, b.loc); continue; }
        impl->downcast = DowncastBinding{ByExternalFunction{b.function}};
        binding_locs_[static_cast<size_t>(impl - items_.data())] = b.loc;
    }
}

void ImplementerRegistry::apply_method(const DowncastCandidate& d, DiagnosticSink& sink){
    ImplementerDefinition* impl = find(d.target);
    if(!impl){ not_an_implementer(sink, d.target, d.loc); return; }
    const SourceLoc& prev_loc = binding_locs_[static_cast<size_t>(impl - items_.data())];
    if(impl->downcast){
        std::string ty = to_string(impl->type);
        if(auto ext = std::get_if<ByExternalFunction>(&*impl->downcast)){
            auto& diag = sink.report(DiagKind::DuplicateDowncastBinding,
                "trait method `"+d.method+"` conflicts with the external downcast function `"+ext->function+
                "` declared on the trait to downcast into the implementer type `"+ty+"`",
                "use `:ignore true` directive to ignore this trait method for interface implementers downcasting",
                d.loc);
            add_note(diag, "external downcast function `"+ext->function+"` declared here", prev_loc);
        } else {
            const auto& prev = std::get<ByMethod>(*impl->downcast);
            auto& diag = sink.report(DiagKind::DuplicateDowncastBinding,
                "trait method `"+d.method+"` conflicts with the trait method `"+prev.method+
                "` declared to downcast into the implementer type `"+ty+"`",
                "use `:ignore true` directive to ignore one of the trait methods for interface implementers downcasting",
                d.loc);
            add_note(diag, "downcast method `"+prev.method+"` declared here", prev_loc);
        }
        return;
    }
    impl->downcast = DowncastBinding{ByMethod{d.method, d.context.has_value()}};
    impl->context = d.context;
    binding_locs_[static_cast<size_t>(impl - items_.data())] = d.loc;
}

} // namespace ifacec
