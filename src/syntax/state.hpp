#pragma once
#include "ifacec/syntax.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace ifacec::syntax {

// Shared build state for all syntax actions. Composite types open a frame when their
// leading token matches and close it once the whole rule succeeded; finished types are
// handed to the enclosing frame, or become the result at top level.
struct build_state {
    struct frame {
        TypeExpr node;
        bool trailing_comma{false};
        std::vector<TypeExpr> kids;
    };
    std::vector<frame> frames;
    std::optional<TypeExpr> result;
    ReceiverSyntax recv;
    PatternSyntax pattern;

    void open(TypeExpr::Kind k){ frame f; f.node.kind = k; frames.push_back(std::move(f)); }
    frame& top(){ return frames.back(); }
    void child(TypeExpr t){
        if(frames.empty()) result = std::move(t);
        else frames.back().kids.push_back(std::move(t));
    }
    void close(){
        frame f = std::move(frames.back()); frames.pop_back();
        TypeExpr t = std::move(f.node); t.args = std::move(f.kids);
        if(t.kind==TypeExpr::Kind::Tuple && t.args.size()==1 && !f.trailing_comma){
            TypeExpr inner = std::move(t.args.front());
            child(std::move(inner));
            return;
        }
        child(std::move(t));
    }
};

} // namespace ifacec::syntax
