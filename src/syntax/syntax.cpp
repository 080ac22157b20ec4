#include "ifacec/syntax.hpp"
#include "state.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>

namespace ifacec::syntax {

TypeParseResult parse_type(std::string_view src){
    tao::pegtl::memory_input in(src, std::string("type"));
    build_state st;
    TypeParseResult r;
    try {
        tao::pegtl::parse< grammar::type_input, actions::action >(in, st);
        if(st.result){ r.success = true; r.type = std::move(*st.result); }
        else r.error_message = "empty type";
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        r.success = false; r.error_message = e.what(); r.column = static_cast<int>(p.column);
    }
    return r;
}

ReceiverParseResult parse_receiver(std::string_view src){
    tao::pegtl::memory_input in(src, std::string("receiver"));
    build_state st;
    ReceiverParseResult r;
    try {
        tao::pegtl::parse< grammar::receiver_input, actions::action >(in, st);
        r.success = true; r.receiver = std::move(st.recv);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        r.success = false; r.error_message = e.what(); r.column = static_cast<int>(p.column);
    }
    return r;
}

std::string to_string(const ReceiverSyntax& r){
    switch(r.kind){
        case ReceiverSyntax::Kind::SharedRef:
            return r.lifetime.empty() ? "&self" : "&'" + r.lifetime + " self";
        case ReceiverSyntax::Kind::MutRef:
            return r.lifetime.empty() ? "&mut self" : "&'" + r.lifetime + " mut self";
        case ReceiverSyntax::Kind::Owned:
            return r.mut_binding ? "mut self" : "self";
        case ReceiverSyntax::Kind::Typed:
            return std::string(r.mut_binding ? "mut self: " : "self: ") + ifacec::to_string(r.typed);
    }
    return "self";
}

PatternSyntax parse_pattern(std::string_view src){
    tao::pegtl::memory_input in(src, std::string("pattern"));
    build_state st;
    PatternSyntax out;
    out.text = std::string(src);
    if(tao::pegtl::parse< grammar::pattern_ident_input, actions::action >(in, st)){
        out.ident = st.pattern.ident;
        out.mut_binding = st.pattern.mut_binding;
        out.kind = out.ident=="_" ? PatternSyntax::Kind::Wildcard : PatternSyntax::Kind::Ident;
    }
    return out;
}

} // namespace ifacec::syntax
