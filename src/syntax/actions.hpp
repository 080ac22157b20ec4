#pragma once
#include "state.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>

namespace ifacec::syntax::actions {
using namespace tao::pegtl;
using ifacec::syntax::build_state;

template<typename Rule>
struct action : nothing<Rule> {};

// Types
template<> struct action< grammar::ref_begin > {
    static void apply0(build_state& st){ st.open(TypeExpr::Kind::Reference); }
};
template<> struct action< grammar::ref_lifetime > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.top().node.lifetime = in.string().substr(1); }
};
template<> struct action< grammar::ref_mut > {
    static void apply0(build_state& st){ st.top().node.is_mut = true; }
};
template<> struct action< grammar::reference > {
    static void apply0(build_state& st){ st.close(); }
};

template<> struct action< grammar::tuple_begin > {
    static void apply0(build_state& st){ st.open(TypeExpr::Kind::Tuple); }
};
template<> struct action< grammar::tuple_trailing_comma > {
    static void apply0(build_state& st){ st.top().trailing_comma = true; }
};
template<> struct action< grammar::tuple > {
    static void apply0(build_state& st){ st.close(); }
};

template<> struct action< grammar::slice_begin > {
    static void apply0(build_state& st){ st.open(TypeExpr::Kind::Slice); }
};
template<> struct action< grammar::slice > {
    static void apply0(build_state& st){ st.close(); }
};

template<> struct action< grammar::path_begin > {
    static void apply0(build_state& st){ st.open(TypeExpr::Kind::Path); }
};
template<> struct action< grammar::path_global > {
    static void apply0(build_state& st){ st.top().node.global = true; }
};
template<> struct action< grammar::path_segment > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.top().node.segments.push_back(in.string()); }
};
template<> struct action< grammar::lifetime_arg > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        TypeExpr lt; lt.kind = TypeExpr::Kind::Lifetime; lt.lifetime = in.string().substr(1);
        st.child(std::move(lt));
    }
};
template<> struct action< grammar::path > {
    static void apply0(build_state& st){ st.close(); }
};

// Receivers
template<> struct action< grammar::recv_ref > {
    static void apply0(build_state& st){ st.recv.kind = ReceiverSyntax::Kind::SharedRef; }
};
template<> struct action< grammar::recv_lifetime > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.recv.lifetime = in.string().substr(1); }
};
template<> struct action< grammar::recv_ref_mut > {
    static void apply0(build_state& st){ st.recv.kind = ReceiverSyntax::Kind::MutRef; }
};
template<> struct action< grammar::recv_binding_mut > {
    static void apply0(build_state& st){ st.recv.mut_binding = true; }
};
template<> struct action< grammar::recv_typed > {
    static void apply0(build_state& st){
        st.recv.kind = ReceiverSyntax::Kind::Typed;
        if(st.result) st.recv.typed = std::move(*st.result);
    }
};

// Patterns
template<> struct action< grammar::pat_mut > {
    static void apply0(build_state& st){ st.pattern.mut_binding = true; }
};
template<> struct action< grammar::pat_binding > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.pattern.ident = in.string(); }
};

} // namespace ifacec::syntax::actions
