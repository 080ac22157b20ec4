#pragma once
#include <tao/pegtl.hpp>

namespace ifacec::syntax::grammar {
using namespace tao::pegtl;

struct sp : star< space > {};
struct kw_mut : tao::pegtl::keyword<'m','u','t'> {};
struct kw_ref : tao::pegtl::keyword<'r','e','f'> {};
struct kw_self : tao::pegtl::keyword<'s','e','l','f'> {};
struct raw_prefix : string<'r','#'> {};

struct lifetime : seq< one<'\''>, identifier > {};

struct type;

// &'a mut T
struct ref_begin : one<'&'> {};
struct ref_lifetime : lifetime {};
struct ref_mut : kw_mut {};
struct reference : if_must< ref_begin, sp, opt< ref_lifetime, sp >, opt< ref_mut, sp >, type > {};

// (A, B) / (A,) / () ; a lone element without a trailing comma is just parentheses
struct tuple_begin : one<'('> {};
struct tuple_trailing_comma : one<','> {};
struct tuple_elems : seq< type, star< sp, one<','>, sp, type >, sp, opt< tuple_trailing_comma > > {};
struct tuple : if_must< tuple_begin, sp, opt< tuple_elems >, sp, one<')'> > {};

// [T]
struct slice_begin : one<'['> {};
struct slice : if_must< slice_begin, sp, type, sp, one<']'> > {};

// ::a::b::C<'a, T>  (generic arguments on the last segment only)
struct path_begin : success {};
struct path_head : seq< at< sor< two<':'>, identifier_first > >, path_begin > {};
struct path_global : two<':'> {};
struct path_segment : seq< opt< raw_prefix >, identifier > {};
struct lifetime_arg : lifetime {};
struct generic_arg : sor< lifetime_arg, type > {};
struct generic_args : if_must< one<'<'>, sp, generic_arg, star< sp, one<','>, sp, generic_arg >, sp, opt< one<','>, sp >, one<'>'> > {};
struct path : if_must< path_head, opt< path_global >, path_segment, star< two<':'>, path_segment >, opt< sp, generic_args > > {};

struct type : sor< reference, tuple, slice, path > {};
struct type_input : must< sp, type, sp, eof > {};

// Receivers
struct recv_ref : one<'&'> {};
struct recv_lifetime : lifetime {};
struct recv_ref_mut : kw_mut {};
struct recv_binding_mut : kw_mut {};
struct recv_colon : seq< sp, one<':'> > {};
struct recv_typed : if_must< recv_colon, sp, type > {};
struct recv_by_ref : seq< recv_ref, sp, opt< recv_lifetime, sp >, opt< recv_ref_mut, sp >, kw_self > {};
struct recv_by_value : seq< opt< recv_binding_mut, plus< space > >, kw_self, opt< recv_typed > > {};
struct receiver_input : must< sp, sor< recv_by_ref, recv_by_value >, sp, eof > {};

// Patterns
struct pat_ref : kw_ref {};
struct pat_mut : kw_mut {};
struct pat_binding : seq< opt< raw_prefix >, identifier > {};
struct pattern_ident_input : seq< sp, opt< pat_ref, plus< space > >, opt< pat_mut, plus< space > >, pat_binding, sp, eof > {};

} // namespace ifacec::syntax::grammar
