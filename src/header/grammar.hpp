#pragma once
#include <tao/pegtl.hpp>

namespace specmark::header::grammar {
using namespace tao::pegtl;

struct ws : star< space > {};

// Revision wrappers around a parameter
struct ins_open : TAO_PEGTL_STRING("<ins>") {};
struct del_open : TAO_PEGTL_STRING("<del>") {};
struct mark_open : TAO_PEGTL_STRING("<mark>") {};
struct wrap_open : sor< ins_open, del_open, mark_open > {};
struct wrap_close : sor< TAO_PEGTL_STRING("</ins>"), TAO_PEGTL_STRING("</del>"), TAO_PEGTL_STRING("</mark>") > {};

struct header_name : plus< not_one<'('> > {};
struct param_name : seq< one<'_'>, plus< sor< alnum, one<'$'> > >, one<'_'> > {};

// A parameter type runs until the next parameter, the end of a bracket group or the closing paren.
struct type_end : seq< ws, sor<
    one<')'>,
    one<']'>,
    wrap_close,
    seq< one<','>, ws, sor< one<'_'>, wrap_open, one<'['> > >,
    seq< one<'['>, ws, sor< one<','>, one<'_'>, wrap_open > >,
    eof > > {};
struct field_ref : seq< two<'['>, until< two<']'> > > {};
struct paren_group : seq< one<'('>, star< sor< paren_group, not_one<'(', ')'> > >, one<')'> > {};
struct type_unit : sor< field_ref, paren_group, any > {};
struct param_type : plus< not_at< type_end >, type_unit > {};

struct param_start : success {};
struct param : seq< param_start, opt< wrap_open, ws >, param_name, opt< ws, one<':'>, ws, param_type >, opt< ws, wrap_close > > {};
struct required_params : seq< param, star< ws, one<','>, ws, param > > {};

struct optional_open : one<'['> {};
struct optional_group : seq< optional_open, ws, opt< one<','>, ws >, param, star< ws, one<','>, ws, param >, ws, opt< optional_group >, ws, one<']'> > {};

struct param_list : seq< one<'('>, ws, opt< required_params >, ws, opt< optional_group >, ws, one<')'> > {};
struct return_type : plus< any > {};

struct header : seq< ws, header_name, must< param_list, ws, opt< one<':'>, ws, return_type >, ws, eof > > {};

} // namespace specmark::header::grammar
