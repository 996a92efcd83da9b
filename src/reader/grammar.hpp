#pragma once
#include <tao/pegtl.hpp>

namespace kiln::reader::grammar {
using namespace tao::pegtl;

// Whitespace, commas and line comments separate forms
struct comment : seq< one<';'>, until< eolf > > {};
struct sep : sor< space, one<','>, comment > {};
struct seps : star< sep > {};

struct sym_start : sor< alpha, one<'*','!','_','?','-','+','/','<','>','=','$','%','&','@'> > {};
struct sym_char : sor< sym_start, digit, one<'.','#','\''> > {};

struct sign : one<'+','-'> {};
struct exponent : seq< one<'e','E'>, opt< sign >, plus< digit > > {};
struct fraction : seq< one<'.'>, star< digit > > {};
struct float_tok : seq< opt< sign >, plus< digit >, sor< seq< fraction, opt< exponent > >, exponent >, not_at< sym_char > > {};
struct int_tok : seq< opt< sign >, plus< digit >, not_at< sym_char > > {};

struct escaped : seq< one<'\\'>, any > {};
struct str_body : star< sor< escaped, not_one<'"','\\'> > > {};
struct string_tok : seq< one<'"'>, str_body, must< one<'"'> > > {};

struct keyword_tok : seq< one<':'>, plus< sym_char > > {};
struct symbol_tok : seq< sym_start, star< sym_char > > {};

struct form;

struct list_open : one<'('> {};
struct list_close : one<')'> {};
struct vec_open : one<'['> {};
struct vec_close : one<']'> {};
struct map_open : one<'{'> {};
struct map_close : one<'}'> {};
struct set_open : seq< one<'#'>, one<'{'> > {};
struct set_close : one<'}'> {};
struct tag_name : seq< sym_start, star< sym_char > > {};

struct list_form : seq< list_open, seps, star< form, seps >, must< list_close > > {};
struct vec_form : seq< vec_open, seps, star< form, seps >, must< vec_close > > {};
struct map_form : seq< map_open, seps, star< form, seps >, must< map_close > > {};
struct set_form : seq< set_open, seps, star< form, seps >, must< set_close > > {};
struct tagged_form : seq< one<'#'>, tag_name, seps, must< form > > {};

struct form : sor< string_tok, float_tok, int_tok, keyword_tok, list_form, vec_form, map_form, set_form, tagged_form, symbol_tok > {};

struct one_form : must< seps, form, seps, eof > {};
struct all_forms : must< seps, star< form, seps >, eof > {};

} // namespace kiln::reader::grammar
