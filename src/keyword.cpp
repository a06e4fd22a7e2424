#include <keyword.hpp>

#include <tsl/robin_map.h>

#include <array>
#include <string>

namespace ktree
{

namespace
{

struct keyword_info
{
  keyword_kind kind;
  std::string_view text;
  keyword_category categories;
};

constexpr keyword_category mod = keyword_category::modifier;
constexpr keyword_category bin = keyword_category::binary_operator;
constexpr keyword_category un = keyword_category::unary_operator;
constexpr keyword_category bty = keyword_category::binary_type_operator;
constexpr keyword_category wty = keyword_category::when_type_operator;
constexpr keyword_category wrg = keyword_category::when_range_operator;
constexpr keyword_category tgt = keyword_category::annotation_target;
constexpr keyword_category cls = keyword_category::class_declaration;
constexpr keyword_category vov = keyword_category::val_or_var;
constexpr keyword_category dlg = keyword_category::delegation_target;
constexpr keyword_category pct = keyword_category::punctuation;
constexpr keyword_category none = keyword_category::none;

// Indexed by keyword_kind.
constexpr std::array<keyword_info, keyword_kind_count> keyword_table = {{
  { keyword_kind::abstract,     "abstract",     mod },
  { keyword_kind::actual,       "actual",       mod },
  { keyword_kind::annotation,   "annotation",   mod },
  { keyword_kind::companion,    "companion",    mod },
  { keyword_kind::const_,       "const",        mod },
  { keyword_kind::crossinline,  "crossinline",  mod },
  { keyword_kind::data,         "data",         mod },
  { keyword_kind::enum_,        "enum",         mod },
  { keyword_kind::expect,       "expect",       mod },
  { keyword_kind::external,     "external",     mod },
  { keyword_kind::final,        "final",        mod },
  { keyword_kind::infix,        "infix",        mod },
  { keyword_kind::inline_,      "inline",       mod },
  { keyword_kind::inner,        "inner",        mod },
  { keyword_kind::internal,     "internal",     mod },
  { keyword_kind::lateinit,     "lateinit",     mod },
  { keyword_kind::noinline,     "noinline",     mod },
  { keyword_kind::open,         "open",         mod },
  { keyword_kind::operator_,    "operator",     mod },
  { keyword_kind::out,          "out",          mod },
  { keyword_kind::override,     "override",     mod },
  { keyword_kind::private_,     "private",      mod },
  { keyword_kind::protected_,   "protected",    mod },
  { keyword_kind::public_,      "public",       mod },
  { keyword_kind::reified,      "reified",      mod },
  { keyword_kind::sealed,       "sealed",       mod },
  { keyword_kind::suspend,      "suspend",      mod },
  { keyword_kind::tailrec,      "tailrec",      mod },
  { keyword_kind::value,        "value",        mod },
  { keyword_kind::vararg,       "vararg",       mod },

  { keyword_kind::package,      "package",      none },
  { keyword_kind::import,       "import",       none },
  { keyword_kind::class_,       "class",        cls },
  { keyword_kind::object,       "object",       cls },
  { keyword_kind::interface,    "interface",    cls },
  { keyword_kind::fun,          "fun",          mod },
  { keyword_kind::val,          "val",          vov },
  { keyword_kind::var,          "var",          vov },
  { keyword_kind::constructor,  "constructor",  none },
  { keyword_kind::by,           "by",           none },
  { keyword_kind::get,          "get",          tgt },
  { keyword_kind::set,          "set",          tgt },
  { keyword_kind::where,        "where",        none },
  { keyword_kind::contract,     "contract",     none },
  { keyword_kind::this_,        "this",         dlg },
  { keyword_kind::super,        "super",        dlg },

  { keyword_kind::if_,          "if",           none },
  { keyword_kind::else_,        "else",         none },
  { keyword_kind::catch_,       "catch",        none },
  { keyword_kind::for_,         "for",          none },
  { keyword_kind::while_,       "while",        none },
  { keyword_kind::when,         "when",         none },

  { keyword_kind::field,        "field",        tgt },
  { keyword_kind::file,         "file",         tgt },
  { keyword_kind::property,     "property",     tgt },
  { keyword_kind::receiver,     "receiver",     tgt },
  { keyword_kind::param,        "param",        tgt },
  { keyword_kind::setparam,     "setparam",     tgt },
  { keyword_kind::delegate,     "delegate",     tgt },

  { keyword_kind::dot,          ".",            bin | pct },
  { keyword_kind::safe_dot,     "?.",           bin },
  { keyword_kind::elvis,        "?:",           bin },
  { keyword_kind::plus,         "+",            bin | un },
  { keyword_kind::minus,        "-",            bin | un },
  { keyword_kind::asterisk,     "*",            bin },
  { keyword_kind::slash,        "/",            bin },
  { keyword_kind::percent,      "%",            bin },
  { keyword_kind::range_to,     "..",           bin },
  { keyword_kind::range_until,  "..<",          bin },
  { keyword_kind::equal,        "=",            bin | pct },
  { keyword_kind::plus_assign,  "+=",           bin },
  { keyword_kind::minus_assign, "-=",           bin },
  { keyword_kind::times_assign, "*=",           bin },
  { keyword_kind::div_assign,   "/=",           bin },
  { keyword_kind::mod_assign,   "%=",           bin },
  { keyword_kind::eq_eq,        "==",           bin },
  { keyword_kind::not_eq_,      "!=",           bin },
  { keyword_kind::eq_eq_eq,     "===",          bin },
  { keyword_kind::not_eq_eq,    "!==",          bin },
  { keyword_kind::lt,           "<",            bin },
  { keyword_kind::gt,           ">",            bin },
  { keyword_kind::le,           "<=",           bin },
  { keyword_kind::ge,           ">=",           bin },
  { keyword_kind::and_and,      "&&",           bin },
  { keyword_kind::or_or,        "||",           bin },
  { keyword_kind::in,           "in",           bin | wrg | mod },
  { keyword_kind::not_in,       "!in",          bin | wrg },
  { keyword_kind::is,           "is",           bty | wty },
  { keyword_kind::not_is,       "!is",          bty | wty },
  { keyword_kind::as,           "as",           bty },
  { keyword_kind::as_safe,      "as?",          bty },
  { keyword_kind::plus_plus,    "++",           un },
  { keyword_kind::minus_minus,  "--",           un },
  { keyword_kind::excl,         "!",            un },
  { keyword_kind::excl_excl,    "!!",           un },

  { keyword_kind::lpar,         "(",            pct },
  { keyword_kind::rpar,         ")",            pct },
  { keyword_kind::lbracket,     "[",            pct },
  { keyword_kind::rbracket,     "]",            pct },
  { keyword_kind::at,           "@",            pct },
  { keyword_kind::colon,        ":",            bty | pct },
  { keyword_kind::comma,        ",",            pct },
  { keyword_kind::arrow,        "->",           pct },
}};

const tsl::robin_map<std::string, keyword_kind>& text_lookup()
{
  static const tsl::robin_map<std::string, keyword_kind> lookup = []()
  {
    tsl::robin_map<std::string, keyword_kind> map;
    for(auto& info : keyword_table)
      map.emplace(std::string(info.text), info.kind);
    return map;
  }();
  return lookup;
}

}

std::string_view keyword_text(keyword_kind kind)
{ return keyword_table[static_cast<std::size_t>(kind)].text; }

bool has_category(keyword_kind kind, keyword_category cat)
{
  const auto have = static_cast<std::uint_fast16_t>(keyword_table[static_cast<std::size_t>(kind)].categories);
  const auto want = static_cast<std::uint_fast16_t>(cat);
  return (have & want) == want;
}

const char* keyword_category_name(keyword_category cat)
{
  switch(cat)
  {
  case keyword_category::none: return "keyword";
  case keyword_category::modifier: return "modifier keyword";
  case keyword_category::binary_operator: return "binary operator";
  case keyword_category::unary_operator: return "unary operator";
  case keyword_category::binary_type_operator: return "binary type operator";
  case keyword_category::when_type_operator: return "when type operator";
  case keyword_category::when_range_operator: return "when range operator";
  case keyword_category::annotation_target: return "annotation target";
  case keyword_category::class_declaration: return "class declaration keyword";
  case keyword_category::val_or_var: return "val or var";
  case keyword_category::delegation_target: return "this or super";
  case keyword_category::punctuation: return "punctuation";
  }
  return "keyword";
}

std::optional<keyword_kind> keyword_from_text(std::string_view text)
{
  auto& lookup = text_lookup();
  auto it = lookup.find(std::string(text));
  if(it == lookup.end())
    return std::nullopt;
  return it->second;
}

bool is_modifier_text(std::string_view text)
{
  auto kind = keyword_from_text(text);
  return kind && has_category(*kind, keyword_category::modifier);
}

}
