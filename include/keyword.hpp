#pragma once

#include <string_view>
#include <optional>
#include <cstdint>

namespace ktree
{

enum class keyword_kind : std::uint_fast8_t
{
  // modifiers
  abstract,
  actual,
  annotation,
  companion,
  const_,
  crossinline,
  data,
  enum_,
  expect,
  external,
  final,
  infix,
  inline_,
  inner,
  internal,
  lateinit,
  noinline,
  open,
  operator_,
  out,
  override,
  private_,
  protected_,
  public_,
  reified,
  sealed,
  suspend,
  tailrec,
  value,
  vararg,

  // declarations
  package,
  import,
  class_,
  object,
  interface,
  fun,
  val,
  var,
  constructor,
  by,
  get,
  set,
  where,
  contract,
  this_,
  super,

  // control flow
  if_,
  else_,
  catch_,
  for_,
  while_,
  when,

  // annotation use-site targets
  field,
  file,
  property,
  receiver,
  param,
  setparam,
  delegate,

  // operators
  dot,
  safe_dot,
  elvis,
  plus,
  minus,
  asterisk,
  slash,
  percent,
  range_to,
  range_until,
  equal,
  plus_assign,
  minus_assign,
  times_assign,
  div_assign,
  mod_assign,
  eq_eq,
  not_eq_,
  eq_eq_eq,
  not_eq_eq,
  lt,
  gt,
  le,
  ge,
  and_and,
  or_or,
  in,
  not_in,
  is,
  not_is,
  as,
  as_safe,
  plus_plus,
  minus_minus,
  excl,
  excl_excl,

  // punctuation
  lpar,
  rpar,
  lbracket,
  rbracket,
  at,
  colon,
  comma,
  arrow,
};
constexpr std::size_t keyword_kind_count = static_cast<std::size_t>(keyword_kind::arrow) + 1;

enum class keyword_category : std::uint_fast16_t
{
  none                  = 0,
  modifier              = 1 << 0,
  binary_operator       = 1 << 1,
  unary_operator        = 1 << 2,
  binary_type_operator  = 1 << 3,
  when_type_operator    = 1 << 4,
  when_range_operator   = 1 << 5,
  annotation_target     = 1 << 6,
  class_declaration     = 1 << 7,
  val_or_var            = 1 << 8,
  delegation_target     = 1 << 9,
  punctuation           = 1 << 10,
};

constexpr keyword_category operator|(keyword_category lhs, keyword_category rhs)
{
  return static_cast<keyword_category>(static_cast<std::uint_fast16_t>(lhs)
                                     | static_cast<std::uint_fast16_t>(rhs));
}

std::string_view keyword_text(keyword_kind kind);
bool has_category(keyword_kind kind, keyword_category cat);
const char* keyword_category_name(keyword_category cat);

std::optional<keyword_kind> keyword_from_text(std::string_view text);

// True when `text` spells a soft modifier keyword (e.g. "data", "open").
bool is_modifier_text(std::string_view text);

}
