#pragma once

#include <diagnostic.hpp>

#include <fmt/format.h>

namespace ktree::diagnostic_db
{

#define db_entry(lv, name, txt) static const auto name = [](const source_range& range) \
{ return mk_diag::lv(range, __COUNTER__, txt); }

#define db_entry_arg(lv, name, txt) static const auto name = [](const source_range& range, auto t) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, txt) static const auto name = [](const source_range& range, auto t1, auto t2) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2)); }

namespace node
{

db_entry_arg(error, missing_child, "\"{}\" must be present.");
db_entry_arg2(error, wrong_category, "\"{}\" must be a {}.");
db_entry_arg2(error, wrong_keyword, "\"{}\" must be the keyword \"{}\".");
db_entry_arg2(error, wrong_kind, "\"{}\" cannot hold a \"{}\" node.");
db_entry_arg2(error, invariant, "{}: {}.");
db_entry_arg(error, empty_list, "\"{}\" must not be empty.");

}

namespace convert
{

db_entry_arg(error, unsupported, "Unsupported construct \"{}\".");
db_entry_arg(error, parse_failed, "Parsing failed with {} error(s).");
db_entry_arg(error, root_not_converted, "Raw root element \"{}\" was never converted into a node.");
db_entry_arg(info, trivia_reattributed, "Raw element \"{}\" was converted more than once, its trivia follows the last node.");
db_entry_arg(info, trivia_to_enclosing, "Trivia next to \"{}\" attached to the enclosing node.");

}

namespace visit
{

db_entry_arg2(error, unhandled_kind, "Node kind \"{}\" is not handled by the {}.");
db_entry_arg(error, extra_as_child, "Extra node \"{}\" cannot be traversed as a child.");

}

namespace config
{

db_entry_arg(warn, unknown_key, "Unknown configuration key \"{}\".");
db_entry_arg2(error, bad_value, "Configuration key \"{}\" expects {}.");

}

#undef db_entry
#undef db_entry_arg
#undef db_entry_arg2

}
