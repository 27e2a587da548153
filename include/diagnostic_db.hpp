#pragma once

#include <diagnostic.hpp>

#include <fmt/format.h>

namespace diagnostic_db
{

#define db_entry(lv, name, txt) static const auto name = [](const source_range& range) \
{ return mk_diag::lv(range, __COUNTER__, txt); }

#define db_entry_arg(lv, name, txt) static const auto name = [](const source_range& range, auto t) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

namespace args
{

db_entry_arg(error, unknown_arg, "Unknown command line argument \"{}\".");
db_entry_arg(error, missing_value, "Command line argument \"{}\" expects a value.");
db_entry_arg(error, emit_not_present, "Selected emit class \"{}\" is unknown!");
db_entry_arg(error, cannot_open_file, "Can not open file \"{}\".");

}

namespace parser
{

db_entry_arg(error, unknown_token, "Can not tokenize \"{}\".");
db_entry_arg(error, label_expects_symbol, "Label expects a symbol, instead got \"{}\".");
db_entry_arg(error, label_expects_rparen, "Label expects a closing parenthesis, instead got \"{}\".");
db_entry_arg(error, at_expects_operand, "Address instruction expects a literal or a symbol, instead got \"{}\".");
db_entry_arg(error, not_a_register, "\"{}\" is not a register, destinations are written with A, D and M.");
db_entry_arg(error, destination_too_long, "Destination \"{}\" names more than three registers.");
db_entry_arg(error, computation_expected, "Computation expected, instead got \"{}\".");
db_entry_arg(error, jump_expected, "Jump mnemonic expected after ';', instead got \"{}\".");
db_entry_arg(error, end_of_line_expected, "Expected end of line, instead got \"{}\".");

}

namespace driver
{

db_entry(warn, empty_program, "Program contains no instructions.");

}


#undef db_entry
#undef db_entry_arg

}
