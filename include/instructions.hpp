#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <optional>
#include <variant>
#include <cstdint>
#include <utility>
#include <ostream>
#include <string>
#include <vector>

namespace hack
{

template<class... Ts> struct base_visitor : Ts... { using Ts::operator()...; };
template<class... Ts> base_visitor(Ts...) -> base_visitor<Ts...>;

enum class reg : char
{
  A = 'A',
  D = 'D',
  M = 'M',
};

enum class jump_kind : std::uint8_t
{
  JMP,
  JGT,
  JEQ,
  JLT,
  JGE,
  JLE,
  JNE,
};

/// COMPUTATIONS

// 1, 0 or -1
struct constant
{
  std::int_fast8_t value;
};

enum class unary_kind : std::uint8_t
{
  Not, // !r
  Neg, // -r
  Inc, // r+1
  Dec, // r-1
};

struct unary
{
  unary_kind kind;
  reg operand;

  bool is_prefix() const
  { return kind == unary_kind::Not || kind == unary_kind::Neg; }
};

enum class binary_op : char
{
  Add = '+',
  Or  = '|',
  Sub = '-',
  And = '&',
};

struct binary
{
  reg lhs;
  binary_op op;
  reg rhs;
};

using computation = std::variant<constant, unary, binary, reg>;

/// INSTRUCTIONS

struct symbol
{
  std::string name;
};

// digits as written, no range check
struct literal
{
  std::string digits;
};

struct label
{
  symbol name;
};

struct at_instruction
{
  std::variant<literal, symbol> value;
};

struct c_instruction
{
  // empty if the instruction has no `dest=` part
  std::vector<reg> destination;
  computation comp;
  std::optional<jump_kind> jump;
};

using instruction = std::variant<label, at_instruction, c_instruction>;

class program
{
public:
  using const_iterator = std::vector<instruction>::const_iterator;

  program() = default;
  explicit program(std::vector<instruction> instructions)
    : instrs(std::move(instructions))
  {  }

  const std::vector<instruction>& instructions() const
  { return instrs; }

  std::size_t size() const { return instrs.size(); }
  bool empty() const { return instrs.empty(); }

  const instruction& operator[](std::size_t i) const
  { return instrs[i]; }

  const_iterator begin() const { return instrs.begin(); }
  const_iterator end() const { return instrs.end(); }

  // Every label with the index of the next non-label instruction, in source order.
  // Labels at the very end point one past the last instruction.
  std::vector<std::pair<std::string, std::size_t>> label_positions() const;

private:
  std::vector<instruction> instrs;
};

bool operator==(const constant& a, const constant& b);
bool operator==(const unary& a, const unary& b);
bool operator==(const binary& a, const binary& b);
bool operator==(const symbol& a, const symbol& b);
bool operator==(const literal& a, const literal& b);
bool operator==(const label& a, const label& b);
bool operator==(const at_instruction& a, const at_instruction& b);
bool operator==(const c_instruction& a, const c_instruction& b);
bool operator==(const program& a, const program& b);

bool operator!=(const constant& a, const constant& b);
bool operator!=(const unary& a, const unary& b);
bool operator!=(const binary& a, const binary& b);
bool operator!=(const symbol& a, const symbol& b);
bool operator!=(const literal& a, const literal& b);
bool operator!=(const label& a, const label& b);
bool operator!=(const at_instruction& a, const at_instruction& b);
bool operator!=(const c_instruction& a, const c_instruction& b);
bool operator!=(const program& a, const program& b);

std::string_view to_string(reg r);
std::string_view to_string(jump_kind j);
std::string to_string(const computation& comp);
std::string to_string(const instruction& instr);

std::ostream& operator<<(std::ostream& os, const instruction& instr);
std::ostream& operator<<(std::ostream& os, const program& prog);

void to_json(nlohmann::json& j, const computation& comp);
void to_json(nlohmann::json& j, const instruction& instr);
void to_json(nlohmann::json& j, const program& prog);

}
