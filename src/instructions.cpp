#include <instructions.hpp>

#include <algorithm>
#include <iterator>

namespace hack
{

std::vector<std::pair<std::string, std::size_t>> program::label_positions() const
{
  std::vector<std::pair<std::string, std::size_t>> positions;

  std::size_t rom = 0;
  for(auto& instr : instrs)
  {
    if(auto* lab = std::get_if<label>(&instr))
      positions.emplace_back(lab->name.name, rom);
    else
      ++rom;
  }
  return positions;
}

bool operator==(const constant& a, const constant& b)
{ return a.value == b.value; }

bool operator==(const unary& a, const unary& b)
{ return a.kind == b.kind && a.operand == b.operand; }

bool operator==(const binary& a, const binary& b)
{ return a.lhs == b.lhs && a.op == b.op && a.rhs == b.rhs; }

bool operator==(const symbol& a, const symbol& b)
{ return a.name == b.name; }

bool operator==(const literal& a, const literal& b)
{ return a.digits == b.digits; }

bool operator==(const label& a, const label& b)
{ return a.name == b.name; }

bool operator==(const at_instruction& a, const at_instruction& b)
{ return a.value == b.value; }

bool operator==(const c_instruction& a, const c_instruction& b)
{ return a.destination == b.destination && a.comp == b.comp && a.jump == b.jump; }

bool operator==(const program& a, const program& b)
{ return a.instructions() == b.instructions(); }

bool operator!=(const constant& a, const constant& b) { return !(a == b); }
bool operator!=(const unary& a, const unary& b) { return !(a == b); }
bool operator!=(const binary& a, const binary& b) { return !(a == b); }
bool operator!=(const symbol& a, const symbol& b) { return !(a == b); }
bool operator!=(const literal& a, const literal& b) { return !(a == b); }
bool operator!=(const label& a, const label& b) { return !(a == b); }
bool operator!=(const at_instruction& a, const at_instruction& b) { return !(a == b); }
bool operator!=(const c_instruction& a, const c_instruction& b) { return !(a == b); }
bool operator!=(const program& a, const program& b) { return !(a == b); }


std::string_view to_string(reg r)
{
  switch(r)
  {
  default:
  case reg::A: return "A";
  case reg::D: return "D";
  case reg::M: return "M";
  }
}

std::string_view to_string(jump_kind j)
{
  switch(j)
  {
  default:
  case jump_kind::JMP: return "JMP";
  case jump_kind::JGT: return "JGT";
  case jump_kind::JEQ: return "JEQ";
  case jump_kind::JLT: return "JLT";
  case jump_kind::JGE: return "JGE";
  case jump_kind::JLE: return "JLE";
  case jump_kind::JNE: return "JNE";
  }
}

std::string to_string(const computation& comp)
{
  return std::visit(base_visitor {
    [](const constant& c) -> std::string { return std::to_string(c.value); },
    [](const unary& u) -> std::string {
      static const char* ops[] = { "!", "-", "+1", "-1" };
      std::string r(to_string(u.operand));
      const std::string op = ops[static_cast<std::size_t>(u.kind)];

      return u.is_prefix() ? op + r : r + op;
    },
    [](const binary& b) -> std::string {
      std::string s(to_string(b.lhs));
      s.push_back(static_cast<char>(b.op));
      s.append(to_string(b.rhs));
      return s;
    },
    [](const reg& r) -> std::string { return std::string(to_string(r)); },
  }, comp);
}

std::string to_string(const instruction& instr)
{
  return std::visit(base_visitor {
    [](const label& lab) -> std::string { return "(" + lab.name.name + ")"; },
    [](const at_instruction& at) -> std::string {
      if(auto* lit = std::get_if<literal>(&at.value))
        return "@" + lit->digits;
      return "@" + std::get<symbol>(at.value).name;
    },
    [](const c_instruction& c) -> std::string {
      std::string s;
      for(auto r : c.destination)
        s.append(to_string(r));
      if(!c.destination.empty())
        s.push_back('=');

      s.append(to_string(c.comp));

      if(c.jump)
      {
        s.push_back(';');
        s.append(to_string(*c.jump));
      }
      return s;
    },
  }, instr);
}

std::ostream& operator<<(std::ostream& os, const instruction& instr)
{
  return os << to_string(instr);
}

std::ostream& operator<<(std::ostream& os, const program& prog)
{
  for(auto& instr : prog)
  {
    // labels stay flush left, everything else is indented
    if(!std::holds_alternative<label>(instr))
      os << "    ";
    os << instr << '\n';
  }
  return os;
}


void to_json(nlohmann::json& j, const computation& comp)
{
  j = std::visit(base_visitor {
    [](const constant& c) -> nlohmann::json {
      return { { "kind", "constant" }, { "value", static_cast<int>(c.value) } };
    },
    [](const unary& u) -> nlohmann::json {
      static const char* names[] = { "not", "neg", "inc", "dec" };
      return { { "kind", "unary" },
               { "op", names[static_cast<std::size_t>(u.kind)] },
               { "operand", std::string(to_string(u.operand)) } };
    },
    [](const binary& b) -> nlohmann::json {
      return { { "kind", "binary" },
               { "lhs", std::string(to_string(b.lhs)) },
               { "op", std::string(1, static_cast<char>(b.op)) },
               { "rhs", std::string(to_string(b.rhs)) } };
    },
    [](const reg& r) -> nlohmann::json {
      return { { "kind", "register" }, { "operand", std::string(to_string(r)) } };
    },
  }, comp);
}

void to_json(nlohmann::json& j, const instruction& instr)
{
  j = std::visit(base_visitor {
    [](const label& lab) -> nlohmann::json {
      return { { "type", "label" }, { "symbol", lab.name.name } };
    },
    [](const at_instruction& at) -> nlohmann::json {
      if(auto* lit = std::get_if<literal>(&at.value))
        return { { "type", "at" }, { "literal", lit->digits } };
      return { { "type", "at" }, { "symbol", std::get<symbol>(at.value).name } };
    },
    [](const c_instruction& c) -> nlohmann::json {
      nlohmann::json out;
      out["type"] = "c";

      std::vector<std::string> dest;
      std::transform(c.destination.begin(), c.destination.end(), std::back_inserter(dest),
          [](reg r) { return std::string(to_string(r)); });
      out["dest"] = dest;
      out["comp"] = c.comp;
      if(c.jump)
        out["jump"] = std::string(to_string(*c.jump));
      else
        out["jump"] = nullptr;
      return out;
    },
  }, instr);
}

void to_json(nlohmann::json& j, const program& prog)
{
  j = nlohmann::json::array();
  for(auto& instr : prog)
    j.push_back(instr);
}

}
