#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <diagnostic.hpp>
#include <parser.hpp>
#include <reader.hpp>

#include <string>
#include <vector>

using namespace hack;

static std::vector<token_kind> kinds(const std::vector<token>& toks)
{
  std::vector<token_kind> v;
  for(auto& t : toks)
    v.push_back(t.kind);
  return v;
}

// parses a single line and hands back its only instruction
static instruction single(const std::string& text)
{
  auto w = parser::parse_text(text);

  const bool is_program = std::holds_alternative<program>(w);
  REQUIRE(is_program);
  auto& prog = std::get<program>(w);
  REQUIRE(prog.size() == 1);
  return prog[0];
}

static c_instruction single_c(const std::string& text)
{
  auto instr = single(text);
  const bool is_c = std::holds_alternative<c_instruction>(instr);
  REQUIRE(is_c);
  return std::get<c_instruction>(instr);
}

static syntax_error failure(const std::string& text)
{
  auto w = parser::parse_text(text);

  const bool is_error = std::holds_alternative<syntax_error>(w);
  REQUIRE(is_error);
  return std::get<syntax_error>(w);
}

TEST_CASE( "Tokens are split correctly", "[Tokenizer]" ) {

  SECTION( "at-instruction-with-comment" ) {
    auto toks = reader::tokenize("@17 // load\n(LOOP)");

    REQUIRE(kinds(toks) == std::vector<token_kind> {
        token_kind::At, token_kind::Literal, token_kind::Newline,
        token_kind::LParen, token_kind::Symbol, token_kind::RParen, token_kind::EndOfFile });

    REQUIRE(toks[1].data == "17");
    REQUIRE(toks[1].loc.row_beg == 1);
    REQUIRE(toks[1].loc.column_beg == 2);

    // the comment is gone, the newline sits right after it
    REQUIRE(toks[2].loc.row_beg == 1);
    REQUIRE(toks[2].loc.column_beg == 12);

    REQUIRE(toks[4].data == "LOOP");
    REQUIRE(toks[4].loc.row_beg == 2);
    REQUIRE(toks[4].loc.column_beg == 2);
  }

  SECTION( "c-instruction" ) {
    auto toks = reader::tokenize("AMD = !M ; jge");

    REQUIRE(kinds(toks) == std::vector<token_kind> {
        token_kind::Symbol, token_kind::Equal, token_kind::Bang, token_kind::Symbol,
        token_kind::Semi, token_kind::Symbol, token_kind::EndOfFile });
    REQUIRE(toks[0].data == "AMD");
    REQUIRE(toks[3].loc.column_beg == 8);
    // spelling is kept as written
    REQUIRE(toks[5].data == "jge");
  }

  SECTION( "symbol-characters" ) {
    auto toks = reader::tokenize("@foo.bar$1 @_x%#.9");

    REQUIRE(toks[1].kind == token_kind::Symbol);
    REQUIRE(toks[1].data == "foo.bar$1");
    REQUIRE(toks[3].kind == token_kind::Symbol);
    REQUIRE(toks[3].data == "_x%#.9");
  }

  SECTION( "digits-end-a-literal" ) {
    auto toks = reader::tokenize("12ab");

    REQUIRE(kinds(toks) == std::vector<token_kind> { token_kind::Literal, token_kind::Symbol, token_kind::EndOfFile });
    REQUIRE(toks[0].data == "12");
    REQUIRE(toks[1].data == "ab");
  }

  SECTION( "operators" ) {
    auto toks = reader::tokenize("+-|&=;()@!");

    REQUIRE(kinds(toks) == std::vector<token_kind> {
        token_kind::Plus, token_kind::Minus, token_kind::Pipe, token_kind::Ampersand,
        token_kind::Equal, token_kind::Semi, token_kind::LParen, token_kind::RParen,
        token_kind::At, token_kind::Bang, token_kind::EndOfFile });
  }

  SECTION( "unknown-characters" ) {
    auto toks = reader::tokenize("D/M ?");

    REQUIRE(toks[1].kind == token_kind::Undef);
    REQUIRE(toks[1].data == "/");
    REQUIRE(toks[3].kind == token_kind::Undef);
    REQUIRE(toks[3].data == "?");
  }

  SECTION( "carriage-returns" ) {
    auto toks = reader::tokenize("@1\r\n@2\r\n");

    REQUIRE(kinds(toks) == std::vector<token_kind> {
        token_kind::At, token_kind::Literal, token_kind::Newline,
        token_kind::At, token_kind::Literal, token_kind::Newline, token_kind::EndOfFile });
    REQUIRE(toks[1].data == "1");
  }

  SECTION( "module-name" ) {
    auto toks = reader::tokenize("@1", "Max.asm");

    REQUIRE(toks[0].loc.module == "Max.asm");
    REQUIRE(toks[0].loc.to_string() == "Max.asm:1:1");
  }

  SECTION( "json" ) {
    auto toks = reader::tokenize("0;JMP", "j.asm");
    nlohmann::json j = toks[1];

    REQUIRE(j["kind"] == "Semicolon");
    REQUIRE(j["data"] == ";");
    REQUIRE(j["range"]["module"] == "j.asm");
    REQUIRE(j["range"]["col_beg"] == 2);
  }
}

TEST_CASE( "Reference scenarios", "[Scenarios]" ) {

  SECTION( "label" ) {
    auto instr = single("(LOOP)");
    REQUIRE(std::holds_alternative<label>(instr));
    REQUIRE(std::get<label>(instr).name.name == "LOOP");
  }

  SECTION( "at-literal" ) {
    auto instr = single("@17");
    REQUIRE(std::holds_alternative<at_instruction>(instr));
    auto& at = std::get<at_instruction>(instr);
    REQUIRE(std::holds_alternative<literal>(at.value));
    REQUIRE(std::get<literal>(at.value).digits == "17");
  }

  SECTION( "at-symbol" ) {
    auto instr = single("@foo.bar$1");
    auto& at = std::get<at_instruction>(instr);
    REQUIRE(std::holds_alternative<symbol>(at.value));
    REQUIRE(std::get<symbol>(at.value).name == "foo.bar$1");
  }

  SECTION( "increment" ) {
    auto c = single_c("D=D+1");
    REQUIRE(c.destination == std::vector<reg> { reg::D });
    REQUIRE(c.comp == computation { unary { unary_kind::Inc, reg::D } });
    REQUIRE(!c.jump);
  }

  SECTION( "unconditional-jump" ) {
    auto c = single_c("0;JMP");
    REQUIRE(c.destination.empty());
    REQUIRE(c.comp == computation { constant { 0 } });
    REQUIRE(c.jump == jump_kind::JMP);
  }

  SECTION( "and-with-comment" ) {
    auto c = single_c("AMD=D&M // clear");
    REQUIRE(c.destination == std::vector<reg> { reg::A, reg::M, reg::D });
    REQUIRE(c.comp == computation { binary { reg::D, binary_op::And, reg::M } });
    REQUIRE(!c.jump);
  }

  SECTION( "chained-operators" ) {
    auto err = failure("D=D+1+1");
    REQUIRE(err.expected == rule::end_of_line);
    REQUIRE(err.loc.row_beg == 1);
    REQUIRE(err.loc.column_beg == 6);
  }
}

TEST_CASE( "Computations follow the ordered alternation", "[Computation]" ) {

  SECTION( "constants" ) {
    REQUIRE(single_c("D=0").comp == computation { constant { 0 } });
    REQUIRE(single_c("D=1").comp == computation { constant { 1 } });
    REQUIRE(single_c("D=-1").comp == computation { constant { -1 } });
  }

  SECTION( "prefix" ) {
    REQUIRE(single_c("D=!A").comp == computation { unary { unary_kind::Not, reg::A } });
    REQUIRE(single_c("D=-M").comp == computation { unary { unary_kind::Neg, reg::M } });
  }

  SECTION( "postfix-before-binary" ) {
    REQUIRE(single_c("D=A+1").comp == computation { unary { unary_kind::Inc, reg::A } });
    REQUIRE(single_c("D=A-1").comp == computation { unary { unary_kind::Dec, reg::A } });
  }

  SECTION( "binary" ) {
    REQUIRE(single_c("D=D+A").comp == computation { binary { reg::D, binary_op::Add, reg::A } });
    REQUIRE(single_c("D=D|M").comp == computation { binary { reg::D, binary_op::Or, reg::M } });
    REQUIRE(single_c("D=D&A").comp == computation { binary { reg::D, binary_op::And, reg::A } });

    // either register on either side, meaning is checked downstream
    REQUIRE(single_c("D=M-D").comp == computation { binary { reg::M, binary_op::Sub, reg::D } });
    REQUIRE(single_c("D=D-M").comp == computation { binary { reg::D, binary_op::Sub, reg::M } });
    REQUIRE(single_c("D=A&A").comp == computation { binary { reg::A, binary_op::And, reg::A } });
  }

  SECTION( "bare-register" ) {
    REQUIRE(single_c("D=M").comp == computation { reg::M });
    REQUIRE(single_c("M").comp == computation { reg::M });
    REQUIRE(single_c("D;JGT").comp == computation { reg::D });
  }

  SECTION( "registers-in-any-case" ) {
    auto c = single_c("am=d|m;jge");
    REQUIRE(c.destination == std::vector<reg> { reg::A, reg::M });
    REQUIRE(c.comp == computation { binary { reg::D, binary_op::Or, reg::M } });
    REQUIRE(c.jump == jump_kind::JGE);
  }

  SECTION( "all-jumps" ) {
    REQUIRE(single_c("0;JMP").jump == jump_kind::JMP);
    REQUIRE(single_c("D;JGT").jump == jump_kind::JGT);
    REQUIRE(single_c("D;JEQ").jump == jump_kind::JEQ);
    REQUIRE(single_c("D;JLT").jump == jump_kind::JLT);
    REQUIRE(single_c("D;JGE").jump == jump_kind::JGE);
    REQUIRE(single_c("D;JLE").jump == jump_kind::JLE);
    REQUIRE(single_c("D;Jne").jump == jump_kind::JNE);
  }

  SECTION( "dest-and-jump" ) {
    auto c = single_c("MD=M-1;JLT");
    REQUIRE(c.destination == std::vector<reg> { reg::M, reg::D });
    REQUIRE(c.comp == computation { unary { unary_kind::Dec, reg::M } });
    REQUIRE(c.jump == jump_kind::JLT);
  }

  SECTION( "whitespace" ) {
    auto c = single_c("  AM = D + 1   ;  JNE   // trailing");
    REQUIRE(c.destination == std::vector<reg> { reg::A, reg::M });
    REQUIRE(c.comp == computation { unary { unary_kind::Inc, reg::D } });
    REQUIRE(c.jump == jump_kind::JNE);
  }
}

TEST_CASE( "Programs are parsed line by line", "[Program]" ) {

  SECTION( "empty-inputs" ) {
    for(auto text : { "", "   ", "\n\n", " \t \n", "// only a comment", "\n  // one\n\t// two\n" })
    {
      auto w = parser::parse_text(text);
      REQUIRE(std::holds_alternative<program>(w));
      REQUIRE(std::get<program>(w).empty());
    }
  }

  SECTION( "source-order" ) {
    auto w = parser::parse_text(
        "// Computes R2 = max(R0, R1)\n"
        "   @R0\n"
        "   D=M\n"
        "\n"
        "(OUTPUT_D)\n"
        "   @R2\n"
        "   M=D   // store\n"
        "(INFINITE_LOOP)\n"
        "   @INFINITE_LOOP\n"
        "   0;JMP");

    REQUIRE(std::holds_alternative<program>(w));
    auto& prog = std::get<program>(w);
    REQUIRE(prog.size() == 8);

    REQUIRE(std::holds_alternative<at_instruction>(prog[0]));
    REQUIRE(std::holds_alternative<c_instruction>(prog[1]));
    REQUIRE(std::holds_alternative<label>(prog[2]));
    REQUIRE(std::get<label>(prog[2]).name.name == "OUTPUT_D");
    REQUIRE(std::holds_alternative<label>(prog[5]));
    REQUIRE(std::get<c_instruction>(prog[7]).jump == jump_kind::JMP);
  }

  SECTION( "label-with-inner-whitespace" ) {
    auto instr = single("( LOOP )");
    REQUIRE(std::get<label>(instr).name.name == "LOOP");
  }

  SECTION( "leading-zeros" ) {
    auto instr = single("@0017");
    REQUIRE(std::get<literal>(std::get<at_instruction>(instr).value).digits == "0017");
  }

  SECTION( "out-of-range-literal" ) {
    auto instr = single("@99999999999999999999");
    REQUIRE(std::get<literal>(std::get<at_instruction>(instr).value).digits == "99999999999999999999");
  }

  SECTION( "register-names-are-symbols-after-at" ) {
    auto instr = single("@A");
    REQUIRE(std::get<symbol>(std::get<at_instruction>(instr).value).name == "A");
  }

  SECTION( "windows-line-endings" ) {
    auto w = parser::parse_text("@1\r\nD=A\r\n");
    REQUIRE(std::holds_alternative<program>(w));
    REQUIRE(std::get<program>(w).size() == 2);
  }
}

TEST_CASE( "Syntax errors", "[Errors]" ) {

  SECTION( "whole-or-nothing" ) {
    auto err = failure("@1\n@2\nD=D+1+1\n@3");
    REQUIRE(err.loc.row_beg == 3);
    REQUIRE(err.loc.column_beg == 6);
  }

  SECTION( "unknown-character" ) {
    auto err = failure("@17\nD=D/M");
    REQUIRE(err.loc.row_beg == 2);
    REQUIRE(err.loc.column_beg == 4);
    REQUIRE(err.message() == "Can not tokenize \"/\".");
  }

  SECTION( "label-without-symbol" ) {
    auto err = failure("(17)");
    REQUIRE(err.expected == rule::symbol);
    REQUIRE(err.loc.column_beg == 2);
  }

  SECTION( "unclosed-label" ) {
    auto err = failure("(LOOP\n@1");
    REQUIRE(err.expected == rule::label);
    REQUIRE(err.loc.row_beg == 1);
    REQUIRE(err.loc.column_beg == 6);
  }

  SECTION( "label-must-stand-alone" ) {
    auto err = failure("(LOOP) @1");
    REQUIRE(err.expected == rule::end_of_line);
    REQUIRE(err.loc.column_beg == 8);
  }

  SECTION( "at-without-operand" ) {
    auto err = failure("@\n");
    REQUIRE(err.expected == rule::at_operand);
    REQUIRE(err.loc.column_beg == 2);
  }

  SECTION( "at-with-signed-literal" ) {
    auto err = failure("@-1");
    REQUIRE(err.expected == rule::at_operand);
  }

  SECTION( "literal-then-symbol" ) {
    auto err = failure("@12abc");
    REQUIRE(err.expected == rule::end_of_line);
    REQUIRE(err.loc.column_beg == 4);
  }

  SECTION( "destination-too-long" ) {
    auto err = failure("AMDM=D");
    REQUIRE(err.expected == rule::destination);
    REQUIRE(err.loc.column_beg == 1);
  }

  SECTION( "destination-not-a-register" ) {
    auto err = failure("X=D");
    REQUIRE(err.expected == rule::destination);
  }

  SECTION( "destination-letters-are-one-token" ) {
    auto err = failure("A M=D");
    REQUIRE(err.expected == rule::end_of_line);
    REQUIRE(err.loc.column_beg == 3);
  }

  SECTION( "missing-computation" ) {
    auto err = failure("D=\n");
    REQUIRE(err.expected == rule::computation);
    REQUIRE(err.loc.column_beg == 3);
  }

  SECTION( "no-such-constant" ) {
    auto err = failure("D=2");
    REQUIRE(err.expected == rule::computation);
  }

  SECTION( "unknown-jump" ) {
    auto err = failure("0;JMX");
    REQUIRE(err.expected == rule::jump);
    REQUIRE(err.loc.column_beg == 3);
    REQUIRE(err.message() == "Jump mnemonic expected after ';', instead got \"JMX\".");
  }

  SECTION( "prefix-and-postfix-together" ) {
    auto err = failure("D=-D+1");
    REQUIRE(err.expected == rule::end_of_line);
    REQUIRE(err.loc.column_beg == 5);
  }

  SECTION( "single-slash" ) {
    auto err = failure("@1 / comment");
    REQUIRE(err.loc.column_beg == 4);
  }

  SECTION( "diagnostic-record" ) {
    auto err = failure("D=D+1+1");

    REQUIRE(err.diag["level"].get<diag_level>() == diag_level::error);
    REQUIRE(err.diag["range"].get<source_range>() == err.loc);
    REQUIRE(err.diag["message"].get<std::string>() == "Expected end of line, instead got \"+\".");
  }
}

TEST_CASE( "Source ranges span tokens", "[Ranges]" ) {

  auto toks = reader::tokenize("(LOOP)\n  @LOOP", "r.asm");
  REQUIRE(toks.size() == 7);

  auto lab = toks[0].loc + toks[2].loc;
  REQUIRE(lab == source_range { "r.asm", 1, 1, 7, 1 });
  REQUIRE(lab.to_string() == "r.asm:1:1");

  // widening is symmetric, the earlier position always wins
  auto both = toks[4].loc;
  both += toks[0].loc;
  REQUIRE(both.row_beg == 1);
  REQUIRE(both.column_beg == 1);
  REQUIRE(both.row_end == 2);
  REQUIRE(both.column_end == 4);
}
