#include <rdfdec/line_lexer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace rdfdec;

namespace {

  std::vector<token>
  lex_all(const std::string& input) {
    std::istringstream in(input);
    line_lexer lexer(in);
    std::vector<token> tokens;
    while (true) {
      tokens.push_back(lexer.next_token());
      if (tokens.back().kind == token_kind::eof) return tokens;
    }
  }

} // namespace

TEST_CASE("line_lexer: one statement", "[line_lexer]") {
  auto tokens = lex_all("<http://a> <http://b> \"x\" .\n");
  REQUIRE(tokens.size() == 6);

  CHECK(tokens[0].kind == token_kind::iri_ref);
  CHECK(tokens[0].text == "http://a");
  CHECK(tokens[0].line == 1);
  CHECK(tokens[0].column == 1);

  CHECK(tokens[1].kind == token_kind::iri_ref);
  CHECK(tokens[1].column == 12);

  CHECK(tokens[2].kind == token_kind::literal);
  CHECK(tokens[2].text == "x");
  CHECK(tokens[2].column == 23);

  CHECK(tokens[3].kind == token_kind::dot);
  CHECK(tokens[3].column == 27);

  CHECK(tokens[4].kind == token_kind::eol);
  CHECK(tokens[5].kind == token_kind::eof);
}

TEST_CASE("line_lexer: empty input is end of input at 1:1", "[line_lexer]") {
  auto tokens = lex_all("");
  REQUIRE(tokens.size() == 1);
  CHECK(tokens[0].kind == token_kind::eof);
  CHECK(tokens[0].line == 1);
  CHECK(tokens[0].column == 1);
}

TEST_CASE("line_lexer: end of input is sticky", "[line_lexer]") {
  std::istringstream in("<http://a>");
  line_lexer lexer(in);
  CHECK(lexer.next_token().kind == token_kind::iri_ref);
  CHECK(lexer.next_token().kind == token_kind::eol);
  CHECK(lexer.next_token().kind == token_kind::eof);
  CHECK(lexer.next_token().kind == token_kind::eof);
}

TEST_CASE("line_lexer: comments and blank lines", "[line_lexer]") {
  auto tokens = lex_all("# a comment\n\n   \t\n<http://a> # trailing\n");
  REQUIRE(tokens.size() == 6);
  CHECK(tokens[0].kind == token_kind::eol);
  CHECK(tokens[1].kind == token_kind::eol);
  CHECK(tokens[2].kind == token_kind::eol);
  CHECK(tokens[3].kind == token_kind::iri_ref);
  CHECK(tokens[3].line == 4);
  CHECK(tokens[4].kind == token_kind::eol);
}

TEST_CASE("line_lexer: carriage returns are dropped", "[line_lexer]") {
  auto tokens = lex_all("<http://a> .\r\n");
  REQUIRE(tokens.size() == 4);
  CHECK(tokens[1].kind == token_kind::dot);
  CHECK(tokens[2].kind == token_kind::eol);
}

TEST_CASE("line_lexer: literal escapes", "[line_lexer]") {
  auto tokens = lex_all(R"("a\tb\"cé\U0001F600")");
  REQUIRE(tokens[0].kind == token_kind::literal);
  CHECK(tokens[0].text == "a\tb\"c\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_CASE("line_lexer: IRI escapes", "[line_lexer]") {
  auto tokens = lex_all(R"(<http://example.org/\u00E9>)");
  REQUIRE(tokens[0].kind == token_kind::iri_ref);
  CHECK(tokens[0].text == "http://example.org/\xC3\xA9");
}

TEST_CASE("line_lexer: language tags and datatypes", "[line_lexer]") {
  auto tokens =
      lex_all("\"chat\"@en-GB \"1\"^^<http://www.w3.org/2001/XMLSchema#int>");
  REQUIRE(tokens.size() >= 5);
  CHECK(tokens[1].kind == token_kind::lang_tag);
  CHECK(tokens[1].text == "en-GB");
  CHECK(tokens[3].kind == token_kind::datatype_marker);
  CHECK(tokens[4].kind == token_kind::iri_ref);
}

TEST_CASE("line_lexer: blank node labels stop before a final dot",
          "[line_lexer]") {
  auto tokens = lex_all("_:b1 _:a.b _:x.");
  CHECK(tokens[0].kind == token_kind::blank_node_label);
  CHECK(tokens[0].text == "b1");
  CHECK(tokens[1].text == "a.b");
  CHECK(tokens[2].text == "x");
  CHECK(tokens[3].kind == token_kind::dot);
}

TEST_CASE("line_lexer: unterminated literal is an error at its start",
          "[line_lexer]") {
  auto tokens = lex_all("<http://a> <http://b> \"abc\n");
  REQUIRE(tokens[2].kind == token_kind::error);
  CHECK(tokens[2].line == 1);
  CHECK(tokens[2].column == 23);
  CHECK(tokens[2].text == "unterminated literal: \"abc");
}

TEST_CASE("line_lexer: malformed lexemes", "[line_lexer]") {
  CHECK(lex_all("<http://a b>")[0].kind == token_kind::error);
  CHECK(lex_all("<http://a")[0].kind == token_kind::error);
  CHECK(lex_all(R"("\q")")[0].kind == token_kind::error);
  CHECK(lex_all("@1a")[0].kind == token_kind::error);
  CHECK(lex_all("_:")[0].kind == token_kind::error);
  CHECK(lex_all("^x")[0].kind == token_kind::error);
  CHECK(lex_all("bare")[0].kind == token_kind::error);
  CHECK(lex_all(R"("\uD800")")[0].kind == token_kind::error);
  CHECK(lex_all(R"(<http://a/\U0000DFFF>)")[0].kind == token_kind::error);
}

TEST_CASE("line_lexer: relative IRI is an error at its start",
          "[line_lexer]") {
  auto tokens = lex_all("<http://a> <b> .\n");
  REQUIRE(tokens[1].kind == token_kind::error);
  CHECK(tokens[1].column == 12);
  CHECK(tokens[1].text == "relative IRI not allowed: <b>");
}
