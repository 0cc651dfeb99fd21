#include <rdfdec/turtle_lexer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace rdfdec;

namespace {

  std::vector<token>
  lex_all(const std::string& input) {
    std::istringstream in(input);
    turtle_lexer lexer(in);
    std::vector<token> tokens;
    while (true) {
      tokens.push_back(lexer.next_token());
      if (tokens.back().kind == token_kind::eof ||
          tokens.back().kind == token_kind::error)
        return tokens;
    }
  }

  std::vector<token_kind>
  kinds(const std::string& input) {
    std::vector<token_kind> result;
    for (const auto& t : lex_all(input))
      result.push_back(t.kind);
    return result;
  }

} // namespace

TEST_CASE("turtle_lexer: directives", "[turtle_lexer]") {
  auto tokens = lex_all("@prefix ex: <http://example.org/> .\n"
                        "@base <http://example.org/> .\n"
                        "PREFIX p: <urn:p:>\n"
                        "base <urn:b>\n");
  REQUIRE(tokens.size() == 13);
  CHECK(tokens[0].kind == token_kind::kw_prefix);
  CHECK(tokens[1].kind == token_kind::prefixed_name);
  CHECK(tokens[1].text == "ex:");
  CHECK(tokens[2].kind == token_kind::iri_ref);
  CHECK(tokens[2].text == "http://example.org/");
  CHECK(tokens[3].kind == token_kind::dot);
  CHECK(tokens[4].kind == token_kind::kw_base);
  CHECK(tokens[7].kind == token_kind::kw_sparql_prefix);
  CHECK(tokens[8].text == "p:");
  CHECK(tokens[10].kind == token_kind::kw_sparql_base);
  CHECK(tokens[12].kind == token_kind::eof);
}

TEST_CASE("turtle_lexer: punctuation", "[turtle_lexer]") {
  CHECK(kinds("ex:s a ex:C ; ex:p ( 1 ) , [ ex:q ex:r ] , [ ] .") ==
        std::vector<token_kind>{
            token_kind::prefixed_name, token_kind::kw_a,
            token_kind::prefixed_name, token_kind::semicolon,
            token_kind::prefixed_name, token_kind::lparen,
            token_kind::integer,       token_kind::rparen,
            token_kind::comma,         token_kind::lbracket,
            token_kind::prefixed_name, token_kind::prefixed_name,
            token_kind::rbracket,      token_kind::comma,
            token_kind::anon,          token_kind::dot,
            token_kind::eof});
}

TEST_CASE("turtle_lexer: numbers", "[turtle_lexer]") {
  auto tokens = lex_all("1 -2 +7 3.5 .5 1e3 1.e5 -4.2E-1 9.");
  REQUIRE(tokens.size() == 11);
  CHECK(tokens[0].kind == token_kind::integer);
  CHECK(tokens[1].kind == token_kind::integer);
  CHECK(tokens[1].text == "-2");
  CHECK(tokens[2].text == "+7");
  CHECK(tokens[3].kind == token_kind::decimal);
  CHECK(tokens[4].kind == token_kind::decimal);
  CHECK(tokens[4].text == ".5");
  CHECK(tokens[5].kind == token_kind::double_literal);
  CHECK(tokens[6].kind == token_kind::double_literal);
  CHECK(tokens[6].text == "1.e5");
  CHECK(tokens[7].kind == token_kind::double_literal);
  CHECK(tokens[7].text == "-4.2E-1");
  CHECK(tokens[8].kind == token_kind::integer);
  CHECK(tokens[8].text == "9");
  CHECK(tokens[9].kind == token_kind::dot);
}

TEST_CASE("turtle_lexer: strings", "[turtle_lexer]") {
  auto tokens = lex_all("'single' \"with \\\"escape\\\"\" "
                        "\"\"\"long\nstring\"\"\" '''it''s''' \"\"\"x\"\"\"\"");
  REQUIRE(tokens.size() == 6);
  CHECK(tokens[0].text == "single");
  CHECK(tokens[1].text == "with \"escape\"");
  CHECK(tokens[2].text == "long\nstring");
  CHECK(tokens[3].text == "it''s");
  CHECK(tokens[4].text == "x\"");
  for (int i = 0; i < 5; ++i)
    CHECK(tokens[i].kind == token_kind::literal);
}

TEST_CASE("turtle_lexer: language tags versus keywords", "[turtle_lexer]") {
  auto tokens = lex_all("\"x\"@en-US \"y\"@prefix-x @base");
  REQUIRE(tokens.size() == 6);
  CHECK(tokens[1].kind == token_kind::lang_tag);
  CHECK(tokens[1].text == "en-US");
  CHECK(tokens[3].kind == token_kind::lang_tag);
  CHECK(tokens[3].text == "prefix-x");
  CHECK(tokens[4].kind == token_kind::kw_base);
}

TEST_CASE("turtle_lexer: names", "[turtle_lexer]") {
  auto tokens = lex_all(":local ex: ex:a\\.b ex:%41 ex:x.y true false");
  REQUIRE(tokens.size() == 8);
  CHECK(tokens[0].text == ":local");
  CHECK(tokens[1].text == "ex:");
  CHECK(tokens[2].text == "ex:a.b");
  CHECK(tokens[3].text == "ex:%41");
  CHECK(tokens[4].text == "ex:x.y");
  CHECK(tokens[5].kind == token_kind::boolean);
  CHECK(tokens[6].text == "false");
}

TEST_CASE("turtle_lexer: blank node labels and trailing dots",
          "[turtle_lexer]") {
  auto tokens = lex_all("_:b1 _:a.b _:x.");
  REQUIRE(tokens.size() == 5);
  CHECK(tokens[0].text == "b1");
  CHECK(tokens[1].text == "a.b");
  CHECK(tokens[2].text == "x");
  CHECK(tokens[3].kind == token_kind::dot);
}

TEST_CASE("turtle_lexer: comments and positions", "[turtle_lexer]") {
  auto tokens = lex_all("# comment\n  <x> # another\n\t<y>");
  REQUIRE(tokens.size() == 3);
  CHECK(tokens[0].line == 2);
  CHECK(tokens[0].column == 3);
  CHECK(tokens[1].line == 3);
  CHECK(tokens[1].column == 2);
}

TEST_CASE("turtle_lexer: IRI escapes", "[turtle_lexer]") {
  auto tokens = lex_all("<http://example.org/\\u00E9>");
  REQUIRE(tokens[0].kind == token_kind::iri_ref);
  CHECK(tokens[0].text == "http://example.org/\xC3\xA9");
}

TEST_CASE("turtle_lexer: tokens spanning read chunks", "[turtle_lexer]") {
  std::string big(10000, 'a');
  auto tokens = lex_all("<x> \"" + big + "\" .");
  REQUIRE(tokens.size() == 4);
  CHECK(tokens[1].text == big);
  CHECK(tokens[2].kind == token_kind::dot);
  CHECK(tokens[2].column == 10008);
}

TEST_CASE("turtle_lexer: malformed input", "[turtle_lexer]") {
  auto error_of = [](const std::string& input) {
    return lex_all(input).back();
  };

  auto unterminated = error_of("<x>\n  \"abc\n");
  CHECK(unterminated.kind == token_kind::error);
  CHECK(unterminated.line == 2);
  CHECK(unterminated.column == 3);

  CHECK(error_of("<http://a b>").kind == token_kind::error);
  CHECK(error_of("\"\\q\"").kind == token_kind::error);
  CHECK(error_of("foo").text == "unexpected name 'foo'");
  CHECK(error_of("!").kind == token_kind::error);
  CHECK(error_of("_:").kind == token_kind::error);
  CHECK(error_of("ex:%4").kind == token_kind::error);
  CHECK(error_of("\"\\uDC00\"").kind == token_kind::error);
}
