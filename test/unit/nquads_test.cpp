#include <rdfdec/decoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using namespace rdfdec;

TEST_CASE("nquads: statement without graph is in the default graph",
          "[nquads]") {
  std::istringstream in("<http://a> <http://b> \"x\" .\n");
  quad_decoder decoder(in, format::nquads);

  auto r = decoder.decode();
  REQUIRE(r.has_value());
  CHECK(r.value() == quad{iri("http://a"), iri("http://b"), literal("x"),
                          blank_node::default_graph()});
  CHECK(decoder.decode().at_end());
}

TEST_CASE("nquads: statement with a graph label", "[nquads]") {
  std::istringstream in("<http://a> <http://b> \"x\" <http://g> .\n");
  quad_decoder decoder(in, format::nquads);

  auto r = decoder.decode();
  REQUIRE(r.has_value());
  CHECK(r.value().as_triple() ==
        triple{iri("http://a"), iri("http://b"), literal("x")});
  CHECK(r.value().context == resource(iri("http://g")));
  CHECK(decoder.decode().at_end());
}

TEST_CASE("nquads: blank node subject, object and graph", "[nquads]") {
  std::istringstream in("_:s <http://p> _:o _:g .");
  quad_decoder decoder(in, format::nquads);

  auto r = decoder.decode();
  REQUIRE(r.has_value());
  CHECK(r.value().subject == resource(blank_node("s")));
  CHECK(r.value().object == term(blank_node("o")));
  CHECK(r.value().context == resource(blank_node("g")));
}

TEST_CASE("nquads: typed and language-tagged literals", "[nquads]") {
  std::istringstream in(
      "<http://a> <http://b> \"1\"^^<http://www.w3.org/2001/XMLSchema#integer> .\n"
      "<http://a> <http://b> \"chat\"@fr <http://g> .\n");
  quad_decoder decoder(in, format::nquads);

  auto all = decoder.decode_all();
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 2);
  CHECK(all.value()[0].object == term(literal("1", vocab::xsd_integer)));
  CHECK(all.value()[1].object == term(literal("chat", "fr")));
  CHECK(all.value()[1].context == resource(iri("http://g")));
}

TEST_CASE("nquads: quads without graph share the same context", "[nquads]") {
  std::istringstream in("<http://a> <http://b> <http://c> .\n"
                        "<http://d> <http://e> <http://f> .\n");
  quad_decoder decoder(in, format::nquads);

  auto first = decoder.decode();
  auto second = decoder.decode();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first.value().context == second.value().context);
  CHECK(first.value().context == resource(decoder.default_graph()));
}

TEST_CASE("nquads: a blank node named like the default graph is distinct",
          "[nquads]") {
  std::istringstream in("<http://a> <http://b> <http://c> _:defaultGraph .\n");
  quad_decoder decoder(in, format::nquads);

  auto r = decoder.decode();
  REQUIRE(r.has_value());
  CHECK(r.value().context != resource(decoder.default_graph()));
}

TEST_CASE("nquads: empty input ends without a fault", "[nquads]") {
  std::istringstream in("");
  quad_decoder decoder(in, format::nquads);

  auto r = decoder.decode();
  CHECK(r.at_end());
  CHECK_FALSE(r.failed());
  CHECK(decoder.decode().at_end());
}

TEST_CASE("nquads: only comments and blank lines", "[nquads]") {
  std::istringstream in("# header\n\n   \n# more\n");
  quad_decoder decoder(in, format::nquads);

  CHECK(decoder.decode().at_end());
}

TEST_CASE("nquads: last line without a newline", "[nquads]") {
  std::istringstream in("<http://a> <http://b> <http://c> .");
  quad_decoder decoder(in, format::nquads);

  CHECK(decoder.decode().has_value());
  CHECK(decoder.decode().at_end());
}

TEST_CASE("nquads: decode_all returns statements in input order",
          "[nquads]") {
  std::string input;
  for (int i = 0; i < 5; ++i)
    input += "<http://s" + std::to_string(i) + "> <http://p> \"" +
             std::to_string(i) + "\" .\n";
  std::istringstream in(input);
  quad_decoder decoder(in, format::nquads);

  auto all = decoder.decode_all();
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 5);
  for (int i = 0; i < 5; ++i)
    CHECK(all.value()[i].subject ==
          resource(iri("http://s" + std::to_string(i))));
}

TEST_CASE("nquads: decode_all fails wherever the bad statement is",
          "[nquads]") {
  for (int k = 0; k < 4; ++k) {
    std::string input;
    for (int i = 0; i < 4; ++i) {
      if (i == k)
        input += "<http://a> <http://b> .\n";
      else
        input += "<http://a> <http://b> <http://c> .\n";
    }
    std::istringstream in(input);
    quad_decoder decoder(in, format::nquads);

    auto all = decoder.decode_all();
    REQUIRE(all.failed());
    CHECK(all.error().line == static_cast<std::size_t>(k + 1));
  }
}

TEST_CASE("nquads: unterminated literal is a lexical fault at its start",
          "[nquads]") {
  std::istringstream in("<http://a> <http://b> <http://c> .\n"
                        "<http://a> <http://b> \"abc .\n");
  quad_decoder decoder(in, format::nquads);

  REQUIRE(decoder.decode().has_value());
  auto r = decoder.decode();
  REQUIRE(r.failed());
  CHECK(r.error().kind == fault_kind::lexical);
  CHECK(r.error().line == 2);
  CHECK(r.error().column == 23);
  CHECK(r.error().message.starts_with("2:23: "));
}

TEST_CASE("nquads: relative IRI references are lexical faults", "[nquads]") {
  std::istringstream in("<a> <b> <c> .");
  quad_decoder decoder(in, format::nquads);

  auto r = decoder.decode();
  REQUIRE(r.failed());
  CHECK(r.error().kind == fault_kind::lexical);
  CHECK(r.error().line == 1);
  CHECK(r.error().column == 1);
  CHECK(r.error().text == "relative IRI not allowed: <a>");
}

TEST_CASE("nquads: a dot in object position is a syntax fault", "[nquads]") {
  std::istringstream in("<http://a> <http://b> .\n");
  quad_decoder decoder(in, format::nquads);

  auto r = decoder.decode();
  REQUIRE(r.failed());
  CHECK(r.error().kind == fault_kind::syntax);
  CHECK(r.error().context == "object");
  REQUIRE(r.error().found.has_value());
  CHECK(*r.error().found == token_kind::dot);
  CHECK(r.error().line == 1);
  CHECK(r.error().column == 23);
  CHECK(r.error().message == "1:23: unexpected '.' while expecting object");
}

TEST_CASE("nquads: grammar positions named in faults", "[nquads]") {
  auto context_of = [](const std::string& line) {
    std::istringstream in(line);
    quad_decoder decoder(in, format::nquads);
    auto r = decoder.decode();
    REQUIRE(r.failed());
    return r.error().context;
  };

  CHECK(context_of("\"x\" <http://b> <http://c> .") == "subject");
  CHECK(context_of("<http://a> _:b <http://c> .") == "predicate");
  CHECK(context_of("<http://a> <http://b> \"x\"^^\"y\" .") == "datatype");
  CHECK(context_of("<http://a> <http://b> <http://c> \"g\" .") == "dot");
  CHECK(context_of("<http://a> <http://b> <http://c>") == "dot");
  CHECK(context_of("<http://a> <http://b> <http://c> . <http://d>") ==
        "end of line");
}

TEST_CASE("nquads: set_base does not change anything", "[nquads]") {
  std::istringstream in("<http://a> <http://b> <http://c> .");
  quad_decoder decoder(in, format::nquads);
  decoder.set_base(iri("http://example.org/"));

  auto r = decoder.decode();
  REQUIRE(r.has_value());
  CHECK(r.value().subject == resource(iri("http://a")));
}
