#include <rdfdec/iri.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace rdfdec;

TEST_CASE("iri: absolute references have a scheme", "[iri]") {
  CHECK(is_absolute_iri("http://example.org/"));
  CHECK(is_absolute_iri("urn:isbn:0451450523"));
  CHECK(is_absolute_iri("tag+x.y-z:thing"));
  CHECK_FALSE(is_absolute_iri("#frag"));
  CHECK_FALSE(is_absolute_iri("../up"));
  CHECK_FALSE(is_absolute_iri("1http:x"));
  CHECK_FALSE(is_absolute_iri(""));
}

TEST_CASE("iri: RFC 3986 normal examples", "[iri]") {
  const std::string base = "http://a/b/c/d;p?q";
  CHECK(resolve_iri(base, "g:h") == "g:h");
  CHECK(resolve_iri(base, "g") == "http://a/b/c/g");
  CHECK(resolve_iri(base, "./g") == "http://a/b/c/g");
  CHECK(resolve_iri(base, "g/") == "http://a/b/c/g/");
  CHECK(resolve_iri(base, "/g") == "http://a/g");
  CHECK(resolve_iri(base, "//g") == "http://g");
  CHECK(resolve_iri(base, "?y") == "http://a/b/c/d;p?y");
  CHECK(resolve_iri(base, "g?y") == "http://a/b/c/g?y");
  CHECK(resolve_iri(base, "#s") == "http://a/b/c/d;p?q#s");
  CHECK(resolve_iri(base, "g#s") == "http://a/b/c/g#s");
  CHECK(resolve_iri(base, "g?y#s") == "http://a/b/c/g?y#s");
  CHECK(resolve_iri(base, ";x") == "http://a/b/c/;x");
  CHECK(resolve_iri(base, "g;x") == "http://a/b/c/g;x");
  CHECK(resolve_iri(base, "") == "http://a/b/c/d;p?q");
  CHECK(resolve_iri(base, ".") == "http://a/b/c/");
  CHECK(resolve_iri(base, "./") == "http://a/b/c/");
  CHECK(resolve_iri(base, "..") == "http://a/b/");
  CHECK(resolve_iri(base, "../") == "http://a/b/");
  CHECK(resolve_iri(base, "../g") == "http://a/b/g");
  CHECK(resolve_iri(base, "../..") == "http://a/");
  CHECK(resolve_iri(base, "../../") == "http://a/");
  CHECK(resolve_iri(base, "../../g") == "http://a/g");
}

TEST_CASE("iri: RFC 3986 abnormal examples", "[iri]") {
  const std::string base = "http://a/b/c/d;p?q";
  CHECK(resolve_iri(base, "../../../g") == "http://a/g");
  CHECK(resolve_iri(base, "../../../../g") == "http://a/g");
  CHECK(resolve_iri(base, "/./g") == "http://a/g");
  CHECK(resolve_iri(base, "/../g") == "http://a/g");
  CHECK(resolve_iri(base, "g.") == "http://a/b/c/g.");
  CHECK(resolve_iri(base, ".g") == "http://a/b/c/.g");
  CHECK(resolve_iri(base, "g..") == "http://a/b/c/g..");
  CHECK(resolve_iri(base, "./../g") == "http://a/b/g");
  CHECK(resolve_iri(base, "./g/.") == "http://a/b/c/g/");
  CHECK(resolve_iri(base, "g/./h") == "http://a/b/c/g/h");
  CHECK(resolve_iri(base, "g/../h") == "http://a/b/c/h");
  CHECK(resolve_iri(base, "g;x=1/./y") == "http://a/b/c/g;x=1/y");
  CHECK(resolve_iri(base, "g;x=1/../y") == "http://a/b/c/y");
  CHECK(resolve_iri(base, "g?y/./x") == "http://a/b/c/g?y/./x");
  CHECK(resolve_iri(base, "g#s/../x") == "http://a/b/c/g#s/../x");
}

TEST_CASE("iri: base without a path", "[iri]") {
  CHECK(resolve_iri("http://example.org", "x") == "http://example.org/x");
  CHECK(resolve_iri("http://example.org", "#me") == "http://example.org#me");
}

TEST_CASE("iri: empty base leaves references alone", "[iri]") {
  CHECK(resolve_iri("", "relative/path") == "relative/path");
  CHECK(resolve_iri("", "#frag") == "#frag");
}
