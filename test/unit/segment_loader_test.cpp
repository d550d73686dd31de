#include <segram/expat_reader.hpp>
#include <segram/segment_loader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace segram;

namespace {

  segment_document
  load(const std::string& body) {
    std::string xml =
        "<segments xmlns=\"http://segram.dev/segments\">" + body +
        "</segments>";
    expat_reader reader(xml);
    return segment_loader().load(reader);
  }

} // namespace

TEST_CASE("segment_loader: leaf segments keep their raw text",
          "[segment_loader]") {
  auto doc = load("<code>select</code><whitespace>  </whitespace>"
                  "<newline>&#10;</newline><comment>-- hi</comment>");

  const auto& segs = doc.segments();
  REQUIRE(segs.size() == 4);
  CHECK(segs[0].kind() == segment_kind::code);
  CHECK(segs[0].raw() == "select");
  CHECK(segs[1].kind() == segment_kind::whitespace);
  CHECK(segs[1].raw() == "  ");
  CHECK(segs[2].kind() == segment_kind::newline);
  CHECK(segs[2].raw() == "\n");
  CHECK(segs[3].kind() == segment_kind::comment);
  CHECK(segs[3].raw() == "-- hi");
}

TEST_CASE("segment_loader: groups nest", "[segment_loader]") {
  auto doc = load("<group><code>a</code><group><code>b</code>"
                  "<whitespace> </whitespace><code>c</code></group></group>");

  REQUIRE(doc.segments().size() == 1);
  const auto& g = doc.segments()[0];
  CHECK(g.is_composite());
  CHECK(g.is_code());
  CHECK(g.raw() == "ab c");
  CHECK(g.leaves().size() == 4);
}

TEST_CASE("segment_loader: view borrows the owned segments",
          "[segment_loader]") {
  auto doc = load("<code>a</code><code>b</code>");
  auto view = doc.view();
  REQUIRE(view.size() == 2);
  CHECK(view[0] == &doc.segments()[0]);
  CHECK(view[1] == &doc.segments()[1]);
}

TEST_CASE("segment_loader: empty document", "[segment_loader]") {
  auto doc = load("");
  CHECK(doc.segments().empty());
  CHECK(doc.view().empty());
}

TEST_CASE("segment_loader: rejects malformed input", "[segment_loader]") {
  SECTION("wrong root") {
    expat_reader reader(R"(<tokens xmlns="http://segram.dev/segments"/>)");
    CHECK_THROWS_AS(segment_loader().load(reader), std::runtime_error);
  }

  SECTION("unknown segment kind") {
    CHECK_THROWS_AS(load("<keyword>a</keyword>"), std::runtime_error);
  }

  SECTION("empty leaf") {
    CHECK_THROWS_AS(load("<code></code>"), std::runtime_error);
  }

  SECTION("empty group") {
    CHECK_THROWS_AS(load("<group/>"), std::runtime_error);
  }

  SECTION("element inside a leaf") {
    CHECK_THROWS_AS(load("<code>a<code>b</code></code>"), std::runtime_error);
  }

  SECTION("stray text") {
    CHECK_THROWS_AS(load("select"), std::runtime_error);
  }
}
