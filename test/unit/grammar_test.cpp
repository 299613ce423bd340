#include <xr/grammar.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace xr;

namespace {

  const markup_grammar grammar{};

} // namespace

// ===== character data =====

TEST_CASE("character data runs up to the next tag", "[grammar]") {
  auto m = grammar.match_character_data("abc<d/>", 0);
  REQUIRE(m);
  CHECK(m->token.text == "abc");
  CHECK(m->end == 3);
}

TEST_CASE("character data does not match at a tag", "[grammar]") {
  CHECK_FALSE(grammar.match_character_data("<a/>", 0));
  CHECK_FALSE(grammar.match_character_data("", 0));
}

TEST_CASE("character data decodes references", "[grammar]") {
  auto m = grammar.match_character_data("a &lt; b &amp; &#65;&#x42;&apos;", 0);
  REQUIRE(m);
  CHECK(m->token.text == "a < b & AB'");
}

TEST_CASE("character data encodes character references as UTF-8",
          "[grammar]") {
  auto m = grammar.match_character_data("&#x20AC;&#233;", 0);
  REQUIRE(m);
  CHECK(m->token.text == "\xE2\x82\xAC\xC3\xA9");
}

TEST_CASE("character data stops before an undecodable ampersand",
          "[grammar]") {
  auto m = grammar.match_character_data("ab&bad<", 0);
  REQUIRE(m);
  CHECK(m->token.text == "ab");
  CHECK(m->end == 2);

  CHECK_FALSE(grammar.match_character_data("&bad<", 0));
  CHECK_FALSE(grammar.match_character_data("& x", 0));
}

TEST_CASE("character data matches from the given position", "[grammar]") {
  auto m = grammar.match_character_data("<a>text</a>", 3);
  REQUIRE(m);
  CHECK(m->token.text == "text");
  CHECK(m->end == 7);
}

// ===== element start =====

TEST_CASE("element start with attributes and self-closing marker",
          "[grammar]") {
  std::string_view input = R"(<a x="1" y='two'/>)";
  auto m = grammar.match_element_start(input, 0);
  REQUIRE(m);
  CHECK(m->token.open == "<");
  CHECK(m->token.name == qname("a"));
  REQUIRE(m->token.attributes.size() == 2);
  CHECK(m->token.attributes[0] == attribute{qname("x"), "1"});
  CHECK(m->token.attributes[1] == attribute{qname("y"), "two"});
  CHECK(m->token.close == "/>");
  CHECK(m->token.self_closing());
  CHECK(m->end == input.size());
}

TEST_CASE("element start keeps trailing whitespace and prefixes",
          "[grammar]") {
  std::string_view input = "<svg:rect  >";
  auto m = grammar.match_element_start(input, 0);
  REQUIRE(m);
  CHECK(m->token.name.prefix() == "svg");
  CHECK(m->token.name.local_name() == "rect");
  CHECK(m->token.trailing_whitespace == "  ");
  CHECK(m->token.close == ">");
  CHECK_FALSE(m->token.self_closing());
  CHECK(m->end == input.size());
}

TEST_CASE("element start allows whitespace around the equals sign",
          "[grammar]") {
  auto m = grammar.match_element_start("<a x = \"a&amp;b\">", 0);
  REQUIRE(m);
  REQUIRE(m->token.attributes.size() == 1);
  CHECK(m->token.attributes[0].value() == "a&b");
}

TEST_CASE("element start rejects malformed tags", "[grammar]") {
  CHECK_FALSE(grammar.match_element_start("< a>", 0));
  CHECK_FALSE(grammar.match_element_start("<a x=1>", 0));
  CHECK_FALSE(grammar.match_element_start("<a x>", 0));
  CHECK_FALSE(grammar.match_element_start("<a x=\"<\">", 0));
  CHECK_FALSE(grammar.match_element_start("<a x=\"&bad;\">", 0));
  CHECK_FALSE(grammar.match_element_start("<a x=\"1\"y=\"2\">", 0));
  CHECK_FALSE(grammar.match_element_start("<a", 0));
  CHECK_FALSE(grammar.match_element_start("</a>", 0));
}

// ===== element end =====

TEST_CASE("element end", "[grammar]") {
  auto m = grammar.match_element_end("</p:a >rest", 0);
  REQUIRE(m);
  CHECK(m->token.name == qname("p", "a"));
  CHECK(m->end == 7);

  CHECK_FALSE(grammar.match_element_end("</>", 0));
  CHECK_FALSE(grammar.match_element_end("</a", 0));
  CHECK_FALSE(grammar.match_element_end("<a>", 0));
}

// ===== comment, CDATA, processing instruction =====

TEST_CASE("comment", "[grammar]") {
  auto m = grammar.match_comment("<!-- hi -->x", 0);
  REQUIRE(m);
  CHECK(m->token.text == " hi ");
  CHECK(m->end == 11);

  CHECK_FALSE(grammar.match_comment("<!-- open", 0));
}

TEST_CASE("CDATA section keeps markup verbatim", "[grammar]") {
  auto m = grammar.match_cdata("<![CDATA[<x>&amp;]]>", 0);
  REQUIRE(m);
  CHECK(m->token.text == "<x>&amp;");
  CHECK(m->end == 20);

  CHECK_FALSE(grammar.match_cdata("<![CDATA[open", 0));
}

TEST_CASE("processing instruction with and without data", "[grammar]") {
  auto decl = grammar.match_processing_instruction(R"(<?xml version="1.0"?>)", 0);
  REQUIRE(decl);
  CHECK(decl->token.target == "xml");
  CHECK(decl->token.text == R"(version="1.0")");

  auto bare = grammar.match_processing_instruction("<?go?>", 0);
  REQUIRE(bare);
  CHECK(bare->token.target == "go");
  CHECK(bare->token.text.empty());
  CHECK(bare->end == 6);

  auto spaced = grammar.match_processing_instruction("<?pi   some data ?>", 0);
  REQUIRE(spaced);
  CHECK(spaced->token.text == "some data ");
}

TEST_CASE("processing instruction rejects malformed input", "[grammar]") {
  CHECK_FALSE(grammar.match_processing_instruction("<? x?>", 0));
  CHECK_FALSE(grammar.match_processing_instruction("<?x data", 0));
  CHECK_FALSE(grammar.match_processing_instruction("<?x-data?", 0));
}

// ===== doctype =====

TEST_CASE("doctype forms", "[grammar]") {
  auto simple = grammar.match_doctype("<!DOCTYPE html>", 0);
  REQUIRE(simple);
  CHECK(simple->token.text == "html");
  CHECK(simple->end == 15);

  auto system = grammar.match_doctype(R"(<!DOCTYPE note SYSTEM "Note.dtd" >)", 0);
  REQUIRE(system);
  CHECK(system->token.text == R"(note SYSTEM "Note.dtd")");

  auto subset =
      grammar.match_doctype("<!DOCTYPE n [<!ELEMENT n (#PCDATA)>]>", 0);
  REQUIRE(subset);
  CHECK(subset->token.text == "n [<!ELEMENT n (#PCDATA)>]");
}

TEST_CASE("doctype internal subset may quote a closing bracket",
          "[grammar]") {
  std::string_view input = R"(<!DOCTYPE a [<!ENTITY x "]">]>)";
  auto m = grammar.match_doctype(input, 0);
  REQUIRE(m);
  CHECK(m->token.text == R"(a [<!ENTITY x "]">])");
  CHECK(m->end == input.size());

  CHECK_FALSE(grammar.match_doctype(R"(<!DOCTYPE a [<!ENTITY x "]>)", 0));
  CHECK_FALSE(grammar.match_doctype("<!DOCTYPE a [<!ELEMENT a ANY>", 0));
}

TEST_CASE("doctype rejects malformed input", "[grammar]") {
  CHECK_FALSE(grammar.match_doctype("<!DOCTYPE>", 0));
  CHECK_FALSE(grammar.match_doctype("<!DOCTYPEhtml>", 0));
  CHECK_FALSE(grammar.match_doctype("<!DOCTYPE html", 0));
  CHECK_FALSE(grammar.match_doctype("<!DOCTYPE note \"open>", 0));
}

// ===== helpers =====

TEST_CASE("decode_reference", "[grammar]") {
  std::string out;
  CHECK(decode_reference("&quot;rest", out) == 6);
  CHECK(decode_reference("&#10;", out) == 5);
  CHECK(out == "\"\n");

  CHECK(decode_reference("&nbsp;", out) == 0);
  CHECK(decode_reference("&#;", out) == 0);
  CHECK(decode_reference("&#x;", out) == 0);
  CHECK(decode_reference("&#0;", out) == 0);
  CHECK(decode_reference("&#xD800;", out) == 0);
  CHECK(decode_reference("&#x110000;", out) == 0);
  CHECK(decode_reference("&amp", out) == 0);
  CHECK(out == "\"\n");
}

TEST_CASE("whitespace classification", "[grammar]") {
  CHECK(is_whitespace(" \t\r\n"));
  CHECK_FALSE(is_whitespace(" x "));
  CHECK_FALSE(is_whitespace('\v'));
}

TEST_CASE("locate converts offsets to line and column", "[grammar]") {
  std::string_view text = "<a>\n  <b>\n</a>";
  auto start = locate(text, 0);
  CHECK(start.line == 1);
  CHECK(start.column == 1);

  auto b = locate(text, 6);
  CHECK(b.line == 2);
  CHECK(b.column == 3);

  auto past = locate(text, 1000);
  CHECK(past.line == 3);
  CHECK(past.column == 5);
}

TEST_CASE("default grammar is a markup grammar", "[grammar]") {
  auto m = default_grammar().match_element_end("</x>", 0);
  REQUIRE(m);
  CHECK(m->token.name == qname("x"));
}
