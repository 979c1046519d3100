#define PEGKIT_DEDUP
#include "../pegkit.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Pegkit;

//---------------------------------------------------------------------------
// any_char
//---------------------------------------------------------------------------
CASE("any_char: one char") {
	auto r = run(any_char(), "xy");
	REQUIRE(r);
	CHECK(r.value() == "x");
	CHECK(r.next() == Pos{1, 1, 1});
}

CASE("any_char: one multi-byte char") {
	auto r = run(any_char(), "\xE2\x82\xAC!");
	REQUIRE(r);
	CHECK(r.value() == "\xE2\x82\xAC");
	CHECK(r.next() == Pos{3, 1, 1});
}

CASE("any_char: end of input") {
	auto r = run(any_char(), "");
	REQUIRE(!r);
	auto& e = r.error();
	CHECK(e.message == "Unexpected end of input");
	CHECK(e.expected == std::vector<string>{"any character"});
	CHECK(e.found == "end of input");
	CHECK(e.matcher_name == "any_char");
	CHECK(e.fault == Fault::EndOfInput);
	CHECK(e.pos == START);
}

//---------------------------------------------------------------------------
// literal
//---------------------------------------------------------------------------
CASE("literal: match, and the rest left alone") {
	auto r = run(literal("let"), "let x");
	REQUIRE(r);
	CHECK(r.value() == "let");
	CHECK(r.next() == Pos{3, 1, 3});
}

CASE("literal: from the middle") {
	auto r = literal("b")("abc", Pos{1, 1, 1});
	REQUIRE(r);
	CHECK(r.success().current == Pos{1, 1, 1});
	CHECK(r.next() == Pos{2, 1, 2});
}

CASE("literal: mismatch reported at the first differing char") {
	auto r = run(literal("hello"), "help!");
	REQUIRE(!r);
	auto& e = r.error();
	CHECK(e.pos == Pos{3, 1, 3});
	CHECK(e.message == "Unexpected character \"p\" at offset 3, expected \"hello\"");
	CHECK(e.expected == std::vector<string>{"hello"});
	CHECK(e.found == "p");
	CHECK(e.fault == Fault::Mismatch);
}

CASE("literal: end of input") {
	auto r = run(literal("abc"), "ab");
	REQUIRE(!r);
	CHECK(r.error().pos.offset == 2);
	CHECK(r.error().message == "Expected \"abc\" but reached end of input");
	CHECK(r.error().found == "end of input");
	CHECK(r.error().fault == Fault::EndOfInput);
}

CASE("literal: multi-byte target, slow path") {
	string target = "na\xC3\xAFve"; // naïve
	auto r = run(literal(target), target + "!");
	REQUIRE(r);
	CHECK(r.value() == target);
	CHECK(r.next() == Pos{6, 1, 5});
}

CASE("literal: multi-byte mismatch reports the found char whole") {
	auto r = run(literal("a\xC3\xA9"), "a\xE2\x82\xAC");
	REQUIRE(!r);
	CHECK(r.error().pos == Pos{1, 1, 1});
	CHECK(r.error().found == "\xE2\x82\xAC");
}

CASE("literal: newline in target moves the line") {
	auto r = run(literal("a\nb"), "a\nbc");
	REQUIRE(r);
	CHECK(r.next() == Pos{3, 2, 1});
}

CASE("literal: mismatch after a newline in the target") {
	auto r = run(literal("a\nb"), "a\nx");
	REQUIRE(!r);
	CHECK(r.error().pos == Pos{2, 2, 0});
}

CASE("literal: empty target is a construction error") {
	CHECK_THROWS_AS(literal(""), std::runtime_error);
}

CASE("literal: custom name") {
	auto r = run(literal("x", "keyword"), "y");
	CHECK(r.error().matcher_name == "keyword");
}

//---------------------------------------------------------------------------
// char_class
//---------------------------------------------------------------------------
CASE("char_class: range") {
	auto r = run(char_class({{"a", "z"}}), "b");
	REQUIRE(r);
	CHECK(r.value() == "b");
	CHECK(r.next() == Pos{1, 1, 1});
}

CASE("char_class: singles and ranges") {
	auto ident = char_class({{"a", "z"}, "_", {"0", "9"}});
	CHECK(run(ident, "_"));
	CHECK(run(ident, "7"));
	CHECK(!run(ident, "-"));
}

CASE("char_class: the failure lists what would have been fine") {
	auto r = run(char_class({{"a", "z"}, "_"}), "!");
	REQUIRE(!r);
	CHECK(r.error().message == "Unexpected character \"!\", expected one of: a-z, _");
	CHECK(r.error().expected == std::vector<string>{"a-z", "_"});
	CHECK(r.error().found == "!");
}

CASE("char_class: end of input") {
	auto r = run(char_class({"x"}), "");
	REQUIRE(!r);
	CHECK(r.error().fault == Fault::EndOfInput);
	CHECK(r.error().found == "end of input");
}

CASE("char_class: code point ranges cover multi-byte chars") {
	auto greek = char_class({{"\xCE\xB1", "\xCF\x89"}}); // alpha-omega
	auto r = run(greek, "\xCE\xBB"); // lambda
	REQUIRE(r);
	CHECK(r.value() == "\xCE\xBB");
	CHECK(r.next() == Pos{2, 1, 1});
	CHECK(!run(greek, "a"));
}

CASE("char_class: bad items are construction errors") {
	CHECK_THROWS_AS(char_class({}), std::runtime_error);
	CHECK_THROWS_AS(char_class({"ab"}), std::runtime_error);
	CHECK_THROWS_AS(char_class({""}), std::runtime_error);
	CHECK_THROWS_AS(char_class({{"z", "a"}}), std::runtime_error);
}

//---------------------------------------------------------------------------
// eoi
//---------------------------------------------------------------------------
CASE("eoi") {
	CHECK(run(eoi(), ""));
	CHECK(eoi()("ab", Pos{2, 1, 2}));
	auto r = run(eoi(), "x");
	REQUIRE(!r);
	CHECK(r.error().found == "x");
}
