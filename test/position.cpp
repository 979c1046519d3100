#define PEGKIT_DEDUP
#include "../pegkit.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Pegkit;

CASE("read_char: ASCII") {
	auto c = read_char("abc", 1);
	CHECK(c.text == "b");
	CHECK(c.code == U'b');
	CHECK(c.length() == 1);
}

CASE("read_char: end of input") {
	CHECK(read_char("abc", 3).empty());
	CHECK(read_char("abc", 3).length() == 0);
	CHECK(read_char("abc", 99).empty());
	CHECK(read_char("", 0).empty());
}

CASE("read_char: multi-byte") {
	string s = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"; // a, é, €, 😀
	CHECK(read_char(s, 1).code == U'\u00E9');
	CHECK(read_char(s, 1).length() == 2);
	CHECK(read_char(s, 3).code == U'\u20AC');
	CHECK(read_char(s, 3).length() == 3);
	CHECK(read_char(s, 6).code == U'\U0001F600');
	CHECK(read_char(s, 6).length() == 4);
}

CASE("read_char: broken UTF-8 goes byte by byte") {
	CHECK(read_char("\x80x", 0).code == REPLACEMENT_CHAR);   // stray continuation
	CHECK(read_char("\x80x", 0).length() == 1);
	CHECK(read_char("\xC3", 0).length() == 1);               // truncated
	CHECK(read_char("\xC3(", 0).code == REPLACEMENT_CHAR);   // bad continuation
	CHECK(read_char("\xC0\x80", 0).length() == 1);           // overlong
	CHECK(read_char("\xED\xA0\x80", 0).length() == 1);       // surrogate
	CHECK(read_char("\xF4\x90\x80\x80", 0).length() == 1);   // > U+10FFFF
}

CASE("advance: column, line") {
	Pos p = START;
	p = advance(read_char("a", 0), p);
	CHECK(p == Pos{1, 1, 1});
	p = advance(read_char("\n", 0), p);
	CHECK(p == Pos{2, 2, 0});
}

CASE("advance: a multi-byte char is one column") {
	string emoji = "\xF0\x9F\x98\x80";
	auto p = advance(read_char(emoji, 0), START);
	CHECK(p.offset == 4);
	CHECK(p.column == 1);
	CHECK(p.line == 1);
}

CASE("advance: end of input doesn't move") {
	CHECK(advance(read_char("", 0), START) == START);
}

CASE("advance_over") {
	CHECK(advance_over("ab\ncd\xC3\xA9", START) == Pos{7, 2, 3});
	CHECK(advance_over("", Pos{5, 2, 3}) == Pos{5, 2, 3});
}

CASE("char_count") {
	CHECK(char_count("") == 0);
	CHECK(char_count("abc") == 3);
	CHECK(char_count("\xC3\xA9\xE2\x82\xAC") == 2);
}

CASE("escaped") {
	CHECK(escaped("a\"b\\c\n\t") == "a\\\"b\\\\c\\n\\t");
}

CASE("to_string(Pos)") {
	CHECK(to_string(Pos{3, 2, 1}) == "{offset: 3, line: 2, column: 1}");
}
