#ifndef _PEGKIT_POSITION_HPP_
#define _PEGKIT_POSITION_HPP_

#include "base.hpp"

#include <cstddef> // size_t
#include <cstdint>

//---------------------------------------------------------------------------
namespace Pegkit {

	// Cursor into the input.
	// - offset: bytes (UTF-8 code units) from the start of the input
	// - line:   1-based, newlines seen + 1
	// - column: characters (not bytes!) since the last newline, 0-based
	struct Pos
	{
		size_t offset = 0;
		size_t line   = 1;
		size_t column = 0;

		bool operator==(const Pos&) const = default;
	};

	CONST START = Pos{0, 1, 0};

	CONST REPLACEMENT_CHAR = U'\U0000FFFD'; // what a broken UTF-8 sequence decodes to

	// One decoded character, still pointing into the input
	struct Char
	{
		string_view text; // the raw bytes; empty at end of input
		char32_t    code = 0;

		size_t length() const { return text.size(); }
		bool   empty()  const { return text.empty(); }
	};

	//-------------------------------------------------------------------
	// The only place that reads the input... Everything else goes through this.
	//
	// Returns the character at `offset` (with its byte length), or an empty
	// Char at (or past) the end of input. An invalid or truncated UTF-8
	// sequence is consumed as a single byte, decoded as REPLACEMENT_CHAR.
	Char read_char(string_view input, size_t offset);

	// Next position after consuming `c` at `pos`
	Pos advance(const Char& c, const Pos& pos);

	// Next position after consuming all of `text` at `pos`
	Pos advance_over(string_view text, const Pos& pos);

	// Number of characters (not bytes) in `text`
	size_t char_count(string_view text);

	// Printable form of some (short) text for messages: escapes quotes,
	// backslashes and the usual control chars
	string escaped(string_view text);

	string to_string(const Pos& pos);

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
namespace Pegkit {

namespace {
	// Byte length announced by a UTF-8 lead byte; 0 if it can't start a sequence
	inline size_t _utf8_seq_length(unsigned char lead)
	{
		if (lead < 0x80) return 1;
		if (lead < 0xC2) return 0; // continuation byte, or overlong 2-byte lead
		if (lead < 0xE0) return 2;
		if (lead < 0xF0) return 3;
		if (lead < 0xF5) return 4;
		return 0;
	}
}

Char read_char(string_view input, size_t offset)
{
	if (offset >= input.size()) return {};

	auto lead = static_cast<unsigned char>(input[offset]);
	auto len = _utf8_seq_length(lead);

	auto broken = [&]() { return Char{input.substr(offset, 1), REPLACEMENT_CHAR}; };

	if (len == 1) return Char{input.substr(offset, 1), char32_t(lead)};
	if (len == 0 || offset + len > input.size()) return broken();

	char32_t code = lead & (0xFFu >> (len + 1));
	for (size_t i = 1; i < len; ++i) {
		auto c = static_cast<unsigned char>(input[offset + i]);
		if ((c & 0xC0) != 0x80) return broken();
		code = (code << 6) | (c & 0x3Fu);
	}

	// Overlongs, surrogates and out-of-range code points are all invalid
	if ((len == 3 && code < 0x800) || (len == 4 && code < 0x10000)
	    || (code >= 0xD800 && code <= 0xDFFF) || code > 0x10FFFF)
		return broken();

	return Char{input.substr(offset, len), code};
}

Pos advance(const Char& c, const Pos& pos)
{
	if (c.empty()) return pos;
	if (c.code == U'\n') return Pos{pos.offset + c.length(), pos.line + 1, 0};
	return Pos{pos.offset + c.length(), pos.line, pos.column + 1};
}

Pos advance_over(string_view text, const Pos& pos)
{
	Pos p = pos;
	for (size_t i = 0; i < text.size();) {
		auto c = read_char(text, i);
		p = advance(c, p);
		i += c.length();
	}
	return p;
}

size_t char_count(string_view text)
{
	size_t n = 0;
	for (size_t i = 0; i < text.size(); ++n)
		i += read_char(text, i).length();
	return n;
}

string escaped(string_view text)
{
	string out;
	out.reserve(text.size());
	for (char c : text) {
		switch (c) {
		case '\n': out += "\\n"; break;
		case '\r': out += "\\r"; break;
		case '\t': out += "\\t"; break;
		case '"':  out += "\\\""; break;
		case '\\': out += "\\\\"; break;
		default:   out += c;
		}
	}
	return out;
}

string to_string(const Pos& pos)
{
	return fmt::format("{{offset: {}, line: {}, column: {}}}", pos.offset, pos.line, pos.column);
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_POSITION_HPP_
