#ifndef _PEGKIT_PRIMITIVES_HPP_
#define _PEGKIT_PRIMITIVES_HPP_

#include "outcome.hpp"

#include <vector>
#include <algorithm> // min

//---------------------------------------------------------------------------
// The only matchers that actually look at the input (via read_char())
//---------------------------------------------------------------------------
namespace Pegkit {

	// Exactly one character, whatever it is
	Matcher<string> any_char(const string& name = "any_char");

	// Exactly `target`, compared byte for byte (but reported per character).
	// `target` must not be empty.
	Matcher<string> literal(const string& target, const string& name = "literal");

	//-------------------------------------------------------------------
	// One entry of a char_class(): a single character, or an inclusive
	// code point range. Each endpoint must be exactly one (UTF-8) character.
	struct ClassItem
	{
		char32_t first;
		char32_t last;
		string   label; // "x", or "a-z"

		ClassItem(string_view ch);
		ClassItem(string_view from, string_view to);
		ClassItem(const char* ch) : ClassItem(string_view(ch)) {}

		bool contains(char32_t c) const { return first <= c && c <= last; }
	};

	// One character matching any of the items. `items` must not be empty.
	Matcher<string> char_class(std::vector<ClassItem> items, const string& name = "char_class");

	// Succeeds (consuming nothing) only at the end of the input
	Matcher<Unit> eoi(const string& name = "eoi");

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
namespace Pegkit {

namespace {
	inline string _char_or_eoi(const Char& c)
	{
		return c.empty() ? string(END_OF_INPUT) : string(c.text);
	}

	// Plain ASCII, nothing that would move the line counter
	inline bool _is_flat_ascii(string_view s)
	{
		for (unsigned char c : s) if (c >= 0x80 || c == '\n') return false;
		return true;
	}
}

//---------------------------------------------------------------------------
Matcher<string> any_char(const string& name)
{
	return [name](string_view input, const Pos& pos) -> Outcome<string>
	{
		auto c = read_char(input, pos.offset);
		if (c.empty()) {
			return fail("Unexpected end of input", pos, {"any character"},
			            string(END_OF_INPUT), name, Fault::EndOfInput);
		}
		return Success<string>{string(c.text), pos, advance(c, pos)};
	};
}

//---------------------------------------------------------------------------
Matcher<string> literal(const string& target, const string& name)
{
	if (target.empty()) ERROR("literal: empty target string");

	auto mismatch = [name, target](string_view input, const Pos& at) -> Failure
	{
		auto c = read_char(input, at.offset);
		if (c.empty()) {
			return fail(fmt::format("Expected \"{}\" but reached end of input", escaped(target)),
			            at, {target}, string(END_OF_INPUT), name, Fault::EndOfInput);
		}
		return fail(fmt::format("Unexpected character \"{}\" at offset {}, expected \"{}\"",
		                        escaped(c.text), at.offset, escaped(target)),
		            at, {target}, string(c.text), name);
	};

	if (_is_flat_ascii(target))
	{
		// Fast path: no decoding, columns are just byte counts
		return [target, mismatch](string_view input, const Pos& pos) -> Outcome<string>
		{
			auto rest = input.substr(std::min(pos.offset, input.size()));
			size_t i = 0;
			while (i < target.size() && i < rest.size() && rest[i] == target[i]) ++i;
			if (i == target.size())
				return Success<string>{target, pos, Pos{pos.offset + i, pos.line, pos.column + i}};
			return mismatch(input, Pos{pos.offset + i, pos.line, pos.column + i});
		};
	}

	return [target, mismatch](string_view input, const Pos& pos) -> Outcome<string>
	{
		Pos at = pos;
		for (size_t i = 0; i < target.size();) {
			auto want = read_char(target, i);
			auto got  = read_char(input, at.offset);
			if (got.text != want.text)
				return mismatch(input, at);
			at = advance(got, at);
			i += want.length();
		}
		return Success<string>{target, pos, at};
	};
}

//---------------------------------------------------------------------------
namespace {
	inline char32_t _single_char(string_view ch)
	{
		auto c = read_char(ch, 0);
		if (c.empty() || c.length() != ch.size())
			ERROR("char_class: \"{}\" is not a single character", escaped(ch));
		return c.code;
	}
}

ClassItem::ClassItem(string_view ch)
	: first(_single_char(ch)), last(first), label(ch)
{
}

ClassItem::ClassItem(string_view from, string_view to)
	: first(_single_char(from)), last(_single_char(to)), label(fmt::format("{}-{}", from, to))
{
	if (last < first) ERROR("char_class: reversed range \"{}\"", escaped(label));
}

Matcher<string> char_class(std::vector<ClassItem> items, const string& name)
{
	if (items.empty()) ERROR("char_class: no characters or ranges given");

	std::vector<string> labels;
	for (auto& item : items) labels.push_back(item.label);
	auto accepted = fmt::format("{}", fmt::join(labels, ", "));

	return [items = std::move(items), labels, accepted, name](string_view input, const Pos& pos) -> Outcome<string>
	{
		auto c = read_char(input, pos.offset);
		if (c.empty()) {
			return fail(fmt::format("Unexpected end of input, expected one of: {}", accepted),
			            pos, labels, string(END_OF_INPUT), name, Fault::EndOfInput);
		}
		for (auto& item : items) {
			if (item.contains(c.code))
				return Success<string>{string(c.text), pos, advance(c, pos)};
		}
		return fail(fmt::format("Unexpected character \"{}\", expected one of: {}", escaped(c.text), accepted),
		            pos, labels, _char_or_eoi(c), name);
	};
}

//---------------------------------------------------------------------------
Matcher<Unit> eoi(const string& name)
{
	return [name](string_view input, const Pos& pos) -> Outcome<Unit>
	{
		auto c = read_char(input, pos.offset);
		if (!c.empty()) {
			return fail(fmt::format("Expected end of input, found \"{}\"", escaped(c.text)),
			            pos, {string(END_OF_INPUT)}, string(c.text), name);
		}
		return Success<Unit>{Unit{}, pos, pos};
	};
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_PRIMITIVES_HPP_
