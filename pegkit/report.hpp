#ifndef _PEGKIT_REPORT_HPP_
#define _PEGKIT_REPORT_HPP_

#include "outcome.hpp"

#include <optional>

//---------------------------------------------------------------------------
// Human-readable failure reports. (Read-only: never changes the diagnostic.)
//---------------------------------------------------------------------------
namespace Pegkit {

	struct FormatOptions
	{
		int  context_lines = 2;     // source lines shown around the failing one (0..10; 0: just that one)
		bool show_source   = true;
		bool highlight     = true;  // caret under the failing column
		bool colorize      = false; // ANSI colors
	};

	CONST MAX_CONTEXT_LINES = 10;

	// Like:
	//
	//	Parse error at line 1, column 2:
	//	Context: sequence item 3 of 3
	//	Matcher: literal
	//	Expected: c
	//	Found: d
	//	Error: Unexpected character "d" at offset 2, expected "c"
	//
	//	Source:
	//	1 | abd
	//	      ^
	//
	// The context chain is shown from the outermost frame inwards.
	string format_diagnostic(const Diagnostic& d, string_view input, FormatOptions opt = {});

	// The report of a failed outcome, or nothing for a success
	template <class T>
	std::optional<string> format_outcome(const Outcome<T>& outcome, string_view input, const FormatOptions& opt = {})
	{
		if (outcome) return std::nullopt;
		return format_diagnostic(outcome.error(), input, opt);
	}

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
#include <vector>
#include <algorithm> // clamp, max, min

namespace Pegkit {

namespace {
	struct _Colors
	{
		bool on;
		string wrap(const char* code, const string& text) const {
			return on ? fmt::format("\x1b[{}m{}\x1b[0m", code, text) : text;
		}
		string red(const string& s)   const { return wrap("31", s); }
		string green(const string& s) const { return wrap("32", s); }
		string blue(const string& s)  const { return wrap("34", s); }
		string bold(const string& s)  const { return wrap("1", s); }
	};

	inline std::vector<string_view> _split_lines(string_view input)
	{
		std::vector<string_view> lines;
		size_t start = 0;
		for (;;) {
			auto nl = input.find('\n', start);
			auto line = input.substr(start, nl == string_view::npos ? string_view::npos : nl - start);
			if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
			lines.push_back(line);
			if (nl == string_view::npos) break;
			start = nl + 1;
		}
		return lines;
	}

	// Blanks to put the caret under the `column`-th char of `line` (tabs kept as tabs)
	inline string _caret_padding(string_view line, size_t column)
	{
		string pad;
		size_t i = 0;
		for (size_t col = 0; col < column; ++col) {
			auto c = read_char(line, i);
			if (c.empty()) { pad += string(column - col, ' '); break; }
			pad += c.code == U'\t' ? '\t' : ' ';
			i += c.length();
		}
		return pad;
	}
}

string format_diagnostic(const Diagnostic& d, string_view input, FormatOptions opt)
{
	if (auto clamped = std::clamp(opt.context_lines, 0, MAX_CONTEXT_LINES); clamped != opt.context_lines) {
DBG("format_diagnostic: context_lines adjusted from {} to {} (valid range: 0-{})",
	opt.context_lines, clamped, MAX_CONTEXT_LINES);
		opt.context_lines = clamped;
	}

	_Colors color{opt.colorize};
	std::vector<string> parts;

	parts.push_back(color.bold(color.red(fmt::format("Parse error at line {}, column {}:", d.pos.line, d.pos.column))));

	if (!d.context.empty()) {
		std::vector<string> chain(d.context.rbegin(), d.context.rend());
		parts.push_back(color.blue(fmt::format("Context: {}", fmt::join(chain, " > "))));
	}
	if (d.matcher_name && !d.matcher_name->empty())
		parts.push_back(color.blue(fmt::format("Matcher: {}", *d.matcher_name)));
	if (!d.expected.empty())
		parts.push_back(color.green(fmt::format("Expected: {}", fmt::join(d.expected, ", "))));
	if (d.found && !d.found->empty())
		parts.push_back(color.red(fmt::format("Found: {}", escaped(*d.found))));
	if (!d.message.empty())
		parts.push_back(fmt::format("Error: {}", d.message));

	auto lines = _split_lines(input);
	if (opt.show_source && !input.empty()
	    && d.pos.line >= 1 && d.pos.line <= lines.size())
	{
		auto context = size_t(opt.context_lines);
		auto first = d.pos.line > context ? d.pos.line - context : 1;
		auto last  = std::min(lines.size(), d.pos.line + context);
		auto width = fmt::format("{}", last).size();

		parts.push_back("");
		parts.push_back(color.bold("Source:"));
		for (auto n = first; n <= last; ++n) {
			auto number = fmt::format("{:>{}}", n, width);
			auto line = lines[n - 1];
			bool failing = n == d.pos.line;
			parts.push_back(fmt::format("{} | {}", failing ? color.bold(color.red(number)) : number, line));
			if (failing && opt.highlight)
				parts.push_back(string(width + 3, ' ') + _caret_padding(line, d.pos.column) + color.bold(color.red("^")));
		}
	}

	return fmt::format("{}", fmt::join(parts, "\n"));
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_REPORT_HPP_
