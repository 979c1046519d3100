#ifndef _PEGKIT_DIAGNOSTIC_HPP_
#define _PEGKIT_DIAGNOSTIC_HPP_

#include "position.hpp"

#include <optional>
#include <vector>
#include <utility> // move

//---------------------------------------------------------------------------
namespace Pegkit {

	// What kind of trouble a failure is. Closed set: switch on it, no default!
	enum class Fault
	{
		Mismatch,      // the input is not what the grammar wants
		EndOfInput,    // ran out of input while something was still required
		InfiniteLoop,  // repetition over a matcher that consumed nothing
		Configuration, // bad quantifier bounds, rule used before defined etc.
	};

	const char* to_cstr(Fault f);

	//-------------------------------------------------------------------
	struct Diagnostic
	{
		string                 message;
		Pos                    pos;
		std::vector<string>    expected;     // empty: unknown
		std::optional<string>  found;
		std::optional<string>  matcher_name;
		std::vector<string>    context;      //! Innermost first; only ever appended to!
		Fault                  fault = Fault::Mismatch;

		// The failures of each alternative of a failed choice (in order),
		// kept for programmatic recovery; see deepest()
		std::vector<Diagnostic> causes;

		// Copy with one more context entry (the outer frame's)
		Diagnostic with_context(string entry) const &;
		Diagnostic with_context(string entry) &&;
	};

	// Follows `causes` down to the diagnostic with the furthest position
	// (the first one wins on a tie). Returns `d` itself if it has no causes.
	const Diagnostic& deepest(const Diagnostic& d);

	// One-line summary, like: line 1, column 2: Unexpected character "d" ...
	string describe(const Diagnostic& d);

	CONST END_OF_INPUT = "end of input";

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
namespace Pegkit {

const char* to_cstr(Fault f)
{
	switch (f) {
	case Fault::Mismatch:      return "mismatch";
	case Fault::EndOfInput:    return "end of input";
	case Fault::InfiniteLoop:  return "infinite loop";
	case Fault::Configuration: return "configuration error";
	}
	return "?"; // unreachable, but GCC wants it
}

Diagnostic Diagnostic::with_context(string entry) const &
{
	Diagnostic d = *this;
	d.context.push_back(std::move(entry));
	return d;
}

Diagnostic Diagnostic::with_context(string entry) &&
{
	context.push_back(std::move(entry));
	return std::move(*this);
}

const Diagnostic& deepest(const Diagnostic& d)
{
	const Diagnostic* best = &d;
	for (auto& cause : d.causes) {
		auto& candidate = deepest(cause);
		if (candidate.pos.offset > best->pos.offset)
			best = &candidate;
	}
	return *best;
}

string describe(const Diagnostic& d)
{
	return fmt::format("line {}, column {}: {}", d.pos.line, d.pos.column, d.message);
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_DIAGNOSTIC_HPP_
