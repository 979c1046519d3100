#ifndef _PEGKIT_LOOKAHEAD_HPP_
#define _PEGKIT_LOOKAHEAD_HPP_

#include "outcome.hpp"

//---------------------------------------------------------------------------
// Predicates: they only ever look, never consume (next == current, always).
//---------------------------------------------------------------------------
namespace Pegkit {

	// &m
	template <class T>
	Matcher<Unit> and_predicate(const Matcher<T>& m)
	{
		return [m](string_view input, const Pos& pos) -> Outcome<Unit>
		{
			auto r = m(input, pos);
			if (!r) return Failure{std::move(r.failure().error).with_context("positive lookahead")};
			return Success<Unit>{Unit{}, pos, pos};
		};
	}

	// !m
	template <class T>
	Matcher<Unit> not_predicate(const Matcher<T>& m)
	{
		return [m](string_view input, const Pos& pos) -> Outcome<Unit>
		{
			auto r = m(input, pos);
			if (!r) return Success<Unit>{Unit{}, pos, pos};

			auto seen = matched_text(r.success(), input);
			auto f = fail("Negative lookahead failed: expected pattern not to match", pos,
			              {"pattern not to match"},
			              seen.empty() ? "matching pattern"s : string(seen),
			              "not_predicate");
			f.error.context.push_back("negative lookahead");
			return f;
		};
	}

} // namespace Pegkit

#endif // _PEGKIT_LOOKAHEAD_HPP_
