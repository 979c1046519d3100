#ifndef _PEGKIT_REPETITION_HPP_
#define _PEGKIT_REPETITION_HPP_

#include "combinators.hpp"

#include <optional>
#include <vector>
#include <utility> // move

//---------------------------------------------------------------------------
// Repetition: driving an inner matcher over and over. All of these fail
// loudly (Fault::InfiniteLoop) if the inner matcher succeeds without
// consuming anything, instead of spinning forever.
//---------------------------------------------------------------------------
namespace Pegkit {

	// The infinite loop diagnostic of `name`, for the `iteration`-th (1-based) attempt at `pos`
	Failure infinite_loop(const string& name, const Pos& pos, size_t iteration);

	// The config. error diagnostic for bad repeat() bounds (or nullopt if they're fine)
	std::optional<Failure> check_bounds(int min, std::optional<int> max, const Pos& pos);

	string bounds_label(int min, std::optional<int> max); // "{2,5}", "{2,}"

namespace detail {

	// Keeps matching from `at` (moving it along), appending to `out`, until
	// `m` fails or `out` reaches `max` items. Only a zero-width match is an
	// error here; a plain failure just ends the loop.
	template <class T>
	std::optional<Failure> collect(const Matcher<T>& m, string_view input, Pos& at,
		std::vector<T>& out, std::optional<size_t> max, const string& name)
	{
		while (!max || out.size() < *max) {
			auto r = m(input, at);
			if (!r) break;
			if (r.next().offset == at.offset)
				return infinite_loop(name, at, out.size() + 1);
			at = r.success().next;
			out.push_back(std::move(r.success().value));
		}
		return std::nullopt;
	}

} // namespace detail

	//-------------------------------------------------------------------
	template <class T>
	Matcher<std::vector<T>> zero_or_more(const Matcher<T>& m, const string& name = "zero_or_more")
	{
		return [m, name](string_view input, const Pos& pos) -> Outcome<std::vector<T>>
		{
			std::vector<T> values;
			Pos at = pos;
			if (auto stuck = detail::collect(m, input, at, values, std::nullopt, name); stuck)
				return *stuck;
			return Success<std::vector<T>>{std::move(values), pos, at};
		};
	}

	//-------------------------------------------------------------------
	template <class T>
	Matcher<std::vector<T>> one_or_more(const Matcher<T>& m, const string& name = "one_or_more")
	{
		return [m, name](string_view input, const Pos& pos) -> Outcome<std::vector<T>>
		{
			auto first = m(input, pos);
			if (!first) return Failure{std::move(first.failure().error)
				.with_context(name + ": at least one occurrence required")};
			if (first.next().offset == pos.offset)
				return infinite_loop(name, pos, 1);

			std::vector<T> values;
			values.push_back(std::move(first.success().value));
			Pos at = first.success().next;
			if (auto stuck = detail::collect(m, input, at, values, std::nullopt, name); stuck)
				return *stuck;
			return Success<std::vector<T>>{std::move(values), pos, at};
		};
	}

	//-------------------------------------------------------------------
	// {min, max}: exactly `min` required matches, then up to `max` in total
	// (no limit if `max` is not given). Bad bounds (min < 0, max < min)
	// make every call fail with Fault::Configuration.
	template <class T>
	Matcher<std::vector<T>> repeat(const Matcher<T>& m, int min, std::optional<int> max = std::nullopt,
	                               const string& name = "repeat")
	{
		if (auto bad = check_bounds(min, max, START); bad) {
DBG("repeat: {}", bad->error.message);
			return [bad = std::move(*bad), name](string_view, const Pos& pos) -> Outcome<std::vector<T>>
			{
				auto f = bad;
				f.error.pos = pos;
				f.error.matcher_name = name;
				return f;
			};
		}

		auto required = size_t(min);
		auto limit = max ? std::optional<size_t>(size_t(*max)) : std::nullopt;
		auto label = bounds_label(min, max);

		return [m, required, limit, label, name](string_view input, const Pos& pos) -> Outcome<std::vector<T>>
		{
			std::vector<T> values;
			Pos at = pos;
			for (size_t i = 1; i <= required; ++i) {
				auto r = m(input, at);
				if (!r) return Failure{std::move(r.failure().error)
					.with_context(fmt::format("{} {}: required repetition {} of {}", name, label, i, required))};
				if (r.next().offset == at.offset)
					return infinite_loop(name, at, i);
				at = r.success().next;
				values.push_back(std::move(r.success().value));
			}
			if (auto stuck = detail::collect(m, input, at, values, limit, name); stuck)
				return *stuck;
			return Success<std::vector<T>>{std::move(values), pos, at};
		};
	}

	//-------------------------------------------------------------------
	// item (sep item)* -- possibly none at all. A trailing separator is
	// not consumed.
	template <class T, class S>
	Matcher<std::vector<T>> sep_by1(const Matcher<T>& item, const Matcher<S>& sep, const string& name = "sep_by1")
	{
		return [item, sep, name](string_view input, const Pos& pos) -> Outcome<std::vector<T>>
		{
			auto first = item(input, pos);
			if (!first) return Failure{std::move(first.failure().error)
				.with_context(name + ": at least one item required")};

			std::vector<T> values;
			values.push_back(std::move(first.success().value));
			Pos at = first.success().next;
			for (;;) {
				auto s = sep(input, at);
				if (!s) break;
				auto r = item(input, s.success().next);
				if (!r) break; // leave the separator alone
				if (r.next().offset == at.offset)
					return infinite_loop(name, at, values.size() + 1);
				at = r.success().next;
				values.push_back(std::move(r.success().value));
			}
			return Success<std::vector<T>>{std::move(values), pos, at};
		};
	}

	template <class T, class S>
	Matcher<std::vector<T>> sep_by(const Matcher<T>& item, const Matcher<S>& sep, const string& name = "sep_by")
	{
		auto some = sep_by1(item, sep, name);
		return [some](string_view input, const Pos& pos) -> Outcome<std::vector<T>>
		{
			auto r = some(input, pos);
			if (!r && r.error().fault != Fault::InfiniteLoop)
				return Success<std::vector<T>>{{}, pos, pos};
			return r;
		};
	}

	//-------------------------------------------------------------------
	// Everything up to (but not including) a match of `terminator`, or to
	// the end of the input. Never fails.
	template <class U>
	Matcher<string> take_until(const Matcher<U>& terminator)
	{
		return [terminator](string_view input, const Pos& pos) -> Outcome<string>
		{
			Pos at = pos;
			for (;;) {
				if (terminator(input, at)) break;
				auto c = read_char(input, at.offset);
				if (c.empty()) break;
				at = advance(c, at);
			}
			return Success<string>{string(input.substr(pos.offset, at.offset - pos.offset)), pos, at};
		};
	}

	// open, then the text up to close, then close; the value is the text between
	template <class O, class C>
	Matcher<string> between(const Matcher<O>& open, const Matcher<C>& close)
	{
		auto whole = sequence(open, take_until(close), close);
		return [whole](string_view input, const Pos& pos) -> Outcome<string>
		{
			auto r = whole(input, pos);
			if (!r) return std::move(r).template as<string>();
			return Success<string>{std::move(std::get<1>(r.success().value)), pos, r.success().next};
		};
	}

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
namespace Pegkit {

Failure infinite_loop(const string& name, const Pos& pos, size_t iteration)
{
DBG("{}: zero-width match at offset {}, bailing out", name, pos.offset);
	auto f = fail(fmt::format("Infinite loop detected in {}: matcher succeeded without consuming input at offset {}",
	                          name, pos.offset),
	              pos, {}, std::nullopt, name, Fault::InfiniteLoop);
	f.error.context.push_back(fmt::format("{} iteration {}", name, iteration));
	return f;
}

string bounds_label(int min, std::optional<int> max)
{
	return max ? fmt::format("{{{},{}}}", min, *max) : fmt::format("{{{},}}", min);
}

std::optional<Failure> check_bounds(int min, std::optional<int> max, const Pos& pos)
{
	string problem;
	if (min < 0)
		problem = fmt::format("min must not be negative (got {})", min);
	else if (max && *max < min)
		problem = fmt::format("max ({}) must not be less than min ({})", *max, min);
	else
		return std::nullopt;

	return fail(fmt::format("Invalid quantifier {}: {}", bounds_label(min, max), problem),
	            pos, {}, std::nullopt, "repeat", Fault::Configuration);
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_REPETITION_HPP_
