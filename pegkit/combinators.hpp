#ifndef _PEGKIT_COMBINATORS_HPP_
#define _PEGKIT_COMBINATORS_HPP_

#include "outcome.hpp"

#include <tuple>
#include <optional>
#include <vector>
#include <type_traits>
#include <algorithm> // find
#include <utility> // move, index_sequence

//---------------------------------------------------------------------------
// Composition: these never look at the input themselves
//---------------------------------------------------------------------------
namespace Pegkit {

	// Combined failure of a choice (all alternatives failed at `pos`)
	Failure choice_failure(std::vector<Diagnostic> causes, const Pos& pos, const string& name);

namespace detail {

	template <class... Ts, size_t... I>
	Outcome<std::tuple<Ts...>> run_sequence(const std::tuple<Matcher<Ts>...>& parts,
		string_view input, const Pos& pos, std::index_sequence<I...>)
	{
		std::tuple<std::optional<Ts>...> values;
		Pos at = pos;
		std::optional<Diagnostic> failed;

		auto step = [&](const auto& m, auto& slot, size_t index) -> bool {
			auto r = m(input, at);
			if (!r) {
				failed = std::move(r.failure().error)
					.with_context(fmt::format("sequence item {} of {}", index, sizeof...(Ts)));
				return false;
			}
			at = r.success().next;
			slot = std::move(r.success().value);
			return true;
		};

		//! Short-circuits: nothing after the first failing item gets called.
		if (!(step(std::get<I>(parts), std::get<I>(values), I + 1) && ...))
			return Failure{std::move(*failed)};

		return Success<std::tuple<Ts...>>{std::tuple<Ts...>(std::move(*std::get<I>(values))...), pos, at};
	}

} // namespace detail

	//-------------------------------------------------------------------
	// All of them, one after the other; the value is the tuple of theirs.
	template <class... Ts>
	Matcher<std::tuple<Ts...>> sequence(const Matcher<Ts>&... items)
	{
		return [parts = std::make_tuple(items...)](string_view input, const Pos& pos)
			-> Outcome<std::tuple<Ts...>>
		{
			return detail::run_sequence(parts, input, pos, std::index_sequence_for<Ts...>{});
		};
	}

	// Same, for a homogeneous list built at run time
	template <class T>
	Matcher<std::vector<T>> sequence(std::vector<Matcher<T>> items)
	{
		return [items = std::move(items)](string_view input, const Pos& pos) -> Outcome<std::vector<T>>
		{
			std::vector<T> values;
			values.reserve(items.size());
			Pos at = pos;
			for (size_t i = 0; i < items.size(); ++i) {
				auto r = items[i](input, at);
				if (!r) return Failure{std::move(r.failure().error)
					.with_context(fmt::format("sequence item {} of {}", i + 1, items.size()))};
				at = r.success().next;
				values.push_back(std::move(r.success().value));
			}
			return Success<std::vector<T>>{std::move(values), pos, at};
		};
	}

	//-------------------------------------------------------------------
	// Ordered choice: the first alternative that matches (at the original
	// position, always) wins.
	template <class T>
	Matcher<T> choice(std::vector<Matcher<T>> alternatives, const string& name = "choice")
	{
		if (alternatives.empty()) ERROR("choice: no alternatives given");

		return [alternatives = std::move(alternatives), name](string_view input, const Pos& pos) -> Outcome<T>
		{
			std::vector<Diagnostic> causes;
			for (auto& alt : alternatives) {
				auto r = alt(input, pos);
				if (r) return r;
				causes.push_back(std::move(r.failure().error));
			}
			return choice_failure(std::move(causes), pos, name);
		};
	}

	template <class T, class... More>
	Matcher<T> choice(const Matcher<T>& first, const More&... more)
	{
		static_assert((std::is_convertible_v<More, Matcher<T>> && ...),
			"choice: all alternatives must produce the same value type");
		return choice(std::vector<Matcher<T>>{first, Matcher<T>(more)...});
	}

	//-------------------------------------------------------------------
	// Never fails: a miss is just an absent value (and consumes nothing).
	template <class T>
	Matcher<std::optional<T>> optional(const Matcher<T>& m)
	{
		return [m](string_view input, const Pos& pos) -> Outcome<std::optional<T>>
		{
			auto r = m(input, pos);
			if (!r) return Success<std::optional<T>>{std::nullopt, pos, pos};
			return Success<std::optional<T>>{std::move(r.success().value), pos, r.success().next};
		};
	}

	// Like optional(), but with a fallback value instead of an empty one
	template <class T>
	Matcher<T> with_default(const Matcher<T>& m, T fallback)
	{
		return [m, fallback = std::move(fallback)](string_view input, const Pos& pos) -> Outcome<T>
		{
			auto r = m(input, pos);
			if (!r) return Success<T>{fallback, pos, pos};
			return r;
		};
	}

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
namespace Pegkit {

Failure choice_failure(std::vector<Diagnostic> causes, const Pos& pos, const string& name)
{
	std::vector<string> expected;
	for (auto& cause : causes)
		for (auto& e : cause.expected)
			if (std::find(expected.begin(), expected.end(), e) == expected.end())
				expected.push_back(e);

	// A broken grammar should not hide behind "nothing matched"
	auto fault = Fault::EndOfInput;
	for (auto& cause : causes) {
		if (cause.fault == Fault::Configuration || cause.fault == Fault::InfiniteLoop) {
			fault = cause.fault;
			break;
		}
		if (cause.fault != Fault::EndOfInput) fault = Fault::Mismatch;
	}

	auto message = expected.empty()
		? fmt::format("None of the {} alternatives matched", causes.size())
		: fmt::format("None of the {} alternatives matched, expected one of: {}",
		              causes.size(), fmt::join(expected, ", "));

	auto f = fail(std::move(message), pos, std::move(expected),
	              causes.front().found, name, fault);
	f.error.context.push_back(fmt::format("choice of {} alternatives", causes.size()));
	f.error.causes = std::move(causes);
	return f;
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_COMBINATORS_HPP_
