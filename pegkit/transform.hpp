#ifndef _PEGKIT_TRANSFORM_HPP_
#define _PEGKIT_TRANSFORM_HPP_

#include "outcome.hpp"

#include <type_traits>
#include <utility> // move

//---------------------------------------------------------------------------
// Shaping values (and errors) without touching what gets consumed
//---------------------------------------------------------------------------
namespace Pegkit {

	// f(value) on success; failures pass through untouched (and f is not called)
	template <class T, class F>
	auto map(const Matcher<T>& m, F f) -> Matcher<std::invoke_result_t<F, T&&>>
	{
		using U = std::invoke_result_t<F, T&&>;
		return [m, f](string_view input, const Pos& pos) -> Outcome<U>
		{
			auto r = m(input, pos);
			if (!r) return std::move(r).template as<U>();
			auto& s = r.success();
			return Success<U>{f(std::move(s.value)), s.current, s.next};
		};
	}

	// Like map(), but f gets the whole Success (value + positions)
	template <class T, class F>
	auto map_result(const Matcher<T>& m, F f) -> Matcher<std::invoke_result_t<F, const Success<T>&>>
	{
		using U = std::invoke_result_t<F, const Success<T>&>;
		return [m, f](string_view input, const Pos& pos) -> Outcome<U>
		{
			auto r = m(input, pos);
			if (!r) return std::move(r).template as<U>();
			auto& s = r.success();
			return Success<U>{f(s), s.current, s.next};
		};
	}

	// f(diagnostic) -> diagnostic, on failure only
	template <class T, class F>
	Matcher<T> map_error(const Matcher<T>& m, F f)
	{
		return [m, f](string_view input, const Pos& pos) -> Outcome<T>
		{
			auto r = m(input, pos);
			if (r) return r;
			return Failure{f(std::move(r.failure().error))};
		};
	}

	// Turns a success into a failure (at the start of the match) unless pred(value)
	template <class T, class P>
	Matcher<T> filter(const Matcher<T>& m, P pred, const string& message = "Filter predicate failed")
	{
		return [m, pred, message](string_view input, const Pos& pos) -> Outcome<T>
		{
			auto r = m(input, pos);
			if (!r || pred(r.value())) return r;
			return fail(message, r.success().current, {}, string(matched_text(r.success(), input)), "filter");
		};
	}

	// Runs effect(value) on success, for debugging, counting etc.; the result is unchanged
	template <class T, class F>
	Matcher<T> tap(const Matcher<T>& m, F effect)
	{
		return [m, effect](string_view input, const Pos& pos) -> Outcome<T>
		{
			auto r = m(input, pos);
			if (r) effect(r.success());
			return r;
		};
	}

	// Replaces the failure message with a friendlier one; the position stays
	template <class T>
	Matcher<T> labeled(const Matcher<T>& m, const string& message)
	{
		return map_error(m, [message](Diagnostic d) {
			d.message = message;
			return d;
		});
	}

	//-------------------------------------------------------------------
	template <class T>
	struct Spanned
	{
		T   value;
		Pos begin;
		Pos end;
	};

	// The value, together with where it came from
	template <class T>
	Matcher<Spanned<T>> with_span(const Matcher<T>& m)
	{
		return map_result(m, [](const Success<T>& s) {
			return Spanned<T>{s.value, s.current, s.next};
		});
	}

} // namespace Pegkit

#endif // _PEGKIT_TRANSFORM_HPP_
