#ifndef _PEGKIT_OUTCOME_HPP_
#define _PEGKIT_OUTCOME_HPP_

#include "diagnostic.hpp"

#include <variant>
#include <functional> // function
#include <optional>
#include <utility> // move
#include <atomic>

//---------------------------------------------------------------------------
namespace Pegkit {

	// The (no-)value of predicates and other value-less matches
	using Unit = std::monostate;

	template <class T>
	struct Success
	{
		T   value;
		Pos current; // where the match started
		Pos next;    // where the next match should start
	};

	struct Failure
	{
		Diagnostic error;
	};

	//-------------------------------------------------------------------
	// Either a Success<T>, or a Failure -- check ok() before poking inside!
	// (Asking for the wrong one throws std::bad_variant_access.)
	template <class T>
	class Outcome
	{
		std::variant<Success<T>, Failure> _val;

	public:
		using value_type = T;

		Outcome(Success<T> s) : _val(std::move(s)) {}
		Outcome(Failure f)    : _val(std::move(f)) {}

		bool ok() const { return _val.index() == 0; }
		explicit operator bool() const { return ok(); }

		const Success<T>& success() const { return std::get<Success<T>>(_val); }
		      Success<T>& success()       { return std::get<Success<T>>(_val); }
		const Failure&    failure() const { return std::get<Failure>(_val); }
		      Failure&    failure()       { return std::get<Failure>(_val); }

		const Diagnostic& error() const { return failure().error; }
		const T&          value() const { return success().value; }
		const Pos&        next()  const { return success().next; }

		// Re-type a failure, for passing it up through a matcher of another type
		template <class U>
		Outcome<U> as() const & { return Outcome<U>(failure()); }
		template <class U>
		Outcome<U> as() &&      { return Outcome<U>(std::move(failure())); }
	};

	//-------------------------------------------------------------------
	// THE abstraction: a pure function of (input, position). The input must
	// outlive (and not change during) the call.
	template <class T>
	using Matcher = std::function<Outcome<T>(string_view input, const Pos& pos)>;

	// Value type of a Matcher (or of anything with a matching call signature)
	template <class M>
	using value_of_t = typename std::invoke_result_t<M, string_view, const Pos&>::value_type;

	//-------------------------------------------------------------------
	// Failure factory for the common case
	inline Failure fail(string message, const Pos& pos, std::vector<string> expected = {},
	                    std::optional<string> found = std::nullopt,
	                    std::optional<string> matcher_name = std::nullopt,
	                    Fault fault = Fault::Mismatch)
	{
		Diagnostic d;
		d.message = std::move(message);
		d.pos = pos;
		d.expected = std::move(expected);
		d.found = std::move(found);
		d.matcher_name = std::move(matcher_name);
		d.fault = fault;
		return Failure{std::move(d)};
	}

	//-------------------------------------------------------------------
	// Every top-level run gets a new id for as long as it lasts (memoized
	// results are filed under it). Outside of any run the id is 0.
	class RunScope
	{
		inline static std::atomic<size_t> _last{0};
		inline static thread_local size_t _current = 0;
		size_t _outer;

	public:
		RunScope() : _outer(_current) { _current = ++_last; }
		~RunScope() { _current = _outer; }
		RunScope(const RunScope&) = delete;
		RunScope& operator=(const RunScope&) = delete;

		static size_t current() { return _current; }
	};

	// Top-level entry: run `m` from the start of `input`
	template <class T>
	Outcome<T> run(const Matcher<T>& m, string_view input)
	{
		RunScope scope;
		return m(input, START);
	}

	// The value of a successful outcome; throws (via ERROR()) on a failure
	template <class T>
	const T& value_of(const Outcome<T>& outcome)
	{
		if (!outcome) ERROR("Parse failed: {} (at {})",
			outcome.error().message, describe(outcome.error()));
		return outcome.value();
	}

	// The value, or nothing
	template <class T>
	std::optional<T> try_value(const Outcome<T>& outcome)
	{
		if (!outcome) return std::nullopt;
		return outcome.value();
	}

	// The slice of the input a success consumed
	template <class T>
	string_view matched_text(const Success<T>& s, string_view input)
	{
		return input.substr(s.current.offset, s.next.offset - s.current.offset);
	}

} // namespace Pegkit

#endif // _PEGKIT_OUTCOME_HPP_
