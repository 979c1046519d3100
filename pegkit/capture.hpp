#ifndef _PEGKIT_CAPTURE_HPP_
#define _PEGKIT_CAPTURE_HPP_

#include "combinators.hpp"
#include "transform.hpp"

#include <any>
#include <map>
#include <tuple>
#include <vector>
#include <type_traits>
#include <utility> // move

//---------------------------------------------------------------------------
// Named captures
//---------------------------------------------------------------------------
namespace Pegkit {

	// Labeled values, of any type. Merging: the later (rightmost) one wins.
	struct Captures
	{
		std::map<string, std::any> fields;

		bool   has(const string& label) const { return fields.find(label) != fields.end(); }
		size_t size() const { return fields.size(); }
		bool   empty() const { return fields.empty(); }

		std::vector<string> labels() const;

		// nullptr if missing, or not a T
		template <class T>
		const T* get(const string& label) const
		{
			auto it = fields.find(label);
			return it == fields.end() ? nullptr : std::any_cast<T>(&it->second);
		}

		// Throws (via ERROR()) if missing, or not a T
		template <class T>
		const T& at(const string& label) const
		{
			if (!has(label)) ERROR("Captures: no \"{}\"", label);
			if (auto p = get<T>(label); p) return *p;
			ERROR("Captures: \"{}\" holds some other type", label);
		}

		Captures& merge(const Captures& other);
	};

	// Merges all the Captures among `values` (in order). If there's none,
	// it returns nothing, so the caller can fall back to the plain values.
	std::optional<Captures> merge_captures(const std::vector<std::any>& values);

	//-------------------------------------------------------------------
	// The value of `m`, under `label`
	template <class T>
	Matcher<Captures> capture(const string& label, const Matcher<T>& m)
	{
		return [label, m](string_view input, const Pos& pos) -> Outcome<Captures>
		{
			auto r = m(input, pos);
			if (!r) return std::move(r).template as<Captures>();
			Captures c;
			c.fields.emplace(label, std::any(std::move(r.success().value)));
			return Success<Captures>{std::move(c), r.success().current, r.success().next};
		};
	}

	//-------------------------------------------------------------------
	// A sequence where captures are "infectious": if any item is a capture,
	// the value is all the captures merged (everything else is dropped);
	// otherwise it's just the usual tuple.
	template <class... Ts>
	using capture_seq_t = std::conditional_t<(std::is_same_v<Ts, Captures> || ...),
		Captures, std::tuple<Ts...>>;

	template <class... Ts>
	Matcher<capture_seq_t<Ts...>> capture_seq(const Matcher<Ts>&... items)
	{
		auto all = sequence(items...);
		if constexpr (std::is_same_v<capture_seq_t<Ts...>, Captures>) {
			return map(all, [](std::tuple<Ts...>&& values) {
				Captures merged;
				std::apply([&](auto&... v) {
					auto add = [&](auto& x) {
						if constexpr (std::is_same_v<std::decay_t<decltype(x)>, Captures>)
							merged.merge(x);
					};
					(add(v), ...);
				}, values);
				return merged;
			});
		} else {
			return all;
		}
	}

	// Captures go through a choice unchanged, so this is just choice()
	template <class T, class... More>
	Matcher<T> capture_choice(const Matcher<T>& first, const More&... more)
	{
		return choice(first, more...);
	}

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
namespace Pegkit {

std::vector<string> Captures::labels() const
{
	std::vector<string> result;
	for (auto& [label, value] : fields) result.push_back(label);
	return result;
}

Captures& Captures::merge(const Captures& other)
{
	for (auto& [label, value] : other.fields)
		fields[label] = value;
	return *this;
}

std::optional<Captures> merge_captures(const std::vector<std::any>& values)
{
	std::optional<Captures> merged;
	for (auto& v : values) {
		if (auto c = std::any_cast<Captures>(&v); c) {
			if (!merged) merged.emplace();
			merged->merge(*c);
		}
	}
	return merged;
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_CAPTURE_HPP_
