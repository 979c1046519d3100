#ifndef _PEGKIT_RULES_HPP_
#define _PEGKIT_RULES_HPP_

#include "outcome.hpp"

#include <map>
#include <memory> // unique_ptr
#include <vector>
#include <utility> // move

//---------------------------------------------------------------------------
// Named (possibly recursive) rules, built in two phases:
//
//   1. declare<T>() every rule: you get an indirect handle (a Matcher<T>)
//      right away, usable in any rule body, even in its own;
//   2. define() each one, once its body is built.
//
// Calling a handle whose rule has not been defined yet is a failure
// (Fault::Configuration), not a crash. check() reports all such leftovers.
//
// NOTE: the handles point into the RuleSet, so it must outlive all the
// matchers built from them! (It can be moved, though.)
//---------------------------------------------------------------------------
namespace Pegkit {

class RuleSet
{
	struct SlotBase
	{
		string name;
		explicit SlotBase(string name) : name(std::move(name)) {}
		virtual ~SlotBase() = default;
		virtual bool bound() const = 0;
	};

	template <class T>
	struct Slot : SlotBase
	{
		Matcher<T> target;
		using SlotBase::SlotBase;
		bool bound() const override { return bool(target); }
	};

	std::map<string, std::unique_ptr<SlotBase>> _slots;

	template <class T>
	Slot<T>* _slot(const string& name) const
	{
		auto it = _slots.find(name);
		if (it == _slots.end()) ERROR("Rule \"{}\" was not found!", name);
		auto slot = dynamic_cast<Slot<T>*>(it->second.get());
		if (!slot) ERROR("Rule \"{}\" was declared with a different value type!", name);
		return slot;
	}

	template <class T>
	static Matcher<T> _handle(Slot<T>* slot)
	{
		return [slot](string_view input, const Pos& pos) -> Outcome<T>
		{
			if (!slot->target) {
				return fail(fmt::format("Rule \"{}\" used before it was defined", slot->name),
				            pos, {}, std::nullopt, slot->name, Fault::Configuration);
			}
			return slot->target(input, pos);
		};
	}

public:
	RuleSet() = default;
	RuleSet(const RuleSet&) = delete;
	RuleSet& operator=(const RuleSet&) = delete;
	RuleSet(RuleSet&&) = default;
	RuleSet& operator=(RuleSet&&) = default;

	// Phase 1. Declaring the same name again (with the same type) is fine.
	template <class T>
	Matcher<T> declare(const string& name)
	{
		if (_slots.find(name) == _slots.end()) {
			_slots.emplace(name, std::make_unique<Slot<T>>(name));
DBG("RuleSet: declared \"{}\"", name);
		}
		return _handle(_slot<T>(name));
	}

	// Phase 2. Each rule can only be defined once.
	template <class T>
	void define(const string& name, Matcher<T> body)
	{
		auto slot = _slot<T>(name);
		if (slot->target) ERROR("Rule \"{}\" is already defined!", name);
		if (!body) ERROR("Rule \"{}\": empty definition!", name);
		slot->target = std::move(body);
DBG("RuleSet: defined \"{}\"", name);
	}

	// Handle of an already declared rule
	template <class T>
	Matcher<T> ref(const string& name) const
	{
		return _handle(_slot<T>(name));
	}

	bool contains(const string& name) const { return _slots.find(name) != _slots.end(); }
	bool defined(const string& name) const;
	size_t size() const { return _slots.size(); }

	// Declared, but still not defined
	std::vector<string> unbound() const;

	// Throws (via ERROR()) if anything is still unbound
	void check() const;
};

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
namespace Pegkit {

bool RuleSet::defined(const string& name) const
{
	auto it = _slots.find(name);
	return it != _slots.end() && it->second->bound();
}

std::vector<string> RuleSet::unbound() const
{
	std::vector<string> names;
	for (auto& [name, slot] : _slots)
		if (!slot->bound()) names.push_back(name);
	return names;
}

void RuleSet::check() const
{
	if (auto names = unbound(); !names.empty())
		ERROR("Undefined rule(s): {}", fmt::join(names, ", "));
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_RULES_HPP_
