#ifndef _PEGKIT_GRAMMAR_HPP_
#define _PEGKIT_GRAMMAR_HPP_

#include "primitives.hpp"
#include "combinators.hpp"
#include "repetition.hpp"
#include "lookahead.hpp"
#include "transform.hpp"
#include "capture.hpp"
#include "rules.hpp"
#include "memo.hpp"
#include "report.hpp"

#include <any>
#include <variant>
#include <vector>
#include <map>
#include <memory> // shared_ptr
#include <optional>

//---------------------------------------------------------------------------
// Grammars as plain data (Rule trees), and a Parser that turns them into
// matchers. Brace notation, LISP-style:
//
//	Rule r = _{ _{_DEF, "block", _{"<", _{_ANY, _{_OR, code, _{_USE, "block"}}}, ">"}},
//	            _{_USE, "block"} };
//
// The first item of a production is its operator; if it isn't one, the
// production is a sequence.
//---------------------------------------------------------------------------
namespace Pegkit {

	using Atom   = string; // literal text, or the name of a curated atom (like "_ID")
	using Value  = std::any;
	using Values = std::vector<Value>;

	//-------------------------------------------------------------------
	// Opcodes... (regex-inspired)
	enum class Op : char
	{
		NIL     = '0', // never matches; ignores the rest of the production
		T       = '1', // always matches (empty); ignores the rest of the production
		SEQ     = ',',
		OR      = '|', // ordered choice; 1 or more arguments
		OPT     = '?', // 0 or 1
		ANY     = '*', // 0 or more (greedy!)
		MANY    = '+', // 1 or more (greedy!)
		REPEAT  = '{', // "{min,max}", "{min,}" or "{n}", then the rule
		AND     = '&', // positive lookahead
		NOT     = '!', // negative lookahead
		DOT     = '.', // any character; no arguments
		CLASS   = '[', // "x" or "a-z" atoms
		SAVE_AS = '=', // "name", then the rule: captures the matched text
		DEF     = ':', // "name", then the rule: defines a named rule (matches empty)
		USE     = '`', // "name": invokes a named rule
	};

	CONST _NIL     = Op::NIL;
	CONST _T       = Op::T;
	CONST _SEQ     = Op::SEQ;
	CONST _OR      = Op::OR;
	CONST _OPT     = Op::OPT;
	CONST _ANY     = Op::ANY;
	CONST _MANY    = Op::MANY;
	CONST _REPEAT  = Op::REPEAT;
	CONST _AND     = Op::AND;
	CONST _NOT     = Op::NOT;
	CONST _DOT     = Op::DOT;
	CONST _CLASS   = Op::CLASS;
	CONST _SAVE_AS = Op::SAVE_AS;
	CONST _DEF     = Op::DEF;
	CONST _USE     = Op::USE;

	const char* to_cstr(Op op);

	// The built-in named atoms ("_ID", "_DIGITS", "_WHITESPACES" etc.)
	const std::map<string, Matcher<Value>>& curated_atoms();


//---------------------------------------------------------------------------
// Grammar rules...
//---------------------------------------------------------------------------
struct Rule
{
	using Production = std::vector<Rule>;

	std::variant<Atom, Op, Production> node;

	string d_memo; // Diagnostic note (e.g. the curated atom name)

	//-----------------------------------------------------------
	Rule(const Atom& atom) : node(atom) { _init_atom(); }
	Rule(Atom&& atom)      : node(std::move(atom)) { _init_atom(); }
	Rule(const char* atom) : Rule(Atom(atom)) {} //! Also stops _{"a", "b"} from being taken as an iterator range!
	Rule(Op opcode)        : node(opcode) {}
	Rule(const Production& expr) : node(expr) {}
	Rule(Production&& expr)      : node(std::move(expr)) {}

	//-----------------------------------------------------------
	// Queries...
	bool is_atom()   const { return std::holds_alternative<Atom>(node); }
	bool is_opcode() const { return std::holds_alternative<Op>(node); }
	bool is_prod()   const { return std::holds_alternative<Production>(node); }

	// "" and _{} both match the empty string
	bool is_empty()  const { return (is_atom() && atom().empty()) || (is_prod() && prod().empty()); }

	const Atom&       atom()   const { return std::get<Atom>(node); }
	Op                opcode() const { return std::get<Op>(node); }
	const Production& prod()   const { return std::get<Production>(node); }

	// The operator of a production (SEQ if it doesn't start with one)
	Op op() const { return !prod().empty() && prod()[0].is_opcode() ? prod()[0].opcode() : Op::SEQ; }

	//-----------------------------------------------------------
	// Diagnostics...
#ifndef NDEBUG
	void DUMP() const { _dump(); }
#else
	void DUMP() const {}
#endif

private:
	void _init_atom()
	{
		if (curated_atoms().count(atom())) d_memo = atom();
	}

#ifndef NDEBUG
	void _dump(unsigned level = 0) const
	{
		string prefix(level * 2, ' ');
		if (!level) cerr << "     /------------------------------------------------------------------\\\n";
		if (is_atom()) {
			cerr << "     " << prefix << fmt::format("\"{}\"", escaped(atom()));
		} else if (is_opcode()) {
			cerr << "     " << prefix << fmt::format("{} ('{}')", to_cstr(opcode()), char(opcode()));
		} else {
			cerr << "     " << prefix << "{\n";
			for (auto& r : prod()) r._dump(level + 1);
			cerr << "     " << prefix << "}";
		}
		cerr << (d_memo.empty() ? "" : fmt::format(" // {}", d_memo)) << "\n";
		if (!level) cerr << "     \\------------------------------------------------------------------/\n";
	}
#endif
};

	// Simple painkillers for grammar-building:
	using Prod = Rule::Production;
	using _    = Rule::Production; // For init. lists like Rule r = _{ ... _{...} }


//---------------------------------------------------------------------------
class Parser
//---------------------------------------------------------------------------
{
public:
	CONST RECURSION_LIMIT = 300; // Hopefully this'd be hit before a stack overflow...

	//-------------------------------------------------------------------
	// Parser state...

	// Input:
	const Rule syntax;
	string text;

	// Named captures (_SAVE_AS); valid only after a successful parse()
	Captures captures;

	// Diagnostics:
	int loopguard;
	int depth_reached; // deepest _USE nesting seen in the last parse()

	//-------------------------------------------------------------------
	// memo_capacity > 0 memoizes every _DEF rule, with that many entries each
	Parser(const Rule& syntax, int maxnest = RECURSION_LIMIT, size_t memo_capacity = 0);

	Parser(const Parser& other) = delete;
	Parser& operator=(const Parser& other) = delete;
	Parser(Parser&&) = delete; //! The compiled matchers point back here!

	//-------------------------------------------------------------------
	// Both succeed if a prefix of `txt` matches (check matched_length, or
	// add an eoi at the end of the grammar, if it must be all of it)
	bool parse(const string& txt);
	bool parse(const string& txt, OUT size_t& matched_length);

	// The result of the last parse(); ERROR() if there was none yet
	const Outcome<Value>& outcome() const;

	// nullptr unless the last parse() failed
	const Diagnostic* error() const;

	// Formatted failure report of the last parse() (empty if it succeeded)
	string report(const FormatOptions& opt = {}) const;

	// Captured text by name, or "" if none
	const string& operator[](const string& name) const;

	const Matcher<Value>& matcher() const { return _entry; }
	const RuleSet& rules() const { return _rules; }

private:
	int _maxnest;
	size_t _memo_capacity;
	RuleSet _rules;
	std::vector<std::shared_ptr<MemoCache<Value>>> _caches;
	Matcher<Value> _entry;
	std::optional<Outcome<Value>> _outcome;

	void _reset();
	void _declare_all(const Rule& rule);
	Matcher<Value> _compile(const Rule& rule);
	Matcher<Value> _compile_prod(const Prod& prod);
	Matcher<Value> _compile_from(const Prod& prod, size_t first); // the rest as a sequence
	Matcher<Value> _compile_use(const string& name);
	const string& _name_arg(const Prod& prod) const;
};

} // namespace Pegkit


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//

#ifndef PEGKIT_DEDUP
//===========================================================================
namespace Pegkit {

namespace {
	// Any matcher, as a Matcher<Value>
	template <class T>
	Matcher<Value> _to_value(const Matcher<T>& m)
	{
		return map(m, [](T&& v) { return Value(std::move(v)); });
	}

	// The text `m` matched, as a Matcher<Value>
	template <class T>
	Matcher<Value> _text_of(const Matcher<T>& m)
	{
		return [m](string_view input, const Pos& pos) -> Outcome<Value>
		{
			auto r = m(input, pos);
			if (!r) return std::move(r).template as<Value>();
			return Success<Value>{Value(string(matched_text(r.success(), input))), pos, r.success().next};
		};
	}

	// Captures are infectious: a list with any in it becomes their merge
	inline Value _values_or_captures(Values&& values)
	{
		if (auto merged = merge_captures(values); merged) return Value(std::move(*merged));
		return Value(std::move(values));
	}

	inline Matcher<Value> _epsilon()
	{
		return [](string_view, const Pos& pos) -> Outcome<Value> {
			return Success<Value>{Value{}, pos, pos};
		};
	}

	inline Matcher<Value> _nil()
	{
		return [](string_view, const Pos& pos) -> Outcome<Value> {
			return fail("_NIL never matches", pos, {}, std::nullopt, "_NIL");
		};
	}

	// "{2,5}", "{2,}", "{2}" -- parsed with our own matchers, naturally
	inline std::pair<int, std::optional<int>> _parse_bounds(const string& text)
	{
		auto digit = char_class({{"0", "9"}});
		auto integer = map(sequence(optional(literal("-")), one_or_more(digit)),
			[](std::tuple<std::optional<string>, std::vector<string>>&& parts) {
				string s = std::get<0>(parts).value_or("");
				for (auto& d : std::get<1>(parts)) s += d;
				return std::stoi(s);
			});
		auto upper = optional(sequence(literal(","), optional(integer)));
		auto bounds = sequence(literal("{"), integer, upper, literal("}"), eoi());

		auto r = [&] {
			try { return run(bounds, text); }
			catch (const std::out_of_range&) { ERROR("_REPEAT: bound out of range in \"{}\"", text); }
		}();
		if (!r) ERROR("_REPEAT: invalid bounds \"{}\" ({})", text, describe(r.error()));

		[[maybe_unused]] auto& [open, min, tail, close, end] = r.value();
		if (!tail) return {min, min};              // {n}
		return {min, std::get<1>(*tail)};           // {n,m} or {n,}
	}

	inline ClassItem _class_item(const Rule& r)
	{
		if (!r.is_atom()) ERROR("_CLASS: arguments must be atoms");
		auto& a = r.atom();
		if (char_count(a) == 3) {
			auto first = read_char(a, 0);
			auto dash = read_char(a, first.length());
			if (dash.text == "-")
				return ClassItem(first.text, string_view(a).substr(first.length() + 1));
		}
		return ClassItem(a);
	}
}

//---------------------------------------------------------------------------
const char* to_cstr(Op op)
{
	switch (op) {
	case Op::NIL:     return "_NIL";
	case Op::T:       return "_T";
	case Op::SEQ:     return "_SEQ";
	case Op::OR:      return "_OR";
	case Op::OPT:     return "_OPT";
	case Op::ANY:     return "_ANY";
	case Op::MANY:    return "_MANY";
	case Op::REPEAT:  return "_REPEAT";
	case Op::AND:     return "_AND";
	case Op::NOT:     return "_NOT";
	case Op::DOT:     return "_DOT";
	case Op::CLASS:   return "_CLASS";
	case Op::SAVE_AS: return "_SAVE_AS";
	case Op::DEF:     return "_DEF";
	case Op::USE:     return "_USE";
	}
	return "?";
}

//---------------------------------------------------------------------------
const std::map<string, Matcher<Value>>& curated_atoms()
{
	// "Curated atoms" are just named, pre-built matchers: "metasyntactic
	// sugar" for the most common character classes.
	static const std::map<string, Matcher<Value>> atoms = []{
		auto digit    = char_class({{"0", "9"}});
		auto hexdigit = char_class({{"0", "9"}, {"a", "f"}, {"A", "F"}});
		auto letter   = char_class({{"a", "z"}, {"A", "Z"}});
		auto alnum    = char_class({{"a", "z"}, {"A", "Z"}, {"0", "9"}});
		auto idchar   = char_class({{"a", "z"}, {"A", "Z"}, {"0", "9"}, "_"});
		auto idstart  = char_class({{"a", "z"}, {"A", "Z"}, "_"});
		auto space    = char_class({" ", "\t", "\n", "\r", "\f", "\v"});

		return std::map<string, Matcher<Value>>{
			{"_EMPTY"      , _epsilon()},
			{"_SPACE"      , _to_value(literal(" "))},
			{"_TAB"        , _to_value(literal("\t"))},
			{"_QUOTE"      , _to_value(literal("\""))},
			{"_APOSTROPHE" , _to_value(literal("'"))},
			{"_SLASH"      , _to_value(literal("/"))},
			{"_BACKSLASH"  , _to_value(literal("\\"))},
			{"_IDCHAR"     , _to_value(idchar)},
			{"_ID"         , _text_of(sequence(idstart, zero_or_more(idchar)))},
			{"_DIGIT"      , _to_value(digit)},
			{"_DIGITS"     , _text_of(one_or_more(digit))},
			{"_HEXDIGIT"   , _to_value(hexdigit)},
			{"_HEXDIGITS"  , _text_of(one_or_more(hexdigit))},
			{"_LETTER"     , _to_value(letter)},
			{"_LETTERS"    , _text_of(one_or_more(letter))},
			{"_ALNUM"      , _to_value(alnum)},
			{"_ALNUMS"     , _text_of(one_or_more(alnum))},
			{"_WHITESPACE" , _to_value(space)},
			{"_WHITESPACES", _text_of(one_or_more(space))},
		};
	}();
	return atoms;
}

//---------------------------------------------------------------------------
Parser::Parser(const Rule& syntax, int maxnest, size_t memo_capacity):
	syntax(syntax),
	loopguard(maxnest),
	depth_reached(0),
	_maxnest(maxnest),
	_memo_capacity(memo_capacity)
{
	if (maxnest < 1) ERROR("Parser: maxnest must be positive (got {})", maxnest);

	// Two phases: every _DEF gets a handle first, so that rules can refer
	// to each other (and themselves) in any order...
	_declare_all(this->syntax);
	// ...then the bodies get built and bound
	_entry = _compile(this->syntax);
	_rules.check();
DBG("Parser: compiled, {} named rule(s)", _rules.size());
}

void Parser::_reset()
{
	loopguard = _maxnest;
	depth_reached = 0;
	captures = {};
	_outcome.reset();
	//! The caches are keyed by the text's address, which may well be reused by the next text!
	for (auto& cache : _caches) cache->clear();
}

bool Parser::parse(const string& txt)
{
	size_t matched_length_ignored;
	return parse(txt, matched_length_ignored);
}

bool Parser::parse(const string& txt, OUT size_t& matched_length)
{
	_reset(); // First this, so that nothing could refer to the old text
	text = txt;
	RunScope scope;
DBG("parse(\"{}\")...", DBG_TRIM(text));

	_outcome.emplace(_entry(text, START));
	if (!*_outcome) {
DBG("parse: failed at {}: {}", to_string(_outcome->error().pos), _outcome->error().message);
		matched_length = 0;
		return false;
	}

	matched_length = _outcome->next().offset;
	if (auto c = std::any_cast<Captures>(&_outcome->value()); c)
		captures = *c;
	return true;
}

const Outcome<Value>& Parser::outcome() const
{
	if (!_outcome) ERROR("Parser: no parse() yet!");
	return *_outcome;
}

const Diagnostic* Parser::error() const
{
	return _outcome && !*_outcome ? &_outcome->error() : nullptr;
}

string Parser::report(const FormatOptions& opt) const
{
	auto d = error();
	return d ? format_diagnostic(*d, text, opt) : EMPTY_STRING;
}

const string& Parser::operator[](const string& name) const
{
	auto s = captures.get<string>(name);
	return s ? *s : EMPTY_STRING;
}

//---------------------------------------------------------------------------
void Parser::_declare_all(const Rule& rule)
{
	if (!rule.is_prod()) return;
	auto& prod = rule.prod();
	if (rule.op() == Op::DEF) _rules.declare<Value>(_name_arg(prod));
	for (auto& r : prod) _declare_all(r);
}

const string& Parser::_name_arg(const Prod& prod) const
{
	if (prod.size() < 2 || !prod[1].is_atom() || prod[1].atom().empty())
		ERROR("Invalid grammar: {} expects a name as its first argument", to_cstr(prod[0].opcode()));
	return prod[1].atom();
}

Matcher<Value> Parser::_compile(const Rule& rule)
{
	if (rule.is_empty()) return _epsilon();

	if (rule.is_atom()) {
		if (auto it = curated_atoms().find(rule.atom()); it != curated_atoms().end())
			return it->second;
		return _to_value(literal(rule.atom()));
	}

	if (rule.is_opcode()) {
		ERROR("Invalid grammar: OPCODE {} ('{}') outside of Production",
			to_cstr(rule.opcode()), char(rule.opcode()));
	}

	return _compile_prod(rule.prod());
}

Matcher<Value> Parser::_compile_from(const Prod& prod, size_t first)
{
	if (first >= prod.size()) return _epsilon();
	if (first + 1 == prod.size()) return _compile(prod[first]);

	std::vector<Matcher<Value>> items;
	for (auto i = first; i < prod.size(); ++i) items.push_back(_compile(prod[i]));
	return map(sequence(std::move(items)), _values_or_captures);
}

Matcher<Value> Parser::_compile_use(const string& name)
{
	auto target = _rules.ref<Value>(name);
	return [this, target, name](string_view input, const Pos& pos) -> Outcome<Value>
	{
		--loopguard;
		struct Restore { int& guard; ~Restore() { ++guard; } } restore{loopguard}; // also when thrown through
		if (depth_reached < _maxnest - loopguard)
			depth_reached = _maxnest - loopguard;
		if (!loopguard) {
			ERROR("Recursion level {} is too deep (in rule \"{}\")!", _maxnest, name);
		}
		return target(input, pos);
	};
}

Matcher<Value> Parser::_compile_prod(const Prod& prod)
{
	const bool headless = !prod[0].is_opcode();
	const auto op = headless ? Op::SEQ : prod[0].opcode();
	const size_t args = headless ? prod.size() : prod.size() - 1;

	auto require = [&](size_t n, const char* what) {
		if (args < n) ERROR("Invalid grammar: {} expects {}", to_cstr(op), what);
	};

	//! No default: the compiler should tell if an opcode is left out!
	switch (op)
	{
	case Op::NIL:
		return _nil();

	case Op::T:
		return _epsilon();

	case Op::SEQ:
		return _compile_from(prod, headless ? 0 : 1);

	case Op::OR: {
		require(1, "at least 1 alternative");
		std::vector<Matcher<Value>> alternatives;
		for (size_t i = 1; i < prod.size(); ++i) alternatives.push_back(_compile(prod[i]));
		return choice(std::move(alternatives));
	}

	case Op::OPT:
		require(1, "an argument");
		return map(optional(_compile_from(prod, 1)), [](std::optional<Value>&& v) {
			return v ? std::move(*v) : Value{};
		});

	case Op::ANY:
		require(1, "an argument");
		return map(zero_or_more(_compile_from(prod, 1)), _values_or_captures);

	case Op::MANY:
		require(1, "an argument");
		return map(one_or_more(_compile_from(prod, 1)), _values_or_captures);

	case Op::REPEAT: {
		require(2, "bounds (like \"{1,3}\"), then a rule");
		if (!prod[1].is_atom()) ERROR("Invalid grammar: _REPEAT bounds must be an atom");
		auto [min, max] = _parse_bounds(prod[1].atom());
		return map(repeat(_compile_from(prod, 2), min, max), _values_or_captures);
	}

	case Op::AND:
		require(1, "an argument");
		return map(and_predicate(_compile_from(prod, 1)), [](Unit) { return Value{}; });

	case Op::NOT:
		require(1, "an argument");
		return map(not_predicate(_compile_from(prod, 1)), [](Unit) { return Value{}; });

	case Op::DOT:
		if (args) ERROR("Invalid grammar: _DOT takes no arguments");
		return _to_value(any_char());

	case Op::CLASS: {
		require(1, "at least 1 character or range");
		std::vector<ClassItem> items;
		for (size_t i = 1; i < prod.size(); ++i) items.push_back(_class_item(prod[i]));
		return _to_value(char_class(std::move(items)));
	}

	case Op::SAVE_AS: {
		require(2, "a name, then a rule");
		auto name = _name_arg(prod);
		auto body = _compile_from(prod, 2);
		// The matched text goes under `name`, on top of whatever the body has captured
		return [name, body](string_view input, const Pos& pos) -> Outcome<Value>
		{
			auto r = body(input, pos);
			if (!r) return r;
			Captures c;
			if (auto inner = std::any_cast<Captures>(&r.value()); inner) c = *inner;
			c.fields[name] = string(matched_text(r.success(), input));
			return Success<Value>{Value(std::move(c)), pos, r.success().next};
		};
	}

	case Op::DEF: {
		require(2, "a name, then a rule");
		auto& name = _name_arg(prod);
		auto body = _compile_from(prod, 2);
		if (_memo_capacity) {
			auto cache = std::make_shared<MemoCache<Value>>(_memo_capacity);
			_caches.push_back(cache);
			body = memoize(body, cache);
		}
		_rules.define(name, std::move(body));
DBG("_DEF: \"{}\"{}", name, _memo_capacity ? " (memoized)" : "");
		return _epsilon();
	}

	case Op::USE:
		if (args != 1) ERROR("Invalid grammar: _USE expects exactly 1 argument (a rule name)");
		return _compile_use(_name_arg(prod));
	}

	ERROR("Unimplemented opcode: {} ('{}')", int(op), char(op));
}

} // namespace Pegkit

#endif // PEGKIT_DEDUP
#endif // _PEGKIT_GRAMMAR_HPP_
