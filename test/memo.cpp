#define PEGKIT_DEDUP
#include "../pegkit.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Pegkit;

//---------------------------------------------------------------------------
// LruCache
//---------------------------------------------------------------------------
CASE("LruCache: get/put") {
	LruCache<string, int> cache(2);
	CHECK(cache.capacity() == 2);
	CHECK(!cache.get("a"));
	cache.put("a", 1);
	REQUIRE(cache.get("a"));
	CHECK(*cache.get("a") == 1);
	cache.put("a", 10);
	CHECK(*cache.get("a") == 10);
	CHECK(cache.size() == 1);
}

CASE("LruCache: the least recently used goes first") {
	LruCache<string, int> cache(2);
	cache.put("a", 1);
	cache.put("b", 2);
	CHECK(cache.get("a")); // "b" is the oldest now
	cache.put("c", 3);
	CHECK(cache.size() == 2);
	CHECK(cache.get("a"));
	CHECK(!cache.get("b"));
	CHECK(cache.get("c"));
	CHECK(cache.stats().evictions == 1);
}

CASE("LruCache: stats, clear") {
	LruCache<int, int> cache(10);
	cache.put(1, 1);
	(void)cache.get(1);
	(void)cache.get(2);
	CHECK(cache.stats().hits == 1);
	CHECK(cache.stats().misses == 1);
	cache.clear();
	CHECK(cache.size() == 0);
	CHECK(cache.stats().hits == 0);
}

CASE("LruCache: zero capacity") {
	CHECK_THROWS_AS((LruCache<int, int>(0)), std::runtime_error);
}

//---------------------------------------------------------------------------
// memoize
//---------------------------------------------------------------------------
CASE("memoize: the inner matcher runs once per input position") {
	int calls = 0;
	auto counted = tap(literal("ab"), [&](auto&) { ++calls; });
	auto cache = std::make_shared<MemoCache<string>>(16);
	auto m = memoize(counted, cache);

	string input = "abab";
	auto r1 = m(input, START);
	auto r2 = m(input, START);
	REQUIRE(r1);
	REQUIRE(r2);
	CHECK(r2.next() == r1.next());
	CHECK(calls == 1);
	CHECK(cache->stats().hits == 1);

	CHECK(m(input, Pos{2, 1, 2}));
	CHECK(calls == 2);
	CHECK(cache->size() == 2);
}

CASE("memoize: failures are cached too") {
	int calls = 0;
	auto probe = map_error(literal("x"), [&](Diagnostic d) { ++calls; return d; });
	auto m = memoize(probe);
	string input = "y";
	CHECK(!m(input, START));
	auto again = m(input, START);
	REQUIRE(!again);
	CHECK(again.error().found == "y");
	CHECK(calls == 1);
}

CASE("memoize: another input is another key") {
	int calls = 0;
	auto m = memoize(tap(literal("a"), [&](auto&) { ++calls; }));
	string one = "a", two = "a";
	CHECK(m(one, START));
	CHECK(m(two, START));
	CHECK(calls == 2);
}

CASE("memoize: a reused buffer is a new input in each run") {
	auto m = memoize(literal("ab"));
	std::vector<bool> matched;
	for (const char* s : {"ab", "xy", "ab"}) {
		string input = s; // Same (small-string) buffer each time, most likely
		matched.push_back(run(m, input).ok());
	}
	CHECK(matched == std::vector<bool>{true, false, true});

	string buf = "ab";
	CHECK(run(m, buf));
	buf = "xy";
	auto r = run(m, buf);
	REQUIRE(!r);
	CHECK(r.error().found == "x");
}

CASE("memoize: results are shared within a run") {
	int calls = 0;
	auto m = memoize(tap(literal("ab"), [&](auto&) { ++calls; }));
	CHECK(run(sequence(and_predicate(m), m), "ab"));
	CHECK(calls == 1);
	CHECK(run(sequence(and_predicate(m), m), "ab"));
	CHECK(calls == 2);
}

CASE("memoize: no cache") {
	CHECK_THROWS_AS(memoize(literal("a"), std::shared_ptr<MemoCache<string>>{}), std::runtime_error);
}

CASE("memoize: same results as without") {
	auto digit = char_class({{"0", "9"}});
	auto plain = sequence(one_or_more(digit), Pegkit::optional(literal(".")), zero_or_more(digit));
	auto cached = memoize(plain);
	//! All alive at once: the cache tells inputs apart by address.
	std::vector<string> inputs{"12.5", "7", "x", "3."};
	for (auto& input : inputs) {
		auto a = run(plain, input);
		auto b = run(cached, input);
		CHECK(a.ok() == b.ok());
		if (a && b) CHECK(a.next() == b.next());
		else if (!a && !b) CHECK(a.error().pos == b.error().pos);
	}
}
