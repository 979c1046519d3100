#ifndef _PEGKIT_MEMO_HPP_
#define _PEGKIT_MEMO_HPP_

#include "outcome.hpp"

#include <list>
#include <unordered_map>
#include <memory> // shared_ptr
#include <mutex>
#include <optional>
#include <functional> // hash
#include <utility> // move

//---------------------------------------------------------------------------
// Memoization (packrat-style), as an opt-in wrapper
//---------------------------------------------------------------------------
namespace Pegkit {

	CONST DEFAULT_MEMO_CAPACITY = size_t(1000);

	//-------------------------------------------------------------------
	// Bounded cache; the least recently used entry goes first when full.
	// All operations lock, so it can be shared by concurrent callers.
	template <class K, class V, class Hash = std::hash<K>>
	class LruCache
	{
		using Entry = std::pair<K, V>;

		size_t _capacity;
		std::list<Entry> _entries; // most recently used first
		std::unordered_map<K, typename std::list<Entry>::iterator, Hash> _index;
		mutable std::mutex _lock;

	public:
		struct Stats { size_t hits = 0, misses = 0, evictions = 0; };

	private:
		Stats _stats;

	public:
		explicit LruCache(size_t capacity = DEFAULT_MEMO_CAPACITY) : _capacity(capacity)
		{
			if (!_capacity) ERROR("LruCache: capacity must be at least 1");
		}

		std::optional<V> get(const K& key)
		{
			std::lock_guard guard(_lock);
			auto it = _index.find(key);
			if (it == _index.end()) { ++_stats.misses; return std::nullopt; }
			++_stats.hits;
			_entries.splice(_entries.begin(), _entries, it->second);
			return it->second->second;
		}

		void put(const K& key, V value)
		{
			std::lock_guard guard(_lock);
			if (auto it = _index.find(key); it != _index.end()) {
				it->second->second = std::move(value);
				_entries.splice(_entries.begin(), _entries, it->second);
				return;
			}
			if (_entries.size() >= _capacity) {
				_index.erase(_entries.back().first);
				_entries.pop_back();
				++_stats.evictions;
			}
			_entries.emplace_front(key, std::move(value));
			_index.emplace(key, _entries.begin());
		}

		void clear()
		{
			std::lock_guard guard(_lock);
			_entries.clear();
			_index.clear();
			_stats = {};
		}

		size_t size() const { std::lock_guard guard(_lock); return _entries.size(); }
		size_t capacity() const { return _capacity; }
		Stats  stats() const { std::lock_guard guard(_lock); return _stats; }
	};

	//-------------------------------------------------------------------
	// What a memoized result is filed under: the run, the input (by identity),
	// and the offset in it. (Line and column follow from the offset.)
	//! Within one run the input must not be modified in place!
	struct MemoKey
	{
		size_t      run;
		const char* data;
		size_t      size;
		size_t      offset;

		bool operator==(const MemoKey&) const = default;
	};

	struct MemoKeyHash
	{
		size_t operator()(const MemoKey& k) const noexcept
		{
			auto h = std::hash<const void*>{}(k.data);
			h ^= std::hash<size_t>{}(k.run) + 0x9e3779b9 + (h << 6) + (h >> 2);
			h ^= std::hash<size_t>{}(k.size) + 0x9e3779b9 + (h << 6) + (h >> 2);
			h ^= std::hash<size_t>{}(k.offset) + 0x9e3779b9 + (h << 6) + (h >> 2);
			return h;
		}
	};

	template <class T>
	using MemoCache = LruCache<MemoKey, Outcome<T>, MemoKeyHash>;

	// `m`, with its outcomes cached in `cache` (which may be shared, and
	// inspected or cleared by the caller)
	template <class T>
	Matcher<T> memoize(const Matcher<T>& m, std::shared_ptr<MemoCache<T>> cache)
	{
		if (!cache) ERROR("memoize: no cache");
		return [m, cache](string_view input, const Pos& pos) -> Outcome<T>
		{
			MemoKey key{RunScope::current(), input.data(), input.size(), pos.offset};
			if (auto hit = cache->get(key); hit) return std::move(*hit);
			//! Not holding the lock while matching: recursive rules come back here.
			auto r = m(input, pos);
			cache->put(key, r);
			return r;
		};
	}

	// `m`, with a cache of its own
	template <class T>
	Matcher<T> memoize(const Matcher<T>& m, size_t capacity = DEFAULT_MEMO_CAPACITY)
	{
		return memoize(m, std::make_shared<MemoCache<T>>(capacity));
	}

} // namespace Pegkit

#endif // _PEGKIT_MEMO_HPP_
