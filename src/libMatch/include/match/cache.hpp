#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace warlens::match {

//! Minimal key-value cache interface. Implementations must be safe to use from multiple threads.
template <typename Key, typename Value>
class ICache {
public:
	virtual ~ICache() = default;

	virtual std::optional<Value> get(const Key& key) const = 0;
	virtual void put(const Key& key, Value value)          = 0;
	virtual void clear()                                   = 0;
	virtual std::size_t size() const                       = 0;
};

/*! Bounded map that drops all entries once it is full.
 * The size never exceeds the capacity. Overflow never raises.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ClearOnFullCache : public ICache<Key, Value> {
public:
	explicit ClearOnFullCache(std::size_t capacity) : m_capacity(std::max<std::size_t>(1, capacity)) {}

	std::optional<Value> get(const Key& key) const override {
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_entries.find(key);
		if (it == m_entries.end()) {
			return std::nullopt;
		}
		return it->second;
	}

	void put(const Key& key, Value value) override {
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_entries.size() >= m_capacity) {
			m_entries.clear();
		}
		m_entries.insert_or_assign(key, std::move(value));
	}

	void clear() override {
		std::lock_guard<std::mutex> lock(m_mutex);
		m_entries.clear();
	}

	std::size_t size() const override {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_entries.size();
	}

	std::size_t capacity() const { return m_capacity; }

private:
	const std::size_t m_capacity;
	mutable std::mutex m_mutex;
	std::unordered_map<Key, Value, Hash> m_entries;
};

//! Boost style hash combination.
inline void hashCombine(std::size_t& seed, std::size_t value) {
	seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace warlens::match
