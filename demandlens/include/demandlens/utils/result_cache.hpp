#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace demandlens::utils {

/**
 * @class ResultCache
 * @brief Keyed cache with per-entry time-to-live, injected into services that
 * want to reuse expensive results (reports, metric summaries).
 */
template <typename Value>
class ResultCache {
public:
	virtual ~ResultCache() = default;

	virtual std::optional<Value> get(const std::string &key) = 0;
	virtual void set(const std::string &key, Value value, std::chrono::seconds ttl) = 0;
	virtual void invalidate(const std::string &key) = 0;
};

/**
 * @class InMemoryResultCache
 * @brief Mutex-guarded map implementation of ResultCache.
 *
 * Expired entries are dropped on lookup of their key and swept on every
 * insert. The clock is injectable so expiry can be tested without sleeping.
 */
template <typename Value>
class InMemoryResultCache final : public ResultCache<Value> {
public:
	using Clock = std::chrono::steady_clock;
	using ClockFn = std::function<Clock::time_point()>;

	InMemoryResultCache() : now_([] { return Clock::now(); }) {
	}

	explicit InMemoryResultCache(ClockFn now) : now_(std::move(now)) {
	}

	std::optional<Value> get(const std::string &key) override {
		std::lock_guard<std::mutex> lock(mutex_);
		const auto it = entries_.find(key);
		if (it == entries_.end()) {
			return std::nullopt;
		}
		if (now_() >= it->second.expires_at) {
			entries_.erase(it);
			return std::nullopt;
		}
		return it->second.value;
	}

	void set(const std::string &key, Value value, std::chrono::seconds ttl) override {
		if (ttl <= std::chrono::seconds::zero()) {
			return;
		}
		std::lock_guard<std::mutex> lock(mutex_);
		const auto now = now_();
		for (auto it = entries_.begin(); it != entries_.end();) {
			if (now >= it->second.expires_at) {
				it = entries_.erase(it);
			} else {
				++it;
			}
		}
		entries_.insert_or_assign(key, Entry{std::move(value), now + ttl});
	}

	void invalidate(const std::string &key) override {
		std::lock_guard<std::mutex> lock(mutex_);
		entries_.erase(key);
	}

	std::size_t size() const {
		std::lock_guard<std::mutex> lock(mutex_);
		return entries_.size();
	}

private:
	struct Entry {
		Value value;
		Clock::time_point expires_at;
	};

	ClockFn now_;
	mutable std::mutex mutex_;
	std::unordered_map<std::string, Entry> entries_;
};

} // namespace demandlens::utils
