// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/config.hpp>
#include <tubeq/core/format.hpp>
#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tubeq::core {

// Bounded LRU of fetched catalogs keyed by normalized URL.
// Values are copied in and out; callers never share state with the cache.
// Control-thread only.
class FormatCache {
public:
    explicit FormatCache(std::size_t capacity = FORMAT_CACHE_MAX_ENTRIES) noexcept
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Insert or replace; the entry becomes most recently used
    void insert(const std::string& url, const FormatCollection& collection);

    // Copy of the entry, promoted to most recently used
    [[nodiscard]] std::optional<FormatCollection> get(const std::string& url);

    // Promote without copying; false when absent
    bool touch(const std::string& url);

    [[nodiscard]] bool contains(const std::string& url) const noexcept;
    bool erase(const std::string& url);
    void clear() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return index_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    // Least recently used first
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    struct Entry {
        std::string url;
        FormatCollection collection;
    };
    using Order = std::list<Entry>;

    void evict_overflow();

    std::size_t capacity_;
    Order order_;  // front = LRU, back = MRU
    std::unordered_map<std::string, Order::iterator> index_;
};

} // namespace tubeq::core
