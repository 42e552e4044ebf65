// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/format_cache.hpp>
#include <spdlog/spdlog.h>
#include <iterator>

namespace tubeq::core {

void FormatCache::insert(const std::string& url, const FormatCollection& collection) {
    if (auto it = index_.find(url); it != index_.end()) {
        it->second->collection = collection;
        order_.splice(order_.end(), order_, it->second);
        return;
    }
    order_.push_back({url, collection});
    index_.emplace(url, std::prev(order_.end()));
    evict_overflow();
}

std::optional<FormatCollection> FormatCache::get(const std::string& url) {
    auto it = index_.find(url);
    if (it == index_.end()) return std::nullopt;
    order_.splice(order_.end(), order_, it->second);
    return it->second->collection;
}

bool FormatCache::touch(const std::string& url) {
    auto it = index_.find(url);
    if (it == index_.end()) return false;
    order_.splice(order_.end(), order_, it->second);
    return true;
}

bool FormatCache::contains(const std::string& url) const noexcept {
    return index_.contains(url);
}

bool FormatCache::erase(const std::string& url) {
    auto it = index_.find(url);
    if (it == index_.end()) return false;
    order_.erase(it->second);
    index_.erase(it);
    return true;
}

void FormatCache::clear() noexcept {
    index_.clear();
    order_.clear();
}

std::vector<std::string> FormatCache::keys() const {
    std::vector<std::string> keys;
    keys.reserve(order_.size());
    for (const auto& entry : order_) {
        keys.push_back(entry.url);
    }
    return keys;
}

void FormatCache::evict_overflow() {
    while (index_.size() > capacity_) {
        auto& oldest = order_.front();
        spdlog::debug("[fetch] cache full, evicting {}", oldest.url);
        index_.erase(oldest.url);
        order_.pop_front();
    }
}

} // namespace tubeq::core
