// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/error.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <expected>

namespace tubeq::core {

class Url {
public:
    using QueryItem = std::pair<std::string, std::string>;

    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    // Query pairs in order of appearance; pairs with an empty value are skipped
    [[nodiscard]] std::vector<QueryItem> query_items() const;

    // First non-empty value of a query parameter
    [[nodiscard]] std::optional<std::string> query_param(std::string_view name) const;

    void path(std::string p) { path_ = std::move(p); }
    void query(std::string q) { query_ = std::move(q); }

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

//=============================================================================
// Media URL helpers
//=============================================================================

// Remove every whitespace character (pasted URLs often wrap)
[[nodiscard]] std::string strip_url_whitespace(std::string_view url);

// Watch URL that also carries a playlist id (?v=...&list=...)
[[nodiscard]] bool is_mixed_url(std::string_view url) noexcept;

// Playlist page, or a list id without a video id
[[nodiscard]] bool is_playlist_url(std::string_view url) noexcept;

// Drop list/index/start so the URL addresses a single video
[[nodiscard]] std::string strip_list_param(std::string_view url);

// Rewrite to /playlist?list=<id>; unchanged when no list id is present
[[nodiscard]] std::string to_playlist_url(std::string_view url);

} // namespace tubeq::core
