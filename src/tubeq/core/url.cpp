// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/url.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <exception>

namespace tubeq::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(Errc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    const auto rest_start = scheme_end + 3;

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }
    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }
    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    const auto host_end = std::min({path_start, query_start, fragment_start});

    // Skip user:pass@
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);
    if (!authority.empty() && authority.front() == '[') {
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(Errc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        auto rest = authority.substr(bracket_end + 1);
        if (rest.starts_with(':')) {
            url.port_ = std::string(rest.substr(1));
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(Errc::invalid_url));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += '?';
        result += query_;
    }
    if (!fragment_.empty()) {
        result += '#';
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ':';
        result += port_;
    }
    return result;
}

std::vector<Url::QueryItem> Url::query_items() const {
    std::vector<QueryItem> items;
    std::string_view rest = query_;
    while (!rest.empty()) {
        auto amp = rest.find('&');
        auto pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);

        auto eq = pair.find('=');
        if (eq == std::string_view::npos) continue;
        auto key = pair.substr(0, eq);
        auto value = pair.substr(eq + 1);
        if (key.empty() || value.empty()) continue;
        items.emplace_back(std::string(key), std::string(value));
    }
    return items;
}

std::optional<std::string> Url::query_param(std::string_view name) const {
    for (auto& [key, value] : query_items()) {
        if (key == name) return value;
    }
    return std::nullopt;
}

//=============================================================================
// Media URL helpers
//=============================================================================

std::string strip_url_whitespace(std::string_view url) {
    std::string out;
    out.reserve(url.size());
    for (char c : url) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out += c;
        }
    }
    return out;
}

bool is_mixed_url(std::string_view url) noexcept {
    try {
        auto parsed = Url::parse(url);
        if (!parsed) return false;
        return parsed->query_param("v").has_value() && parsed->query_param("list").has_value();
    } catch (const std::exception&) {
        return false;
    }
}

bool is_playlist_url(std::string_view url) noexcept {
    try {
        auto parsed = Url::parse(url);
        if (!parsed) return false;
        const bool has_list = parsed->query_param("list").has_value();
        if (!has_list) return false;
        if (parsed->path().starts_with("/playlist")) return true;
        return !parsed->query_param("v").has_value();
    } catch (const std::exception&) {
        return false;
    }
}

std::string strip_list_param(std::string_view url) {
    auto parsed = Url::parse(url);
    if (!parsed) return std::string(url);

    constexpr std::array<std::string_view, 3> dropped{"list", "index", "start"};
    std::string query;
    for (auto& [key, value] : parsed->query_items()) {
        if (std::ranges::find(dropped, key) != dropped.end()) continue;
        if (!query.empty()) query += '&';
        query += key;
        query += '=';
        query += value;
    }
    parsed->query(std::move(query));
    return parsed->full();
}

std::string to_playlist_url(std::string_view url) {
    auto parsed = Url::parse(url);
    if (!parsed) return std::string(url);

    auto list_id = parsed->query_param("list");
    if (!list_id) return std::string(url);

    parsed->path("/playlist");
    parsed->query("list=" + *list_id);
    return parsed->full();
}

} // namespace tubeq::core
