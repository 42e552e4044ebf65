// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>
#include <string_view>
#include <cstddef>

namespace tubeq::core {

enum class Errc {
    success = 0,
    fetch_failed,
    invalid_url,
    metadata_parse_error,
    selection_incomplete,
    formats_unavailable,
    missing_url,
    download_in_progress,
    queue_locked,
    output_dir_unavailable,
    backend_unavailable,
    config_parse_error,
    file_not_found,
    write_error,
};

// Category of the first invalid field found when validating a queue item
enum class QueueIssue {
    none = 0,
    missing_url,
    playlist,
    formats,
    mode,
    codec,
    container,
    format,
};

namespace detail {

struct ErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tubeq";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<Errc>(ev)) {
            case Errc::success:                return "Success";
            case Errc::fetch_failed:           return "Could not fetch formats";
            case Errc::invalid_url:            return "Invalid URL";
            case Errc::metadata_parse_error:   return "Malformed metadata";
            case Errc::selection_incomplete:   return "Format selection incomplete";
            case Errc::formats_unavailable:    return "Formats not loaded";
            case Errc::missing_url:            return "No URL given";
            case Errc::download_in_progress:   return "A download is already running";
            case Errc::queue_locked:           return "Queue is locked while running";
            case Errc::output_dir_unavailable: return "Output folder cannot be created";
            case Errc::backend_unavailable:    return "Downloader backend not available";
            case Errc::config_parse_error:     return "Invalid configuration file";
            case Errc::file_not_found:         return "File not found";
            case Errc::write_error:            return "Write error";
            default:                           return "Unknown error";
        }
    }
};

struct QueueIssueCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tubeq::queue";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<QueueIssue>(ev)) {
            case QueueIssue::none:        return "Ready";
            case QueueIssue::missing_url: return "Enter a URL first";
            case QueueIssue::playlist:    return "Playlist URLs cannot be queued";
            case QueueIssue::formats:     return "Fetch formats first";
            case QueueIssue::mode:        return "Choose video or audio";
            case QueueIssue::codec:       return "Choose a codec";
            case QueueIssue::container:   return "Choose a container";
            case QueueIssue::format:      return "Choose a format";
            default:                      return "Unknown queue issue";
        }
    }
};

} // namespace detail

inline const detail::ErrcCategory& errc_category() noexcept {
    static detail::ErrcCategory category;
    return category;
}

inline const detail::QueueIssueCategory& queue_issue_category() noexcept {
    static detail::QueueIssueCategory category;
    return category;
}

inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), errc_category()};
}

inline std::error_code make_error_code(QueueIssue e) noexcept {
    return {static_cast<int>(e), queue_issue_category()};
}

// Short machine-friendly name, used in logs and the queue file
[[nodiscard]] constexpr std::string_view to_string(QueueIssue issue) noexcept {
    switch (issue) {
        case QueueIssue::none:        return "none";
        case QueueIssue::missing_url: return "missing_url";
        case QueueIssue::playlist:    return "playlist";
        case QueueIssue::formats:     return "formats";
        case QueueIssue::mode:        return "mode";
        case QueueIssue::codec:       return "codec";
        case QueueIssue::container:   return "container";
        case QueueIssue::format:      return "format";
    }
    return "unknown";
}

// Queue run rejected before any I/O: 1-based item index plus the missing field
struct QueueValidationError {
    std::size_t index{0};
    QueueIssue issue{QueueIssue::none};

    [[nodiscard]] std::error_code code() const noexcept { return make_error_code(issue); }

    bool operator==(const QueueValidationError&) const = default;
};

} // namespace tubeq::core

namespace std {

template<>
struct is_error_code_enum<tubeq::core::Errc> : true_type {};

template<>
struct is_error_code_enum<tubeq::core::QueueIssue> : true_type {};

} // namespace std
