// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/error.hpp>
#include <tubeq/core/progress.hpp>
#include <tubeq/core/raw_info.hpp>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>

namespace tubeq::core {

struct DownloadRequest;

enum class Outcome : std::uint8_t {
    success,
    failed,
    cancelled,
};

[[nodiscard]] constexpr std::string_view to_string(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::success:   return "success";
        case Outcome::failed:    return "failed";
        case Outcome::cancelled: return "cancelled";
    }
    return "unknown";
}

struct FetchError {
    std::error_code code;
    std::string detail;
};

// Metadata side of the extractor. Called from worker threads.
class MetadataSource {
public:
    virtual ~MetadataSource() = default;

    [[nodiscard]] virtual std::expected<RawInfo, FetchError>
    fetch_metadata(const std::string& url) = 0;
};

// Transfer side of the extractor. Called from worker threads; must poll
// `stop` and report cancellation as Outcome::cancelled rather than throwing.
class DownloadBackend {
public:
    virtual ~DownloadBackend() = default;

    [[nodiscard]] virtual Outcome run_download(const DownloadRequest& request,
                                               std::stop_token stop,
                                               const ProgressSink& progress) = 0;
};

} // namespace tubeq::core
