// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/progress.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tubeq::cli {

// Single-line terminal progress bar fed with backend progress events
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});

    // Downloading redraws the bar, ItemStarted relabels it,
    // Finished fills it, Cancelled clears it
    void on_event(const core::ProgressEvent& event);

    void finish() noexcept;
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] std::optional<double> percent() const noexcept { return percent_; }

    // Bar text without the carriage return, exposed for tests
    [[nodiscard]] std::string render() const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::string label_;
    std::optional<double> percent_;
    std::string speed_{core::UNKNOWN_VALUE};
    std::string eta_{core::UNKNOWN_VALUE};
    std::size_t drawn_width_{0};
    bool finished_{false};
};

// Spinner for indeterminate waits
class Spinner {
public:
    Spinner() noexcept = default;

    void update(std::string_view text = {}) noexcept;
    void clear() noexcept;

private:
    std::size_t frame_{0};
};

} // namespace tubeq::cli
