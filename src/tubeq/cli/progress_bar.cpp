// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace tubeq::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::string_view text) noexcept {
    std::cout << "\r" << SPINNER_FRAMES[frame_ % 4] << " " << text << std::flush;
    ++frame_;
}

void Spinner::clear() noexcept {
    std::cout << "\r" << std::string(60, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::string_view label)
    : label_(label) {}

void ProgressBar::on_event(const core::ProgressEvent& event) {
    std::visit(overloaded{
        [this](const core::Downloading& d) {
            if (d.percent) percent_ = std::clamp(*d.percent, 0.0, 100.0);
            speed_ = d.speed.empty() ? std::string(core::UNKNOWN_VALUE) : d.speed;
            // Keep the last known ETA through blank updates
            if (!d.eta.empty() && d.eta != core::UNKNOWN_VALUE) eta_ = d.eta;
            finished_ = false;
        },
        [this](const core::ItemStarted& item) {
            // Previous item keeps its own line
            if (drawn_width_ > 0) {
                std::cout << std::endl;
                drawn_width_ = 0;
            }
            label_ = item.label;
            percent_.reset();
            eta_ = std::string(core::UNKNOWN_VALUE);
        },
        [this](const core::Finished&) {
            percent_ = 100.0;
        },
        [this](const core::Cancelled&) {
            clear();
            percent_.reset();
        },
    }, event);

    if (std::holds_alternative<core::Cancelled>(event)) return;

    auto line = render();
    const auto pad = drawn_width_ > line.size() ? drawn_width_ - line.size() : 0;
    drawn_width_ = line.size();
    std::cout << "\r" << line << std::string(pad, ' ') << std::flush;
}

std::string ProgressBar::render() const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    if (percent_) {
        line += std::format("{} {:5.1f}%", render_bar(*percent_), *percent_);
    } else {
        line += std::format("{} {:>6}", render_bar(0.0), core::UNKNOWN_VALUE);
    }
    line += std::format(" @ {} ETA {}", speed_, eta_);
    return line;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    if (drawn_width_ > 0) {
        std::cout << std::endl;
    }
    drawn_width_ = 0;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(std::max<std::size_t>(drawn_width_, 50), ' ') << "\r" << std::flush;
    drawn_width_ = 0;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += ']';
    return bar;
}

} // namespace tubeq::cli
