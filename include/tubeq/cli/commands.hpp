// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/app_config.hpp>
#include <tubeq/core/options.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tubeq::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class Command {
    none,
    formats,
    download,
    queue,
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::string url;
    std::string queue_file;       // queue <file>
    std::string enqueue_file;     // download ... --enqueue <file>
    std::string config_path;

    core::Mode mode{core::Mode::none};
    std::string container;
    std::string codec;
    std::string format_label;
    bool convert_to_mp4{false};
    std::string output_dir;
    std::string playlist_items;
    bool no_playlist{false};
    core::RawOptions options;

    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;            // First parse problem, empty when fine
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Config from --config, else the default location, else built-in defaults
[[nodiscard]] core::AppConfig load_config(const CliArgs& args);

// List formats for a URL
[[nodiscard]] CliResult formats(const CliArgs& args, const core::AppConfig& config) noexcept;

// Download one URL, or append it to a queue file with --enqueue
[[nodiscard]] CliResult download(const CliArgs& args, const core::AppConfig& config) noexcept;

// Run every item of a queue file
[[nodiscard]] CliResult queue(const CliArgs& args, const core::AppConfig& config) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

// Set from the SIGINT handler, consumed by the event loop
void request_interrupt() noexcept;

} // namespace tubeq::cli
