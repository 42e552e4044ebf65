// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/cli/commands.hpp>
#include <tubeq/cli/progress_bar.hpp>
#include <tubeq/backend/ytdlp_client.hpp>
#include <tubeq/core/controller.hpp>
#include <tubeq/core/error.hpp>
#include <tubeq/core/launcher.hpp>
#include <tubeq/core/queue_file.hpp>
#include <tubeq/version.hpp>
#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>
#include <spdlog/spdlog.h>
#include <atomic>
#include <format>
#include <functional>
#include <iostream>
#include <optional>

using namespace tubeq::core;

namespace tubeq::cli {

namespace {

std::atomic<bool> g_interrupted{false};

// Pump the controller on the Qt event loop until `done` holds.
// Returns false if interrupted while `cancel_on_interrupt` is off.
bool run_until(Controller& controller, const AppConfig& config,
               const std::function<bool()>& done, bool cancel_on_interrupt) {
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool interrupted = false;

    QObject::connect(&timer, &QTimer::timeout, &loop, [&] {
        if (g_interrupted.exchange(false)) {
            if (!cancel_on_interrupt) {
                interrupted = true;
                loop.quit();
                return;
            }
            std::cout << "\nCancelling..." << std::endl;
            controller.cancel();
        }
        controller.tick();
        if (done()) {
            loop.quit();
            return;
        }
        // Re-tick immediately while a batch was cut short
        timer.start(controller.has_pending() ? 0 : static_cast<int>(config.poll_interval.count()));
    });

    timer.start(0);
    loop.exec();
    return !interrupted;
}

std::string take_value(int argc, char* argv[], int& i, std::string_view flag, std::string& error) {
    if (i + 1 < argc) {
        return argv[++i];
    }
    if (error.empty()) {
        error = std::format("{} needs a value", flag);
    }
    return {};
}

void apply_default_selection(const CliArgs& args, Mode& mode, std::string& container, std::string& codec) {
    mode = args.mode == Mode::none ? Mode::video : args.mode;
    container = args.container;
    codec = args.codec;
    if (container.empty()) {
        container = mode == Mode::audio ? "m4a" : "mp4";
    }
    if (codec.empty() && mode == Mode::video) {
        codec = "avc1";
    }
}

// Fetch the formats for args.url; false when the fetch failed or was interrupted
bool fetch_formats(Controller& controller, const AppConfig& config, const CliArgs& args) {
    controller.on_url_changed(args.url, true);
    controller.on_fetch_formats(true);

    Spinner spinner;
    const bool completed = run_until(controller, config, [&] {
        if (!args.quiet) spinner.update("Fetching formats");
        return !controller.fetcher().is_fetching();
    }, false);
    if (!args.quiet) spinner.clear();

    if (!completed) {
        std::cout << "Interrupted" << std::endl;
        return false;
    }
    switch (controller.fetcher().status()) {
        case FetchStatus::loaded:
            return true;
        case FetchStatus::no_formats:
            std::cout << "Error: No formats found" << std::endl;
            return false;
        default:
            std::cout << "Error: Could not fetch formats" << std::endl;
            return false;
    }
}

void print_labels(std::string_view heading, const FormatList& list) {
    std::cout << heading << ":\n";
    if (list.empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto& entry : list) {
        std::cout << "  " << entry.label << "\n";
    }
}

Controller::Listener console_listener(const CliArgs& args, ProgressBar& bar,
                                      std::optional<Outcome>& outcome) {
    Controller::Listener listener;
    listener.status = [&args](std::string_view text) {
        if (!args.quiet && !text.empty()) spdlog::info("{}", text);
    };
    listener.progress = [&args, &bar](const ProgressEvent& event) {
        if (!args.quiet) bar.on_event(event);
    };
    listener.finished = [&bar, &outcome, &args](Outcome o) {
        if (!args.quiet) bar.finish();
        outcome = o;
    };
    return listener;
}

int exit_code(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::success:   return 0;
        case Outcome::failed:    return 1;
        case Outcome::cancelled: return 130;
    }
    return 1;
}

} // namespace

void request_interrupt() noexcept {
    g_interrupted.store(true);
}

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--config") {
            args.config_path = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "-m" || arg == "--mode") {
            auto value = take_value(argc, argv, i, arg, args.error);
            args.mode = parse_mode(value);
            if (args.mode == Mode::none && args.error.empty()) {
                args.error = std::format("unknown mode '{}'", value);
            }
        } else if (arg == "-c" || arg == "--container") {
            args.container = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--codec") {
            args.codec = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "-f" || arg == "--format") {
            args.format_label = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--convert-mp4") {
            args.convert_to_mp4 = true;
        } else if (arg == "-d" || arg == "--directory") {
            args.output_dir = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "-o" || arg == "--output") {
            args.options.custom_filename = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--items") {
            args.playlist_items = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--no-playlist") {
            args.no_playlist = true;
        } else if (arg == "--timeout") {
            args.options.network_timeout = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--retries") {
            args.options.network_retries = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--retry-sleep") {
            args.options.retry_backoff = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--subs") {
            args.options.write_subtitles = true;
            args.options.subtitle_languages = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--embed-subs") {
            args.options.embed_subtitles = true;
        } else if (arg == "--audio-lang") {
            args.options.audio_language = take_value(argc, argv, i, arg, args.error);
        } else if (arg == "--enqueue") {
            args.enqueue_file = take_value(argc, argv, i, arg, args.error);
        } else if (arg.starts_with("-")) {
            if (args.error.empty()) args.error = std::format("unknown option '{}'", arg);
        } else if (args.command == Command::none) {
            if (arg == "formats") {
                args.command = Command::formats;
            } else if (arg == "download") {
                args.command = Command::download;
            } else if (arg == "queue") {
                args.command = Command::queue;
            } else if (args.error.empty()) {
                args.error = std::format("unknown command '{}'", arg);
            }
        } else if (args.command == Command::queue && args.queue_file.empty()) {
            args.queue_file = arg;
        } else if (args.url.empty()) {
            args.url = arg;
        }
    }

    return args;
}

AppConfig load_config(const CliArgs& args) {
    const auto path = args.config_path.empty()
        ? AppConfig::default_path()
        : std::filesystem::path(args.config_path);

    auto loaded = AppConfig::load(path);
    if (loaded) {
        return *loaded;
    }
    // A missing default file is normal; anything else is worth a warning
    if (!args.config_path.empty() || loaded.error() != Errc::file_not_found) {
        spdlog::warn("[config] {}: {}; using defaults", path.string(), loaded.error().message());
    }
    return AppConfig{};
}

//=============================================================================
// Commands
//=============================================================================

CliResult formats(const CliArgs& args, const AppConfig& config) noexcept {
    if (args.url.empty()) {
        std::cout << "Error: No URL specified" << std::endl;
        return std::unexpected(make_error_code(Errc::missing_url));
    }

    backend::YtDlpClient client({.program = config.ytdlp_path});
    ThreadLauncher launcher;
    Controller controller(client, client, launcher, config);

    if (!fetch_formats(controller, config, args)) {
        return std::unexpected(make_error_code(Errc::fetch_failed));
    }

    const auto& collection = controller.fetcher().visible();
    if (!collection.preview_title.empty()) {
        std::cout << "Title: " << collection.preview_title << "\n";
    }
    std::cout << "Playlist: " << (controller.playlist_mode() ? "yes" : "no") << "\n";
    if (!collection.audio_languages.empty()) {
        std::cout << "Audio languages:";
        for (const auto& lang : collection.audio_languages) {
            std::cout << " " << lang;
        }
        std::cout << "\n";
    }

    if (args.mode == Mode::none) {
        print_labels("Video formats", collection.video);
        print_labels("Audio formats", collection.audio);
        return 0;
    }

    Mode mode{};
    std::string container;
    std::string codec;
    apply_default_selection(args, mode, container, codec);
    controller.apply_mode_formats(mode, container, codec);
    if (controller.codec_fallback_used()) {
        std::cout << "No " << codec << " formats in " << container << "; showing any codec\n";
    }
    print_labels(std::format("Formats for {} {}{}{}", to_string(mode), container,
                             codec.empty() ? "" : " ", codec),
                 controller.formats());
    return 0;
}

CliResult download(const CliArgs& args, const AppConfig& config) noexcept {
    if (args.url.empty()) {
        std::cout << "Error: No URL specified" << std::endl;
        return std::unexpected(make_error_code(Errc::missing_url));
    }

    backend::YtDlpClient client({.program = config.ytdlp_path});
    ThreadLauncher launcher;
    Controller controller(client, client, launcher, config);

    ProgressBar bar;
    std::optional<Outcome> outcome;
    controller.listener(console_listener(args, bar, outcome));

    if (!fetch_formats(controller, config, args)) {
        return std::unexpected(make_error_code(Errc::fetch_failed));
    }

    Mode mode{};
    std::string container;
    std::string codec;
    apply_default_selection(args, mode, container, codec);
    controller.apply_mode_formats(mode, container, codec);

    if (!args.format_label.empty()) {
        if (auto ec = controller.select_format(args.format_label)) {
            std::cout << "Error: format '" << args.format_label << "' is not offered\n";
            print_labels("Available", controller.formats());
            return std::unexpected(ec);
        }
    }
    controller.set_convert_to_mp4(args.convert_to_mp4);
    if (!args.output_dir.empty()) {
        controller.set_output_dir(args.output_dir);
    }
    controller.set_playlist_enabled(!args.no_playlist);
    controller.set_playlist_items(args.playlist_items);
    controller.set_options(args.options);

    if (!args.enqueue_file.empty()) {
        std::vector<QueueItem> items;
        auto loaded = load_queue_file(args.enqueue_file);
        if (loaded) {
            items = std::move(*loaded);
        } else if (loaded.error() != Errc::file_not_found) {
            std::cout << "Error: " << args.enqueue_file << ": " << loaded.error().message() << std::endl;
            return std::unexpected(loaded.error());
        }
        if (auto ec = controller.queue().replace(std::move(items))) {
            return std::unexpected(ec);
        }
        if (auto ec = controller.add_to_queue()) {
            std::cout << "Error: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
        if (auto ec = save_queue_file(args.enqueue_file, controller.queue().items())) {
            std::cout << "Error: " << args.enqueue_file << ": " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
        std::cout << "Queued " << controller.selected_label() << " ("
                  << controller.queue().items().size() << " item(s) in "
                  << args.enqueue_file << ")" << std::endl;
        return 0;
    }

    if (!args.quiet) {
        bar.label(controller.fetcher().visible().preview_title);
    }
    if (auto ec = controller.start_single()) {
        std::cout << "Error: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    run_until(controller, config, [&] { return outcome.has_value(); }, true);
    return exit_code(*outcome);
}

CliResult queue(const CliArgs& args, const AppConfig& config) noexcept {
    if (args.queue_file.empty()) {
        std::cout << "Error: No queue file specified" << std::endl;
        return std::unexpected(make_error_code(Errc::file_not_found));
    }

    auto items = load_queue_file(args.queue_file);
    if (!items) {
        std::cout << "Error: " << args.queue_file << ": " << items.error().message() << std::endl;
        return std::unexpected(items.error());
    }

    backend::YtDlpClient client({.program = config.ytdlp_path});
    ThreadLauncher launcher;
    Controller controller(client, client, launcher, config);

    ProgressBar bar;
    std::optional<Outcome> outcome;
    controller.listener(console_listener(args, bar, outcome));

    if (auto ec = controller.queue().replace(std::move(*items))) {
        return std::unexpected(ec);
    }

    auto started = controller.start_queue();
    if (!started) {
        std::cout << "Error: queue item " << started.error().index << ": "
                  << started.error().code().message() << std::endl;
        return std::unexpected(started.error().code());
    }
    if (*started == QueueStartStatus::empty) {
        std::cout << "Queue is empty" << std::endl;
        return 0;
    }

    run_until(controller, config, [&] { return outcome.has_value(); }, true);
    return exit_code(*outcome);
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "tubeq " << program_name << " - Media download queue for yt-dlp\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " formats <URL> [-m MODE -c CONTAINER --codec CODEC]\n";
    std::cout << "  " << program_name << " download <URL> [OPTIONS] [--enqueue FILE]\n";
    std::cout << "  " << program_name << " queue <FILE>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "      --config <FILE>     Read settings from FILE\n";
    std::cout << "  -m, --mode <MODE>       video or audio (default: video)\n";
    std::cout << "  -c, --container <EXT>   mp4, webm, m4a, mp3, opus, wav, flac\n";
    std::cout << "      --codec <CODEC>     avc1 or av01 (video only)\n";
    std::cout << "  -f, --format <LABEL>    Format label as listed by 'formats'\n";
    std::cout << "      --convert-mp4       Convert webm output to mp4\n";
    std::cout << "  -d, --directory <DIR>   Save to specified directory\n";
    std::cout << "  -o, --output <NAME>     Custom file name (single videos only)\n";
    std::cout << "      --items <LIST>      Playlist items, e.g. 1-3,7,10-\n";
    std::cout << "      --no-playlist       Download only the linked video\n";
    std::cout << "      --timeout <S>       Network timeout in seconds\n";
    std::cout << "      --retries <N>       Network retries\n";
    std::cout << "      --retry-sleep <S>   Seconds between retries\n";
    std::cout << "      --subs <LANGS>      Write subtitles, e.g. en,de\n";
    std::cout << "      --embed-subs        Embed written subtitles\n";
    std::cout << "      --audio-lang <L>    Preferred audio language\n";
    std::cout << "      --enqueue <FILE>    Append to a queue file instead of downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " formats https://youtu.be/abc -m video -c mp4 --codec avc1\n";
    std::cout << "  " << program_name << " download https://youtu.be/abc -m audio -c mp3\n";
    std::cout << "  " << program_name << " queue ~/queue.json\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
    std::cout << "Copyright changcheng967 2026\n";
}

void print_version() noexcept {
    std::cout << "tubeq " << tubeq::version.to_string() << std::endl;
    std::cout << "Created by changcheng967\n";
    std::cout << "\n";
    std::cout << "Built with C++23, Qt 6, nlohmann_json, spdlog\n";
}

} // namespace tubeq::cli
