// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/backend/ytdlp_client.hpp>
#include <tubeq/backend/ytdlp_command.hpp>
#include <tubeq/core/playlist_range.hpp>
#include <QByteArray>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <spdlog/spdlog.h>
#include <format>

namespace tubeq::backend {

namespace {

QStringList to_qt(const std::vector<std::string>& args) {
    QStringList list;
    list.reserve(static_cast<qsizetype>(args.size()));
    for (const auto& arg : args) {
        list << QString::fromStdString(arg);
    }
    return list;
}

int to_ms(std::chrono::milliseconds ms) noexcept {
    return static_cast<int>(ms.count());
}

// Last non-empty line of stderr, usually yt-dlp's "ERROR: ..." summary
std::string last_error_line(const QByteArray& text) {
    const auto lines = QString::fromUtf8(text).split('\n', Qt::SkipEmptyParts);
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        auto trimmed = it->trimmed();
        if (!trimmed.isEmpty()) return trimmed.toStdString();
    }
    return {};
}

void stop_process(QProcess& process, std::chrono::milliseconds grace) {
    process.terminate();
    if (!process.waitForFinished(to_ms(grace))) {
        process.kill();
        process.waitForFinished(1000);
    }
}

// Hand every complete line in `buffer` to `fn`, keeping the partial tail
template <typename Fn>
void consume_lines(QByteArray& buffer, Fn&& fn) {
    qsizetype newline = 0;
    while ((newline = buffer.indexOf('\n')) >= 0) {
        fn(buffer.left(newline).toStdString());
        buffer.remove(0, newline + 1);
    }
}

} // namespace

std::expected<core::RawInfo, core::FetchError> YtDlpClient::fetch_metadata(const std::string& url) {
    QProcess process;
    process.setProgram(QString::fromStdString(settings_.program));
    process.setArguments(to_qt(metadata_arguments(url)));

    spdlog::debug("[fetch] {} {}", settings_.program, url);
    process.start();
    if (!process.waitForStarted(to_ms(settings_.start_timeout))) {
        return std::unexpected(core::FetchError{
            make_error_code(core::Errc::backend_unavailable),
            process.errorString().toStdString()});
    }
    if (!process.waitForFinished(to_ms(settings_.metadata_timeout))) {
        stop_process(process, settings_.terminate_grace);
        return std::unexpected(core::FetchError{
            make_error_code(core::Errc::fetch_failed), "metadata request timed out"});
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        auto detail = last_error_line(process.readAllStandardError());
        return std::unexpected(core::FetchError{
            make_error_code(core::Errc::fetch_failed),
            detail.empty() ? std::format("yt-dlp exited with code {}", process.exitCode()) : detail});
    }

    const auto output = process.readAllStandardOutput();
    auto info = nlohmann::json::parse(output.constData(), output.constData() + output.size(),
                                      nullptr, false);
    if (info.is_discarded() || !info.is_object()) {
        return std::unexpected(core::FetchError{
            make_error_code(core::Errc::metadata_parse_error), "yt-dlp returned malformed JSON"});
    }
    return info;
}

core::Outcome YtDlpClient::run_download(const core::DownloadRequest& request,
                                        std::stop_token stop,
                                        const core::ProgressSink& progress) {
    const auto ranges = request.playlist_items
        ? core::PlaylistRangeSet::parse(*request.playlist_items)
        : core::PlaylistRangeSet{};

    QProcess process;
    process.setProgram(QString::fromStdString(settings_.program));
    process.setArguments(to_qt(download_arguments(request)));
    process.setProcessChannelMode(QProcess::MergedChannels);

    spdlog::info("[download] start {}", request.url);
    const auto started = std::chrono::steady_clock::now();
    process.start();
    if (!process.waitForStarted(to_ms(settings_.start_timeout))) {
        spdlog::error("[download] cannot run {}: {}", settings_.program,
                      process.errorString().toStdString());
        return core::Outcome::failed;
    }

    std::string last_error;
    const auto handle_line = [&](const std::string& line) {
        if (auto event = parse_output_line(line, ranges)) {
            progress(std::move(*event));
        } else if (line.starts_with("ERROR:")) {
            last_error = line;
            spdlog::error("[download] {}", line);
        } else if (!line.empty()) {
            spdlog::debug("[download] {}", line);
        }
    };

    QByteArray buffer;
    while (process.state() != QProcess::NotRunning) {
        if (stop.stop_requested()) {
            stop_process(process, settings_.terminate_grace);
            progress(core::Cancelled{});
            spdlog::info("[download] cancelled {}", request.url);
            return core::Outcome::cancelled;
        }
        process.waitForReadyRead(to_ms(settings_.poll_interval));
        buffer += process.readAll();
        consume_lines(buffer, handle_line);
    }

    buffer += process.readAll();
    consume_lines(buffer, handle_line);
    if (!buffer.isEmpty()) {
        handle_line(buffer.toStdString());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("[download] elapsed {}", core::format_duration(elapsed));

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        spdlog::error("[download] yt-dlp exited with code {}{}", process.exitCode(),
                      last_error.empty() ? std::string{} : ": " + last_error);
        return core::Outcome::failed;
    }
    spdlog::info("[download] complete {}", request.url);
    return core::Outcome::success;
}

std::string YtDlpClient::version() const {
    QProcess process;
    process.start(QString::fromStdString(settings_.program), QStringList{"--version"});
    if (!process.waitForStarted(to_ms(settings_.start_timeout)) ||
        !process.waitForFinished(to_ms(settings_.start_timeout))) {
        return {};
    }
    return QString::fromUtf8(process.readAllStandardOutput()).trimmed().toStdString();
}

} // namespace tubeq::backend
