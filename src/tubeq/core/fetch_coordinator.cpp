// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/fetch_coordinator.hpp>
#include <tubeq/core/raw_info.hpp>
#include <tubeq/core/url.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace tubeq::core {

namespace {

// Worker body; runs off the control thread
FetchCompleted fetch_collection(MetadataSource& source, std::uint64_t sequence,
                                const std::string& url) {
    FetchCompleted result{sequence, url, std::nullopt, {}};
    try {
        auto info = source.fetch_metadata(url);
        if (!info) {
            result.error = info.error().detail.empty()
                ? info.error().code.message()
                : info.error().detail;
            return result;
        }
        result.collection = collection_from_info(*info);
    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

} // namespace

FetchCoordinator::FetchCoordinator(MetadataSource& source, Launcher& launcher)
    : FetchCoordinator(source, launcher, Settings{}) {}

FetchCoordinator::FetchCoordinator(MetadataSource& source, Launcher& launcher,
                                   Settings settings, TimeSource now)
    : source_(source)
    , launcher_(launcher)
    , settings_(settings)
    , now_(std::move(now))
    , mailbox_(std::make_shared<Mailbox<FetchCompleted>>())
    , cache_(settings.cache_capacity) {}

//=============================================================================
// Input events
//=============================================================================

void FetchCoordinator::on_url_changed(std::string_view url, bool suppress_fetch) {
    deadline_.reset();
    url_ = strip_url_whitespace(url);
    clear_visible();
    set_status(FetchStatus::idle, {});

    if (!suppress_fetch && !url_.empty() && !held_) {
        deadline_ = now_() + settings_.debounce;
    }
}

void FetchCoordinator::on_fetch_formats(bool force) {
    if (!force && loaded_ && !last_failed_) {
        return;
    }
    fetch_now();
}

void FetchCoordinator::fetch_now() {
    deadline_.reset();
    if (url_.empty() || held_) {
        return;
    }

    if (auto cached = cache_.get(url_)) {
        // Whatever is in flight is now stale
        active_.reset();
        fetching_ = false;
        last_failed_ = false;
        spdlog::debug("[fetch] cache hit for {}", url_);
        apply(*cached);
        set_status(FetchStatus::loaded, "Formats loaded");
        return;
    }

    const auto sequence = ++counter_;
    active_ = sequence;
    fetching_ = true;
    set_status(FetchStatus::fetching, "Fetching formats...");
    spdlog::debug("[fetch] request {} for {}", sequence, url_);

    launcher_.launch([mailbox = mailbox_, &source = source_, sequence, url = url_]() {
        mailbox->post(fetch_collection(source, sequence, url));
    });
}

std::size_t FetchCoordinator::tick() {
    if (deadline_ && now_() >= *deadline_) {
        fetch_now();
    }
    return mailbox_->drain(settings_.max_events_per_tick, [this](FetchCompleted result) {
        deliver(std::move(result));
    });
}

void FetchCoordinator::hold(bool held) noexcept {
    held_ = held;
    if (held_) {
        deadline_.reset();
    }
}

//=============================================================================
// Result delivery
//=============================================================================

void FetchCoordinator::deliver(FetchCompleted result) {
    if (!active_ || result.sequence != *active_) {
        spdlog::debug("[fetch] dropping stale result {} for {}", result.sequence, result.url);
        return;
    }
    active_.reset();
    fetching_ = false;

    if (result.url != url_) {
        // The user kept typing; keep the result for later and chase the new URL
        if (result.collection && !result.collection->empty()) {
            cache_.insert(result.url, *result.collection);
        }
        set_status(FetchStatus::idle, {});
        if (!url_.empty() && !held_) {
            fetch_now();
        }
        return;
    }

    if (!result.collection) {
        last_failed_ = true;
        spdlog::error("[fetch] could not fetch formats: {}", result.error);
        clear_visible();
        set_status(FetchStatus::failed, "Could not fetch formats");
        return;
    }

    last_failed_ = false;
    apply(*result.collection);
    if (result.collection->empty()) {
        set_status(FetchStatus::no_formats, "No formats found");
        return;
    }
    cache_.insert(result.url, *result.collection);
    set_status(FetchStatus::loaded, "Formats loaded");
}

void FetchCoordinator::apply(const FormatCollection& collection) {
    visible_ = collection;
    loaded_ = true;
    if (listener_.applied) listener_.applied(visible_);
}

void FetchCoordinator::clear_visible() {
    visible_ = {};
    loaded_ = false;
    if (listener_.cleared) listener_.cleared();
}

void FetchCoordinator::set_status(FetchStatus status, std::string_view message) {
    status_ = status;
    if (listener_.status) listener_.status(status, message);
}

} // namespace tubeq::core
