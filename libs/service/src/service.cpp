#include "modkeeper/service.h"
#include "modkeeper/error.h"
#include "modkeeper/log.h"

#include <string_view>
#include <utility>

namespace modkeeper::service {

static const char* scan_topic(std::string_view phase) {
    if (phase == "prune_start") return topic::prune_start;
    if (phase == "prune") return topic::prune_progress;
    if (phase == "prune_complete") return topic::prune_complete;
    if (phase == "prune_error") return topic::prune_error;
    return topic::scan_progress;
}

static const char* preset_topic(std::string_view phase) {
    if (phase == "start") return topic::preset_apply_start;
    if (phase == "complete") return topic::preset_apply_complete;
    return topic::preset_apply_progress;
}

LibraryService::LibraryService(std::shared_ptr<catalog::Catalog> cat, NotifyFunc notify)
    : cat_(std::move(cat)), notify_(std::move(notify)) {
    if (!cat_) throw Error(ErrorKind::InvalidInput, "library service needs a catalog");
}

LibraryService::~LibraryService() {
    wait();
}

void LibraryService::claim_worker() {
    if (running_) throw Error(ErrorKind::Conflict, "another library operation is already running");
    // The previous worker has cleared running_ and touches nothing else.
    if (worker_.joinable()) worker_.join();
    running_ = true;
}

void LibraryService::start_scan(const library::ScanOptions& opts) {
    std::lock_guard lock(mutex_);
    claim_worker();
    worker_ = std::jthread([this, opts] { run_scan(opts); });
}

void LibraryService::start_preset_apply(int64_t preset_id) {
    std::lock_guard lock(mutex_);
    claim_worker();
    worker_ = std::jthread([this, preset_id] { run_preset_apply(preset_id); });
}

void LibraryService::wait() {
    std::jthread worker;
    {
        std::lock_guard lock(mutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) worker.join();
}

bool LibraryService::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

void LibraryService::emit(const Notification& n) const {
    if (!notify_) return;
    try {
        notify_(n);
    } catch (const std::exception& e) {
        LOGW("service: notification handler for", n.topic, "failed:", e.what());
    }
}

void LibraryService::run_scan(library::ScanOptions opts) {
    bool prune_failed = false;
    try {
        auto result = library::scan(*cat_, opts, [&](const library::ScanProgress& p) {
            if (p.phase == "prune_error") prune_failed = true;
            emit({.topic = scan_topic(p.phase), .processed = p.processed, .total = p.total,
                  .current = p.current_path, .message = p.message});
        });
        LOGI("service:", result.summary());
        emit({.topic = topic::scan_complete, .processed = result.processed, .total = result.total,
              .current = "", .message = result.summary()});
    } catch (const std::exception& e) {
        LOGE("service: scan failed:", e.what());
        // A prune failure has already been reported on its own topic.
        if (!prune_failed)
            emit({.topic = topic::scan_error, .processed = 0, .total = 0, .current = "", .message = e.what()});
    }
    std::lock_guard lock(mutex_);
    running_ = false;
}

void LibraryService::run_preset_apply(int64_t preset_id) {
    try {
        auto result = library::apply_preset(*cat_, preset_id, [&](const library::PresetProgress& p) {
            emit({.topic = preset_topic(p.phase), .processed = p.processed, .total = p.total,
                  .current = p.current_id ? std::to_string(p.current_id) : std::string(),
                  .message = p.message});
        });
        LOGI("service:", result.summary());
    } catch (const std::exception& e) {
        LOGE("service: preset", preset_id, "failed:", e.what());
        emit({.topic = topic::preset_apply_error, .processed = 0, .total = 0,
              .current = std::to_string(preset_id), .message = e.what()});
    }
    std::lock_guard lock(mutex_);
    running_ = false;
}

} // namespace modkeeper::service
