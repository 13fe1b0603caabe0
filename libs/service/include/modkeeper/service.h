#pragma once

#include "modkeeper/catalog.h"
#include "modkeeper/library.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace modkeeper::service {

// Notification topics emitted by long operations.
namespace topic {
inline constexpr const char* scan_progress = "scan://progress";
inline constexpr const char* scan_complete = "scan://complete";
inline constexpr const char* scan_error = "scan://error";
inline constexpr const char* prune_start = "prune://start";
inline constexpr const char* prune_progress = "prune://progress";
inline constexpr const char* prune_complete = "prune://complete";
inline constexpr const char* prune_error = "prune://error";
inline constexpr const char* preset_apply_start = "preset://apply_start";
inline constexpr const char* preset_apply_progress = "preset://apply_progress";
inline constexpr const char* preset_apply_complete = "preset://apply_complete";
inline constexpr const char* preset_apply_error = "preset://apply_error";
} // namespace topic

struct Notification {
    std::string topic;
    int processed = 0;
    int total = 0;
    std::string current; // path or asset id of the item being worked on
    std::string message;
};

// NotifyFunc is called on the worker thread.
using NotifyFunc = std::function<void(const Notification&)>;

// LibraryService runs scans and preset applications on a background thread
// and reports their progress as notifications.
//
// Only one long operation runs at a time; starting another while the worker
// is busy throws ErrorKind::Conflict. Notification sinks that throw are
// logged and otherwise ignored. The destructor waits for the worker.
class LibraryService {
public:
    LibraryService(std::shared_ptr<catalog::Catalog> cat, NotifyFunc notify = nullptr);
    ~LibraryService();

    LibraryService(const LibraryService&) = delete;
    LibraryService& operator=(const LibraryService&) = delete;

    // StartScan begins a scan/reconcile of the mods folder and returns at once.
    void start_scan(const library::ScanOptions& opts);

    // StartPresetApply begins applying a preset and returns at once.
    void start_preset_apply(int64_t preset_id);

    // Wait blocks until the current operation (if any) has finished.
    void wait();

    bool is_running() const;

private:
    void claim_worker();
    void emit(const Notification& n) const;
    void run_scan(library::ScanOptions opts);
    void run_preset_apply(int64_t preset_id);

    std::shared_ptr<catalog::Catalog> cat_;
    NotifyFunc notify_;

    mutable std::mutex mutex_; // guards running_ and worker_
    bool running_ = false;
    std::jthread worker_;
};

} // namespace modkeeper::service
