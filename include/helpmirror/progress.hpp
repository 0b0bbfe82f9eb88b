#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace helpmirror {

// Per-file transfer status. Byte counts are -1 when unknown or not started.
struct FileStatus {
    std::string filename;
    int percent{0};
    int64_t bytesDownloaded{-1};
    int64_t bytesToDownload{-1};
};

// Notification sinks handed to syncBooks. Either may be empty. They can be
// invoked from whatever thread runs the sync; per file the order is start,
// transfer ticks, completion.
struct SyncCallbacks {
    std::function<void(int)> progress;                    // aggregate percent, once per package
    std::function<void(const FileStatus&)> fileStatus;
};

// Worker -> presentation event channel.
enum class SyncEventKind { Progress, FileStatus, Finished, Failed };

struct SyncEvent {
    SyncEventKind kind{SyncEventKind::Progress};
    int percent{0};
    FileStatus file;
    std::string error; // only for Failed
};

class SyncEventQueue {
public:
    void push(const SyncEvent& ev) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(ev);
    }

    std::optional<SyncEvent> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        SyncEvent ev = queue_.front();
        queue_.pop();
        return ev;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::queue<SyncEvent> empty;
        std::swap(queue_, empty);
    }

private:
    std::mutex mutex_;
    std::queue<SyncEvent> queue_;
};

inline SyncCallbacks makeQueueingCallbacks(SyncEventQueue& queue) {
    SyncCallbacks cb;
    cb.progress = [&queue](int percent) {
        SyncEvent ev;
        ev.kind = SyncEventKind::Progress;
        ev.percent = percent;
        queue.push(ev);
    };
    cb.fileStatus = [&queue](const FileStatus& fs) {
        SyncEvent ev;
        ev.kind = SyncEventKind::FileStatus;
        ev.percent = fs.percent;
        ev.file = fs;
        queue.push(ev);
    };
    return cb;
}

} // namespace helpmirror
