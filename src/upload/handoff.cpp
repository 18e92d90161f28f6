#include "capsync/upload/handoff.hpp"

#include <spdlog/spdlog.h>

namespace capsync::upload {

using namespace capsync::core;

ChunkHandoff::ChunkHandoff(UploadQueue& queue) : queue_(queue) {}

bool ChunkHandoff::offer(const ChunkDescriptor& d) {
    std::lock_guard<std::mutex> lock(mutex_);
    backlog_.push_back(d);
    drain_locked();
    // d is last in line, so it went through only if everything did
    const bool accepted = backlog_.empty();
    if (!accepted) {
        spdlog::debug("chunk {}/{} held back ({} waiting)", d.recording_id, d.chunk_id, backlog_.size());
    }
    return accepted;
}

u32 ChunkHandoff::pump() {
    std::lock_guard<std::mutex> lock(mutex_);
    return drain_locked();
}

u32 ChunkHandoff::drain_locked() {
    u32 accepted = 0;
    while (!backlog_.empty()) {
        const ChunkDescriptor& d = backlog_.front();
        const Status s = queue_.enqueue(d);
        if (!is_ok(s)) {
            last_error_ = s;
            if (s.code != StatusCode::Busy) {
                spdlog::warn("chunk {}/{} not accepted for upload: {}", d.recording_id, d.chunk_id, status_describe(s));
            }
            break;
        }
        backlog_.pop_front();
        ++accepted;
    }
    return accepted;
}

size_t ChunkHandoff::backlog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backlog_.size();
}

Status ChunkHandoff::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

} // namespace capsync::upload
