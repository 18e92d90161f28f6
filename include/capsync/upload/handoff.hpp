#pragma once

#include <cstddef>
#include <deque>
#include <mutex>

#include "capsync/core/errors.hpp"
#include "capsync/core/models.hpp"
#include "capsync/upload/upload_queue.hpp"

namespace capsync::upload {

// Capture -> upload adapter. The capture side hands every finalized chunk to
// offer() and never blocks; chunks the queue cannot take yet are held in
// order and acknowledged later by pump(). Nothing is ever dropped.
class ChunkHandoff {
public:
    explicit ChunkHandoff(UploadQueue& queue);

    // True when the queue accepted the chunk right away.
    bool offer(const capsync::core::ChunkDescriptor& d);

    // Retries held chunks in order; returns how many the queue accepted.
    u32 pump();

    [[nodiscard]] size_t backlog() const;
    [[nodiscard]] capsync::core::Status last_error() const;

private:
    u32 drain_locked();

    UploadQueue& queue_;
    mutable std::mutex mutex_;
    std::deque<capsync::core::ChunkDescriptor> backlog_;
    capsync::core::Status last_error_{};
};

} // namespace capsync::upload
