// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "linkwatch/discovery/ObservationQueue.h"

#include <atomic>

namespace linkwatch::discovery {

/**
 * @brief Source fed in-process by the agent channel.
 *
 * Agents that report raw interface status or counters hand them to push();
 * the pipeline drains them like any other backend.
 */
class PushSource final : public ObservationSource {
public:
    explicit PushSource(std::size_t capacity = 4096) : queue_(capacity) {}

    const char* name() const noexcept override { return "push"; }
    bool open() override;
    void close() override;
    bool poll(const ObservationHandler& handler, std::chrono::milliseconds max_wait) override;
    SourceStats stats() const override;

    /// @return false when the source is closed.
    bool push(RawObservation obs);

private:
    ObservationQueue queue_;
    std::atomic<bool> open_{false};
    std::atomic<std::uint64_t> observations_{0};
};

} // namespace linkwatch::discovery
