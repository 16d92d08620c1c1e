// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file ObservationPipeline.h
 * @brief Drives discovery sources and routes their observations to the store.
 *
 * Each source gets one worker thread that loops on poll(). Observations are
 * resolved to a link (interface name via the store's index, or link id as
 * delivered), counter samples are turned into rates by the normalizer and
 * the result is applied to the store, which runs the state machine and
 * publishes.
 */

#include "linkwatch/discovery/Observation.h"
#include "linkwatch/state/ObservationNormalizer.h"
#include "linkwatch/topology/TopologyStore.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace linkwatch::app {

struct PipelineStats {
    std::uint64_t observations{0};   ///< Raw observations received from all sources.
    std::uint64_t unresolved{0};     ///< Keys that map to no known link.
    std::uint64_t status_applied{0};
    std::uint64_t metrics_applied{0};
    std::uint64_t rejected{0};       ///< Store refused the mutation.
};

struct NamedSourceStats {
    std::string name;
    discovery::SourceStats stats;
};

class ObservationPipeline {
public:
    ObservationPipeline(TopologyStore& store, state::ObservationNormalizer& normalizer);
    ~ObservationPipeline();

    ObservationPipeline(const ObservationPipeline&) = delete;
    ObservationPipeline& operator=(const ObservationPipeline&) = delete;

    /**
     * @brief Take ownership of @p source; must be called before start().
     *
     * @return Non-owning pointer to the stored source (nullptr if empty).
     */
    discovery::ObservationSource* add_source(discovery::ObservationSourcePtr source);

    /**
     * @brief Open every source and start its worker.
     *
     * A source that fails to open is logged and skipped.
     *
     * @return Number of sources running.
     */
    std::size_t start();

    /// Close every source and join the workers.
    void stop();

    /**
     * @brief Resolve and apply one observation on the caller's thread.
     *
     * @param source Tag recorded on any resulting event.
     */
    void handle(const discovery::RawObservation& obs, const std::string& source);

    PipelineStats stats() const;
    std::vector<NamedSourceStats> source_stats() const;

    void set_poll_wait(std::chrono::milliseconds wait) { poll_wait_ = wait; }

private:
    struct Slot {
        discovery::ObservationSourcePtr source;
        std::thread worker;
        bool running{false};
    };

    void worker_loop(Slot& slot);
    std::optional<std::string> resolve(const std::string& key, discovery::KeyKind kind);

    TopologyStore& store_;
    state::ObservationNormalizer& normalizer_;
    std::vector<std::unique_ptr<Slot>> slots_;
    std::atomic<bool> running_{false};
    std::chrono::milliseconds poll_wait_{200};

    std::atomic<std::uint64_t> observations_{0};
    std::atomic<std::uint64_t> unresolved_{0};
    std::atomic<std::uint64_t> status_applied_{0};
    std::atomic<std::uint64_t> metrics_applied_{0};
    std::atomic<std::uint64_t> rejected_{0};
};

} // namespace linkwatch::app
