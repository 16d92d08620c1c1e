// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/discovery/PushSource.h"

#include <utility>

namespace linkwatch::discovery {

bool PushSource::open() {
    queue_.reopen();
    open_.store(true);
    return true;
}

void PushSource::close() {
    open_.store(false);
    queue_.close();
}

bool PushSource::poll(const ObservationHandler& handler, std::chrono::milliseconds max_wait) {
    queue_.drain(handler, max_wait);
    return open_.load();
}

SourceStats PushSource::stats() const {
    SourceStats s;
    s.observations = observations_.load();
    s.connected = open_.load();
    return s;
}

bool PushSource::push(RawObservation obs) {
    if (!open_.load()) return false;
    if (!queue_.push(std::move(obs))) return false;
    observations_.fetch_add(1);
    return true;
}

} // namespace linkwatch::discovery
