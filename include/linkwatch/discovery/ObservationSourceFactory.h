// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "linkwatch/config/Config.h"
#include "linkwatch/discovery/Observation.h"

namespace linkwatch::discovery {

class IObservationSourceFactory {
public:
    virtual ~IObservationSourceFactory() = default;
    virtual ObservationSourcePtr create(const Config& cfg) const = 0;
};

/**
 * @brief Picks the backend named by Config::discovery_mode.
 *
 * DiscoveryMode::None yields an empty pointer.
 */
class DefaultObservationSourceFactory : public IObservationSourceFactory {
public:
    ObservationSourcePtr create(const Config& cfg) const override;
};

// Create the configured source through the default factory (or an override, if set).
ObservationSourcePtr create_observation_source(const Config& cfg);

const IObservationSourceFactory& default_observation_source_factory();

// For tests: override the factory used by create_observation_source.
void set_observation_source_factory_for_tests(const IObservationSourceFactory* factory);

} // namespace linkwatch::discovery
