// SPDX-License-Identifier: BSD-2-Clause

#include "linkwatch/discovery/ObservationSourceFactory.h"

#include "linkwatch/log/Log.h"
#include "linkwatch/sources/relay/RelayFlowSource.h"
#include "linkwatch/sources/sysfs/SysfsNetlinkSource.h"

namespace linkwatch::discovery {
namespace {
const IObservationSourceFactory* g_factory_override = nullptr;
}

ObservationSourcePtr DefaultObservationSourceFactory::create(const Config& cfg) const {
    switch (cfg.discovery_mode) {
    case DiscoveryMode::Sysfs: {
        auto source = std::make_unique<SysfsNetlinkSource>();
        source->configure_from_config(cfg);
        return source;
    }
    case DiscoveryMode::Hubble: {
        auto source = std::make_unique<RelayFlowSource>();
        source->configure_from_config(cfg);
        return source;
    }
    case DiscoveryMode::None:
        LWLOG_INFO("[discovery] mode none: relying on agent push and API calls");
        return {};
    }
    return {};
}

const IObservationSourceFactory& default_observation_source_factory() {
    static DefaultObservationSourceFactory factory;
    return factory;
}

ObservationSourcePtr create_observation_source(const Config& cfg) {
    if (g_factory_override) {
        return g_factory_override->create(cfg);
    }
    return default_observation_source_factory().create(cfg);
}

void set_observation_source_factory_for_tests(const IObservationSourceFactory* factory) {
    g_factory_override = factory;
}

} // namespace linkwatch::discovery
