// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file DemoTopology.h
 * @brief Fixed four-node lab topology used when DEMO_MODE is enabled.
 */

#include "linkwatch/topology/Status.h"

namespace linkwatch {

class TopologyStore;

/**
 * @brief Seed @p store with router1..3, switch1 and link1..4.
 *
 * Links are created idle; the non-idle starting states (link1 and link3
 * active, link4 down) are applied as overrides so subscribers see the
 * transitions. Fails on the first rejected insertion.
 */
Status load_demo_topology(TopologyStore& store);

} // namespace linkwatch
