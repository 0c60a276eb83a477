#pragma once

#include <common/standard.h>

#include "network.h"
#include "state.h"
#include "status.h"

namespace rbn
{

// Find every attractor of the network under synchronous update by walking the
// complete state space. This visits all 2^n states and is only tractable for
// small networks, lim.max_states bounds the size of the state space that will
// be attempted. Returns success, or resource_exceeded with an empty result.
int find_sync_attractors(const network &net, vector<attractor> &result, limits lim=limits(), bool report_progress=false);

}
