#pragma once

#include <common/standard.h>

#include "simulator.h"
#include "state.h"

namespace rbn
{

// The share of a trajectory spent before reaching an attractor and the share
// spent inside one. The two always sum to 1.
struct proportion
{
	proportion();
	proportion(double transient, double attractor);
	~proportion();

	double transient;
	double attractor;

	string to_string() const;
};

// A state counts toward the attractor share if it belongs to any of the
// attractors. With no attractors at all the whole trajectory is considered
// transient.
proportion compute_proportions(const trajectory &t, const vector<attractor> &attractors);

// Same as above with the union of the attractors already computed.
proportion compute_proportions(const trajectory &t, const attractor &recurrent);

// Estimate the proportions without knowing the attractors. The trajectory
// is considered to enter its attractor at the first state that it later
// revisits. If no state repeats the whole trajectory is transient.
proportion estimate_proportions(const trajectory &t);

}
