#pragma once

#include <common/standard.h>
#include <random>

#include "network.h"
#include "state.h"

namespace rbn
{

// The two update disciplines.
enum discipline
{
	// Every node is recomputed at once from the same prior state.
	synchronous = 0,

	// A single node, chosen uniformly at random, is recomputed per step.
	asynchronous = 1
};

const char *discipline_name(int d);

typedef vector<state> trajectory;

// Compute the next value of one node from the values of its parents in s.
int evaluate(const network &net, int node, const state &s);

// All reads come from the pre-step state. Nodes with no parents apply their
// constant rule on every step.
state update_sync(const state &s, const network &net);

// Recompute one uniformly chosen node. A node without parents is left as is,
// so at most one bit changes per call.
state update_async(const state &s, const network &net, std::mt19937 &rng);

// This keeps track of a single simulation of a network and makes it easy to
// step that simulation programmatically. The network and the random
// generator are borrowed, both have to outlive the simulator.
struct simulator
{
	simulator();
	simulator(const network *base, std::mt19937 *rng);
	~simulator();

	const network *base;
	std::mt19937 *rng;

	// The state the next step starts from.
	state current;

	// Draw a uniformly random initial state.
	void reset();
	void reset(state initial);

	state step(int discipline);
};

// Draw a random initial state and apply steps updates. The result has
// steps+1 states including the initial one.
trajectory simulate(const network &net, int steps, int discipline, std::mt19937 &rng);

// Keep every stride-th state starting with the first.
trajectory sample(const trajectory &t, int stride);

}
