#pragma once

#include <cstdint>

namespace rbn
{

// Every analysis either fully succeeds or returns one of these codes with an
// empty result. Callers must check the code before reading the result, an
// empty list of attractors is only meaningful alongside success.
enum status
{
	success = 0,
	configuration_error = 1,  // invalid node count, parent bound or stride
	resource_exceeded = 2,    // state space or time budget exhausted
	solver_failure = 3,       // trap space solver failed or returned garbage
	translation_error = 4     // rule expression has no solver equivalent
};

const char *status_name(int code);

// Attractor analysis is exponential in the number of nodes. These bound the
// work a single analysis may do before it gives up with resource_exceeded.
struct limits
{
	limits();
	limits(uint64_t max_states, float max_seconds=0.0f);
	~limits();

	// The largest number of states that may be enumerated, either while
	// walking the full state space or while expanding a trap space.
	uint64_t max_states;

	// Wall clock budget in seconds, 0 disables the check.
	float max_seconds;
};

}
