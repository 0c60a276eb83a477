#include "elaborator.h"
#include "simulator.h"
#include <common/message.h>
#include <common/text.h>
#include <common/timer.h>

namespace rbn
{

// Do an exhaustive simulation of all of the states in the state space and
// record the cycles of the synchronous transition map.
//
// Synchronous update is a total deterministic map from states to states, so
// every walk eventually revisits a state. Each state keeps the walk that first
// visited it and its depth in that walk. A walk stops at the first visited
// state. If that state belongs to the current walk, the path from its depth
// onward is a new cycle. If it belongs to an earlier walk, this walk just
// funnels into an outcome that is already known. Every state is transitioned
// from exactly once over the whole run.
int find_sync_attractors(const network &net, vector<attractor> &result, limits lim, bool report_progress)
{
	result.clear();

	int n = net.size();
	if (n > 30 or ((uint64_t)1 << n) > lim.max_states)
	{
		error("", "synchronous state space of " + ::to_string(n) + " nodes exceeds the configured state limit", __FILE__, __LINE__);
		return resource_exceeded;
	}

	int total = 1 << n;

	// walk[i] is the index of the start state of the walk that first visited
	// state i, or -1 if state i has not been visited yet.
	vector<int> walk(total, -1);
	vector<int> depth(total, 0);

	Timer tmr;
	int transitions = 0;
	vector<int> path;
	for (int start = 0; start < total; start++)
	{
		if (walk[start] >= 0)
			continue;

		if (report_progress)
			progress("", ::to_string(start) + "/" + ::to_string(total) + " " + ::to_string((int)result.size()), __FILE__, __LINE__);

		path.clear();
		int curr = start;
		while (walk[curr] < 0)
		{
			walk[curr] = start;
			depth[curr] = (int)path.size();
			path.push_back(curr);
			curr = (int)update_sync(state::from_index(curr, n), net).index();

			transitions++;
			if (lim.max_seconds > 0.0f and (transitions & 0xFFF) == 0 and tmr.since() > lim.max_seconds)
			{
				if (report_progress)
					done_progress();
				error("", "synchronous attractor search ran out of time after " + ::to_string(transitions) + " transitions", __FILE__, __LINE__);
				result.clear();
				return resource_exceeded;
			}
		}

		if (walk[curr] == start)
		{
			attractor cycle;
			for (int i = depth[curr]; i < (int)path.size(); i++)
				cycle.insert(state::from_index(path[i], n));

			if (find(result.begin(), result.end(), cycle) == result.end())
				result.push_back(cycle);
		}
	}

	if (report_progress)
		done_progress();

	return success;
}

}
