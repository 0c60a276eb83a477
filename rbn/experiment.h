#pragma once

#include <common/standard.h>
#include <random>

#include "network.h"
#include "simulator.h"
#include "state.h"
#include "status.h"
#include "trap_space.h"

namespace rbn
{

// The parameters of an experiment. One network is generated for every entry of
// nodes, or a single network is read from model. Every network is then run
// through a set of sweeps that each differ from a baseline in a single
// parameter: the trajectory length, the sampling stride or the number of
// trajectories.
struct experiment
{
	experiment();
	~experiment();

	vector<int> nodes;
	int max_parents;
	int policy;

	// The length of a sampled trajectory, in states.
	vector<int> lengths;
	vector<int> strides;
	vector<int> counts;
	vector<int> disciplines;

	unsigned int seed;

	// A .bnet file to simulate instead of generated networks.
	string model;

	// The directory the trajectory files go to.
	string output;

	// A file that receives a copy of the summary printed to stdout.
	string report;

	// The external trap space solver, the built-in enumerative solver is
	// used when this is empty.
	string solver;

	bool wide;
	bool report_progress;
	limits lim;

	// Returns configuration_error and reports the first violation if any
	// parameter is out of range.
	int validate() const;
};

struct sweep
{
	sweep();
	sweep(int length, int stride, int count);
	~sweep();

	int length;
	int stride;
	int count;
};

bool operator==(const sweep &v0, const sweep &v1);

// The parameter sweeps of an experiment. The baseline takes the second
// length, the first stride and the second count (or the only one if a list
// has a single entry). Each list is then swept with the other two parameters
// held at the baseline.
vector<sweep> sweeps(const experiment &e);

// The attractors of one network under both disciplines along with the status
// of each analysis. Only an analysis with status success has meaningful
// attractors.
struct analysis
{
	analysis();
	~analysis();

	int code[2];
	vector<attractor> attractors[2];
	float seconds[2];
};

// Compute the attractors for every discipline the experiment asks for.
analysis analyze(const experiment &e, const network &net);

// Simulate the trajectories of one sweep, score each one and save them.
// Returns false if a file could not be written.
bool run_sweep(const experiment &e, const network &net, const analysis &a, sweep v, std::mt19937 &rng, ostream &report);

// Run every sweep for one network.
bool run_network(const experiment &e, const network &net, std::mt19937 &rng, ostream &report);

// Validate the experiment, then build or load the networks and run them.
// Returns the status of the first failure or success.
int run_experiment(const experiment &e);

}
