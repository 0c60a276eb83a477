#pragma once

#include <common/standard.h>
#include <boolean/cube.h>

#include <cstdint>
#include <random>

namespace rbn
{

// A state is the value of every node in the network encoded as a minterm.
// Node i is variable i in the cube and every variable in [0, size) is
// assigned either 0 or 1. The simulator and the attractor finders walk the
// state space one of these at a time.
//
// See haystack/lib/boolean/boolean/{cube.h, cube.cpp} for more details
// about the minterm representation.
struct state
{
	state();
	state(int size);
	state(vector<int> values);
	~state();

	// The current value assigned to each node.
	boolean::cube encoding;

	// The number of nodes in the network this state belongs to.
	int size;

	int get(int node) const;
	void set(int node, int value);

	// The state space of a network with n nodes is enumerated through the
	// integers [0, 2^n). Bit i of the index is the value of node i.
	uint64_t index() const;
	static state from_index(uint64_t index, int size);

	// Each node is drawn independently with probability 1/2.
	static state random(int size, std::mt19937 &rng);

	vector<int> values() const;
	string to_string() const;
};

ostream &operator<<(ostream &os, const state &s);

bool operator<(const state &s0, const state &s1);
bool operator>(const state &s0, const state &s1);
bool operator<=(const state &s0, const state &s1);
bool operator>=(const state &s0, const state &s1);
bool operator==(const state &s0, const state &s1);
bool operator!=(const state &s0, const state &s1);

// An attractor is the set of states a trajectory cycles through forever once
// it gets there. Under synchronous update this is a cycle of the deterministic
// transition map, under asynchronous update this is the expansion of a
// minimal trap space.
typedef set<state> attractor;

// The union of a list of attractors, used to classify trajectory states.
attractor merge(const vector<attractor> &attractors);

// A subspace is a partial assignment. Fixed nodes are 0 or 1 and free nodes
// are left as don't care ('-', get() returns 2). A trap space is a subspace
// that the update rules can never leave.
typedef boolean::cube subspace;

int free_count(const subspace &s, int size);
bool is_subset_of(const subspace &s0, const subspace &s1, int size);
string to_string(const subspace &s, int size);

// Every full state consistent with the subspace. The caller is responsible
// for bounding 2^free_count() beforehand.
attractor expand(const subspace &s, int size);

}

namespace std {

template<> struct hash<rbn::state> {
	std::size_t operator()(const rbn::state& s) const noexcept {
		static std::hash<uint64_t> h;
		return h(s.index()) ^ ((size_t)s.size << 1);
	}
};

}
