#pragma once

#include <rbn/network.h>
#include <rbn/state.h>
#include <rbn/trap_space.h>

namespace rbn {

network parse_network(const std::string &bnet);

// Build a network by hand, node i gets parents[i] and rules[i].
network make_network(const std::vector<std::vector<int> > &parents, const std::vector<rule> &rules);

// A rule that copies its only parent, or negates it.
rule copy_rule();
rule negate_rule();

// X0 = 1, X1 = X0, X2 = X1
network chain_network();

// X0 = X1, X1 = X0
network swap_network();

attractor make_attractor(const std::vector<std::vector<int> > &states);

// A solver that returns a fixed answer and records the rules and limits it
// was given.
struct fixed_solver : trap_space_solver
{
	fixed_solver(int code, std::vector<assignment> spaces);
	~fixed_solver();

	int code;
	std::vector<assignment> spaces;
	std::string rules;
	limits lim;
	int calls;

	int minimal_trap_spaces(const std::string &rules, std::vector<assignment> &result, limits lim);
};

} // namespace rbn
