#include "helpers.h"

#include <string>

namespace rbn {

// @brief Parse a network in the .bnet format
// @param bnet The rules, one "target, expression" line per node
// @return The resulting network, empty if the rules did not parse
network parse_network(const std::string &bnet) {
  network net;
  if (not import_bnet(bnet, net))
    return network();
  return net;
}

network make_network(const std::vector<std::vector<int> > &parents, const std::vector<rule> &rules) {
	network net;
	for (int i = 0; i < (int)parents.size(); i++) {
		net.nodes.push_back(node("X" + std::to_string(i), parents[i], rules[i]));
	}
	return net;
}

rule copy_rule() {
	return rule(std::vector<bool>(1, false), std::vector<int>(), false);
}

rule negate_rule() {
	return rule(std::vector<bool>(1, true), std::vector<int>(), false);
}

network chain_network() {
	return make_network({{}, {0}, {1}}, {rule(1), copy_rule(), copy_rule()});
}

network swap_network() {
	return make_network({{1}, {0}}, {copy_rule(), copy_rule()});
}

attractor make_attractor(const std::vector<std::vector<int> > &states) {
	attractor result;
	for (int i = 0; i < (int)states.size(); i++) {
		result.insert(state(states[i]));
	}
	return result;
}

fixed_solver::fixed_solver(int code, std::vector<assignment> spaces) {
	this->code = code;
	this->spaces = spaces;
	calls = 0;
}

fixed_solver::~fixed_solver() {
}

int fixed_solver::minimal_trap_spaces(const std::string &rules, std::vector<assignment> &result, limits lim) {
	this->rules = rules;
	this->lim = lim;
	calls++;
	result.clear();
	if (code == success) {
		result = spaces;
	}
	return code;
}

} // namespace rbn
