#pragma once

#include <common/standard.h>
#include <random>

#include "rule.h"

namespace rbn
{

// A node is a binary variable in the network. Its next value is computed by
// applying its update rule to the current values of its parents, in the order
// they are listed here.
struct node
{
	node();
	node(string name, vector<int> parents, rule update);
	~node();

	string name;
	vector<int> parents;
	rule update;

	// The rule as readable text over the parents' names.
	string expression(const vector<string> &names) const;
};

struct network
{
	// How parents are drawn by generate_network().
	enum
	{
		// Every node has between 1 and max_parents parents and never lists
		// itself. This is the default because some downstream rule file
		// formats reject self regulation.
		exclude_self = 0,

		// Every node has between 0 and max_parents parents drawn from all of
		// the nodes, including itself.
		allow_self = 1
	};

	network();
	~network();

	string name;
	vector<node> nodes;

	int size() const;
	vector<string> names() const;

	// The symbolic expression of every node's rule, indexed by node.
	vector<string> expressions() const;

	// Checks the structural invariants: parents are in range, unique, and
	// match the rule arity. Self parents are reported when allow_self is false.
	bool is_valid(bool allow_self=false) const;

	string to_string() const;
	void print() const;
};

// Build a random network of n nodes, each with a random set of parents and a
// random update rule. Returns configuration_error when the policy requires a
// parent but the bound (after excluding the node itself) leaves no choice.
int generate_network(network &result, int n, int max_parents, std::mt19937 &rng, int policy=network::exclude_self);

// One "target, expression" line of a .bnet file, with surrounding whitespace
// removed. line is the 1-based line number in the file.
struct bnet_line
{
	string target;
	string expr;
	int line;
};

string trim(const string &str);

// Split .bnet text into its rule lines. Blank lines, '#' comments, lines
// without a comma and the "targets, factors" header are skipped.
vector<bnet_line> read_bnet_lines(const string &text);

// Read a network from the plain text .bnet format, one "target, expression"
// line per node. Nodes referenced but never defined become inputs that hold
// their value. Returns false and reports the offending line on a syntax error.
bool import_bnet(const string &text, network &result);
bool load_bnet(const string &filename, network &result);

}
