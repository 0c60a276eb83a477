#pragma once

#include <common/standard.h>

#include "network.h"
#include "state.h"
#include "status.h"

namespace rbn
{

// A partial assignment from solver identifiers ("v0", "v1", ...) to 0 or 1.
// Identifiers that do not appear are free.
typedef map<string, int> assignment;

// A trap space solver computes the minimal trap spaces of a rule set given in
// the .bnet text format: one "v<i>, <expression>" line per node using '!',
// '&' and '|'. Minimal means that no returned trap space contains another.
// The solver returns success, resource_exceeded when it runs out of the
// budget in lim, or solver_failure if it is otherwise unable to produce a
// result. Only success comes with a result, which may be empty.
struct trap_space_solver
{
	trap_space_solver();
	virtual ~trap_space_solver();

	virtual int minimal_trap_spaces(const string &rules, vector<assignment> &result, limits lim) = 0;
};

// Solves the rule set in-process by checking every subspace, ordered by the
// number of free nodes. A trap space is kept only if it does not contain a
// trap space that was already kept, so everything kept is minimal. There are
// 3^n subspaces which must fit in lim.max_states.
struct enumerative_solver : trap_space_solver
{
	enumerative_solver();
	~enumerative_solver();

	int minimal_trap_spaces(const string &rules, vector<assignment> &result, limits lim);
};

// Runs an external program to do the work. The rule set is written to a
// temporary file whose path is appended to command. The program prints one
// trap space per line as a string of '0', '1' and '-' with one character per
// rule in file order, for example "01-1-". The program is killed once it
// runs past lim.max_seconds.
struct command_solver : trap_space_solver
{
	command_solver();
	command_solver(string command);
	~command_solver();

	string command;

	int minimal_trap_spaces(const string &rules, vector<assignment> &result, limits lim);
};

// The solver identifier of a node.
string solver_id(int node);

// Parse a trap space line in the "01-1-" format into an assignment over the
// given identifiers. Returns false if the line is malformed.
bool parse_subspace(const string &line, const vector<string> &ids, assignment &result);

// Translate every node's rule expression into the solver's rule grammar.
// Returns translation_error if an expression has no equivalent, which means
// the rule printer and this translator disagree.
int translate_network(const network &net, string &rules);

// Find the attractors of the network under asynchronous update, defined as
// the minimal trap spaces of its rules. Each trap space is expanded into the
// set of states it contains. The solver is trusted for minimality.
int find_async_attractors(const network &net, trap_space_solver &solver, vector<attractor> &result, limits lim=limits());

}
