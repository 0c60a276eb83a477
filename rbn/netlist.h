#pragma once

#include <common/standard.h>

namespace rbn
{

// The names of the variables of a boolean cover. The haystack importer and
// exporter look variables up by name through the same interface that
// hse::graph provides for its nets. Variable i is called names[i].
struct netlist
{
	netlist();
	netlist(vector<string> names);
	~netlist();

	vector<string> names;

	// Returns -1 if there is no variable with this name, unless define is
	// set in which case a new variable is appended.
	int netIndex(string name, bool define=false);
	int netIndex(string name) const;
	string netAt(int uid) const;
	int netCount() const;
};

}
