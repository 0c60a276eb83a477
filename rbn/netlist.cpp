#include "netlist.h"

namespace rbn
{

netlist::netlist()
{
}

netlist::netlist(vector<string> names)
{
	this->names = names;
}

netlist::~netlist()
{
}

int netlist::netIndex(string name, bool define)
{
	int uid = ((const netlist*)this)->netIndex(name);
	if (uid < 0 and define)
	{
		uid = (int)names.size();
		names.push_back(name);
	}
	return uid;
}

int netlist::netIndex(string name) const
{
	for (int i = 0; i < (int)names.size(); i++)
		if (names[i] == name)
			return i;
	return -1;
}

string netlist::netAt(int uid) const
{
	if (uid < 0 or uid >= (int)names.size())
		return "";
	return names[uid];
}

int netlist::netCount() const
{
	return (int)names.size();
}

}
