#include "export.h"
#include <common/message.h>
#include <common/text.h>

#include <fstream>

namespace rbn
{

void write_stacked(ostream &os, const network &net, const vector<trajectory> &trajectories)
{
	for (auto t = trajectories.begin(); t != trajectories.end(); t++)
	{
		os << "Gene";
		for (int i = 0; i < (int)t->size(); i++)
			os << "\tS" << i;
		os << endl;

		for (int g = 0; g < net.size(); g++)
		{
			os << net.nodes[g].name;
			for (auto s = t->begin(); s != t->end(); s++)
				os << "\t" << s->get(g);
			os << endl;
		}
		os << endl;
	}
}

void write_wide(ostream &os, const network &net, const vector<trajectory> &trajectories)
{
	os << "net";
	for (int j = 0; j < (int)trajectories.size(); j++)
		for (int i = 0; i < (int)trajectories[j].size(); i++)
			os << "\ts" << j+1 << ":t" << i+1;
	os << endl;

	for (int g = 0; g < net.size(); g++)
	{
		os << net.nodes[g].name;
		for (auto t = trajectories.begin(); t != trajectories.end(); t++)
			for (auto s = t->begin(); s != t->end(); s++)
				os << "\t" << s->get(g);
		os << endl;
	}
}

bool write_bnet(ostream &os, const network &net)
{
	vector<string> names = net.names();
	os << "targets, factors" << endl;
	for (int i = 0; i < net.size(); i++)
	{
		string expr;
		if (not to_bnet(net.nodes[i].expression(names), expr))
		{
			error("", "no .bnet form for the rule of " + net.nodes[i].name, __FILE__, __LINE__);
			return false;
		}
		os << net.nodes[i].name << ", " << expr << endl;
	}
	return true;
}

namespace {

template <typename writer>
bool save(const string &filename, writer write)
{
	ofstream fout(filename.c_str());
	if (not fout.is_open())
	{
		error("", "unable to open file '" + filename + "' for writing", __FILE__, __LINE__);
		return false;
	}

	if (not write(fout))
		return false;
	fout.close();
	if (fout.fail())
	{
		error("", "unable to write file '" + filename + "'", __FILE__, __LINE__);
		return false;
	}
	return true;
}

}

bool save_stacked(const string &filename, const network &net, const vector<trajectory> &trajectories)
{
	return save(filename, [&](ostream &os) { write_stacked(os, net, trajectories); return true; });
}

bool save_wide(const string &filename, const network &net, const vector<trajectory> &trajectories)
{
	return save(filename, [&](ostream &os) { write_wide(os, net, trajectories); return true; });
}

bool save_bnet(const string &filename, const network &net)
{
	return save(filename, [&](ostream &os) { return write_bnet(os, net); });
}

string data_filename(int nodes, int length, int stride, int count, int discipline)
{
	return "nodes" + ::to_string(nodes) + "_steps" + ::to_string(length) + "_sample" + ::to_string(stride) + "_ntraj" + ::to_string(count) + "_" + discipline_name(discipline) + ".data";
}

}
