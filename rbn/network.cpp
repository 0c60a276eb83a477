#include "network.h"
#include "status.h"
#include <common/message.h>
#include <common/text.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace rbn
{

node::node()
{
}

node::node(string name, vector<int> parents, rule update)
{
	this->name = name;
	this->parents = parents;
	this->update = update;
}

node::~node()
{

}

string node::expression(const vector<string> &names) const
{
	vector<string> operands;
	operands.reserve(parents.size());
	for (int i = 0; i < (int)parents.size(); i++)
		operands.push_back(names[parents[i]]);
	return update.to_string(operands);
}

network::network()
{
}

network::~network()
{
}

int network::size() const
{
	return (int)nodes.size();
}

vector<string> network::names() const
{
	vector<string> result;
	result.reserve(nodes.size());
	for (int i = 0; i < (int)nodes.size(); i++)
		result.push_back(nodes[i].name);
	return result;
}

vector<string> network::expressions() const
{
	vector<string> n = names();
	vector<string> result;
	result.reserve(nodes.size());
	for (int i = 0; i < (int)nodes.size(); i++)
		result.push_back(nodes[i].expression(n));
	return result;
}

bool network::is_valid(bool allow_self) const
{
	for (int i = 0; i < (int)nodes.size(); i++)
	{
		const vector<int> &p = nodes[i].parents;
		if (nodes[i].update.arity() != (int)p.size())
			return false;

		for (int j = 0; j < (int)p.size(); j++)
		{
			if (p[j] < 0 or p[j] >= (int)nodes.size())
				return false;
			if (not allow_self and p[j] == i)
				return false;
			if (find(p.begin()+j+1, p.end(), p[j]) != p.end())
				return false;
		}
	}
	return true;
}

string network::to_string() const
{
	vector<string> n = names();
	string result;
	for (int i = 0; i < (int)nodes.size(); i++)
	{
		result += nodes[i].name + " <- ";
		if (nodes[i].parents.empty())
			result += "NONE";
		for (int j = 0; j < (int)nodes[i].parents.size(); j++)
		{
			if (j != 0)
				result += ", ";
			result += n[nodes[i].parents[j]];
		}
		result += "\n   f" + ::to_string(i) + " = " + nodes[i].expression(n) + "\n";
	}
	return result;
}

void network::print() const
{
	cout << to_string();
}

int generate_network(network &result, int n, int max_parents, std::mt19937 &rng, int policy)
{
	result = network();
	if (n < 1)
	{
		error("", "network must have at least one node, got " + ::to_string(n), __FILE__, __LINE__);
		return configuration_error;
	}

	int candidates = policy == network::allow_self ? n : n-1;
	int lo = policy == network::allow_self ? 0 : 1;
	int hi = min(max_parents, candidates);
	if (max_parents < 1 or hi < lo)
	{
		error("", "no valid parent count for " + ::to_string(n) + " nodes with at most " + ::to_string(max_parents) + " parents", __FILE__, __LINE__);
		return configuration_error;
	}

	result.nodes.reserve(n);
	for (int i = 0; i < n; i++)
	{
		vector<int> possible;
		possible.reserve(candidates);
		for (int j = 0; j < n; j++)
			if (policy == network::allow_self or j != i)
				possible.push_back(j);

		std::uniform_int_distribution<int> count(lo, hi);
		int k = count(rng);

		// partial Fisher-Yates, the first k entries are a uniform sample
		// without replacement in random order
		for (int j = 0; j < k; j++)
		{
			std::uniform_int_distribution<int> pick(j, (int)possible.size()-1);
			swap(possible[j], possible[pick(rng)]);
		}
		possible.resize(k);

		result.nodes.push_back(node("X" + ::to_string(i), possible, random_rule(k, rng)));
	}

	return success;
}

string trim(const string &str)
{
	size_t first = str.find_first_not_of(" \t\r\n");
	if (first == string::npos)
		return "";
	size_t last = str.find_last_not_of(" \t\r\n");
	return str.substr(first, last-first+1);
}

vector<bnet_line> read_bnet_lines(const string &text)
{
	vector<bnet_line> result;

	std::istringstream fin(text);
	string line;
	int lineno = 0;
	while (getline(fin, line))
	{
		lineno++;
		line = trim(line);
		if (line.empty() or line[0] == '#')
			continue;

		size_t comma = line.find(',');
		if (comma == string::npos)
			continue;

		bnet_line entry;
		entry.target = trim(line.substr(0, comma));
		entry.expr = trim(line.substr(comma+1));
		entry.line = lineno;

		string lower = entry.target;
		transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
			return (char)tolower(c);
		});
		if (lower == "targets")
			continue;

		result.push_back(entry);
	}

	return result;
}

bool import_bnet(const string &text, network &result)
{
	result = network();

	vector<bnet_line> lines = read_bnet_lines(text);

	// Targets take the first variables of the netlist in file order, inputs
	// are appended by the importer as they are found.
	netlist nets;
	for (auto line = lines.begin(); line != lines.end(); line++)
	{
		if (nets.netIndex(line->target) >= 0)
		{
			error("", "line " + ::to_string(line->line) + ": duplicate rule for " + line->target, __FILE__, __LINE__);
			return false;
		}
		nets.netIndex(line->target, true);
	}

	int targets = (int)lines.size();
	vector<boolean::cover> exprs;
	exprs.reserve(targets);
	for (int i = 0; i < targets; i++)
	{
		boolean::cover e;
		if (not parse_bnet_expression(lines[i].expr, nets, e))
		{
			error("", "line " + ::to_string(lines[i].line) + ": unable to parse rule for " + lines[i].target, __FILE__, __LINE__);
			return false;
		}
		exprs.push_back(e);
	}

	for (int i = 0; i < targets; i++)
	{
		vector<int> parents = variables(exprs[i], nets.netCount());

		if (parents.empty())
		{
			result.nodes.push_back(node(lines[i].target, parents, rule(evaluate(exprs[i], vector<int>()))));
			continue;
		}

		vector<int> slot(nets.netCount(), -1);
		for (int j = 0; j < (int)parents.size(); j++)
			slot[parents[j]] = j;

		result.nodes.push_back(node(lines[i].target, parents, rule(remap(exprs[i], slot), (int)parents.size())));
	}

	// Inputs are referenced by some rule but never defined. They keep
	// whatever value they start with.
	for (int i = targets; i < nets.netCount(); i++)
		result.nodes.push_back(node(nets.netAt(i), vector<int>(1, i), rule(boolean::cover(0, 1), 1)));

	return true;
}

bool load_bnet(const string &filename, network &result)
{
	std::ifstream fin(filename.c_str());
	if (not fin.is_open())
	{
		error("", "unable to open " + filename, __FILE__, __LINE__);
		return false;
	}

	std::stringstream buffer;
	buffer << fin.rdbuf();
	if (not import_bnet(buffer.str(), result))
		return false;

	result.name = filename;
	return true;
}

}
