#include "experiment.h"
#include "elaborator.h"
#include "export.h"
#include "proportion.h"
#include <common/message.h>
#include <common/text.h>
#include <common/timer.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace rbn
{

experiment::experiment()
{
	nodes.push_back(5);
	nodes.push_back(8);
	nodes.push_back(16);
	max_parents = 3;
	policy = network::exclude_self;
	lengths.push_back(10);
	lengths.push_back(20);
	lengths.push_back(30);
	strides.push_back(1);
	strides.push_back(2);
	strides.push_back(3);
	counts.push_back(16);
	counts.push_back(32);
	counts.push_back(64);
	disciplines.push_back(synchronous);
	disciplines.push_back(asynchronous);
	seed = 0;
	output = ".";
	wide = false;
	report_progress = false;
}

experiment::~experiment()
{
}

int experiment::validate() const
{
	if (model.empty())
	{
		if (nodes.empty())
		{
			error("", "no network sizes given", __FILE__, __LINE__);
			return configuration_error;
		}

		for (int i = 0; i < (int)nodes.size(); i++)
		{
			if (nodes[i] < 1)
			{
				error("", "network must have at least one node, got " + ::to_string(nodes[i]), __FILE__, __LINE__);
				return configuration_error;
			}

			// a node may list itself only under allow_self
			int candidates = policy == network::allow_self ? nodes[i] : nodes[i]-1;
			if (max_parents < 1 or max_parents > candidates)
			{
				error("", "the maximum number of parents must be between 1 and " + ::to_string(candidates) + " for " + ::to_string(nodes[i]) + " nodes, got " + ::to_string(max_parents), __FILE__, __LINE__);
				return configuration_error;
			}
		}
	}

	if (policy != network::exclude_self and policy != network::allow_self)
	{
		error("", "unknown parent policy " + ::to_string(policy), __FILE__, __LINE__);
		return configuration_error;
	}

	if (lengths.empty() or strides.empty() or counts.empty())
	{
		error("", "trajectory lengths, strides and counts must each have at least one entry", __FILE__, __LINE__);
		return configuration_error;
	}

	for (int i = 0; i < (int)lengths.size(); i++)
		if (lengths[i] < 1)
		{
			error("", "trajectory length must be at least 1, got " + ::to_string(lengths[i]), __FILE__, __LINE__);
			return configuration_error;
		}

	for (int i = 0; i < (int)strides.size(); i++)
		if (strides[i] < 1)
		{
			error("", "sampling stride must be at least 1, got " + ::to_string(strides[i]), __FILE__, __LINE__);
			return configuration_error;
		}

	for (int i = 0; i < (int)counts.size(); i++)
		if (counts[i] < 1)
		{
			error("", "trajectory count must be at least 1, got " + ::to_string(counts[i]), __FILE__, __LINE__);
			return configuration_error;
		}

	if (disciplines.empty())
	{
		error("", "no update discipline selected", __FILE__, __LINE__);
		return configuration_error;
	}

	for (int i = 0; i < (int)disciplines.size(); i++)
		if (disciplines[i] != synchronous and disciplines[i] != asynchronous)
		{
			error("", "unknown update discipline " + ::to_string(disciplines[i]), __FILE__, __LINE__);
			return configuration_error;
		}

	return success;
}

sweep::sweep()
{
	length = 1;
	stride = 1;
	count = 1;
}

sweep::sweep(int length, int stride, int count)
{
	this->length = length;
	this->stride = stride;
	this->count = count;
}

sweep::~sweep()
{
}

bool operator==(const sweep &v0, const sweep &v1)
{
	return v0.length == v1.length and v0.stride == v1.stride and v0.count == v1.count;
}

vector<sweep> sweeps(const experiment &e)
{
	vector<sweep> result;
	if (e.lengths.empty() or e.strides.empty() or e.counts.empty())
		return result;

	int length = e.lengths[min(1, (int)e.lengths.size()-1)];
	int stride = e.strides[0];
	int count = e.counts[min(1, (int)e.counts.size()-1)];

	for (int i = 0; i < (int)e.lengths.size(); i++)
		result.push_back(sweep(e.lengths[i], stride, count));
	for (int i = 0; i < (int)e.strides.size(); i++)
		result.push_back(sweep(length, e.strides[i], count));
	for (int i = 0; i < (int)e.counts.size(); i++)
		result.push_back(sweep(length, stride, e.counts[i]));

	return result;
}

analysis::analysis()
{
	for (int d = 0; d < 2; d++)
	{
		// an analysis that was never requested is unavailable
		code[d] = configuration_error;
		seconds[d] = 0.0f;
	}
}

analysis::~analysis()
{
}

namespace {

bool uses(const experiment &e, int d)
{
	return find(e.disciplines.begin(), e.disciplines.end(), d) != e.disciplines.end();
}

void emit(ostream &report, const string &line)
{
	printf("%s\n", line.c_str());
	report << line << endl;
}

string attractor_count(const analysis &a, int d)
{
	if (a.code[d] != success)
		return string("unavailable (") + status_name(a.code[d]) + ")";
	return ::to_string((int)a.attractors[d].size());
}

}

analysis analyze(const experiment &e, const network &net)
{
	analysis result;

	if (uses(e, synchronous))
	{
		Timer tmr;
		result.code[synchronous] = find_sync_attractors(net, result.attractors[synchronous], e.lim, e.report_progress);
		result.seconds[synchronous] = tmr.since();
	}

	if (uses(e, asynchronous))
	{
		Timer tmr;
		if (e.solver.empty())
		{
			enumerative_solver solver;
			result.code[asynchronous] = find_async_attractors(net, solver, result.attractors[asynchronous], e.lim);
		}
		else
		{
			command_solver solver(e.solver);
			result.code[asynchronous] = find_async_attractors(net, solver, result.attractors[asynchronous], e.lim);
		}
		result.seconds[asynchronous] = tmr.since();
	}

	return result;
}

bool run_sweep(const experiment &e, const network &net, const analysis &a, sweep v, std::mt19937 &rng, ostream &report)
{
	emit(report, "");
	emit(report, "[Attractors | nodes=" + ::to_string(net.size()) + ", steps=" + ::to_string(v.length) + ", sample=" + ::to_string(v.stride) + ", ntraj=" + ::to_string(v.count) + "]");
	for (auto d = e.disciplines.begin(); d != e.disciplines.end(); d++)
	{
		string name = *d == synchronous ? "sync " : "async";
		emit(report, "  " + name + " attractors : " + attractor_count(a, *d));
	}

	vector<trajectory> data[2];
	for (int i = 0; i < v.count; i++)
	{
		char buffer[32];
		snprintf(buffer, sizeof(buffer), "  traj %02d", i+1);
		string line = buffer;

		for (auto d = e.disciplines.begin(); d != e.disciplines.end(); d++)
		{
			trajectory t = sample(simulate(net, (v.length-1)*v.stride, *d, rng), v.stride);

			line += string(" | ") + (*d == synchronous ? "sync=" : "async=");
			if (a.code[*d] == success)
				line += compute_proportions(t, a.attractors[*d]).to_string();
			else
				line += "n/a";

			data[*d].push_back(t);
		}
		emit(report, line);
	}

	bool ok = true;
	for (auto d = e.disciplines.begin(); d != e.disciplines.end(); d++)
	{
		string path = e.output + "/" + data_filename(net.size(), v.length, v.stride, v.count, *d);
		bool saved = e.wide ? save_wide(path, net, data[*d]) : save_stacked(path, net, data[*d]);
		if (saved)
			printf("saved: %s\n", path.c_str());
		ok = ok and saved;
	}

	return ok;
}

bool run_network(const experiment &e, const network &net, std::mt19937 &rng, ostream &report)
{
	emit(report, "");
	emit(report, "BOOLEAN NETWORK (nodes = " + ::to_string(net.size()) + ")");
	emit(report, "");
	string listing = net.to_string();
	printf("%s", listing.c_str());
	report << listing;

	analysis a = analyze(e, net);
	for (auto d = e.disciplines.begin(); d != e.disciplines.end(); d++)
		if (a.code[*d] == success)
			printf("[%s%d %s ATTRACTORS%s]\t%gs\n", KGRN, (int)a.attractors[*d].size(), *d == synchronous ? "SYNCHRONOUS" : "ASYNCHRONOUS", KNRM, a.seconds[*d]);

	vector<sweep> vs = sweeps(e);
	for (auto v = vs.begin(); v != vs.end(); v++)
		if (not run_sweep(e, net, a, *v, rng, report))
			return false;

	emit(report, "");
	emit(report, "======================");
	return true;
}

int run_experiment(const experiment &e)
{
	int code = e.validate();
	if (code != success)
		return code;

	struct stat st;
	if (stat(e.output.c_str(), &st) != 0 and mkdir(e.output.c_str(), 0755) != 0)
	{
		error("", "unable to create output directory '" + e.output + "'", __FILE__, __LINE__);
		return configuration_error;
	}

	std::ostringstream discard;
	ofstream fout;
	if (not e.report.empty())
	{
		fout.open(e.report.c_str());
		if (not fout.is_open())
		{
			error("", "unable to open report file '" + e.report + "'", __FILE__, __LINE__);
			return configuration_error;
		}
	}
	ostream &report = e.report.empty() ? (ostream&)discard : (ostream&)fout;

	std::mt19937 rng(e.seed);
	Timer tmr;

	if (not e.model.empty())
	{
		network net;
		if (not load_bnet(e.model, net))
			return configuration_error;
		net.name = e.model;

		if (not run_network(e, net, rng, report))
			return configuration_error;
	}
	else
	{
		for (auto n = e.nodes.begin(); n != e.nodes.end(); n++)
		{
			network net;
			code = generate_network(net, *n, e.max_parents, rng, e.policy);
			if (code != success)
				return code;
			net.name = "BN" + ::to_string((int)(n - e.nodes.begin()) + 1);

			if (not run_network(e, net, rng, report))
				return configuration_error;
		}
	}

	int count = e.model.empty() ? (int)e.nodes.size() : 1;
	printf("[%s%d NETWORKS SIMULATED%s]\t%gs\n", KGRN, count, KNRM, tmr.since());
	return success;
}

}
