#include <common/standard.h>
#include <common/message.h>
#include <common/text.h>

#include <rbn/experiment.h>
#include <rbn/export.h>
#include <rbn/network.h>

#include <cstdlib>
#include <cstring>

using namespace rbn;

void print_help()
{
	printf("Usage: rbnsim [options]\n");
	printf("Generate random boolean networks, find their attractors and export sampled trajectories.\n");
	printf("\nNetworks:\n");
	printf(" -n, --nodes <list>       network sizes, one network each (default 5,8,16)\n");
	printf(" -k, --max-parents <int>  the maximum number of parents of a node (default 3)\n");
	printf("     --allow-self         draw between 0 and k parents from every node including itself\n");
	printf(" -m, --model <file>       simulate the network in this .bnet file instead\n");
	printf(" -s, --seed <int>         seed the random generator (default 0)\n");
	printf("\nTrajectories:\n");
	printf(" -l, --lengths <list>     sampled trajectory lengths in states (default 10,20,30)\n");
	printf(" -e, --strides <list>     sampling strides (default 1,2,3)\n");
	printf(" -c, --counts <list>      trajectories per file (default 16,32,64)\n");
	printf("     --sync               only use synchronous update\n");
	printf("     --async              only use asynchronous update\n");
	printf("\nAnalysis:\n");
	printf("     --solver <command>   run this program to find minimal trap spaces\n");
	printf("     --max-states <int>   the largest state space to enumerate (default 4194304)\n");
	printf("     --max-seconds <real> time budget of one attractor search, 0 for none (default 0)\n");
	printf(" -p, --progress           report progress of the state space traversal\n");
	printf("\nOutput:\n");
	printf(" -o, --output <dir>       the directory for the trajectory files (default .)\n");
	printf(" -r, --report <file>      also write the summary to this file\n");
	printf("     --wide               write one wide table per file instead of stacked tables\n");
	printf("     --export <file>      write the first network's rules in .bnet format and exit\n");
	printf(" -h, --help               display this information\n");
}

bool parse_int(string text, int &result)
{
	char *end = NULL;
	long value = strtol(text.c_str(), &end, 10);
	if (text.empty() or *end != '\0')
		return false;
	result = (int)value;
	return true;
}

// Parse a comma separated list of integers like "5,8,16".
bool parse_list(string text, vector<int> &result)
{
	result.clear();
	size_t start = 0;
	while (start <= text.size())
	{
		size_t comma = text.find(',', start);
		if (comma == string::npos)
			comma = text.size();

		int value = 0;
		if (not parse_int(text.substr(start, comma-start), value))
			return false;
		result.push_back(value);
		start = comma+1;
	}
	return not result.empty();
}

int main(int argc, char **argv)
{
	experiment e;
	string export_file;

	for (int i = 1; i < argc; i++)
	{
		string arg = argv[i];
		bool has_value = i+1 < argc;

		if (arg == "--help" or arg == "-h")
		{
			print_help();
			return 0;
		}
		else if ((arg == "--nodes" or arg == "-n") and has_value)
		{
			if (not parse_list(argv[++i], e.nodes))
			{
				error("", string("invalid list of network sizes '") + argv[i] + "'", __FILE__, __LINE__);
				return 1;
			}
		}
		else if ((arg == "--max-parents" or arg == "-k") and has_value)
		{
			if (not parse_int(argv[++i], e.max_parents))
			{
				error("", string("invalid parent bound '") + argv[i] + "'", __FILE__, __LINE__);
				return 1;
			}
		}
		else if (arg == "--allow-self")
			e.policy = network::allow_self;
		else if ((arg == "--model" or arg == "-m") and has_value)
			e.model = argv[++i];
		else if ((arg == "--seed" or arg == "-s") and has_value)
		{
			int seed = 0;
			if (not parse_int(argv[++i], seed))
			{
				error("", string("invalid seed '") + argv[i] + "'", __FILE__, __LINE__);
				return 1;
			}
			e.seed = (unsigned int)seed;
		}
		else if ((arg == "--lengths" or arg == "-l") and has_value)
		{
			if (not parse_list(argv[++i], e.lengths))
			{
				error("", string("invalid list of trajectory lengths '") + argv[i] + "'", __FILE__, __LINE__);
				return 1;
			}
		}
		else if ((arg == "--strides" or arg == "-e") and has_value)
		{
			if (not parse_list(argv[++i], e.strides))
			{
				error("", string("invalid list of sampling strides '") + argv[i] + "'", __FILE__, __LINE__);
				return 1;
			}
		}
		else if ((arg == "--counts" or arg == "-c") and has_value)
		{
			if (not parse_list(argv[++i], e.counts))
			{
				error("", string("invalid list of trajectory counts '") + argv[i] + "'", __FILE__, __LINE__);
				return 1;
			}
		}
		else if (arg == "--sync")
			e.disciplines = vector<int>(1, synchronous);
		else if (arg == "--async")
			e.disciplines = vector<int>(1, asynchronous);
		else if (arg == "--solver" and has_value)
			e.solver = argv[++i];
		else if (arg == "--max-states" and has_value)
		{
			char *end = NULL;
			e.lim.max_states = strtoull(argv[++i], &end, 10);
			if (*end != '\0' or e.lim.max_states == 0)
			{
				error("", string("invalid state limit '") + argv[i] + "'", __FILE__, __LINE__);
				return 1;
			}
		}
		else if (arg == "--max-seconds" and has_value)
		{
			char *end = NULL;
			e.lim.max_seconds = strtof(argv[++i], &end);
			if (*end != '\0' or e.lim.max_seconds < 0.0f)
			{
				error("", string("invalid time limit '") + argv[i] + "'", __FILE__, __LINE__);
				return 1;
			}
		}
		else if (arg == "--progress" or arg == "-p")
			e.report_progress = true;
		else if ((arg == "--output" or arg == "-o") and has_value)
			e.output = argv[++i];
		else if ((arg == "--report" or arg == "-r") and has_value)
			e.report = argv[++i];
		else if (arg == "--wide")
			e.wide = true;
		else if (arg == "--export" and has_value)
			export_file = argv[++i];
		else
		{
			error("", "unrecognized option '" + arg + "'", __FILE__, __LINE__);
			print_help();
			return 1;
		}
	}

	if (not export_file.empty())
	{
		if (e.validate() != success)
			return 1;

		network net;
		if (not e.model.empty())
		{
			if (not load_bnet(e.model, net))
				return 1;
		}
		else
		{
			std::mt19937 rng(e.seed);
			if (generate_network(net, e.nodes[0], e.max_parents, rng, e.policy) != success)
				return 1;
		}

		net.print();
		return save_bnet(export_file, net) ? 0 : 1;
	}

	return run_experiment(e) == success ? 0 : 1;
}
