#include "trap_space.h"
#include "expression.h"
#include <common/message.h>
#include <common/text.h>
#include <common/timer.h>

#include <algorithm>
#include <bit>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rbn
{

trap_space_solver::trap_space_solver()
{
}

trap_space_solver::~trap_space_solver()
{
}

enumerative_solver::enumerative_solver()
{
}

enumerative_solver::~enumerative_solver()
{
}

namespace {

// Every fixed node's rule must evaluate to the node's fixed value everywhere
// in the subspace. free has a bit set for every free node and value holds
// the values of the fixed nodes. Only the free parents of each rule need to
// be enumerated.
bool is_trap(const network &net, uint64_t free, uint64_t value)
{
	for (int i = 0; i < net.size(); i++)
	{
		if ((free >> i) & 1)
			continue;

		const node &n = net.nodes[i];
		int expect = (int)((value >> i) & 1);

		vector<int> bits(n.parents.size(), 0);
		vector<int> open;
		for (int j = 0; j < (int)n.parents.size(); j++)
		{
			if ((free >> n.parents[j]) & 1)
				open.push_back(j);
			else
				bits[j] = (int)((value >> n.parents[j]) & 1);
		}

		for (uint64_t m = 0; m < ((uint64_t)1 << open.size()); m++)
		{
			for (int j = 0; j < (int)open.size(); j++)
				bits[open[j]] = (int)((m >> j) & 1);

			if (n.update.evaluate(bits) != expect)
				return false;
		}
	}
	return true;
}

subspace unpack(uint64_t free, uint64_t value, int size)
{
	subspace result;
	result = 1;
	for (int i = 0; i < size; i++)
		if (((free >> i) & 1) == 0)
			result.set(i, (int)((value >> i) & 1));
	return result;
}

}

int enumerative_solver::minimal_trap_spaces(const string &rules, vector<assignment> &result, limits lim)
{
	result.clear();

	network net;
	if (not import_bnet(rules, net))
		return solver_failure;

	int n = net.size();
	uint64_t count = 1;
	for (int i = 0; i < n and count <= lim.max_states; i++)
		count *= 3;

	if (count > lim.max_states)
	{
		error("", "3^" + ::to_string(n) + " subspaces exceed the budget of " + std::to_string(lim.max_states) + " states", __FILE__, __LINE__);
		return resource_exceeded;
	}

	uint64_t full = ((uint64_t)1 << n) - 1;

	// Visit the sets of free nodes from smallest to largest. Any trap space
	// that is not minimal contains a smaller trap space, which has fewer free
	// nodes and has therefore already been kept.
	vector<uint64_t> frees;
	frees.reserve(full+1);
	for (uint64_t f = 0; f <= full; f++)
		frees.push_back(f);
	stable_sort(frees.begin(), frees.end(), [](uint64_t a, uint64_t b) {
		return std::popcount(a) < std::popcount(b);
	});

	Timer tmr;
	uint64_t checked = 0;
	vector<subspace> kept;
	for (auto f = frees.begin(); f != frees.end(); f++)
	{
		uint64_t fixed = full & ~*f;

		// Walk every assignment to the fixed nodes, submasks of fixed.
		uint64_t value = fixed;
		while (true)
		{
			if (lim.max_seconds > 0.0f and (++checked & 0xFFF) == 0 and tmr.since() > lim.max_seconds)
			{
				error("", "trap space enumeration ran out of time after " + std::to_string(checked) + " subspaces", __FILE__, __LINE__);
				return resource_exceeded;
			}

			subspace candidate = unpack(*f, value, n);
			bool dominated = false;
			for (auto k = kept.begin(); k != kept.end() and not dominated; k++)
				dominated = is_subset_of(*k, candidate, n);

			if (not dominated and is_trap(net, *f, value))
				kept.push_back(candidate);

			if (value == 0)
				break;
			value = (value-1) & fixed;
		}
	}

	for (auto k = kept.begin(); k != kept.end(); k++)
	{
		assignment a;
		for (int i = 0; i < n; i++)
			if (k->get(i) == 0 or k->get(i) == 1)
				a[net.nodes[i].name] = k->get(i);
		result.push_back(a);
	}

	return success;
}

command_solver::command_solver()
{
}

command_solver::command_solver(string command)
{
	this->command = command;
}

command_solver::~command_solver()
{
}

namespace {

// Run cmd through the shell and collect its standard output. With a budget
// of max_seconds, the process group is killed once the budget runs out and
// the result is resource_exceeded. A non-zero exit is a solver_failure.
int run_command(const string &cmd, float max_seconds, string &output)
{
	output.clear();

	int fds[2];
	if (pipe(fds) < 0)
	{
		error("", "unable to create a pipe for '" + cmd + "'", __FILE__, __LINE__);
		return solver_failure;
	}

	pid_t pid = fork();
	if (pid < 0)
	{
		close(fds[0]);
		close(fds[1]);
		error("", "unable to fork for '" + cmd + "'", __FILE__, __LINE__);
		return solver_failure;
	}
	else if (pid == 0)
	{
		setpgid(0, 0);
		dup2(fds[1], STDOUT_FILENO);
		close(fds[0]);
		close(fds[1]);
		execl("/bin/sh", "sh", "-c", cmd.c_str(), (char*)NULL);
		_exit(127);
	}

	close(fds[1]);

	Timer tmr;
	bool expired = false;
	bool broken = false;
	char buffer[1024];
	while (true)
	{
		int wait = -1;
		if (max_seconds > 0.0f)
		{
			double left = max_seconds - tmr.since();
			if (left <= 0.0)
			{
				expired = true;
				break;
			}
			wait = (int)(left*1000.0) + 1;
		}

		struct pollfd pfd;
		pfd.fd = fds[0];
		pfd.events = POLLIN;
		pfd.revents = 0;
		int ready = ::poll(&pfd, 1, wait);
		if (ready < 0 and errno == EINTR)
			continue;
		else if (ready < 0)
		{
			broken = true;
			break;
		}
		else if (ready == 0)
			continue;

		ssize_t got = read(fds[0], buffer, sizeof(buffer));
		if (got < 0 and errno == EINTR)
			continue;
		else if (got < 0)
		{
			broken = true;
			break;
		}
		else if (got == 0)
			break;

		output.append(buffer, (size_t)got);
	}
	close(fds[0]);

	// The output is closed, but the process may still be running.
	int wstatus = 0;
	if (max_seconds > 0.0f)
	{
		while (not expired)
		{
			pid_t done = waitpid(pid, &wstatus, WNOHANG);
			if (done == pid)
				break;
			else if (done < 0 and errno != EINTR)
			{
				broken = true;
				break;
			}
			else if (tmr.since() > max_seconds)
				expired = true;
			else
				::poll(NULL, 0, 10);
		}

		if (expired)
		{
			kill(-pid, SIGKILL);
			kill(pid, SIGKILL);
			while (waitpid(pid, &wstatus, 0) < 0 and errno == EINTR);
			error("", "'" + cmd + "' ran out of time after " + std::to_string(max_seconds) + " seconds", __FILE__, __LINE__);
			return resource_exceeded;
		}
	}
	else
	{
		while (waitpid(pid, &wstatus, 0) < 0)
		{
			if (errno != EINTR)
			{
				broken = true;
				break;
			}
		}
	}

	if (broken)
	{
		error("", "lost track of '" + cmd + "'", __FILE__, __LINE__);
		return solver_failure;
	}

	if (not WIFEXITED(wstatus) or WEXITSTATUS(wstatus) != 0)
	{
		int code = WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : -1;
		error("", "'" + cmd + "' exited with status " + ::to_string(code), __FILE__, __LINE__);
		return solver_failure;
	}

	return success;
}

}

int command_solver::minimal_trap_spaces(const string &rules, vector<assignment> &result, limits lim)
{
	result.clear();
	if (command.empty())
	{
		error("", "no trap space solver command configured", __FILE__, __LINE__);
		return solver_failure;
	}

	vector<string> ids;
	vector<bnet_line> lines = read_bnet_lines(rules);
	for (auto line = lines.begin(); line != lines.end(); line++)
		ids.push_back(line->target);

	char path[] = "/tmp/rbn_rules_XXXXXX";
	int fd = mkstemp(path);
	if (fd < 0)
	{
		error("", "unable to create a temporary rule file", __FILE__, __LINE__);
		return solver_failure;
	}

	FILE *fout = fdopen(fd, "w");
	if (fout == NULL)
	{
		close(fd);
		unlink(path);
		error("", "unable to write the temporary rule file", __FILE__, __LINE__);
		return solver_failure;
	}
	bool written = fputs(rules.c_str(), fout) >= 0;
	written = fclose(fout) == 0 and written;
	if (not written)
	{
		unlink(path);
		error("", "unable to write the temporary rule file", __FILE__, __LINE__);
		return solver_failure;
	}

	string output;
	int code = run_command(command + " " + path, lim.max_seconds, output);
	unlink(path);
	if (code != success)
		return code;

	std::istringstream fin(output);
	string line;
	while (getline(fin, line))
	{
		line = trim(line);
		if (line.empty())
			continue;

		assignment a;
		if (not parse_subspace(line, ids, a))
		{
			error("", "malformed trap space \"" + line + "\" from solver '" + command + "'", __FILE__, __LINE__);
			result.clear();
			return solver_failure;
		}
		result.push_back(a);
	}

	return success;
}

string solver_id(int node)
{
	return "v" + ::to_string(node);
}

bool parse_subspace(const string &line, const vector<string> &ids, assignment &result)
{
	result.clear();
	if (line.size() != ids.size())
		return false;

	for (int i = 0; i < (int)line.size(); i++)
	{
		if (line[i] == '0' or line[i] == '1')
			result[ids[i]] = line[i] - '0';
		else if (line[i] != '-')
			return false;
	}
	return true;
}

int translate_network(const network &net, string &rules)
{
	rules.clear();

	vector<string> names = net.names();
	map<string, int> ids;
	for (int i = 0; i < (int)names.size(); i++)
		ids.insert(pair<string, int>(names[i], i));

	vector<string> exprs = net.expressions();
	for (int i = 0; i < (int)exprs.size(); i++)
	{
		string translated;
		if (not translate_expression(exprs[i], ids, translated))
		{
			internal("", "unable to translate rule f" + ::to_string(i) + " = " + exprs[i], __FILE__, __LINE__);
			rules.clear();
			return translation_error;
		}

		rules += solver_id(i) + ", " + translated + "\n";
	}

	return success;
}

namespace {

// Map a solver identifier back to its node, -1 if it is not one of ours.
int node_of(const string &id, int size)
{
	if (id.size() < 2 or id[0] != 'v' or id.size() > 10)
		return -1;

	int result = 0;
	for (int i = 1; i < (int)id.size(); i++)
	{
		if (id[i] < '0' or id[i] > '9')
			return -1;
		result = result*10 + (id[i] - '0');
	}

	return result < size ? result : -1;
}

}

int find_async_attractors(const network &net, trap_space_solver &solver, vector<attractor> &result, limits lim)
{
	result.clear();

	string rules;
	int code = translate_network(net, rules);
	if (code != success)
		return code;

	vector<assignment> spaces;
	code = solver.minimal_trap_spaces(rules, spaces, lim);
	if (code == resource_exceeded)
	{
		error("", "asynchronous attractor analysis unavailable, the trap space solver ran out of budget", __FILE__, __LINE__);
		return resource_exceeded;
	}
	else if (code != success)
	{
		error("", "asynchronous attractor analysis unavailable, the trap space solver failed", __FILE__, __LINE__);
		return solver_failure;
	}

	int n = net.size();
	vector<subspace> subspaces;
	subspaces.reserve(spaces.size());
	for (auto s = spaces.begin(); s != spaces.end(); s++)
	{
		subspace space;
		space = 1;
		for (auto v = s->begin(); v != s->end(); v++)
		{
			int i = node_of(v->first, n);
			if (i < 0 or (v->second != 0 and v->second != 1))
			{
				error("", "trap space solver returned an invalid assignment " + v->first + "=" + ::to_string(v->second), __FILE__, __LINE__);
				return solver_failure;
			}
			space.set(i, v->second);
		}

		int free = free_count(space, n);
		if (free > 62 or ((uint64_t)1 << free) > lim.max_states)
		{
			error("", "trap space " + rbn::to_string(space, n) + " has too many states to expand", __FILE__, __LINE__);
			return resource_exceeded;
		}
		subspaces.push_back(space);
	}

	for (auto s = subspaces.begin(); s != subspaces.end(); s++)
	{
		attractor a = expand(*s, n);
		if (find(result.begin(), result.end(), a) == result.end())
			result.push_back(a);
	}

	return success;
}

}
