#include "simulator.h"
#include <common/message.h>

namespace rbn
{

const char *discipline_name(int d)
{
	return d == asynchronous ? "async" : "sync";
}

int evaluate(const network &net, int node, const state &s)
{
	const rbn::node &n = net.nodes[node];
	vector<int> bits;
	bits.reserve(n.parents.size());
	for (int i = 0; i < (int)n.parents.size(); i++)
		bits.push_back(s.get(n.parents[i]));
	return n.update.evaluate(bits);
}

state update_sync(const state &s, const network &net)
{
	state result = s;
	for (int i = 0; i < net.size(); i++)
		result.set(i, evaluate(net, i, s));
	return result;
}

state update_async(const state &s, const network &net, std::mt19937 &rng)
{
	state result = s;
	if (net.size() == 0)
		return result;

	std::uniform_int_distribution<int> pick(0, net.size()-1);
	int i = pick(rng);
	if (not net.nodes[i].parents.empty())
		result.set(i, evaluate(net, i, s));
	return result;
}

simulator::simulator()
{
	base = NULL;
	rng = NULL;
}

simulator::simulator(const network *base, std::mt19937 *rng)
{
	this->base = base;
	this->rng = rng;
	if (base != NULL)
		current = state(base->size());
}

simulator::~simulator()
{

}

void simulator::reset()
{
	if (base == NULL or rng == NULL)
	{
		internal("", "NULL pointer to simulator::base", __FILE__, __LINE__);
		return;
	}

	current = state::random(base->size(), *rng);
}

void simulator::reset(state initial)
{
	current = initial;
}

state simulator::step(int discipline)
{
	if (base == NULL)
	{
		internal("", "NULL pointer to simulator::base", __FILE__, __LINE__);
		return current;
	}

	if (discipline == synchronous)
		current = update_sync(current, *base);
	else if (rng != NULL)
		current = update_async(current, *base, *rng);
	else
		internal("", "NULL pointer to simulator::rng", __FILE__, __LINE__);

	return current;
}

trajectory simulate(const network &net, int steps, int discipline, std::mt19937 &rng)
{
	simulator sim(&net, &rng);
	sim.reset();

	trajectory result;
	result.reserve(steps+1);
	result.push_back(sim.current);
	for (int i = 0; i < steps; i++)
		result.push_back(sim.step(discipline));
	return result;
}

trajectory sample(const trajectory &t, int stride)
{
	if (stride < 1)
		stride = 1;

	trajectory result;
	result.reserve(t.size()/stride + 1);
	for (int i = 0; i < (int)t.size(); i += stride)
		result.push_back(t[i]);
	return result;
}

}
