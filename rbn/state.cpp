#include "state.h"
#include <common/text.h>

namespace rbn
{

state::state()
{
	encoding = 1;
	size = 0;
}

state::state(int size)
{
	this->size = size;
	encoding = 1;
	for (int i = 0; i < size; i++)
		encoding.set(i, 0);
}

state::state(vector<int> values)
{
	size = (int)values.size();
	encoding = 1;
	for (int i = 0; i < (int)values.size(); i++)
		encoding.set(i, values[i] != 0 ? 1 : 0);
}

state::~state()
{

}

int state::get(int node) const
{
	return encoding.get(node);
}

void state::set(int node, int value)
{
	encoding.set(node, value != 0 ? 1 : 0);
}

uint64_t state::index() const
{
	uint64_t result = 0;
	for (int i = 0; i < size; i++)
		if (encoding.get(i) == 1)
			result |= ((uint64_t)1 << i);
	return result;
}

state state::from_index(uint64_t index, int size)
{
	state result(size);
	for (int i = 0; i < size; i++)
		if ((index >> i) & 1)
			result.encoding.set(i, 1);
	return result;
}

state state::random(int size, std::mt19937 &rng)
{
	std::bernoulli_distribution coin(0.5);
	state result(size);
	for (int i = 0; i < size; i++)
		if (coin(rng))
			result.encoding.set(i, 1);
	return result;
}

vector<int> state::values() const
{
	vector<int> result;
	result.reserve(size);
	for (int i = 0; i < size; i++)
		result.push_back(encoding.get(i));
	return result;
}

string state::to_string() const
{
	string result = "(";
	for (int i = 0; i < size; i++)
	{
		if (i != 0)
			result += ",";
		result += ::to_string(encoding.get(i));
	}
	result += ")";
	return result;
}

ostream &operator<<(ostream &os, const state &s)
{
	os << s.to_string();
	return os;
}

bool operator<(const state &s0, const state &s1)
{
	return (s0.size < s1.size) ||
		   (s0.size == s1.size && s0.index() < s1.index());
}

bool operator>(const state &s0, const state &s1)
{
	return (s0.size > s1.size) ||
		   (s0.size == s1.size && s0.index() > s1.index());
}

bool operator<=(const state &s0, const state &s1)
{
	return not (s0 > s1);
}

bool operator>=(const state &s0, const state &s1)
{
	return not (s0 < s1);
}

bool operator==(const state &s0, const state &s1)
{
	return s0.size == s1.size && s0.index() == s1.index();
}

bool operator!=(const state &s0, const state &s1)
{
	return not (s0 == s1);
}

attractor merge(const vector<attractor> &attractors)
{
	attractor result;
	for (auto a = attractors.begin(); a != attractors.end(); a++)
		result.insert(a->begin(), a->end());
	return result;
}

int free_count(const subspace &s, int size)
{
	int result = 0;
	for (int i = 0; i < size; i++)
		if (s.get(i) != 0 and s.get(i) != 1)
			result++;
	return result;
}

// s0 is a subset of s1 if every node that s1 fixes is fixed to the same value
// in s0.
bool is_subset_of(const subspace &s0, const subspace &s1, int size)
{
	for (int i = 0; i < size; i++)
	{
		int v1 = s1.get(i);
		if ((v1 == 0 or v1 == 1) and s0.get(i) != v1)
			return false;
	}
	return true;
}

string to_string(const subspace &s, int size)
{
	string result;
	for (int i = 0; i < size; i++)
	{
		int v = s.get(i);
		if (v == 0)
			result.push_back('0');
		else if (v == 1)
			result.push_back('1');
		else
			result.push_back('-');
	}
	return result;
}

attractor expand(const subspace &s, int size)
{
	vector<int> free;
	state base(size);
	for (int i = 0; i < size; i++)
	{
		int v = s.get(i);
		if (v == 0 or v == 1)
			base.set(i, v);
		else
			free.push_back(i);
	}

	attractor result;
	uint64_t total = (uint64_t)1 << free.size();
	for (uint64_t mask = 0; mask < total; mask++)
	{
		state x = base;
		for (int j = 0; j < (int)free.size(); j++)
			x.set(free[j], (int)((mask >> j) & 1));
		result.insert(x);
	}
	return result;
}

}
