#include "proportion.h"

#include <cstdio>

namespace rbn
{

proportion::proportion()
{
	transient = 1.0;
	attractor = 0.0;
}

proportion::proportion(double transient, double attractor)
{
	this->transient = transient;
	this->attractor = attractor;
}

proportion::~proportion()
{

}

string proportion::to_string() const
{
	char buffer[64];
	snprintf(buffer, sizeof(buffer), "%.3f, %.3f", transient, attractor);
	return buffer;
}

proportion compute_proportions(const trajectory &t, const vector<attractor> &attractors)
{
	if (attractors.empty())
		return proportion(1.0, 0.0);

	return compute_proportions(t, merge(attractors));
}

proportion compute_proportions(const trajectory &t, const attractor &recurrent)
{
	if (t.empty() or recurrent.empty())
		return proportion(1.0, 0.0);

	int count = 0;
	for (auto s = t.begin(); s != t.end(); s++)
		if (recurrent.find(*s) != recurrent.end())
			count++;

	double a = (double)count / (double)t.size();
	return proportion(1.0 - a, a);
}

proportion estimate_proportions(const trajectory &t)
{
	map<state, int> seen;
	for (int i = 0; i < (int)t.size(); i++)
	{
		auto loc = seen.find(t[i]);
		if (loc != seen.end())
		{
			double total = (double)t.size();
			return proportion((double)loc->second / total, (double)(t.size() - loc->second) / total);
		}
		seen.insert(pair<state, int>(t[i], i));
	}

	return proportion(1.0, 0.0);
}

}
