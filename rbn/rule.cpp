#include "rule.h"
#include <common/text.h>

#include <cstdint>

namespace rbn
{

rule::rule()
{
	kind = constant;
	value = 0;
	invert = false;
}

rule::rule(int value)
{
	kind = constant;
	this->value = value != 0 ? 1 : 0;
	invert = false;
}

rule::rule(vector<bool> negated, vector<int> ops, bool invert)
{
	kind = fold;
	value = 0;
	this->negated = negated;
	this->ops = ops;
	this->invert = invert;
}

// The arity of a composite rule is stored in negated so that every kind
// reports it the same way. Composite rules never negate individual slots.
rule::rule(boolean::cover expr, int arity)
{
	kind = composite;
	value = 0;
	this->expr = expr;
	negated.resize(arity, false);
	invert = false;
}

rule::~rule()
{

}

int rule::arity() const
{
	return kind == constant ? 0 : (int)negated.size();
}

int rule::evaluate(const vector<int> &bits) const
{
	if (kind == constant)
		return value;
	else if (kind == composite)
		return rbn::evaluate(expr, bits);

	if (negated.empty())
		return invert ? 1 : 0;

	int out = negated[0] ? 1-bits[0] : bits[0];
	for (int i = 1; i < (int)negated.size(); i++)
	{
		int b = negated[i] ? 1-bits[i] : bits[i];
		if (ops[i-1] == op_and)
			out = out & b;
		else
			out = out | b;
	}

	if (invert)
		out = 1-out;

	return out != 0 ? 1 : 0;
}

string rule::to_string(const vector<string> &names) const
{
	if (kind == constant)
		return ::to_string(value);
	else if (kind == composite)
	{
		netlist nets(names);
		return emit_expression(expr, nets);
	}

	string result = (negated[0] ? "¬" : "") + names[0];
	for (int i = 1; i < (int)negated.size(); i++)
	{
		string operand = (negated[i] ? "¬" : "") + names[i];
		result = "(" + result + (ops[i-1] == op_and ? " ∧ " : " ∨ ") + operand + ")";
	}

	if (invert)
		result = "¬(" + result + ")";

	return result;
}

bool operator==(const rule &r0, const rule &r1)
{
	if (r0.kind != r1.kind)
		return false;

	if (r0.kind == rule::constant)
		return r0.value == r1.value;
	else if (r0.kind == rule::fold)
		return r0.negated == r1.negated && r0.ops == r1.ops && r0.invert == r1.invert;

	// Composite rules compare by truth table.
	if (r0.arity() != r1.arity())
		return false;

	int k = r0.arity();
	vector<int> bits(k, 0);
	for (uint64_t mask = 0; mask < ((uint64_t)1 << k); mask++)
	{
		for (int i = 0; i < k; i++)
			bits[i] = (int)((mask >> i) & 1);
		if (r0.evaluate(bits) != r1.evaluate(bits))
			return false;
	}
	return true;
}

bool operator!=(const rule &r0, const rule &r1)
{
	return not (r0 == r1);
}

rule random_rule(int k, std::mt19937 &rng)
{
	std::bernoulli_distribution coin(0.5);
	if (k <= 0)
		return rule(coin(rng) ? 1 : 0);

	vector<int> ops;
	ops.reserve(k-1);
	for (int i = 0; i < k-1; i++)
		ops.push_back(coin(rng) ? rule::op_and : rule::op_or);

	vector<bool> negated;
	negated.reserve(k);
	for (int i = 0; i < k; i++)
		negated.push_back(coin(rng));

	bool invert = coin(rng);

	return rule(negated, ops, invert);
}

}
