#pragma once

#include <common/standard.h>
#include <random>

#include "expression.h"

namespace rbn
{

// An update rule computes the next value of a node from the current values of
// its parents. The input bit-vector is ordered like the node's parent list.
//
// A rule is an immutable value. All of the random choices are made once by
// random_rule() and stored here so that every evaluation of the rule, over
// every trajectory, computes the same function.
struct rule
{
	enum
	{
		// A function of no inputs that always returns value.
		constant = 0,

		// The operands (each possibly negated) are folded strictly from the
		// left, ((a op0 b) op1 c) ..., and the result is optionally negated.
		fold = 1,

		// An arbitrary expression over the parent slots, used for rules read
		// from a model file.
		composite = 2
	};

	enum
	{
		op_and = 0,
		op_or = 1
	};

	rule();
	rule(int value);
	rule(vector<bool> negated, vector<int> ops, bool invert);
	rule(boolean::cover expr, int arity);
	~rule();

	int kind;

	// constant
	int value;

	// fold
	vector<bool> negated; // one per operand
	vector<int> ops;      // one fewer than the operands, op_and or op_or
	bool invert;          // negation of the whole expression

	// composite, variable i of the cover is parent slot i
	boolean::cover expr;

	int arity() const;
	int evaluate(const vector<int> &bits) const;

	// The rule as a readable expression over the given operand names using
	// ¬, ∧ and ∨, for example ¬((X0 ∧ ¬X3) ∨ X1).
	string to_string(const vector<string> &names) const;
};

bool operator==(const rule &r0, const rule &r1);
bool operator!=(const rule &r0, const rule &r1);

// Generate a random rule for a node with k parents. With no parents this
// is a random constant.
rule random_rule(int k, std::mt19937 &rng);

}
