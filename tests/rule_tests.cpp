#include <gtest/gtest.h>

#include <random>
#include <vector>

#include <rbn/rule.h>

using namespace rbn;
using namespace std;

TEST(Rule, ConstantIgnoresInputs) {
	rule r(1);
	EXPECT_EQ(r.kind, rule::constant);
	EXPECT_EQ(r.arity(), 0);
	EXPECT_EQ(r.evaluate(vector<int>()), 1);
	EXPECT_EQ(r.to_string(vector<string>()), "1");

	EXPECT_EQ(rule(0).evaluate(vector<int>()), 0);
}

TEST(Rule, FoldNegatesOperands) {
	// X0 ∧ ¬X1
	rule r(vector<bool>{false, true}, vector<int>{rule::op_and}, false);
	EXPECT_EQ(r.arity(), 2);
	EXPECT_EQ(r.evaluate({0, 0}), 0);
	EXPECT_EQ(r.evaluate({1, 0}), 1);
	EXPECT_EQ(r.evaluate({0, 1}), 0);
	EXPECT_EQ(r.evaluate({1, 1}), 0);
	EXPECT_EQ(r.to_string({"X0", "X1"}), "(X0 ∧ ¬X1)");
}

TEST(Rule, FoldAssociatesLeft) {
	// ((a ∧ b) ∨ c) is 1 for a=0, b=0, c=1 where (a ∧ (b ∨ c)) would be 0
	rule r(vector<bool>{false, false, false}, vector<int>{rule::op_and, rule::op_or}, false);
	EXPECT_EQ(r.evaluate({0, 0, 1}), 1);
	EXPECT_EQ(r.evaluate({1, 0, 0}), 0);
	EXPECT_EQ(r.to_string({"X0", "X3", "X1"}), "((X0 ∧ X3) ∨ X1)");
}

TEST(Rule, WholeNegation) {
	rule r(vector<bool>{false, true, false}, vector<int>{rule::op_and, rule::op_or}, true);
	EXPECT_EQ(r.to_string({"X0", "X1", "X2"}), "¬((X0 ∧ ¬X1) ∨ X2)");
	EXPECT_EQ(r.evaluate({1, 0, 0}), 0);
	EXPECT_EQ(r.evaluate({0, 0, 0}), 1);

	rule single(vector<bool>{true}, vector<int>(), true);
	EXPECT_EQ(single.to_string({"X4"}), "¬(¬X4)");
	EXPECT_EQ(single.evaluate({1}), 1);
}

TEST(Rule, RandomConstant) {
	std::mt19937 rng(7);
	for (int i = 0; i < 20; i++) {
		rule r = random_rule(0, rng);
		EXPECT_EQ(r.kind, rule::constant);
		EXPECT_EQ(r.arity(), 0);
		EXPECT_TRUE(r.value == 0 or r.value == 1);
	}
}

TEST(Rule, RandomFoldShape) {
	std::mt19937 rng(11);
	for (int k = 1; k <= 5; k++) {
		rule r = random_rule(k, rng);
		EXPECT_EQ(r.kind, rule::fold);
		EXPECT_EQ(r.arity(), k);
		EXPECT_EQ((int)r.negated.size(), k);
		EXPECT_EQ((int)r.ops.size(), k-1);
	}
}

TEST(Rule, RandomRuleIsCommitted) {
	// The same rule must compute the same function on every evaluation.
	std::mt19937 rng(3);
	for (int trial = 0; trial < 50; trial++) {
		int k = 1 + trial%4;
		rule r = random_rule(k, rng);
		vector<int> bits(k, 0);
		for (int mask = 0; mask < (1 << k); mask++) {
			for (int i = 0; i < k; i++) {
				bits[i] = (mask >> i) & 1;
			}
			int first = r.evaluate(bits);
			EXPECT_EQ(r.evaluate(bits), first);
		}
	}
}

TEST(Rule, SameSeedSameRules) {
	std::mt19937 rng0(42);
	std::mt19937 rng1(42);
	for (int k = 0; k < 6; k++) {
		EXPECT_EQ(random_rule(k, rng0), random_rule(k, rng1));
	}
}

TEST(Rule, CompositeComparesByFunction) {
	// ¬(a ∧ b) and ¬a ∨ ¬b
	boolean::cover a(0, 1), b(1, 1);
	rule r0(~(a & b), 2);
	rule r1(~a | ~b, 2);
	rule r2(a | b, 2);
	EXPECT_EQ(r0, r1);
	EXPECT_NE(r0, r2);
	EXPECT_EQ(r0.arity(), 2);
}

TEST(Rule, CompositeEvaluatesCover) {
	// x0 ∧ ¬x1
	rule r(boolean::cover(0, 1) & boolean::cover(1, 0), 2);
	EXPECT_EQ(r.kind, rule::composite);
	EXPECT_EQ(r.evaluate({1, 0}), 1);
	EXPECT_EQ(r.evaluate({1, 1}), 0);
	EXPECT_EQ(r.evaluate({0, 0}), 0);

	string text = r.to_string({"P", "Q"});
	EXPECT_NE(text.find("P"), string::npos);
	EXPECT_NE(text.find("Q"), string::npos);
}
