#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include <rbn/expression.h>
#include <rbn/netlist.h>

using namespace rbn;
using namespace std;

TEST(Expression, ParsePrecedence) {
	netlist nets;
	boolean::cover e;
	ASSERT_TRUE(parse_bnet_expression("a | b & !c", nets, e));
	ASSERT_EQ(nets.netCount(), 3);
	EXPECT_EQ(nets.netAt(0), "a");
	EXPECT_EQ(nets.netAt(1), "b");
	EXPECT_EQ(nets.netAt(2), "c");

	// a ∨ (b ∧ ¬c)
	EXPECT_EQ(evaluate(e, {0, 1, 0}), 1);
	EXPECT_EQ(evaluate(e, {0, 1, 1}), 0);
	EXPECT_EQ(evaluate(e, {1, 0, 1}), 1);
	EXPECT_EQ(evaluate(e, {0, 0, 0}), 0);
}

TEST(Expression, ParseReusesNames) {
	netlist nets(vector<string>{"x", "y"});
	boolean::cover e;
	ASSERT_TRUE(parse_bnet_expression("(y & x) | !(x)", nets, e));
	EXPECT_EQ(nets.netCount(), 2);

	// (y ∧ x) ∨ ¬x
	EXPECT_EQ(evaluate(e, {0, 0}), 1);
	EXPECT_EQ(evaluate(e, {1, 0}), 0);
	EXPECT_EQ(evaluate(e, {1, 1}), 1);
}

TEST(Expression, ParseConstants) {
	netlist nets;
	boolean::cover e;
	ASSERT_TRUE(parse_bnet_expression("true", nets, e));
	EXPECT_TRUE(e.is_tautology());
	EXPECT_EQ(evaluate(e, vector<int>()), 1);

	ASSERT_TRUE(parse_bnet_expression("0", nets, e));
	EXPECT_EQ(evaluate(e, vector<int>()), 0);
	EXPECT_EQ(nets.netCount(), 0);
}

TEST(Expression, ParseErrors) {
	netlist nets;
	boolean::cover e;
	EXPECT_FALSE(parse_bnet_expression("a &", nets, e));
	EXPECT_FALSE(parse_bnet_expression("(a | b", nets, e));
	EXPECT_FALSE(parse_bnet_expression("a ⊕ b", nets, e));
}

TEST(Expression, Variables) {
	boolean::cover a(0, 1), c(2, 0), d(3, 1);
	boolean::cover e = (a & c) | d;
	vector<int> vars = variables(e, 5);
	ASSERT_EQ(vars.size(), 3u);
	EXPECT_EQ(vars[0], 0);
	EXPECT_EQ(vars[1], 2);
	EXPECT_EQ(vars[2], 3);

	EXPECT_TRUE(variables(boolean::cover(1), 5).empty());
}

TEST(Expression, Remap) {
	// x2 ∧ ¬x4 renumbered onto slots 0 and 1
	boolean::cover e = boolean::cover(2, 1) & boolean::cover(4, 0);
	vector<int> slot = {-1, -1, 0, -1, 1};
	boolean::cover r = remap(e, slot);

	vector<int> vars = variables(r, 5);
	ASSERT_EQ(vars.size(), 2u);
	EXPECT_EQ(vars[0], 0);
	EXPECT_EQ(vars[1], 1);
	EXPECT_EQ(evaluate(r, {1, 0}), 1);
	EXPECT_EQ(evaluate(r, {1, 1}), 0);
	EXPECT_EQ(evaluate(r, {0, 0}), 0);
}

TEST(Expression, EmitUsesNames) {
	netlist nets(vector<string>{"X0", "X1"});
	boolean::cover e = boolean::cover(0, 1) & boolean::cover(1, 0);
	string text = emit_expression(e, nets);
	EXPECT_NE(text.find("X0"), string::npos);
	EXPECT_NE(text.find("X1"), string::npos);

	// whatever the printer produces reads back as the same function
	string bnet;
	ASSERT_TRUE(to_bnet(text, bnet));
	boolean::cover back;
	ASSERT_TRUE(parse_bnet_expression(bnet, nets, back));
	EXPECT_EQ(nets.netCount(), 2);
	for (int i = 0; i < 4; i++) {
		vector<int> bits = {i & 1, (i >> 1) & 1};
		EXPECT_EQ(evaluate(back, bits), evaluate(e, bits));
	}
}

TEST(Expression, ToBnet) {
	string result;
	ASSERT_TRUE(to_bnet("¬((X0 ∧ ¬X1) ∨ X2)", result));
	EXPECT_EQ(result, "!((X0 & !X1) | X2)");

	ASSERT_TRUE(to_bnet("~a&b|c", result));
	EXPECT_EQ(result, "!a&b|c");
}

TEST(Expression, Translate) {
	map<string, int> ids = {{"X0", 0}, {"X1", 1}, {"X12", 12}};
	string result;
	ASSERT_TRUE(translate_expression("¬((X0 ∧ ¬X12) ∨ X1)", ids, result));
	EXPECT_EQ(result, "!((v0 & !v12) | v1)");

	ASSERT_TRUE(translate_expression("1", ids, result));
	EXPECT_EQ(result, "1");
}

TEST(Expression, TranslateRejectsUnknown) {
	map<string, int> ids = {{"X0", 0}};
	string result;
	EXPECT_FALSE(translate_expression("(X0 ∧ X7)", ids, result));
	EXPECT_FALSE(translate_expression("X0 ⊕ X0", ids, result));
}
