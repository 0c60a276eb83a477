#include <gtest/gtest.h>

#include <random>
#include <vector>

#include <rbn/network.h>
#include <rbn/state.h>
#include <rbn/simulator.h>

#include "helpers.h"

using namespace rbn;
using namespace std;

TEST(Simulator, StateIndex) {
	state s(vector<int>{1, 0, 1});
	EXPECT_EQ(s.size, 3);
	EXPECT_EQ(s.index(), 5u);
	EXPECT_EQ(state::from_index(5, 3), s);
	EXPECT_EQ(s.to_string(), "(1,0,1)");
	EXPECT_EQ(s.values(), (vector<int>{1, 0, 1}));

	for (uint64_t i = 0; i < 16; i++) {
		EXPECT_EQ(state::from_index(i, 4).index(), i);
	}
}

TEST(Simulator, ChainReachesAllOnes) {
	network net = chain_network();
	state target(vector<int>{1, 1, 1});

	for (uint64_t i = 0; i < 8; i++) {
		state s = state::from_index(i, 3);
		s = update_sync(update_sync(s, net), net);
		EXPECT_EQ(s, target);
	}
}

TEST(Simulator, SyncReadsPriorState) {
	// both nodes must swap, not copy the already updated value
	network net = swap_network();
	state s(vector<int>{0, 1});
	EXPECT_EQ(update_sync(s, net), state(vector<int>{1, 0}));
}

TEST(Simulator, ConstantsIgnoreState) {
	network net = make_network({{}, {}, {}}, {rule(1), rule(0), rule(1)});
	state expect(vector<int>{1, 0, 1});
	for (uint64_t i = 0; i < 8; i++) {
		EXPECT_EQ(update_sync(state::from_index(i, 3), net), expect);
	}
}

TEST(Simulator, AsyncFlipsAtMostOneBit) {
	std::mt19937 rng(17);
	network net;
	ASSERT_EQ(generate_network(net, 3, 2, rng), 0);

	trajectory t = simulate(net, 500, asynchronous, rng);
	ASSERT_EQ(t.size(), 501u);
	for (int i = 1; i < (int)t.size(); i++) {
		int changed = 0;
		for (int j = 0; j < 3; j++) {
			changed += t[i].get(j) != t[i-1].get(j);
		}
		EXPECT_LE(changed, 1);
	}
}

TEST(Simulator, AsyncPicksNodesUniformly) {
	// Every node negates itself, so each step flips exactly the chosen node.
	network net = make_network({{0}, {1}, {2}}, {negate_rule(), negate_rule(), negate_rule()});
	std::mt19937 rng(99);

	const int steps = 30000;
	vector<int> counts(3, 0);
	state s(3);
	for (int i = 0; i < steps; i++) {
		state next = update_async(s, net, rng);
		int changed = 0;
		for (int j = 0; j < 3; j++) {
			if (next.get(j) != s.get(j)) {
				counts[j]++;
				changed++;
			}
		}
		EXPECT_EQ(changed, 1);
		s = next;
	}

	for (int j = 0; j < 3; j++) {
		EXPECT_NEAR((double)counts[j]/steps, 1.0/3.0, 0.02);
	}
}

TEST(Simulator, AsyncLeavesParentlessNodes) {
	network net = make_network({{}, {}}, {rule(1), rule(1)});
	std::mt19937 rng(2);
	state s(vector<int>{0, 0});
	for (int i = 0; i < 100; i++) {
		EXPECT_EQ(update_async(s, net, rng), s);
	}
}

TEST(Simulator, SimulateLength) {
	network net = chain_network();
	std::mt19937 rng(4);

	trajectory t = simulate(net, 0, synchronous, rng);
	EXPECT_EQ(t.size(), 1u);

	t = simulate(net, 6, synchronous, rng);
	ASSERT_EQ(t.size(), 7u);
	EXPECT_EQ(t.back(), state(vector<int>{1, 1, 1}));
	for (int i = 1; i < (int)t.size(); i++) {
		EXPECT_EQ(t[i], update_sync(t[i-1], net));
	}
}

TEST(Simulator, SameSeedSameTrajectory) {
	std::mt19937 rng(8);
	network net;
	ASSERT_EQ(generate_network(net, 6, 3, rng), 0);

	std::mt19937 rng0(21);
	std::mt19937 rng1(21);
	EXPECT_EQ(simulate(net, 40, asynchronous, rng0), simulate(net, 40, asynchronous, rng1));
}

TEST(Simulator, Stepping) {
	network net = swap_network();
	std::mt19937 rng(0);
	simulator sim(&net, &rng);
	sim.reset(state(vector<int>{1, 0}));

	EXPECT_EQ(sim.step(synchronous), state(vector<int>{0, 1}));
	EXPECT_EQ(sim.step(synchronous), state(vector<int>{1, 0}));
	EXPECT_EQ(sim.current, state(vector<int>{1, 0}));
}

TEST(Simulator, Sample) {
	trajectory t;
	for (uint64_t i = 0; i < 7; i++) {
		t.push_back(state::from_index(i, 3));
	}

	trajectory s = sample(t, 3);
	ASSERT_EQ(s.size(), 3u);
	EXPECT_EQ(s[0].index(), 0u);
	EXPECT_EQ(s[1].index(), 3u);
	EXPECT_EQ(s[2].index(), 6u);

	EXPECT_EQ(sample(t, 1), t);
}
