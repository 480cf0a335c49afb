#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "behavior.h"
#include "conflict.h"
#include "hpnerror.h"
#include "petrinet.h"
#include "sampler.h"

using namespace std;

namespace {

class ConflictTest : public ::testing::Test
{
protected:
    HPetriNet net{"conflicts"};
    SimClock clock;
    Sampler sampler{uint64_t(11)};
    BehaviorFactory factory{clock, sampler};
    vector<unique_ptr<TransitionBehavior>> owned;

    DiscreteBehavior* add(const string& name, TransitionParams params = ImmediateParams{}, int priority = 0)
    {
        auto t = net.createTransition(name, params, priority);
        owned.emplace_back(factory.create(t));
        return dynamic_cast<DiscreteBehavior*>(owned.back().get());
    }
};

} // namespace

TEST(ConflictPolicyNames, ParseAndPrint)
{
    for(auto p:{ConflictPolicy::Random, ConflictPolicy::Priority, ConflictPolicy::RoundRobin, ConflictPolicy::TypeBased})
        EXPECT_EQ(parsePolicy(policyName(p)), p);
    EXPECT_EQ(policyName(ConflictPolicy::RoundRobin), "round_robin");
    EXPECT_THROW(parsePolicy("fifo"), HPNConfigError);
}

TEST_F(ConflictTest, EmptyCandidateListSelectsNothing)
{
    ConflictResolver resolver(net.transitions(), ConflictPolicy::Priority, sampler);
    EXPECT_EQ(resolver.select({}), nullptr);
}

TEST_F(ConflictTest, PriorityPicksHighestThenInsertionOrder)
{
    auto low = add("Low", ImmediateParams{}, 1);
    auto highA = add("HighA", ImmediateParams{}, 5);
    auto highB = add("HighB", ImmediateParams{}, 5);
    ConflictResolver resolver(net.transitions(), ConflictPolicy::Priority, sampler);
    EXPECT_EQ(resolver.select({low, highB, highA}), highA);
    EXPECT_EQ(resolver.select({low, highB}), highB);
    EXPECT_EQ(resolver.select({low}), low);
}

TEST_F(ConflictTest, TypeBasedOrdersImmediateTimedStochastic)
{
    auto stochastic = add("S", StochasticParams{});
    auto timed = add("T", TimedParams{});
    auto immediate = add("I");
    ConflictResolver resolver(net.transitions(), ConflictPolicy::TypeBased, sampler);
    EXPECT_EQ(resolver.select({stochastic, timed, immediate}), immediate);
    EXPECT_EQ(resolver.select({stochastic, timed}), timed);
    EXPECT_EQ(resolver.select({stochastic}), stochastic);
}

TEST_F(ConflictTest, RoundRobinCyclesFairly)
{
    auto a = add("A");
    auto b = add("B");
    auto c = add("C");
    ConflictResolver resolver(net.transitions(), ConflictPolicy::RoundRobin, sampler);
    vector<DiscreteBehavior*> all {c, a, b};
    EXPECT_EQ(resolver.select(all), a);
    EXPECT_EQ(resolver.select(all), b);
    EXPECT_EQ(resolver.select(all), c);
    EXPECT_EQ(resolver.select(all), a);
    // B not enabled: skipped
    EXPECT_EQ(resolver.select({a, c}), c);
    EXPECT_EQ(resolver.select({a, c}), a);
}

TEST_F(ConflictTest, SetPolicyRestartsRoundRobin)
{
    auto a = add("A");
    auto b = add("B");
    ConflictResolver resolver(net.transitions(), ConflictPolicy::RoundRobin, sampler);
    EXPECT_EQ(resolver.select({a, b}), a);
    resolver.setPolicy(ConflictPolicy::Priority);
    resolver.setPolicy(ConflictPolicy::RoundRobin);
    EXPECT_EQ(resolver.policy(), ConflictPolicy::RoundRobin);
    EXPECT_EQ(resolver.select({a, b}), a);
    EXPECT_EQ(resolver.select({a, b}), b);
    resolver.reset();
    EXPECT_EQ(resolver.select({a, b}), a);
}

TEST_F(ConflictTest, RandomCoversAllCandidatesReproducibly)
{
    vector<DiscreteBehavior*> all {add("A"), add("B"), add("C")};
    Sampler s1(uint64_t(3)), s2(uint64_t(3));
    ConflictResolver r1(net.transitions(), ConflictPolicy::Random, s1);
    ConflictResolver r2(net.transitions(), ConflictPolicy::Random, s2);
    map<string,int> counts;
    for(int i=0; i<300; i++)
    {
        auto x = r1.select(all);
        auto y = r2.select(all);
        ASSERT_EQ(x, y);
        counts[x->name()]++;
    }
    EXPECT_EQ(counts.size(), 3u);
    for(auto const& c:counts) EXPECT_GT(c.second, 50);
}
