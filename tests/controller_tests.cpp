#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "behavior.h"
#include "hpnerror.h"
#include "petrinet.h"
#include "simcontroller.h"
#include "simevents.h"
#include "simsettings.h"

#include "helpers.h"

using namespace std;

namespace {

class StepLog : public SimulationObserver
{
public:
    vector<StepEvent> steps;
    vector<FiringRecord> firings;
    int resets = 0;
    int settingsChanges = 0;
    function<void(const StepEvent&)> hook;

    void onStep(const StepEvent& ev) override
    {
        steps.push_back(ev);
        if ( hook ) hook(ev);
    }
    void onFiring(const FiringRecord& r) override { firings.push_back(r); }
    void onReset() override { resets++; }
    void onSettingsChanged(const SimulationSettings&) override { settingsChanges++; }
};

vector<map<string,double>> trajectory(SimulationController& sim, int steps)
{
    vector<map<string,double>> out;
    for(int i=0; i<steps; i++)
    {
        sim.step();
        out.push_back(sim.net().markings());
    }
    return out;
}

} // namespace

TEST(Controller, ImmediateStepMovesOneToken)
{
    HPetriNet net("immediate");
    addImmediatePath(net, "P1", "T1", "P2", 5);
    SimulationController sim(net, manualSettings(0.1));
    EXPECT_TRUE(sim.behavior("T1")->canFire().ok);
    EXPECT_TRUE(sim.step());
    EXPECT_EQ(net.place("P1")->tokens(), 4.0);
    EXPECT_EQ(net.place("P2")->tokens(), 1.0);
    EXPECT_NEAR(sim.time(), 0.1, 1e-12);
    EXPECT_EQ(sim.stepCount(), 1u);
}

TEST(Controller, ContinuousDepletion)
{
    HPetriNet net("depletion");
    addContinuousPath(net, "P1", "T1", "P2", 10.0, 2.0);
    SimulationController sim(net, manualSettings(0.1));
    for(int i=0; i<50; i++)
    {
        sim.step();
        EXPECT_NEAR(totalTokens(net, {"P1", "P2"}), 10.0, 1e-9);
    }
    EXPECT_NEAR(sim.time(), 5.0, 1e-9);
    EXPECT_NEAR(net.place("P1")->tokens(), 0.0, 1e-6);
    EXPECT_NEAR(net.place("P2")->tokens(), 10.0, 1e-6);

    double p2 = net.place("P2")->tokens();
    for(int i=0; i<10; i++) sim.step();
    EXPECT_NEAR(net.place("P2")->tokens(), p2, 1e-9);
    EXPECT_GE(net.place("P1")->tokens(), 0.0);
}

TEST(Controller, HybridPathsDoNotInterfere)
{
    const int N = 20;
    HPetriNet both("both"), discrete("discrete"), continuous("continuous");
    addImmediatePath(both, "P1", "T1", "P2", 5);
    addContinuousPath(both, "P3", "T2", "P4", 3.0, 1.5);
    addImmediatePath(discrete, "P1", "T1", "P2", 5);
    addContinuousPath(continuous, "P3", "T2", "P4", 3.0, 1.5);

    SimulationController simBoth(both, manualSettings(0.1));
    SimulationController simDiscrete(discrete, manualSettings(0.1));
    SimulationController simContinuous(continuous, manualSettings(0.1));
    for(int i=0; i<N; i++)
    {
        simBoth.step();
        simDiscrete.step();
        simContinuous.step();
        EXPECT_EQ(both.place("P1")->tokens(), discrete.place("P1")->tokens());
        EXPECT_EQ(both.place("P2")->tokens(), discrete.place("P2")->tokens());
        EXPECT_DOUBLE_EQ(both.place("P3")->tokens(), continuous.place("P3")->tokens());
        EXPECT_DOUBLE_EQ(both.place("P4")->tokens(), continuous.place("P4")->tokens());
    }
    EXPECT_EQ(both.place("P2")->tokens(), 5.0);
}

TEST(Controller, OverlappingLocalitiesStayConsistent)
{
    // T1 (immediate) and T2 (continuous) both drain P1
    HPetriNet net("overlap");
    auto p1 = net.createPlace("P1", 1.0);
    auto p2 = net.createPlace("P2");
    auto p3 = net.createPlace("P3");
    auto t1 = net.createTransition("T1");
    ContinuousParams params;
    params.rate = RateFunction::constant(5.0);
    auto t2 = net.createTransition("T2", params);
    net.createArc(p1, t1);
    net.createArc(t1, p2);
    net.createArc(p1, t2);
    net.createArc(t2, p3);

    StepLog log;
    SimulationController sim(net, manualSettings(0.1), {&log});
    sim.step();
    ASSERT_EQ(log.steps.size(), 1u);
    auto& ev = log.steps.front();
    EXPECT_EQ(ev.fired, "T1");
    // T2 passed the start-of-step snapshot, so it is integrated even though
    // T1 emptied P1 first; the flow is clamped instead of going negative
    ASSERT_EQ(ev.records.size(), 2u);
    EXPECT_EQ(ev.records[1].transition, "T2");
    EXPECT_TRUE(ev.records[1].clamped);
    EXPECT_EQ(p1->tokens(), 0.0);
    EXPECT_EQ(p2->tokens(), 1.0);
    EXPECT_EQ(p3->tokens(), 0.0);

    sim.reset();
    p1->setTokens(2.0);
    sim.step();
    EXPECT_EQ(p2->tokens(), 1.0);
    EXPECT_NEAR(p3->tokens(), 0.5, 1e-12);
    EXPECT_NEAR(p1->tokens(), 0.5, 1e-12);
    EXPECT_NEAR(totalTokens(net, {"P1", "P2", "P3"}), 2.0, 1e-12);
}

TEST(Controller, ResetReproducesTrajectory)
{
    HPetriNet net("reset");
    auto a = net.createPlace("A", 6);
    auto b = net.createPlace("B");
    auto c = net.createPlace("C", 4.0);
    auto d = net.createPlace("D");
    auto s = net.createTransition("S", StochasticParams{3.0, 2});
    ContinuousParams params;
    params.rate = RateFunction::expression("0.3 * C");
    auto k = net.createTransition("K", params);
    net.createArc(a, s);
    net.createArc(s, b);
    net.createArc(c, k);
    net.createArc(k, d);

    StepLog log;
    SimulationController sim(net, manualSettings(0.1, ConflictPolicy::Random, 99), {&log});
    auto first = trajectory(sim, 40);
    sim.reset();
    EXPECT_EQ(sim.time(), 0.0);
    EXPECT_EQ(sim.stepCount(), 0u);
    EXPECT_EQ(a->tokens(), 6.0);
    EXPECT_EQ(log.resets, 1);
    auto second = trajectory(sim, 40);
    EXPECT_EQ(first, second);
}

TEST(Controller, SameSeedSameStochasticRun)
{
    auto build = [](HPetriNet& net)
    {
        auto a = net.createPlace("A", 20);
        auto b = net.createPlace("B");
        auto s = net.createTransition("S", StochasticParams{2.0, 4});
        net.createArc(a, s);
        net.createArc(s, b);
    };
    HPetriNet n1("seed1"), n2("seed2");
    build(n1);
    build(n2);
    StepLog l1, l2;
    SimulationController s1(n1, manualSettings(0.05, ConflictPolicy::Random, 5), {&l1});
    SimulationController s2(n2, manualSettings(0.05, ConflictPolicy::Random, 5), {&l2});
    s1.step();
    s2.step();
    auto b1 = s1.behaviorAs<StochasticBehavior>("S");
    auto b2 = s2.behaviorAs<StochasticBehavior>("S");
    ASSERT_TRUE(b1 && b2);
    ASSERT_TRUE(b1->scheduledFireTime().has_value());
    EXPECT_EQ(*b1->scheduledFireTime(), *b2->scheduledFireTime());
    EXPECT_EQ(*b1->sampledBurst(), *b2->sampledBurst());
    for(int i=0; i<100; i++)
    {
        s1.step();
        s2.step();
    }
    ASSERT_EQ(l1.firings.size(), l2.firings.size());
    for(size_t i=0; i<l1.firings.size(); i++)
    {
        EXPECT_EQ(l1.firings[i].step, l2.firings[i].step);
        EXPECT_EQ(l1.firings[i].burst, l2.firings[i].burst);
    }
    EXPECT_EQ(n1.markings(), n2.markings());
}

TEST(Controller, ClosedNetConservesTokens)
{
    HPetriNet net("closed");
    auto a = net.createPlace("A", 5);
    auto b = net.createPlace("B", 1);
    auto t1 = net.createTransition("T1");
    ContinuousParams params;
    params.rate = RateFunction::expression("0.5 * B");
    auto t2 = net.createTransition("T2", params);
    auto t3 = net.createTransition("T3", StochasticParams{4.0, 3});
    net.createArc(a, t1);
    net.createArc(t1, b);
    net.createArc(b, t2);
    net.createArc(t2, a);
    net.createArc(b, t3);
    net.createArc(t3, a);

    SimulationController sim(net, manualSettings(0.1, ConflictPolicy::RoundRobin, 1));
    for(int i=0; i<200; i++)
    {
        sim.step();
        EXPECT_NEAR(totalTokens(net, {"A", "B"}), 6.0, 1e-9);
        EXPECT_GE(a->tokens(), 0.0);
        EXPECT_GE(b->tokens(), 0.0);
    }
}

TEST(Controller, AtMostOneDiscreteFiringPerStep)
{
    HPetriNet net("single");
    addImmediatePath(net, "A", "TA", "A2", 3);
    addImmediatePath(net, "B", "TB", "B2", 3);
    StepLog log;
    SimulationController sim(net, manualSettings(1.0, ConflictPolicy::RoundRobin), {&log});
    for(int i=0; i<6; i++) sim.step();
    for(auto const& ev:log.steps) EXPECT_LE(ev.records.size(), 1u);
    ASSERT_EQ(log.steps.size(), 6u);
    EXPECT_EQ(log.steps[0].fired, "TA");
    EXPECT_EQ(log.steps[1].fired, "TB");
    EXPECT_EQ(net.place("A2")->tokens(), 3.0);
    EXPECT_EQ(net.place("B2")->tokens(), 3.0);
}

TEST(Controller, TimedUrgencyAndDeadlineMiss)
{
    // The self loop H always wins under Priority, so T never fires
    HPetriNet net("urgency");
    auto loop = net.createPlace("Loop", 1);
    auto h = net.createTransition("H", ImmediateParams{}, 10);
    net.createArc(loop, h);
    net.createArc(h, loop);
    auto p1 = net.createPlace("P1", 1);
    auto p2 = net.createPlace("P2");
    auto t = net.createTransition("T", TimedParams{2.0, 5.0});
    net.createArc(p1, t);
    net.createArc(t, p2);

    StepLog log;
    SimulationController sim(net, manualSettings(0.5, ConflictPolicy::Priority), {&log});
    for(int i=0; i<12; i++) sim.step();

    bool urgentSeen = false;
    bool missSeen = false;
    for(auto const& ev:log.steps)
    {
        EXPECT_EQ(ev.fired, "H");
        double before = ev.time - ev.dt;
        bool urgent = not ev.urgent.empty();
        if ( urgent )
        {
            EXPECT_EQ(ev.urgent.front(), "T");
            EXPECT_GE(before, 4.5 - 1e-9);
            EXPECT_LE(before, 5.0 + 1e-9);
        }
        urgentSeen = urgentSeen or urgent;
        if ( not ev.deadlineMisses.empty() )
        {
            EXPECT_GT(ev.time, 5.0);
            missSeen = true;
        }
    }
    EXPECT_TRUE(urgentSeen);
    EXPECT_TRUE(missSeen);
    EXPECT_EQ(p1->tokens(), 1.0);
    EXPECT_EQ(p2->tokens(), 0.0);
}

TEST(Controller, TimedFiresInsideWindow)
{
    HPetriNet net("timed");
    auto p1 = net.createPlace("P1", 1);
    auto p2 = net.createPlace("P2");
    auto t = net.createTransition("T", TimedParams{1.0, 2.0});
    net.createArc(p1, t);
    net.createArc(t, p2);
    StepLog log;
    SimulationController sim(net, manualSettings(0.25), {&log});
    // waiting for the window is not a deadlock
    for(int i=0; i<4; i++) EXPECT_TRUE(sim.step());
    EXPECT_EQ(p2->tokens(), 0.0);
    EXPECT_TRUE(sim.step());
    EXPECT_EQ(p2->tokens(), 1.0);
    ASSERT_EQ(log.firings.size(), 1u);
    EXPECT_EQ(log.firings[0].kind, TransitionKind::Timed);
    EXPECT_DOUBLE_EQ(log.firings[0].time, 1.0);
}

TEST(Controller, DetectsDeadlock)
{
    HPetriNet net("deadlock");
    addImmediatePath(net, "P1", "T1", "P2", 1);
    StepLog log;
    SimulationController sim(net, manualSettings(0.1), {&log});
    EXPECT_EQ(sim.run(), 2u);
    ASSERT_EQ(log.steps.size(), 2u);
    EXPECT_FALSE(log.steps[0].deadlocked);
    EXPECT_TRUE(log.steps[1].deadlocked);
    EXPECT_FALSE(sim.isRunning());
}

TEST(Controller, RunStopsAtDuration)
{
    HPetriNet net("duration");
    addContinuousPath(net, "P1", "T1", "P2", 1000.0, 1.0);
    SimulationSettings settings;
    settings.setDuration(1.0);
    StepLog log;
    SimulationController sim(net, settings, {&log});
    EXPECT_DOUBLE_EQ(sim.effectiveDt(), 0.001);
    EXPECT_EQ(sim.run(), 1000u);
    EXPECT_TRUE(sim.isComplete());
    EXPECT_NEAR(sim.progress(), 1.0, 1e-9);
    EXPECT_TRUE(log.steps.back().completed);
    EXPECT_NEAR(net.place("P2")->tokens(), 1.0, 1e-9);
}

TEST(Controller, RunWithFinerStepReachesDuration)
{
    HPetriNet net("finestep");
    addContinuousPath(net, "P1", "T1", "P2", 1000.0, 1.0);
    SimulationSettings settings;
    settings.setDuration(1.0);
    SimulationController sim(net, settings);
    EXPECT_EQ(sim.run(0.0001), 10000u);
    EXPECT_NEAR(sim.time(), 1.0, 1e-9);
    EXPECT_TRUE(sim.isComplete());
    EXPECT_FALSE(sim.isRunning());
    EXPECT_NEAR(net.place("P2")->tokens(), 1.0, 1e-9);
}

TEST(Controller, RunHonoursStepLimitAndStop)
{
    HPetriNet net("limits");
    addContinuousPath(net, "P1", "T1", "P2", 1000.0, 1.0);
    StepLog log;
    SimulationController sim(net, manualSettings(0.1), {&log});
    EXPECT_EQ(sim.run(nullopt, 5), 5u);

    log.hook = [&sim](const StepEvent& ev) { if ( ev.step == 8 ) sim.stop(); };
    EXPECT_EQ(sim.run(0.2), 3u);
    EXPECT_NEAR(sim.time(), 0.5 + 0.6, 1e-9);
    EXPECT_FALSE(sim.isRunning());
}

TEST(Controller, RejectsNonPositiveStep)
{
    HPetriNet net("dt");
    addImmediatePath(net, "P1", "T1", "P2", 1);
    SimulationController sim(net, manualSettings(0.1));
    EXPECT_THROW(sim.step(0.0), HPNConfigError);
    EXPECT_THROW(sim.step(-0.1), HPNConfigError);
    EXPECT_EQ(sim.stepCount(), 0u);
    EXPECT_EQ(net.place("P1")->tokens(), 1.0);
}

TEST(Controller, InvalidParametersRefuseToBuild)
{
    HPetriNet net("invalid");
    net.createTransition("S", StochasticParams{-1.0, 1});
    EXPECT_THROW(SimulationController sim(net), HPNConfigError);
}

TEST(Controller, FlowErrorsDoNotAbortStep)
{
    HPetriNet net("flowerror");
    addImmediatePath(net, "P1", "T1", "P2", 2);
    auto p3 = net.createPlace("P3", 1.0);
    auto p4 = net.createPlace("P4");
    ContinuousParams params;
    params.rate = RateFunction::expression("missing + 1");
    auto t2 = net.createTransition("T2", params);
    net.createArc(p3, t2);
    net.createArc(t2, p4);
    StepLog log;
    SimulationController sim(net, manualSettings(0.1), {&log});
    sim.step();
    ASSERT_EQ(log.steps.size(), 1u);
    EXPECT_EQ(log.steps[0].fired, "T1");
    ASSERT_EQ(log.steps[0].errors.size(), 1u);
    EXPECT_EQ(log.steps[0].errors[0].transition, "T2");
    EXPECT_EQ(p3->tokens(), 1.0);
}

TEST(Controller, SettingsAndObservers)
{
    HPetriNet net("settings");
    addImmediatePath(net, "P1", "T1", "P2", 3);
    StepLog log, other;
    SimulationController sim(net, manualSettings(0.1), {&log});
    sim.addObserver(&other);
    sim.step();
    sim.removeObserver(&other);
    sim.step();
    EXPECT_EQ(log.steps.size(), 2u);
    EXPECT_EQ(other.steps.size(), 1u);
    EXPECT_EQ(log.firings.size(), 2u);
    EXPECT_EQ(log.firings[0].consumed.at("P1"), 1.0);

    sim.setConflictPolicy(ConflictPolicy::Priority);
    EXPECT_EQ(sim.conflictPolicy(), ConflictPolicy::Priority);
    EXPECT_EQ(sim.settings().conflictPolicy(), ConflictPolicy::Priority);
    EXPECT_EQ(log.settingsChanges, 1);

    EXPECT_THROW(sim.behavior("nosuch"), HPNConfigError);
    EXPECT_EQ(sim.behaviorAs<TimedBehavior>("T1"), nullptr);
    EXPECT_NE(sim.behaviorAs<ImmediateBehavior>("T1"), nullptr);
}
