/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <gtest/gtest.h>

#include "qadapt/solvers/adapt.h"

using namespace qadapt::solvers;
using namespace qadapt::solvers::adapt;

namespace {
/// Records every data map it sees, optionally requesting termination.
class recorder : public callback {
public:
  std::vector<qadapt::heterogeneous_map> adaptations;
  std::vector<qadapt::heterogeneous_map> iterations;
  bool stop = false;

  bool on_adaptation(const qadapt::heterogeneous_map &data, abstract_ansatz &,
                     trace &, const adapt_protocol &, const generator_pool &,
                     const observable &, const quantum_state &) override {
    adaptations.push_back(data);
    return stop;
  }
  bool on_iteration(const qadapt::heterogeneous_map &data, abstract_ansatz &,
                    trace &, const optimization_protocol &, const observable &,
                    const quantum_state &) override {
    iterations.push_back(data);
    return stop;
  }
};

/// Checks at every optimizer iteration that the ansatz holds the reported
/// iterate, and optionally flags it optimized on the given call (0-based).
class iterate_checker : public callback {
public:
  std::vector<std::vector<double>> angles;
  std::size_t optimizeAt = std::numeric_limits<std::size_t>::max();

  bool on_iteration(const qadapt::heterogeneous_map &data,
                    abstract_ansatz &ansatz, trace &,
                    const optimization_protocol &, const observable &H,
                    const quantum_state &reference) override {
    angles.push_back(ansatz.angles());
    EXPECT_NEAR(evaluate(ansatz, H, reference), data.get<double>("energy"),
                1e-12);
    // Gradient-free optimizers report no gradient norm
    auto gNorm = data.get<double>("g_norm");
    if (!std::isnan(gNorm)) {
      double largest = 0.0;
      for (auto g : gradient(ansatz, H, reference))
        largest = std::max(largest, std::abs(g));
      EXPECT_NEAR(largest, gNorm, 1e-12);
    }
    if (angles.size() == optimizeAt + 1) {
      ansatz.set_optimized(true);
      return true;
    }
    return false;
  }
};
} // namespace

class AdaptTester : public ::testing::Test {
protected:
  // H = X0 + X1, whose ground state |-->  is reached from |00> by Y rotations
  pauli_observable H{cudaq::spin::x(0) + cudaq::spin::x(1), 2};
  dense_state reference{2};
  generator_pool pool = make_pool(
      {cudaq::spin::z(0), cudaq::spin::y(0), cudaq::spin::y(1)}, 2);
};

TEST(TraceTester, checkEntries) {
  trace tr;
  EXPECT_EQ(tr.size("energy"), 0);
  EXPECT_FALSE(tr.contains("energy"));
  EXPECT_THROW(tr.get<double>("energy"), std::runtime_error);

  tr.push("energy", -1.0);
  tr.push("energy", -1.5);
  tr.push("iteration", std::size_t(2));
  EXPECT_EQ(tr.size("energy"), 2);
  EXPECT_EQ(tr.get<double>("energy"), (std::vector<double>{-1.0, -1.5}));
  EXPECT_DOUBLE_EQ(tr.last<double>("energy"), -1.5);
  EXPECT_EQ(tr.last<std::size_t>("iteration"), 2);
  EXPECT_THROW(tr.last<int>("iteration"), std::runtime_error);
  EXPECT_EQ(tr.keys(), (std::vector<std::string>{"energy", "iteration"}));
  EXPECT_EQ(tr.at("energy").size(), 2);
}

TEST(TraceTester, checkParameterMatrix) {
  trace tr;
  EXPECT_EQ(tr.parameters().shape(0), 0);

  tr.push_parameters({});
  tr.push_parameters({0.5});
  tr.push_parameters({0.25, -1.0});
  const auto &x = tr.parameters();
  ASSERT_EQ(x.shape(0), 3);
  ASSERT_EQ(x.shape(1), 2);
  EXPECT_DOUBLE_EQ(x(0, 0), 0.0);
  EXPECT_DOUBLE_EQ(x(1, 0), 0.5);
  EXPECT_DOUBLE_EQ(x(1, 1), 0.0);
  EXPECT_DOUBLE_EQ(x(2, 1), -1.0);
}

TEST(AnsatzTester, checkListSemantics) {
  ansatz a(2);
  EXPECT_TRUE(a.empty());
  EXPECT_TRUE(a.is_optimized());
  EXPECT_FALSE(a.is_converged());

  auto g = make_generator(cudaq::spin::y(0), 2);
  a.set_converged(true);
  a.add_generator(g, 0.5);
  // Growing invalidates the optimum but not generator selection
  EXPECT_FALSE(a.is_optimized());
  EXPECT_TRUE(a.is_converged());
  EXPECT_EQ(a.size(), 1);
  EXPECT_EQ(a.get(0).first, g);
  EXPECT_DOUBLE_EQ(a.get(0).second, 0.5);

  a.add_generator(make_generator(cudaq::spin::y(1), 2));
  EXPECT_EQ(a.angles(), (std::vector<double>{0.5, 0.0}));
  a.bind({1.0, 2.0});
  EXPECT_DOUBLE_EQ(a.get(1).second, 2.0);
  EXPECT_THROW(a.bind({1.0}), std::invalid_argument);

  a.set(1, {g, 3.0});
  EXPECT_EQ(a.get(1).first, g);
  EXPECT_THROW(a.get(2), std::out_of_range);
  EXPECT_THROW(a.set(2, {g, 0.0}), std::out_of_range);

  auto copy = a.clone();
  a.resize(1);
  EXPECT_EQ(a.size(), 1);
  EXPECT_EQ(copy->size(), 2);
  EXPECT_THROW(a.resize(3), std::invalid_argument);
}

TEST_F(AdaptTester, checkVanillaSelection) {
  auto protocol = adapt_protocol::get("vanilla", {});
  EXPECT_EQ(protocol->name(), "vanilla");

  auto scores = protocol->calculate_scores(ansatz(2), pool, H, reference);
  ASSERT_EQ(scores.size(), 3);
  EXPECT_NEAR(scores[0], 0.0, 1e-14);
  EXPECT_NEAR(scores[1], 2.0, 1e-14);
  EXPECT_NEAR(scores[2], 2.0, 1e-14);

  ansatz a(2);
  trace tr;
  auto rec = std::make_shared<recorder>();
  EXPECT_TRUE(protocol->adapt(a, tr, pool, H, reference, {rec}));
  ASSERT_EQ(a.size(), 1);
  // Ties go to the first candidate
  EXPECT_EQ(a.get(0).first, pool[1]);
  EXPECT_DOUBLE_EQ(a.get(0).second, 0.0);
  EXPECT_FALSE(a.is_optimized());

  ASSERT_EQ(rec->adaptations.size(), 1);
  auto &data = rec->adaptations.front();
  EXPECT_EQ(data.get<std::size_t>("selected_index"), 1);
  EXPECT_NEAR(data.get<double>("selected_score"), 2.0, 1e-14);
  EXPECT_EQ(data.get<std::vector<double>>("scores").size(), 3);
  EXPECT_EQ(data.get<generator_ptr>("selected_generator"), pool[1]);
}

TEST_F(AdaptTester, checkCallbackCanStop) {
  auto protocol = adapt_protocol::get("vanilla", {});
  ansatz a(2);
  trace tr;
  auto rec = std::make_shared<recorder>();
  rec->stop = true;
  auto never = std::make_shared<recorder>();
  EXPECT_FALSE(protocol->adapt(a, tr, pool, H, reference, {rec, never}));
  EXPECT_TRUE(a.empty());
  EXPECT_FALSE(a.is_converged());
  // Callbacks after the one that stopped are skipped
  EXPECT_TRUE(never->adaptations.empty());

  // A stopper that flags convergence also leaves the ansatz alone
  EXPECT_FALSE(protocol->adapt(a, tr, pool, H, reference,
                               {std::make_shared<parameter_stopper>(0)}));
  EXPECT_TRUE(a.empty());
  EXPECT_TRUE(a.is_converged());
}

TEST_F(AdaptTester, checkVanishingScoresConverge) {
  auto protocol = adapt_protocol::get("vanilla", {});
  ansatz a(2);
  trace tr;
  auto rec = std::make_shared<recorder>();
  generator_pool useless{pool[0]};
  EXPECT_FALSE(protocol->adapt(a, tr, useless, H, reference, {rec}));
  EXPECT_TRUE(a.is_converged());
  EXPECT_TRUE(rec->adaptations.empty());

  EXPECT_THROW(protocol->adapt(a, tr, {}, H, reference, {}),
               std::runtime_error);
}

TEST_F(AdaptTester, checkDegenerateSelection) {
  std::set<generator_ptr> picked;
  for (std::uint64_t seed = 0; seed < 32; seed++) {
    auto protocol = adapt_protocol::get("degenerate", {{"seed", seed}});
    ansatz a(2);
    trace tr;
    EXPECT_TRUE(protocol->adapt(a, tr, pool, H, reference, {}));
    ASSERT_EQ(a.size(), 1);
    EXPECT_NE(a.get(0).first, pool[0]);
    picked.insert(a.get(0).first);
  }
  // Both tied candidates are reachable
  EXPECT_EQ(picked.size(), 2);

  EXPECT_THROW(adapt_protocol::get("degenerate", {{"tie_tolerance", -1.0}}),
               std::invalid_argument);
}

TEST(TetrisTester, checkSelect) {
  tetris protocol({{"threshold", 0.1}});
  auto pool = make_pool({cudaq::spin::x(0) * cudaq::spin::x(1),
                         cudaq::spin::y(1) * cudaq::spin::y(2),
                         cudaq::spin::z(2) * cudaq::spin::y(3),
                         cudaq::spin::y(4), cudaq::spin::x(5)},
                        6);
  // Largest first, then disjoint supports, stopping at the threshold
  std::vector<score> scores{0.9, 1.0, 0.5, 0.3, 0.05};
  auto selected = protocol.select(scores, pool, 6);
  EXPECT_EQ(selected, (std::vector<std::size_t>{1, 3}));

  // The first pick is always taken, even below the threshold
  std::vector<score> small{0.01, 0.02, 0.0, 0.0, 0.0};
  EXPECT_EQ(protocol.select(small, pool, 6), std::vector<std::size_t>{1});
}

TEST_F(AdaptTester, checkTetrisAdapt) {
  auto protocol = adapt_protocol::get("tetris", {});
  ansatz a(2);
  trace tr;
  auto rec = std::make_shared<recorder>();
  EXPECT_TRUE(protocol->adapt(a, tr, pool, H, reference, {rec}));
  // Y0 and Y1 act on different qubits, so both are added at once
  ASSERT_EQ(a.size(), 2);
  EXPECT_EQ(a.get(0).first, pool[1]);
  EXPECT_EQ(a.get(1).first, pool[2]);
  EXPECT_EQ(rec->adaptations.front().get<std::vector<std::size_t>>(
                "selected_index"),
            (std::vector<std::size_t>{1, 2}));
}

TEST_F(AdaptTester, checkOptimizationFree) {
  auto protocol = optimization_protocol::get("optimization_free", {});
  ansatz a(2);
  a.add_generator(pool[1], 0.25);
  trace tr;
  auto rec = std::make_shared<recorder>();
  EXPECT_TRUE(protocol->optimize(a, tr, H, reference, {rec}));
  EXPECT_TRUE(a.is_optimized());
  EXPECT_DOUBLE_EQ(a.get(0).second, 0.25);
  ASSERT_EQ(rec->iterations.size(), 1);
  EXPECT_NEAR(rec->iterations[0].get<double>("energy"), std::sin(0.5), 1e-12);
}

TEST_F(AdaptTester, checkVQE) {
  auto protocol =
      optimization_protocol::get("vqe", {{"optimizer", "lbfgs"}, {"g_tol", 1e-6}});
  ansatz a(2);
  a.add_generator(pool[1], 0.0);
  a.add_generator(pool[2], 0.0);
  trace tr;
  callback_list callbacks{std::make_shared<tracer>(
                              std::vector<std::string>{"energy", "g_norm"}),
                          std::make_shared<parameter_tracer>()};
  EXPECT_TRUE(protocol->optimize(a, tr, H, reference, callbacks));
  EXPECT_TRUE(a.is_optimized());
  EXPECT_NEAR(evaluate(a, H, reference), -2.0, 1e-10);
  EXPECT_NEAR(a.get(0).second, -M_PI / 4, 1e-6);

  // Iteration 0 is the starting point
  auto energies = tr.get<double>("energy");
  ASSERT_GE(energies.size(), 2);
  EXPECT_NEAR(energies.front(), 0.0, 1e-12);
  EXPECT_EQ(tr.get<std::size_t>("iteration").front(), 1);
  EXPECT_EQ(tr.parameters().shape(0), energies.size());

  EXPECT_THROW(optimization_protocol::get("vqe", {{"optimizer", "nope"}}),
               std::runtime_error);
}

TEST_F(AdaptTester, checkVQEStoppedByCallback) {
  auto protocol = optimization_protocol::get("vqe", {});
  ansatz a(2);
  a.add_generator(pool[1], 0.0);
  trace tr;
  auto rec = std::make_shared<recorder>();
  rec->stop = true;
  EXPECT_FALSE(protocol->optimize(a, tr, H, reference, {rec}));
  EXPECT_FALSE(a.is_optimized());
  EXPECT_EQ(rec->iterations.size(), 1);
  EXPECT_EQ(rec->iterations[0].get<std::size_t>("elapsed_iterations"), 0);
}

TEST_F(AdaptTester, checkVQEStartingPointOptimal) {
  auto protocol = optimization_protocol::get("vqe", {{"g_tol", 1e-6}});
  ansatz a(2);
  a.add_generator(pool[1], -M_PI / 4);
  trace tr;
  auto rec = std::make_shared<recorder>();
  EXPECT_TRUE(protocol->optimize(a, tr, H, reference, {rec}));
  EXPECT_TRUE(a.is_optimized());
  EXPECT_DOUBLE_EQ(a.get(0).second, -M_PI / 4);
  // Only the starting point is reported
  ASSERT_EQ(rec->iterations.size(), 1);
  EXPECT_LE(rec->iterations[0].get<double>("g_norm"), 1e-6);
  EXPECT_NEAR(rec->iterations[0].get<double>("energy"), -1.0, 1e-12);
}

TEST_F(AdaptTester, checkVQEReportsBoundIterates) {
  auto protocol = optimization_protocol::get("vqe", {{"g_tol", 1e-8}});
  ansatz a(2);
  a.add_generator(pool[1], 0.1);
  a.add_generator(pool[2], 0.3);
  trace tr;
  auto checker = std::make_shared<iterate_checker>();
  EXPECT_TRUE(protocol->optimize(a, tr, H, reference, {checker}));
  ASSERT_GE(checker->angles.size(), 2);
  EXPECT_EQ(checker->angles.front(), (std::vector<double>{0.1, 0.3}));
  // Trial points of the line searches never stay bound
  EXPECT_EQ(checker->angles.back(), a.angles());
  EXPECT_NEAR(evaluate(a, H, reference), -2.0, 1e-10);
}

TEST_F(AdaptTester, checkVQEStoppedOptimized) {
  for (auto name : {"lbfgs", "cobyla"}) {
    auto protocol = optimization_protocol::get("vqe", {{"optimizer", name}});
    ansatz a(2);
    a.add_generator(pool[1], 0.1);
    a.add_generator(pool[2], 0.3);
    trace tr;
    auto checker = std::make_shared<iterate_checker>();
    checker->optimizeAt = 2;
    EXPECT_TRUE(protocol->optimize(a, tr, H, reference, {checker})) << name;
    EXPECT_TRUE(a.is_optimized()) << name;
    ASSERT_EQ(checker->angles.size(), 3) << name;
    EXPECT_EQ(checker->angles.back(), a.angles()) << name;
  }
}

TEST_F(AdaptTester, checkVQEWithCobyla) {
  auto protocol = optimization_protocol::get(
      "vqe", {{"optimizer", "cobyla"}, {"rhoend", 1e-8}});
  ansatz a(2);
  a.add_generator(pool[1], 0.0);
  trace tr;
  EXPECT_TRUE(protocol->optimize(a, tr, H, reference, {}));
  EXPECT_NEAR(evaluate(a, H, reference), -1.0, 1e-6);
}

TEST_F(AdaptTester, checkRun) {
  ansatz a(2);
  trace tr;
  auto adapt = adapt_protocol::get("vanilla", {});
  auto vqe = optimization_protocol::get("vqe", {{"g_tol", 1e-6}});
  callback_list callbacks{
      std::make_shared<tracer>(std::vector<std::string>{"energy"}),
      std::make_shared<score_stopper>(1e-4),
      std::make_shared<parameter_stopper>(10)};

  EXPECT_TRUE(run(a, tr, *adapt, *vqe, pool, H, reference, callbacks));
  EXPECT_TRUE(a.is_converged());
  EXPECT_TRUE(a.is_optimized());
  EXPECT_EQ(a.size(), 2);
  EXPECT_NEAR(evaluate(a, H, reference), -2.0, 1e-10);
  EXPECT_NEAR(tr.last<double>("energy"), -2.0, 1e-10);
  EXPECT_GE(tr.size("adaptation"), 2);

  // A converged ansatz returns immediately, even without candidates
  EXPECT_TRUE(run(a, tr, *adapt, *vqe, pool, H, reference, callbacks));
  EXPECT_EQ(a.size(), 2);
  EXPECT_TRUE(run(a, tr, *adapt, *vqe, {}, H, reference, callbacks));
  EXPECT_EQ(a.size(), 2);

  ansatz b(2);
  EXPECT_THROW(run(b, tr, *adapt, *vqe, {}, H, reference, callbacks),
               std::runtime_error);
}

TEST_F(AdaptTester, checkRunStoppedByParameterCount) {
  ansatz a(2);
  trace tr;
  auto adapt = adapt_protocol::get("vanilla", {});
  auto vqe = optimization_protocol::get("vqe", {{"g_tol", 1e-6}});
  EXPECT_TRUE(run(a, tr, *adapt, *vqe, pool, H, reference,
                  {std::make_shared<parameter_stopper>(1)}));
  EXPECT_EQ(a.size(), 1);
  EXPECT_NEAR(evaluate(a, H, reference), -1.0, 1e-8);
}

TEST(AdaptVQETester, checkSimple) {
  cudaq::spin_op H = cudaq::spin::x(0) + cudaq::spin::x(1);
  std::vector<cudaq::spin_op> pool{cudaq::spin::z(0), cudaq::spin::y(0),
                                   cudaq::spin::y(1)};
  auto [energy, thetas, ops] = adapt_vqe(H, pool, dense_state(2),
                                         {{"grad_norm_tolerance", 1e-4}});
  EXPECT_NEAR(energy, -2.0, 1e-8);
  EXPECT_EQ(thetas.size(), 2);
  ASSERT_EQ(ops.size(), 2);
  EXPECT_EQ(ops[0], cudaq::spin::y(0));
  EXPECT_EQ(ops[1], cudaq::spin::y(1));
}

TEST(AdaptVQETester, checkAntiHermitianPool) {
  // exp(θ iY) == exp(-iθ(-Y))
  cudaq::spin_op H = cudaq::spin::x(0);
  std::vector<cudaq::spin_op> pool{std::complex<double>(0.0, 1.0) *
                                   cudaq::spin::y(0)};
  auto [energy, thetas, ops] =
      adapt_vqe(H, pool, sparse_state(1),
                {{"grad_norm_tolerance", 1e-4}, {"max_iter", 4}});
  EXPECT_NEAR(energy, -1.0, 1e-8);
  ASSERT_EQ(thetas.size(), 1);
  EXPECT_NEAR(thetas[0], M_PI / 4, 1e-5);
}

TEST(AdaptVQETester, checkTetrisAndOptions) {
  cudaq::spin_op H = cudaq::spin::x(0) + cudaq::spin::x(1);
  std::vector<cudaq::spin_op> pool{cudaq::spin::y(0), cudaq::spin::y(1)};
  auto [energy, thetas, ops] =
      adapt_vqe(H, pool, dense_state(2),
                {{"adapt", "tetris"}, {"grad_norm_tolerance", 1e-4}});
  EXPECT_NEAR(energy, -2.0, 1e-8);
  EXPECT_EQ(ops.size(), 2);

  EXPECT_THROW(adapt_vqe(H, {}, dense_state(2)), std::runtime_error);
  EXPECT_THROW(adapt_vqe(H, pool, dense_state(2), {{"num_qubits", 3}}),
               std::invalid_argument);
}

TEST(CallbackTester, checkStoppers) {
  pauli_observable H(cudaq::spin::z(0), 1);
  dense_state reference(1);
  generator_pool pool{make_generator(cudaq::spin::y(0), 1)};
  auto protocol = adapt_protocol::get("vanilla", {});
  qadapt::heterogeneous_map data{{"scores", std::vector<double>{1e-4, -2e-4}}};

  {
    ansatz a(1);
    trace tr;
    score_stopper loose(1e-3), tight(1e-5);
    tight.on_adaptation(data, a, tr, *protocol, pool, H, reference);
    EXPECT_FALSE(a.is_converged());
    loose.on_adaptation(data, a, tr, *protocol, pool, H, reference);
    EXPECT_TRUE(a.is_converged());
  }
  {
    ansatz a(1);
    trace tr;
    parameter_stopper stopper(1);
    stopper.on_adaptation(data, a, tr, *protocol, pool, H, reference);
    EXPECT_FALSE(a.is_converged());
    a.add_generator(pool[0]);
    stopper.on_adaptation(data, a, tr, *protocol, pool, H, reference);
    EXPECT_TRUE(a.is_converged());
  }
  {
    ansatz a(1);
    trace tr;
    floor_stopper stopper(1e-3, -1.0);
    stopper.on_adaptation(data, a, tr, *protocol, pool, H, reference);
    EXPECT_FALSE(a.is_converged());
    tr.push("energy", -0.5);
    stopper.on_adaptation(data, a, tr, *protocol, pool, H, reference);
    EXPECT_FALSE(a.is_converged());
    tr.push("energy", -0.9995);
    stopper.on_adaptation(data, a, tr, *protocol, pool, H, reference);
    EXPECT_TRUE(a.is_converged());
  }
}

TEST(CallbackTester, checkSlowStopper) {
  pauli_observable H(cudaq::spin::z(0), 1);
  dense_state reference(1);
  generator_pool pool{make_generator(cudaq::spin::y(0), 1)};
  auto protocol = adapt_protocol::get("vanilla", {});
  qadapt::heterogeneous_map data;

  EXPECT_THROW(slow_stopper(1e-3, 0), std::invalid_argument);

  ansatz a(1);
  trace tr;
  tracer t({"energy"});
  slow_stopper stopper(1e-3, 2);
  auto adaptation = [&](double energy) {
    // One optimization iteration, then an adaptation
    tr.push("iteration", tr.size("iteration") + 1);
    tr.push("energy", energy);
    t.on_adaptation(data, a, tr, *protocol, pool, H, reference);
    stopper.on_adaptation(data, a, tr, *protocol, pool, H, reference);
  };

  adaptation(1.0);
  EXPECT_FALSE(a.is_converged());
  adaptation(0.5);
  EXPECT_FALSE(a.is_converged());
  adaptation(0.4995);
  EXPECT_TRUE(a.is_converged());
}

TEST(CallbackTester, checkTracerAndPrinter) {
  pauli_observable H(cudaq::spin::z(0), 1);
  dense_state reference(1);
  generator_pool pool{make_generator(cudaq::spin::y(0), 1)};
  auto adapt = adapt_protocol::get("vanilla", {});
  auto vqe = optimization_protocol::get("optimization_free", {});

  ansatz a(1);
  trace tr;
  std::stringstream ss;
  tracer t({"energy", "selected_index"});
  printer p({"energy", "selected_index"}, ss);

  qadapt::heterogeneous_map iteration{{"energy", -0.5}};
  t.on_iteration(iteration, a, tr, *vqe, H, reference);
  p.on_iteration(iteration, a, tr, *vqe, H, reference);
  t.on_iteration(iteration, a, tr, *vqe, H, reference);

  qadapt::heterogeneous_map adaptation{{"selected_index", std::size_t(0)}};
  t.on_adaptation(adaptation, a, tr, *adapt, pool, H, reference);
  p.on_adaptation(adaptation, a, tr, *adapt, pool, H, reference);

  EXPECT_EQ(tr.get<std::size_t>("iteration"),
            (std::vector<std::size_t>{1, 2}));
  EXPECT_EQ(tr.get<std::size_t>("adaptation"), std::vector<std::size_t>{2});
  EXPECT_EQ(tr.get<double>("energy").size(), 2);
  EXPECT_EQ(tr.get<std::size_t>("selected_index").size(), 1);

  auto out = ss.str();
  EXPECT_NE(out.find(": Iteration #1 :"), std::string::npos);
  EXPECT_NE(out.find("energy: -0.5"), std::string::npos);
  EXPECT_NE(out.find("--- Adaptation #1 ---"), std::string::npos);
  EXPECT_NE(out.find("selected_index: 0"), std::string::npos);

  std::stringstream params;
  a.add_generator(pool[0], 0.125);
  parameter_printer pp(params);
  pp.on_adaptation(adaptation, a, tr, *adapt, pool, H, reference);
  EXPECT_NE(params.str().find("*** Parameters ***"), std::string::npos);
  EXPECT_NE(params.str().find("0.125"), std::string::npos);
  EXPECT_THROW(parameter_printer(std::cout, true, false, 0),
               std::invalid_argument);
}
