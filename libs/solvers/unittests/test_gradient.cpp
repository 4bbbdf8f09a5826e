/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include <atomic>
#include <cmath>
#include <cstdlib>
#include <gtest/gtest.h>
#include <new>

#include "qadapt/solvers/adapt.h"
#include "qadapt/solvers/adapt/matrix.h"

using namespace qadapt::solvers::adapt;

namespace {
std::atomic<bool> countAllocations{false};
std::atomic<std::size_t> allocations{0};
} // namespace

// Heap allocations are counted while `countAllocations` is set.
void *operator new(std::size_t size) {
  if (countAllocations)
    allocations++;
  if (void *ptr = std::malloc(size ? size : 1))
    return ptr;
  throw std::bad_alloc();
}

void operator delete(void *ptr) noexcept { std::free(ptr); }
void operator delete(void *ptr, std::size_t) noexcept { std::free(ptr); }

class GradientTester : public ::testing::Test {
protected:
  std::shared_ptr<pauli_observable> H;
  std::unique_ptr<ansatz> circuit;
  dense_state reference{3, 0b001};

  void SetUp() override {
    H = std::make_shared<pauli_observable>(
        cudaq::spin::z(0) + 0.5 * cudaq::spin::x(0) * cudaq::spin::x(1) -
            0.8 * cudaq::spin::z(1) * cudaq::spin::z(2) +
            0.3 * cudaq::spin::y(2),
        3);
    circuit = std::make_unique<ansatz>(3);
    circuit->add_generator(make_generator(cudaq::spin::y(0), 3), 0.3);
    circuit->add_generator(
        make_generator(cudaq::spin::x(0) * cudaq::spin::y(1), 3), -0.7);
    circuit->add_generator(
        make_generator(cudaq::spin::x(1) * cudaq::spin::x(2) +
                           cudaq::spin::y(1) * cudaq::spin::y(2),
                       3),
        1.1);
    circuit->add_generator(make_generator(cudaq::spin::y(2), 3), 0.2);
  }

  std::vector<double> finite_difference(abstract_ansatz &a,
                                        const observable &obs,
                                        const quantum_state &ref) {
    // Five-point central stencil
    const double h = 1e-3;
    auto x = a.angles();
    auto shifted = [&](std::size_t i, double dx) {
      auto xs = x;
      xs[i] += dx;
      a.bind(xs);
      return evaluate(a, obs, ref);
    };
    std::vector<double> g(x.size());
    for (std::size_t i = 0; i < x.size(); i++)
      g[i] = (-shifted(i, 2 * h) + 8 * shifted(i, h) - 8 * shifted(i, -h) +
              shifted(i, -2 * h)) /
             (12 * h);
    a.bind(x);
    return g;
  }
};

TEST_F(GradientTester, checkEvolution) {
  auto before = reference.to_vector();
  auto evolved = evolve_state(*circuit, reference);
  EXPECT_EQ(reference.to_vector(), before);

  dense_state inplace = reference;
  auto &ret = evolve_state_inplace(*circuit, inplace);
  EXPECT_EQ(&ret, &inplace);
  EXPECT_TRUE(evolved->equals(inplace));
  EXPECT_NEAR(evolved->norm(), 1.0, 1e-13);

  EXPECT_NEAR(evaluate(*circuit, *H, reference), H->evaluate(*evolved),
              1e-14);

  dense_state wrongSize(2);
  EXPECT_THROW(evolve_state(*circuit, wrongSize), std::invalid_argument);
  EXPECT_THROW(evaluate(*H, wrongSize), std::invalid_argument);
}

TEST_F(GradientTester, checkGradientMatchesFiniteDifference) {
  auto grad = gradient(*circuit, *H, reference);
  auto fd = finite_difference(*circuit, *H, reference);
  ASSERT_EQ(grad.size(), 4);
  for (std::size_t i = 0; i < grad.size(); i++)
    EXPECT_NEAR(grad[i], fd[i], 1e-8) << "parameter " << i;
}

TEST_F(GradientTester, checkPartials) {
  auto grad = gradient(*circuit, *H, reference);
  for (std::size_t i = 0; i < grad.size(); i++)
    EXPECT_NEAR(partial(i, *circuit, *H, reference), grad[i], 1e-12);
  EXPECT_THROW(partial(4, *circuit, *H, reference), std::out_of_range);
}

TEST_F(GradientTester, checkWorkspaceReuse) {
  gradient_workspace ws;
  std::vector<double> result;
  auto &ret = gradient_inplace(result, *circuit, *H, reference, ws);
  EXPECT_EQ(&ret, &result);
  auto first = result;

  // Same register, different parameters
  circuit->bind({0.1, 0.2, 0.3, 0.4});
  gradient_inplace(result, *circuit, *H, reference, ws);
  auto expected = gradient(*circuit, *H, reference);
  for (std::size_t i = 0; i < result.size(); i++)
    EXPECT_NEAR(result[i], expected[i], 1e-14);

  // A different state representation reallocates the buffers
  sparse_state sparse(3, 0b001);
  gradient_inplace(result, *circuit, *H, sparse, ws);
  for (std::size_t i = 0; i < result.size(); i++)
    EXPECT_NEAR(result[i], expected[i], 1e-12);
}

TEST(GradientWorkspaceTester, checkReusedWorkspaceDoesNotAllocate) {
  const std::size_t n = 3;
  pauli_observable H(cudaq::spin::z(0) * cudaq::spin::z(1) +
                         0.4 * cudaq::spin::x(1) - 0.7 * cudaq::spin::y(2),
                     n);
  auto phase = std::make_shared<qaoa_observable>(
      cudaq::spin::z(0) * cudaq::spin::z(2) + 0.5 * cudaq::spin::z(1), n);

  ansatz a(n);
  for (std::size_t i = 0; i < 10; i++)
    a.add_generator(make_generator(cudaq::spin::y(i % n), n), 0.1 * i + 0.05);
  a.add_generator(make_generator(cudaq::spin::x(0) * cudaq::spin::x(1) +
                                     cudaq::spin::y(0) * cudaq::spin::y(1),
                                 n),
                  0.6);
  a.add_generator(phase, -0.3);

  dense_state reference(n, 0b101);
  gradient_workspace workspace;
  std::vector<double> result;
  gradient_inplace(result, a, H, reference, workspace);
  auto first = result;

  allocations = 0;
  countAllocations = true;
  gradient_inplace(result, a, H, reference, workspace);
  countAllocations = false;

  EXPECT_EQ(allocations.load(), 0);
  EXPECT_EQ(result, first);
  auto expected = gradient(a, H, reference);
  for (std::size_t i = 0; i < result.size(); i++)
    EXPECT_NEAR(result[i], expected[i], 1e-14) << "parameter " << i;
}

TEST_F(GradientTester, checkEmptyAnsatz) {
  ansatz empty(3);
  EXPECT_TRUE(gradient(empty, *H, reference).empty());
  EXPECT_NEAR(evaluate(empty, *H, reference), H->evaluate(reference), 1e-14);
}

TEST_F(GradientTester, checkInfidelityGradient) {
  auto target = evolve_state(*circuit, reference);
  infidelity F(*target);
  EXPECT_NEAR(evaluate(*circuit, F, reference), 0.0, 1e-13);

  circuit->bind({0.0, 0.0, 0.5, 0.0});
  auto grad = gradient(*circuit, F, reference);
  auto fd = finite_difference(*circuit, F, reference);
  for (std::size_t i = 0; i < grad.size(); i++)
    EXPECT_NEAR(grad[i], fd[i], 1e-8) << "parameter " << i;
}

TEST_F(GradientTester, checkScoreIsAppendedPartial) {
  auto protocol = adapt_protocol::get("vanilla", {});
  auto pool = make_pool({cudaq::spin::y(0), cudaq::spin::x(0) * cudaq::spin::y(1),
                         cudaq::spin::y(1) * cudaq::spin::z(2),
                         cudaq::spin::x(2)},
                        3);
  auto scores = protocol->calculate_scores(*circuit, pool, *H, reference);
  ASSERT_EQ(scores.size(), pool.size());
  for (std::size_t i = 0; i < pool.size(); i++) {
    auto candidate = circuit->clone();
    candidate->add_generator(pool[i], 0.0);
    EXPECT_NEAR(scores[i],
                std::abs(partial(candidate->size() - 1, *candidate, *H,
                                 reference)),
                1e-12);
    EXPECT_NEAR(scores[i],
                protocol->calculate_score(*circuit, *pool[i], *H, reference),
                1e-14);
  }
}

TEST(AnsatzUnitaryTester, checkEvolutionMatchesMatrix) {
  const std::size_t n = 4;
  ansatz a(n);
  a.add_generator(make_generator(cudaq::spin::x(0) * cudaq::spin::y(3), n),
                  0.4);
  a.add_generator(make_generator(cudaq::spin::y(1) + cudaq::spin::x(1) *
                                                         cudaq::spin::z(2),
                                 n),
                  -1.3);
  a.add_generator(make_generator(cudaq::spin::z(0) * cudaq::spin::z(2) +
                                     cudaq::spin::y(2) * cudaq::spin::y(3),
                                 n),
                  0.75);
  dense_state reference(n, 0b0110);

  auto evolved = evolve_state(a, reference);
  complex_vector expected =
      xt::linalg::dot(ansatz_unitary(a), state_vector(reference));
  auto actual = evolved->to_vector();
  ASSERT_EQ(actual.size(), expected.size());
  for (std::size_t k = 0; k < actual.size(); k++)
    EXPECT_NEAR(std::abs(actual[k] - expected(k)), 0.0, 1e-10) << k;
}
