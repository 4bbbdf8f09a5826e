/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
// [Begin Documentation]
#include "qadapt/solvers/adapt.h"
#include "qadapt/solvers/operators.h"

#include <algorithm>
#include <cstdio>

// Build with -DQADAPT_BUILD_EXAMPLES=ON and run
// ./adapt_qaoa_maxcut

int main() {
  using namespace qadapt::solvers;

  // Random 8-node graph
  const std::size_t n = 8;
  auto g = qadapt::erdos_renyi(n, 0.5, 42);

  // Diagonal cost Hamiltonian, also used as the phase separator
  auto H = std::make_shared<adapt::qaoa_observable>(get_maxcut_hamiltonian(g),
                                                    n);
  auto diag = H->diagonal();
  double exact = *std::min_element(diag.begin(), diag.end());

  auto pool = adapt::make_pool(
      get_operator_pool("qaoa_double", {{"num-qubits", n}}), n);
  auto reference = adapt::dense_state::uniform_superposition(n);

  adapt::qaoa_ansatz ansatz(H, 0.1);
  adapt::trace trace;
  auto vanilla = adapt::adapt_protocol::get("vanilla", {});
  auto vqe = adapt::optimization_protocol::get(
      "vqe", {{"optimizer", "lbfgs"}, {"g_tol", 1e-6}});

  adapt::callback_list callbacks{
      std::make_shared<adapt::tracer>(
          std::vector<std::string>{"energy", "selected_score"}),
      std::make_shared<adapt::printer>(
          std::vector<std::string>{"energy", "selected_score"}),
      std::make_shared<adapt::score_stopper>(1e-3),
      std::make_shared<adapt::parameter_stopper>(2 * n),
      std::make_shared<adapt::floor_stopper>(0.5, exact)};

  adapt::run(ansatz, trace, *vanilla, *vqe, pool, *H, reference, callbacks);

  auto energy = adapt::evaluate(ansatz, *H, reference);
  printf("%zu layers: <H> = %.6lf, exact %.6lf, ratio %.4lf\n",
         ansatz.num_layers(), energy, exact, energy / exact);
}
