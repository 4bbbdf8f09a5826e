/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/adapt_protocols/tetris.h"

#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace qadapt::solvers::adapt {

tetris::tetris(const heterogeneous_map &options)
    : threshold(options.get<double>("threshold", 1e-3)) {}

std::vector<std::size_t> tetris::select(const std::vector<score> &scores,
                                        const generator_pool &pool,
                                        std::size_t num_qubits) const {
  std::vector<std::size_t> order(scores.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](auto a, auto b) {
    return std::abs(scores[a]) > std::abs(scores[b]);
  });

  const std::uint64_t full = num_qubits >= max_pauli_qubits
                                 ? ~std::uint64_t(0)
                                 : (std::uint64_t(1) << num_qubits) - 1;

  std::vector<std::size_t> selected{order.front()};
  std::uint64_t covered = pool[order.front()]->support_mask();
  for (std::size_t k = 1; k < order.size(); k++) {
    if (covered == full || std::abs(scores[order[k]]) <= threshold)
      break;
    auto mask = pool[order[k]]->support_mask();
    if (mask & covered)
      continue;
    selected.push_back(order[k]);
    covered |= mask;
  }
  return selected;
}

bool tetris::adapt(abstract_ansatz &ansatz, trace &tr,
                   const generator_pool &pool, const observable &H,
                   const quantum_state &reference,
                   const callback_list &callbacks) {
  check_pool(pool);
  auto scores = calculate_scores(ansatz, pool, H, reference);

  const double eps = std::numeric_limits<score>::epsilon();
  if (std::all_of(scores.begin(), scores.end(),
                  [&](score s) { return std::abs(s) < eps; })) {
    cudaq::info("[adapt] all scores vanish, ansatz converged");
    ansatz.set_converged(true);
    return false;
  }

  auto indices = select(scores, pool, H.num_qubits());
  std::vector<score> selectedScores;
  generator_pool selectedGenerators;
  for (auto i : indices) {
    selectedScores.push_back(scores[i]);
    selectedGenerators.push_back(pool[i]);
  }
  std::vector<parameter> selectedParameters(indices.size(), 0.0);
  cudaq::info("[adapt] tetris selected {} disjoint operators", indices.size());

  heterogeneous_map data;
  data.insert("scores", scores);
  data.insert("selected_index", indices);
  data.insert("selected_score", selectedScores);
  data.insert("selected_generator", selectedGenerators);
  data.insert("selected_parameter", selectedParameters);

  bool stop = run_adaptation_callbacks(callbacks, data, ansatz, tr, *this,
                                       pool, H, reference);
  if (stop || ansatz.is_converged())
    return false;

  ansatz.add_generators(selectedGenerators, selectedParameters);
  return true;
}

} // namespace qadapt::solvers::adapt
