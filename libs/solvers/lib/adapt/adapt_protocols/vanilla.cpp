/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/adapt_protocols/vanilla.h"

#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace qadapt::solvers::adapt {

std::size_t vanilla::select_index(const std::vector<score> &scores) {
  std::size_t maxIdx = 0;
  for (std::size_t i = 1; i < scores.size(); i++)
    if (std::abs(scores[i]) > std::abs(scores[maxIdx]))
      maxIdx = i;
  return maxIdx;
}

bool vanilla::adapt(abstract_ansatz &ansatz, trace &tr,
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

  auto index = select_index(scores);
  const parameter theta = 0.0;
  cudaq::info("[adapt] index of element with max score is {} ({})", index,
              scores[index]);

  heterogeneous_map data;
  data.insert("scores", scores);
  data.insert("selected_index", index);
  data.insert("selected_score", scores[index]);
  data.insert("selected_generator", pool[index]);
  data.insert("selected_parameter", theta);

  bool stop = run_adaptation_callbacks(callbacks, data, ansatz, tr, *this,
                                       pool, H, reference);
  if (stop || ansatz.is_converged())
    return false;

  ansatz.add_generator(pool[index], theta);
  return true;
}

} // namespace qadapt::solvers::adapt
