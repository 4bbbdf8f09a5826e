/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/adapt_protocols/degenerate.h"

#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace qadapt::solvers::adapt {

degenerate::degenerate(const heterogeneous_map &options)
    : rng(options.get<std::uint64_t>("seed", 0)),
      tieTolerance(options.get<double>("tie_tolerance", 0.0)) {
  if (tieTolerance < 0.0)
    throw std::invalid_argument(
        "degenerate - tie_tolerance must be non-negative.");
}

std::size_t degenerate::select_index(const std::vector<score> &scores) {
  double largest = 0.0;
  for (auto s : scores)
    largest = std::max(largest, std::abs(s));

  std::vector<std::size_t> tied;
  for (std::size_t i = 0; i < scores.size(); i++)
    if (largest - std::abs(scores[i]) <= tieTolerance)
      tied.push_back(i);

  std::uniform_int_distribution<std::size_t> pick(0, tied.size() - 1);
  auto index = tied[pick(rng)];
  cudaq::debug("[adapt] {} candidates tied for the largest score, picked {}",
               tied.size(), index);
  return index;
}

} // namespace qadapt::solvers::adapt
