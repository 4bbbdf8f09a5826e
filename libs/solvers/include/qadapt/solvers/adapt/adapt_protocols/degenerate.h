/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <random>

#include "vanilla.h"

namespace qadapt::solvers::adapt {

/// @brief Vanilla ADAPT, except that ties for the largest score are broken
/// uniformly at random, so that symmetric problems do not favor whichever
/// symmetry sector happens to come first in the pool.
///
/// Options:
/// - "seed" (std::uint64_t, default 0): seed of the tie-breaking generator
/// - "tie_tolerance" (double, default 0): scores within this distance of the
///   maximum count as tied
class degenerate : public vanilla {
private:
  std::mt19937 rng;
  double tieTolerance = 0.0;

protected:
  std::size_t select_index(const std::vector<score> &scores) override;

public:
  degenerate() : degenerate(heterogeneous_map()) {}
  explicit degenerate(const heterogeneous_map &options);

  std::string name() const override { return "degenerate"; }

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      degenerate, "degenerate",
      static std::unique_ptr<adapt_protocol> create(
          const heterogeneous_map &options) {
        return std::make_unique<degenerate>(options);
      })
};
QADAPT_REGISTER_TYPE(degenerate)

} // namespace qadapt::solvers::adapt
