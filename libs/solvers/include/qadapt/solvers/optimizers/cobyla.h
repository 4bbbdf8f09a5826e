/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "qadapt/solvers/optimizer.h"

namespace qadapt::optim {

/// @brief The COBYLA derivative-free black-box function optimizer from the
/// [PRIMA](https://www.libprima.net) library.
///
/// Options:
/// - "initial_parameters" (std::vector<double>, default zeros)
/// - "rhobeg", "rhoend" (double): initial and final trust region radius
/// - "max_iterations" or "maxfun" (std::size_t): function evaluation budget
/// - "callback" (iteration_callback), called with an empty gradient
/// - "verbose" (bool, default false)
class cobyla : public optimizer {
public:
  using optimizer::optimize;

  /// @brief Return false, cobyla only uses function values.
  bool requiresGradients() const override { return false; }

  /// @brief Optimize the provided function according to the
  /// cobyla algorithm.
  optimization_result optimize(std::size_t dim,
                               const optimizable_function &opt_function,
                               const heterogeneous_map &options) override;

  QADAPT_EXTENSION_CREATOR_FUNCTION(optimizer, cobyla)
};

QADAPT_REGISTER_TYPE(cobyla)

} // namespace qadapt::optim
