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

/// @brief The limited-memory Broyden-Fletcher-Goldfarb-Shanno
/// gradient based black-box function optimizer, backed by liblbfgs.
///
/// Options:
/// - "initial_parameters" (std::vector<double>, default zeros)
/// - "tol" or "g_tol" (double, default 1e-12): stop once the largest
///   gradient component is at most this value
/// - "max_iterations" (std::size_t, default unbounded)
/// - "callback" (iteration_callback)
/// - "verbose" (bool, default false)
class lbfgs : public optimizer {
public:
  using optimizer::optimize;

  /// @brief Return true indicating this optimizer requires an
  /// optimization functor that produces gradients.
  bool requiresGradients() const override { return true; }

  /// @brief Optimize the provided function according to the
  /// LBFGS algorithm.
  /// @throw std::runtime_error if `opt_function` does not provide gradients
  optimization_result optimize(std::size_t dim,
                               const optimizable_function &opt_function,
                               const heterogeneous_map &options) override;

  QADAPT_EXTENSION_CREATOR_FUNCTION(optimizer, lbfgs)
};
QADAPT_REGISTER_TYPE(lbfgs)
} // namespace qadapt::optim
