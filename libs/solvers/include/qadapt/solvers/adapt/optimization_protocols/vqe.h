/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "../optimization_protocol.h"
#include "qadapt/solvers/optimizer.h"

namespace qadapt::solvers::adapt {

/// @brief Variational optimization of all ansatz parameters with a classical
/// optimizer.
///
/// @details The objective binds the trial point, evaluates the energy (and
/// the adjoint gradient for gradient-based optimizers) and restores the
/// previous parameters, so trial points never leak into the ansatz. Each
/// accepted iterate, and the starting point as iteration 0, is bound into
/// the ansatz before the callbacks see it.
///
/// Options:
/// - "optimizer" (std::string, default "lbfgs"): name of the
///   `optim::optimizer`
/// - "g_tol" or "tol" (double, default 1e-12): a gradient-based optimizer
///   is not started when the largest gradient component at the starting
///   point is already within this tolerance
/// - every other option is forwarded to the optimizer, e.g.
///   "max_iterations"
class vqe : public optimization_protocol {
private:
  std::string optimizerName = "lbfgs";
  heterogeneous_map optimizerOptions;
  double gradientTolerance = 1e-12;

public:
  vqe() = default;
  explicit vqe(const heterogeneous_map &options);

  std::string name() const override { return "vqe"; }
  const std::string &get_optimizer() const { return optimizerName; }

  bool optimize(abstract_ansatz &ansatz, trace &tr, const observable &H,
                const quantum_state &reference,
                const callback_list &callbacks) override;

  QADAPT_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      vqe, "vqe",
      static std::unique_ptr<optimization_protocol> create(
          const heterogeneous_map &options) {
        return std::make_unique<vqe>(options);
      })
};
QADAPT_REGISTER_TYPE(vqe)

} // namespace qadapt::solvers::adapt
