/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "dense_state.h"
#include "generator.h"

namespace qadapt::solvers::adapt {

/// @brief Options for the Lanczos exponential action.
struct krylov_options {
  /// Largest Krylov subspace built before sub-stepping.
  std::size_t max_dimension = 30;
  /// Target error per sub-step, measured in the 2-norm of the state.
  double tolerance = 1e-13;
  /// Maximum number of times a sub-step may be halved.
  std::size_t max_halvings = 60;
};

/// @brief state = exp(-i θ G) state for a Hermitian generator, using only
/// applications of G.
///
/// @details Builds an orthonormal Lanczos basis V of the Krylov space of G
/// and the state, exponentiates the small tridiagonal projection T through
/// its eigendecomposition, and maps back with V. When the a posteriori
/// error estimate β_m |e_m^T exp(-iτT) e_1| exceeds the tolerance, the time
/// step τ is halved and the remainder is propagated in further sub-steps.
void krylov_evolve(const generator &G, parameter theta, dense_state &state,
                   const krylov_options &options = krylov_options());

} // namespace qadapt::solvers::adapt
