/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "qadapt/solvers/adapt/adapt_protocol.h"
#include "qadapt/solvers/adapt/adapt_protocols/degenerate.h"
#include "qadapt/solvers/adapt/adapt_protocols/tetris.h"
#include "qadapt/solvers/adapt/adapt_protocols/vanilla.h"
#include "qadapt/solvers/adapt/ansatz.h"
#include "qadapt/solvers/adapt/callbacks.h"
#include "qadapt/solvers/adapt/dense_state.h"
#include "qadapt/solvers/adapt/evolution.h"
#include "qadapt/solvers/adapt/generators.h"
#include "qadapt/solvers/adapt/gradient.h"
#include "qadapt/solvers/adapt/optimization_protocol.h"
#include "qadapt/solvers/adapt/optimization_protocols/optimization_free.h"
#include "qadapt/solvers/adapt/optimization_protocols/vqe.h"
#include "qadapt/solvers/adapt/qaoa_ansatz.h"
#include "qadapt/solvers/adapt/sparse_state.h"
#include "qadapt/solvers/optimizers/cobyla.h"
#include "qadapt/solvers/optimizers/lbfgs.h"

/**
 * @file
 * @brief The ADAPT family of adaptive variational algorithms.
 *
 * @details
 * ADAPT grows a problem-tailored ansatz one (or a few) generators at a time.
 * Each round alternates two protocols on a shared ansatz:
 *
 * - the optimization protocol refines all current parameters until they are
 *   locally optimal (the ansatz is flagged `optimized`), and
 * - the adapt protocol scores every candidate of a fixed pool by the energy
 *   gradient it would have if appended at zero, and appends the best.
 *
 * Callbacks observe and steer both phases: tracers record history in a
 * `trace`, printers report progress, stoppers flag convergence. The loop ends
 * when the ansatz is flagged `converged` or a callback aborts.
 */

namespace qadapt::solvers {

namespace adapt {

/// Result type for ADAPT-VQE algorithm
/// @return Tuple containing:
///   - Final energy (double)
///   - Optimized parameters (vector of doubles)
///   - Selected operators (vector of cudaq::spin_op)
using result =
    std::tuple<double, std::vector<double>, std::vector<cudaq::spin_op>>;

/// @brief Run ADAPT until the ansatz converges or a callback aborts.
///
/// @details Loops: return true once the ansatz is converged; if it is not
/// optimized, optimize it and return false if it still is not; then adapt,
/// returning whether the ansatz is converged when no generator was added.
/// There is no implicit iteration cap, a stopper callback is needed for pools
/// that never exhaust their scores.
/// @return true on convergence, false if stopped by a callback or an
/// unconverged optimization
/// @throw std::runtime_error for an empty pool, unless the ansatz is
/// already converged
bool run(abstract_ansatz &ansatz, trace &tr, adapt_protocol &adapt,
         optimization_protocol &optimization, const generator_pool &pool,
         const observable &H, const quantum_state &reference,
         const callback_list &callbacks);

} // namespace adapt

/// @brief Run ADAPT-VQE on a Hamiltonian and operator pool given as
/// `cudaq::spin_op`s, starting from `reference`.
/// @param H Hermitian Hamiltonian
/// @param poolList Pool of operators. Hermitian operators are used as the
/// generator G of exp(-iθG). Operators with purely imaginary coefficients are
/// taken as anti-Hermitian A in exp(θA), i.e. G = iA.
/// @param reference Initial state
/// @param options Additional options for the algorithm. Supported Keys:
///  - "adapt" (string): adapt protocol name [default: "vanilla"]
///  - "optimizer" (string): optimizer name [default: "lbfgs"]
///  - "max_iter" (int): Maximum number of generators [default: 30]
///  - "grad_norm_tolerance" (double): Convergence tolerance for the largest
///  score [default: 1e-5]
///  - "threshold_energy" (double): converge when the energy changes by less
///  than this between adaptations [default: 1e-6]
///  - "g_tol" (double): gradient tolerance of the optimizer [default: 1e-6]
///  - "verbose" (bool): Print energies and selections [default: false]
///  - "num_qubits" (int): register size [default: that of `reference`]
///  Remaining options are passed on to the protocols and the optimizer.
/// @return Result of the ADAPT-VQE algorithm
adapt::result adapt_vqe(const cudaq::spin_op &H,
                        const std::vector<cudaq::spin_op> &poolList,
                        const adapt::quantum_state &reference,
                        const heterogeneous_map &options = heterogeneous_map());

} // namespace qadapt::solvers
