/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "qadapt/core/extension_point.h"
#include "qadapt/core/heterogeneous_map.h"

#include "callbacks.h"

namespace qadapt::solvers::adapt {

/// @brief Strategy for growing the ansatz: how pool candidates are scored
/// and which of them are appended.
///
/// @details Protocols are created by name with an options map, e.g.
/// `adapt_protocol::get("tetris", {{"threshold", 1e-3}})`. Registered
/// protocols: "vanilla", "degenerate" and "tetris".
class adapt_protocol
    : public extension_point<adapt_protocol, const heterogeneous_map &> {
protected:
  /// @brief The score of one candidate on a prepared scoring state `psi`
  /// with gradient seed `lambda`, using `work` as scratch.
  static score commutator_score(const generator &G, const quantum_state &psi,
                                const quantum_state &lambda,
                                quantum_state &work);

  /// @throw std::runtime_error for an empty pool
  static void check_pool(const generator_pool &pool);

public:
  virtual ~adapt_protocol() = default;

  /// @brief Registered name of the protocol.
  virtual std::string name() const = 0;

  /// @brief Score every pool candidate.
  ///
  /// @details The default score is |<ψ|[G, H]|ψ>| = 2|Im<Gψ|λ>| on the
  /// scoring state ψ of the ansatz, which equals the magnitude of the
  /// partial derivative G would have if appended with parameter zero.
  virtual std::vector<score> calculate_scores(const abstract_ansatz &ansatz,
                                              const generator_pool &pool,
                                              const observable &H,
                                              const quantum_state &reference)
      const;

  /// @brief Score a single candidate, consistent with `calculate_scores`.
  virtual score calculate_score(const abstract_ansatz &ansatz,
                                const generator &G, const observable &H,
                                const quantum_state &reference) const;

  /// @brief Perform one adaptation step.
  ///
  /// @details When every score is below machine epsilon the ansatz is flagged
  /// converged and false is returned without calling any callback.
  /// Otherwise the selection is reported to the callbacks in order; if one
  /// of them requests termination or flags convergence the ansatz is left
  /// untouched. Otherwise the selection is appended with zero parameters.
  /// @return true if the ansatz was modified
  /// @throw std::runtime_error for an empty pool
  virtual bool adapt(abstract_ansatz &ansatz, trace &tr,
                     const generator_pool &pool, const observable &H,
                     const quantum_state &reference,
                     const callback_list &callbacks) = 0;
};

} // namespace qadapt::solvers::adapt
