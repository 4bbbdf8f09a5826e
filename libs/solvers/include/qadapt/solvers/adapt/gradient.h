/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "ansatz.h"
#include "observable.h"

namespace qadapt::solvers::adapt {

/// @brief Work buffers of the adjoint gradient sweep, kept between calls.
///
/// @details Once the buffers exist, a gradient on a `dense_state` register
/// through Pauli, commuting and QAOA phase generators allocates nothing.
/// Krylov evolution of a `pauli_sum_generator` still builds its subspace
/// basis on every call, and `sparse_state` buffers grow with their support.
class gradient_workspace {
private:
  std::unique_ptr<quantum_state> psi;
  std::unique_ptr<quantum_state> lambda;
  std::unique_ptr<quantum_state> sigma;
  std::unique_ptr<quantum_state> scratch;

  friend std::vector<energy> &gradient_inplace(std::vector<energy> &,
                                               const abstract_ansatz &,
                                               const observable &,
                                               const quantum_state &,
                                               gradient_workspace &);

  /// Allocate buffers shaped like `reference` unless compatible ones exist.
  void prepare(const quantum_state &reference);

public:
  gradient_workspace() = default;
};

/// @brief dC/dθ_index of the cost C = evaluate(ansatz, H, reference),
/// computed by evolving forward to `index`, differentiating that generator
/// and finishing the evolution. Costs O(L) evolutions for one component.
/// @throw std::out_of_range for `index >= ansatz.size()`
energy partial(std::size_t index, const abstract_ansatz &ansatz,
               const observable &H, const quantum_state &reference);

/// @brief Every dC/dθ_i with one adjoint sweep.
std::vector<energy> gradient(const abstract_ansatz &ansatz, const observable &H,
                             const quantum_state &reference);

/// @brief Adjoint gradient written into `result`, reusing `workspace`.
///
/// @details With |ψ> = U|ψ0> and λ = H.gradient_seed(ψ), walks the ansatz
/// backwards: undo generator i on ψ, form σ = d/dθ_i exp(-iθ_i G_i)|ψ>,
/// record 2 Re<σ|λ>, then undo generator i on λ.
/// @return `result`
std::vector<energy> &gradient_inplace(std::vector<energy> &result,
                                      const abstract_ansatz &ansatz,
                                      const observable &H,
                                      const quantum_state &reference,
                                      gradient_workspace &workspace);

} // namespace qadapt::solvers::adapt
