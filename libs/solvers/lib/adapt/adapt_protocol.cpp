/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/adapt_protocol.h"
#include "qadapt/solvers/adapt/errors.h"

QADAPT_INSTANTIATE_REGISTRY(qadapt::solvers::adapt::adapt_protocol,
                            const qadapt::heterogeneous_map &)

namespace qadapt::solvers::adapt {

score adapt_protocol::commutator_score(const generator &G,
                                       const quantum_state &psi,
                                       const quantum_state &lambda,
                                       quantum_state &work) {
  check_num_qubits(psi.num_qubits(), G.num_qubits(), "calculate_scores");
  G.apply(psi, work);
  return 2.0 * std::abs(work.inner(lambda).imag());
}

void adapt_protocol::check_pool(const generator_pool &pool) {
  if (pool.empty())
    throw std::runtime_error("Invalid adapt input, operator pool is empty.");
}

std::vector<score>
adapt_protocol::calculate_scores(const abstract_ansatz &ansatz,
                                 const generator_pool &pool,
                                 const observable &H,
                                 const quantum_state &reference) const {
  check_num_qubits(H.num_qubits(), reference.num_qubits(), "calculate_scores");
  auto psi = ansatz.prepare_scoring_state(reference);
  auto lambda = psi->zeros_like();
  auto work = psi->zeros_like();
  H.gradient_seed(*psi, *lambda);

  std::vector<score> scores(pool.size());
  for (std::size_t i = 0; i < pool.size(); i++)
    scores[i] = commutator_score(*pool[i], *psi, *lambda, *work);
  return scores;
}

score adapt_protocol::calculate_score(const abstract_ansatz &ansatz,
                                      const generator &G, const observable &H,
                                      const quantum_state &reference) const {
  check_num_qubits(H.num_qubits(), reference.num_qubits(), "calculate_score");
  auto psi = ansatz.prepare_scoring_state(reference);
  auto lambda = psi->zeros_like();
  auto work = psi->zeros_like();
  H.gradient_seed(*psi, *lambda);
  return commutator_score(G, *psi, *lambda, *work);
}

} // namespace qadapt::solvers::adapt
