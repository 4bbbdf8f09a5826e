/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/evolution.h"
#include "qadapt/solvers/adapt/errors.h"

namespace qadapt::solvers::adapt {

std::unique_ptr<quantum_state> evolve_state(const generator &G, parameter theta,
                                            const quantum_state &state) {
  auto ret = state.clone();
  evolve_state_inplace(G, theta, *ret);
  return ret;
}

quantum_state &evolve_state_inplace(const generator &G, parameter theta,
                                    quantum_state &state) {
  check_num_qubits(G.num_qubits(), state.num_qubits(), "evolve_state");
  G.evolve(theta, state);
  return state;
}

std::unique_ptr<quantum_state> evolve_state(const abstract_ansatz &ansatz,
                                            const quantum_state &reference) {
  auto ret = reference.clone();
  evolve_state_inplace(ansatz, *ret);
  return ret;
}

quantum_state &evolve_state_inplace(const abstract_ansatz &ansatz,
                                    quantum_state &state) {
  check_num_qubits(ansatz.num_qubits(), state.num_qubits(), "evolve_state");
  for (std::size_t i = 0; i < ansatz.size(); i++) {
    auto [G, theta] = ansatz.get(i);
    G->evolve(theta, state);
  }
  return state;
}

energy evaluate(const observable &H, const quantum_state &state) {
  check_num_qubits(H.num_qubits(), state.num_qubits(), "evaluate");
  return H.evaluate(state);
}

energy evaluate(const abstract_ansatz &ansatz, const observable &H,
                const quantum_state &reference) {
  check_num_qubits(H.num_qubits(), reference.num_qubits(), "evaluate");
  auto state = evolve_state(ansatz, reference);
  return H.evaluate(*state);
}

} // namespace qadapt::solvers::adapt
