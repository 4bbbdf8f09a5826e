/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/gradient.h"
#include "qadapt/solvers/adapt/errors.h"
#include "qadapt/solvers/adapt/evolution.h"

#include <typeinfo>

namespace qadapt::solvers::adapt {

void gradient_workspace::prepare(const quantum_state &reference) {
  auto compatible = [&](const std::unique_ptr<quantum_state> &buffer) {
    return buffer && typeid(*buffer) == typeid(reference) &&
           buffer->num_qubits() == reference.num_qubits();
  };
  if (!compatible(psi))
    psi = reference.zeros_like();
  if (!compatible(lambda))
    lambda = reference.zeros_like();
  if (!compatible(sigma))
    sigma = reference.zeros_like();
  if (!compatible(scratch))
    scratch = reference.zeros_like();
}

energy partial(std::size_t index, const abstract_ansatz &ansatz,
               const observable &H, const quantum_state &reference) {
  if (index >= ansatz.size())
    throw std::out_of_range("partial - index out of range.");
  check_num_qubits(ansatz.num_qubits(), reference.num_qubits(), "partial");
  check_num_qubits(H.num_qubits(), reference.num_qubits(), "partial");

  auto psi = reference.clone();
  for (std::size_t i = 0; i < index; i++) {
    auto [G, theta] = ansatz.get(i);
    G->evolve(theta, *psi);
  }

  auto [G, theta] = ansatz.get(index);
  auto sigma = psi->zeros_like();
  G->differential_action(theta, *psi, *sigma);
  G->evolve(theta, *psi);

  for (std::size_t i = index + 1; i < ansatz.size(); i++) {
    auto [Gi, thetai] = ansatz.get(i);
    Gi->evolve(thetai, *psi);
    Gi->evolve(thetai, *sigma);
  }

  auto lambda = psi->zeros_like();
  H.gradient_seed(*psi, *lambda);
  return 2.0 * sigma->inner(*lambda).real();
}

std::vector<energy> gradient(const abstract_ansatz &ansatz, const observable &H,
                             const quantum_state &reference) {
  std::vector<energy> result;
  gradient_workspace workspace;
  return gradient_inplace(result, ansatz, H, reference, workspace);
}

std::vector<energy> &gradient_inplace(std::vector<energy> &result,
                                      const abstract_ansatz &ansatz,
                                      const observable &H,
                                      const quantum_state &reference,
                                      gradient_workspace &workspace) {
  check_num_qubits(ansatz.num_qubits(), reference.num_qubits(), "gradient");
  check_num_qubits(H.num_qubits(), reference.num_qubits(), "gradient");

  result.resize(ansatz.size());
  workspace.prepare(reference);
  auto &psi = *workspace.psi;
  auto &lambda = *workspace.lambda;
  auto &sigma = *workspace.sigma;
  auto &scratch = *workspace.scratch;

  psi.assign(reference);
  evolve_state_inplace(ansatz, psi);
  H.gradient_seed(psi, lambda);

  for (std::size_t i = ansatz.size(); i-- > 0;) {
    auto [G, theta] = ansatz.get(i);
    G->unevolve(theta, psi);
    G->differential_action(theta, psi, sigma, scratch);
    result[i] = 2.0 * sigma.inner(lambda).real();
    G->unevolve(theta, lambda);
  }
  return result;
}

} // namespace qadapt::solvers::adapt
