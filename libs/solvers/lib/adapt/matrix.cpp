/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/matrix.h"
#include "qadapt/solvers/adapt/dense_state.h"

#include <xtensor-blas/xlinalg.hpp>
#include <xtensor/xbuilder.hpp>
#include <xtensor/xcomplex.hpp>
#include <xtensor/xmanipulation.hpp>
#include <xtensor/xview.hpp>

namespace qadapt::solvers::adapt {

namespace {
void check_matrix_size(std::size_t num_qubits, const std::string &what) {
  if (num_qubits > max_matrix_qubits)
    throw std::invalid_argument(what + " - " + std::to_string(num_qubits) +
                                " qubits exceed the dense limit of " +
                                std::to_string(max_matrix_qubits) + ".");
}

/// Columns A|k> for every basis state |k>.
template <typename ApplyFn>
complex_matrix columns(std::size_t num_qubits, ApplyFn &&apply) {
  auto dim = std::size_t(1) << num_qubits;
  complex_matrix matrix = xt::zeros<amplitude>({dim, dim});
  dense_state out(num_qubits);
  for (std::size_t k = 0; k < dim; k++) {
    dense_state in(num_qubits, k);
    out.set_zero();
    apply(in, out);
    for (std::size_t j = 0; j < dim; j++)
      matrix(j, k) = out[j];
  }
  return matrix;
}
} // namespace

complex_vector state_vector(const quantum_state &state) {
  auto data = state.to_vector();
  complex_vector v = xt::zeros<amplitude>({data.size()});
  std::copy(data.begin(), data.end(), v.begin());
  return v;
}

complex_matrix generator_matrix(const generator &G) {
  check_matrix_size(G.num_qubits(), "generator_matrix");
  return columns(G.num_qubits(),
                 [&](const quantum_state &in, quantum_state &out) {
                   G.apply(in, out);
                 });
}

complex_matrix observable_matrix(const observable &H) {
  check_matrix_size(H.num_qubits(), "observable_matrix");
  return columns(H.num_qubits(),
                 [&](const quantum_state &in, quantum_state &out) {
                   H.apply(in, out);
                 });
}

complex_matrix evolution_matrix(const generator &G, parameter theta) {
  auto matrix = generator_matrix(G);
  auto [evals, evecs] = xt::linalg::eigh(matrix);
  complex_matrix V = evecs;

  complex_matrix scaled = V;
  for (std::size_t j = 0; j < scaled.shape(1); j++) {
    auto phase = std::exp(amplitude(0.0, -theta * evals(j)));
    for (std::size_t i = 0; i < scaled.shape(0); i++)
      scaled(i, j) *= phase;
  }

  complex_matrix Vdag = xt::conj(xt::transpose(V));
  return xt::linalg::dot(scaled, Vdag);
}

complex_matrix ansatz_unitary(const abstract_ansatz &ansatz) {
  check_matrix_size(ansatz.num_qubits(), "ansatz_unitary");
  auto dim = std::size_t(1) << ansatz.num_qubits();
  complex_matrix U = xt::eye<amplitude>(dim);
  for (std::size_t i = 0; i < ansatz.size(); i++) {
    auto [G, theta] = ansatz.get(i);
    complex_matrix step = evolution_matrix(*G, theta);
    U = xt::linalg::dot(step, U);
  }
  return U;
}

} // namespace qadapt::solvers::adapt
