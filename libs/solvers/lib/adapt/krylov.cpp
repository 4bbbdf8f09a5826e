/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/krylov.h"

#include "common/Logger.h"

#include <xtensor-blas/xlinalg.hpp>
#include <xtensor/xtensor.hpp>

namespace qadapt::solvers::adapt {

namespace {

/// Below this off-diagonal the Krylov space is invariant and the projection
/// is exact.
constexpr double breakdown_threshold = 1e-14;

/// The Lanczos decomposition of G restricted to the Krylov space of a state.
struct lanczos_basis {
  std::vector<dense_state> vectors;
  std::vector<double> alpha;
  std::vector<double> beta;
  /// beta_m, the residual coupling out of the space. Zero on breakdown.
  double residual = 0.0;
};

lanczos_basis build_basis(const generator &G, const dense_state &start,
                          double norm, std::size_t maxDim) {
  lanczos_basis basis;
  basis.vectors.push_back(start);
  basis.vectors.back().scale(1.0 / norm);

  dense_state w(start.num_qubits());
  for (std::size_t j = 0; j < maxDim; j++) {
    G.apply(basis.vectors[j], w);
    double a = w.inner(basis.vectors[j]).real();
    basis.alpha.push_back(a);

    // Full reorthogonalization against every basis vector.
    for (int pass = 0; pass < 2; pass++)
      for (const auto &v : basis.vectors)
        w.add(-v.inner(w), v);

    double b = w.norm();
    if (b < breakdown_threshold) {
      basis.residual = 0.0;
      return basis;
    }
    if (j + 1 == maxDim) {
      basis.residual = b;
      return basis;
    }
    basis.beta.push_back(b);
    w.scale(1.0 / b);
    basis.vectors.push_back(w);
  }
  return basis;
}

/// Coefficients c = exp(-i tau T) e_1 in the Lanczos basis.
std::vector<amplitude> project_exponential(const xt::xtensor<double, 1> &evals,
                                           const xt::xtensor<double, 2> &evecs,
                                           double tau) {
  const std::size_t m = evals.size();
  std::vector<amplitude> c(m, 0.0);
  for (std::size_t k = 0; k < m; k++) {
    amplitude weight = std::exp(amplitude(0.0, -tau * evals(k))) * evecs(0, k);
    for (std::size_t i = 0; i < m; i++)
      c[i] += evecs(i, k) * weight;
  }
  return c;
}

} // namespace

void krylov_evolve(const generator &G, parameter theta, dense_state &state,
                   const krylov_options &options) {
  if (options.max_dimension == 0)
    throw std::invalid_argument("krylov_evolve - max_dimension must be > 0.");

  const std::size_t maxDim =
      std::min<std::uint64_t>(options.max_dimension, state.dimension());
  double remaining = theta;
  std::size_t substeps = 0;

  while (remaining != 0.0) {
    const double norm = state.norm();
    if (norm == 0.0)
      return;

    auto basis = build_basis(G, state, norm, maxDim);
    const std::size_t m = basis.alpha.size();

    xt::xtensor<double, 2> T = xt::zeros<double>({m, m});
    for (std::size_t i = 0; i < m; i++) {
      T(i, i) = basis.alpha[i];
      if (i + 1 < m)
        T(i, i + 1) = T(i + 1, i) = basis.beta[i];
    }
    auto [evals, evecs] = xt::linalg::eigh(T);
    xt::xtensor<double, 1> w = evals;
    xt::xtensor<double, 2> V = evecs;

    double tau = remaining;
    auto c = project_exponential(w, V, tau);
    std::size_t halvings = 0;
    while (basis.residual > 0.0 &&
           norm * basis.residual * std::abs(c.back()) > options.tolerance) {
      if (++halvings > options.max_halvings)
        throw std::runtime_error(
            "krylov_evolve - failed to reach the requested tolerance.");
      tau /= 2.0;
      c = project_exponential(w, V, tau);
    }

    state.set_zero();
    for (std::size_t i = 0; i < m; i++)
      state.add(norm * c[i], basis.vectors[i]);

    remaining -= tau;
    substeps++;
  }

  cudaq::debug("krylov_evolve - theta = {} in {} sub-steps", theta, substeps);
}

} // namespace qadapt::solvers::adapt
