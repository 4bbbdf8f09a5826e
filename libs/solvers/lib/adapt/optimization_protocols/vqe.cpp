/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/optimization_protocols/vqe.h"
#include "qadapt/solvers/adapt/evolution.h"
#include "qadapt/solvers/adapt/gradient.h"

#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace qadapt::solvers::adapt {

namespace {
/// Puts the saved parameters back into the ansatz when leaving scope.
class parameter_restorer {
  abstract_ansatz &ansatz;
  std::vector<parameter> saved;

public:
  explicit parameter_restorer(abstract_ansatz &a)
      : ansatz(a), saved(a.angles()) {}
  ~parameter_restorer() { ansatz.bind(saved); }
};

double inf_norm(const std::vector<double> &v) {
  if (v.empty())
    return std::numeric_limits<double>::quiet_NaN();
  double largest = 0.0;
  for (auto vi : v)
    largest = std::max(largest, std::abs(vi));
  return largest;
}
} // namespace

vqe::vqe(const heterogeneous_map &options)
    : optimizerName(options.get<std::string>("optimizer", "lbfgs")),
      optimizerOptions(options),
      gradientTolerance(options.get<double>(
          std::vector<std::string>{"tol", "g_tol"}, 1e-12)) {
  optimizerOptions.erase("optimizer");
  if (!optim::optimizer::is_registered(optimizerName))
    throw std::runtime_error("vqe - unknown optimizer " + optimizerName + ".");
}

bool vqe::optimize(abstract_ansatz &ansatz, trace &tr, const observable &H,
                   const quantum_state &reference,
                   const callback_list &callbacks) {
  auto start = std::chrono::steady_clock::now();
  auto opt = optim::optimizer::get(optimizerName);
  const bool useGradient = opt->requiresGradients();

  gradient_workspace workspace;
  std::vector<energy> grad;
  std::size_t fCalls = 0, gCalls = 0;
  bool stop = false, ended = false;

  auto report = [&](std::size_t iteration, double value,
                    const std::vector<double> &x,
                    const std::vector<double> &g) {
    ansatz.bind(x);
    heterogeneous_map data;
    data.insert("energy", value);
    data.insert("g_norm", inf_norm(g));
    data.insert("elapsed_iterations", iteration);
    data.insert("elapsed_time",
                std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - start)
                    .count());
    data.insert("elapsed_f_calls", fCalls);
    data.insert("elapsed_g_calls", gCalls);
    stop = run_iteration_callbacks(callbacks, data, ansatz, tr, *this, H,
                                   reference);
    ended = stop || ansatz.is_optimized();
    return ended;
  };

  // The starting point is reported as iteration 0.
  auto x0 = ansatz.angles();
  double e0 = evaluate(ansatz, H, reference);
  fCalls++;
  if (useGradient && !x0.empty()) {
    gradient_inplace(grad, ansatz, H, reference, workspace);
    gCalls++;
  }
  if (report(0, e0, x0, useGradient ? grad : std::vector<double>()))
    return ansatz.is_optimized();

  // Nothing to optimize, or the starting point already meets the gradient
  // tolerance of the optimizer.
  if (x0.empty() || (useGradient && inf_norm(grad) <= gradientTolerance)) {
    cudaq::info("[vqe] starting point accepted, |g| = {}",
                x0.empty() ? 0.0 : inf_norm(grad));
    ansatz.set_optimized(true);
    return true;
  }

  optim::optimizable_function objective;
  if (useGradient)
    objective = [&](const std::vector<double> &x, std::vector<double> &dx) {
      parameter_restorer restore(ansatz);
      ansatz.bind(x);
      fCalls++;
      gCalls++;
      double e = evaluate(ansatz, H, reference);
      gradient_inplace(grad, ansatz, H, reference, workspace);
      std::copy(grad.begin(), grad.end(), dx.begin());
      return e;
    };
  else
    objective = [&](const std::vector<double> &x) {
      parameter_restorer restore(ansatz);
      ansatz.bind(x);
      fCalls++;
      return evaluate(ansatz, H, reference);
    };

  auto options = optimizerOptions;
  options.insert("initial_parameters", x0);
  options.insert("callback", optim::iteration_callback(report));

  auto [value, xopt] = opt->optimize(x0.size(), objective, options);
  // Callbacks that end the run keep the iterate they were shown.
  if (!ended)
    ansatz.bind(xopt);

  cudaq::info("[vqe] {} finished: energy = {}, converged = {}, {} iterations",
              optimizerName, value, opt->summary.converged,
              opt->summary.iterations);

  if (ansatz.is_optimized())
    return true;
  if (!stop && opt->summary.converged)
    ansatz.set_optimized(true);
  return ansatz.is_optimized();
}

} // namespace qadapt::solvers::adapt
