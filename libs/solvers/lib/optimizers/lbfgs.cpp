/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/optimizers/lbfgs.h"

#include "common/Logger.h"

#include <lbfgs.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <cmath>
#include <exception>
#include <limits>
#include <memory>

namespace qadapt::optim {

namespace {

/// State shared with the liblbfgs C callbacks through their instance pointer.
struct lbfgs_context {
  const optimizable_function &function;
  std::vector<optimization_result> &history;
  const iteration_callback &callback;
  double tol;
  bool verbose;

  std::vector<double> x;
  std::vector<double> dx;
  std::size_t functionCalls = 0;
  std::size_t iterations = 0;
  bool gradientConverged = false;
  bool stoppedByCallback = false;
  std::exception_ptr error;
};

double inf_norm(const std::vector<double> &v) {
  double largest = 0.0;
  for (auto vi : v)
    largest = std::max(largest, std::abs(vi));
  return largest;
}

lbfgsfloatval_t evaluate(void *instance, const lbfgsfloatval_t *x,
                         lbfgsfloatval_t *g, const int n,
                         const lbfgsfloatval_t) {
  auto *ctx = static_cast<lbfgs_context *>(instance);
  if (ctx->error)
    return std::numeric_limits<double>::infinity();

  ctx->x.assign(x, x + n);
  ctx->dx.assign(n, 0.0);
  ctx->functionCalls++;
  try {
    double fx = ctx->function(ctx->x, ctx->dx);
    std::copy(ctx->dx.begin(), ctx->dx.end(), g);
    return fx;
  } catch (...) {
    // Exceptions must not unwind through liblbfgs; rethrown after the run.
    ctx->error = std::current_exception();
    std::fill(g, g + n, 0.0);
    return std::numeric_limits<double>::infinity();
  }
}

int progress(void *instance, const lbfgsfloatval_t *x,
             const lbfgsfloatval_t *g, const lbfgsfloatval_t fx,
             const lbfgsfloatval_t, const lbfgsfloatval_t gnorm,
             const lbfgsfloatval_t, int n, int k, int) {
  auto *ctx = static_cast<lbfgs_context *>(instance);
  if (ctx->error)
    return 1;

  ctx->iterations = k;
  std::vector<double> xk(x, x + n), gk(g, g + n);
  ctx->history.emplace_back(fx, xk);

  if (ctx->verbose)
    cudaq::info("[lbfgs] iteration {}: f = {}, |g| = {}", k, fx, gnorm);

  if (ctx->callback) {
    try {
      if (ctx->callback(k, fx, xk, gk)) {
        ctx->stoppedByCallback = true;
        return 1;
      }
    } catch (...) {
      ctx->error = std::current_exception();
      return 1;
    }
  }

  if (inf_norm(gk) <= ctx->tol) {
    ctx->gradientConverged = true;
    return 1;
  }
  return 0;
}

} // namespace

optimization_result lbfgs::optimize(std::size_t dim,
                                    const optimizable_function &opt_function,
                                    const heterogeneous_map &options) {
  if (!opt_function.providesGradients())
    throw std::runtime_error("lbfgs optimizer requires a gradient-providing "
                             "objective function.");

  history.clear();
  summary = optimization_summary();
  auto start = std::chrono::steady_clock::now();

  auto x0 = options.get("initial_parameters", std::vector<double>(dim));
  if (x0.size() != dim)
    throw std::invalid_argument("lbfgs - initial_parameters has the wrong "
                                "length.");
  auto tol = options.get<double>(std::vector<std::string>{"tol", "g_tol"},
                                 1e-12);
  auto maxIterations = options.get<std::size_t>(
      "max_iterations", std::numeric_limits<std::size_t>::max());
  auto verbose = options.get("verbose", false);
  auto callback = options.get("callback", iteration_callback());

  lbfgs_context ctx{opt_function, history, callback, tol, verbose};

  if (dim == 0) {
    std::vector<double> empty;
    double fx = opt_function(empty, ctx.dx);
    summary.converged = true;
    summary.function_calls = summary.gradient_calls = 1;
    summary.message = "No parameters to optimize.";
    return {fx, empty};
  }

  std::unique_ptr<lbfgsfloatval_t, decltype(&lbfgs_free)> x(
      lbfgs_malloc(static_cast<int>(dim)), &lbfgs_free);
  if (!x)
    throw std::bad_alloc();
  std::copy(x0.begin(), x0.end(), x.get());

  lbfgs_parameter_t param;
  lbfgs_parameter_init(&param);
  // Convergence is decided by the gradient test in `progress`.
  param.epsilon = 0.0;
  param.max_iterations =
      static_cast<int>(std::min<std::size_t>(maxIterations, INT_MAX));

  lbfgsfloatval_t fx = 0.0;
  int ret = ::lbfgs(static_cast<int>(dim), x.get(), &fx, evaluate, progress,
                    &ctx, &param);

  if (ctx.error)
    std::rethrow_exception(ctx.error);

  // A failed line search returns the last accepted point without calling
  // `progress` on it, so the gradient test has not been applied there. This
  // includes a starting point that already satisfies it.
  if (ret < 0 && ret != LBFGSERR_MAXIMUMITERATION && !ctx.gradientConverged &&
      !ctx.stoppedByCallback) {
    std::vector<double> xk(x.get(), x.get() + dim), gk(dim, 0.0);
    fx = opt_function(xk, gk);
    ctx.functionCalls++;
    if (inf_norm(gk) <= tol)
      ctx.gradientConverged = true;
    cudaq::debug("[lbfgs] line search stopped with status {}, |g| = {}", ret,
                 inf_norm(gk));
  }

  summary.converged =
      ctx.gradientConverged ||
      (!ctx.stoppedByCallback &&
       (ret == LBFGS_SUCCESS || ret == LBFGS_ALREADY_MINIMIZED));
  summary.iterations = ctx.iterations;
  summary.function_calls = summary.gradient_calls = ctx.functionCalls;
  summary.elapsed_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
          .count();
  summary.message = ctx.stoppedByCallback ? "Stopped by callback."
                    : ctx.gradientConverged
                        ? "Gradient tolerance reached."
                        : "liblbfgs returned status " + std::to_string(ret) +
                              ".";
  cudaq::info("[lbfgs] {} ({} iterations, f = {})", summary.message,
              summary.iterations, fx);

  return {fx, std::vector<double>(x.get(), x.get() + dim)};
}

} // namespace qadapt::optim
