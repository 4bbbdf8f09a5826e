/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/optimizers/cobyla.h"

#include "common/Logger.h"

#include <prima/prima.h>

#include <chrono>
#include <climits>
#include <cmath>
#include <exception>
#include <limits>

namespace qadapt::optim {

namespace {

/// State shared with the PRIMA C callbacks.
struct cobyla_context {
  const optimizable_function &function;
  std::vector<optimization_result> &history;
  const iteration_callback &callback;
  bool verbose;
  std::size_t dim;

  std::vector<double> x;
  std::vector<double> dx;
  std::size_t functionCalls = 0;
  std::size_t iterations = 0;
  bool stoppedByCallback = false;
  std::exception_ptr error;
};

/// PRIMA's iteration callback carries no user data pointer.
thread_local cobyla_context *activeContext = nullptr;

void calcfc(const double x[], double *const f, double[], const void *data) {
  auto *ctx = static_cast<cobyla_context *>(const_cast<void *>(data));
  if (ctx->error) {
    *f = std::numeric_limits<double>::quiet_NaN();
    return;
  }
  ctx->x.assign(x, x + ctx->dim);
  ctx->functionCalls++;
  try {
    *f = ctx->function(ctx->x, ctx->dx);
  } catch (...) {
    // Exceptions must not unwind through PRIMA; rethrown after the run.
    ctx->error = std::current_exception();
    *f = std::numeric_limits<double>::quiet_NaN();
  }
}

void progress(const int n, const double x[], const double f, const int nf,
              const int tr, const double, const int, const double[],
              bool *const terminate) {
  auto *ctx = activeContext;
  if (ctx->error) {
    *terminate = true;
    return;
  }

  ctx->iterations = tr;
  std::vector<double> xk(x, x + n);
  ctx->history.emplace_back(f, xk);
  if (ctx->verbose)
    cudaq::info("[cobyla] iteration {}: f = {} after {} evaluations", tr, f,
                nf);

  if (ctx->callback) {
    try {
      if (ctx->callback(tr, f, xk, {})) {
        ctx->stoppedByCallback = true;
        *terminate = true;
      }
    } catch (...) {
      ctx->error = std::current_exception();
      *terminate = true;
    }
  }
}

/// Restores the thread-local context and releases the PRIMA result.
struct prima_run_guard {
  prima_result_t &result;
  cobyla_context *previous;
  ~prima_run_guard() {
    activeContext = previous;
    prima_free_result(&result);
  }
};

} // namespace

optimization_result cobyla::optimize(std::size_t dim,
                                     const optimizable_function &opt_function,
                                     const heterogeneous_map &options) {
  history.clear();
  summary = optimization_summary();
  auto start = std::chrono::steady_clock::now();

  auto x0 = options.get("initial_parameters", std::vector<double>(dim));
  if (x0.size() != dim)
    throw std::invalid_argument("cobyla - initial_parameters has the wrong "
                                "length.");
  auto verbose = options.get("verbose", false);
  auto callback = options.get("callback", iteration_callback());

  cobyla_context ctx{opt_function, history, callback, verbose, dim};
  ctx.dx.resize(dim);

  if (dim == 0) {
    std::vector<double> empty;
    double fx = opt_function(empty, ctx.dx);
    summary.converged = true;
    summary.function_calls = 1;
    summary.message = "No parameters to optimize.";
    return {fx, empty};
  }

  prima_problem_t problem;
  prima_init_problem(&problem, static_cast<int>(dim));
  problem.x0 = x0.data();
  problem.calcfc = calcfc;
  problem.m_nlcon = 0;

  prima_options_t primaOptions;
  prima_init_options(&primaOptions);
  primaOptions.data = &ctx;
  primaOptions.callback = progress;
  if (options.contains("rhobeg"))
    primaOptions.rhobeg = options.get<double>("rhobeg");
  if (options.contains("rhoend"))
    primaOptions.rhoend = options.get<double>("rhoend");
  auto maxfun = options.get<std::size_t>(
      std::vector<std::string>{"max_iterations", "maxfun"}, 0);
  if (maxfun > 0)
    primaOptions.maxfun =
        static_cast<int>(std::min<std::size_t>(maxfun, INT_MAX));

  prima_result_t result{};
  prima_run_guard guard{result, activeContext};
  activeContext = &ctx;
  auto rc = prima_minimize(PRIMA_COBYLA, problem, primaOptions, &result);

  if (ctx.error)
    std::rethrow_exception(ctx.error);

  summary.converged = result.success && !ctx.stoppedByCallback;
  summary.iterations = ctx.iterations;
  summary.function_calls = ctx.functionCalls;
  summary.elapsed_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
          .count();
  summary.message = ctx.stoppedByCallback ? "Stopped by callback."
                    : result.message      ? result.message
                                          : prima_get_rc_string(rc);
  cudaq::info("[cobyla] {} ({} evaluations, f = {})", summary.message,
              result.nf, result.f);

  return {result.f, std::vector<double>(result.x, result.x + dim)};
}

} // namespace qadapt::optim
