/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <functional>
#include <string>
#include <tuple>
#include <vector>

#include "qadapt/core/extension_point.h"
#include "qadapt/core/heterogeneous_map.h"

namespace qadapt::optim {

/// Typedef modeling the result of an optimization strategy,
/// a double representing the optimal value and the corresponding
/// optimal parameters.
using optimization_result = std::tuple<double, std::vector<double>>;

/// @brief User hook called once per accepted iterate with the iteration
/// number, the value, the parameters and the gradient (empty for
/// gradient-free strategies). Returning true stops the optimization.
using iteration_callback = std::function<bool(
    std::size_t iteration, double value, const std::vector<double> &x,
    const std::vector<double> &gradient)>;

/// @brief Bookkeeping of the most recent `optimize` call.
struct optimization_summary {
  /// True if the strategy met its own convergence criterion, false if it
  /// ran out of iterations, failed, or was stopped by the callback.
  bool converged = false;
  std::size_t iterations = 0;
  std::size_t function_calls = 0;
  std::size_t gradient_calls = 0;
  double elapsed_seconds = 0.0;
  std::string message;
};

/// An optimizable_function wraps a user-provided objective function
/// to be optimized.
class optimizable_function {
private:
  using NoGradientSignature =
      std::function<double(const std::vector<double> &)>;
  using GradientSignature =
      std::function<double(const std::vector<double> &, std::vector<double> &)>;

  GradientSignature _opt_func;
  bool _providesGradients = true;

public:
  optimizable_function() = default;
  optimizable_function &operator=(const optimizable_function &other) = default;

  template <typename Callable>
  optimizable_function(const Callable &callable) {
    static_assert(
        std::is_invocable_v<Callable, std::vector<double>> ||
            std::is_invocable_v<Callable, std::vector<double>,
                                std::vector<double> &>,
        "Invalid optimization function. Must have signature double(const "
        "std::vector<double>&) or double(const std::vector<double>&, "
        "std::vector<double>&) for gradient-free or gradient-based "
        "optimizations, respectively.");

    if constexpr (std::is_invocable_v<Callable, std::vector<double>>) {
      _opt_func = [c = callable](const std::vector<double> &x,
                                 std::vector<double> &) { return c(x); };
      _providesGradients = false;
    } else {
      _opt_func = callable;
    }
  }

  bool providesGradients() const { return _providesGradients; }
  double operator()(const std::vector<double> &x,
                    std::vector<double> &dx) const {
    return _opt_func(x, dx);
  }
};

/// @brief Interface of the classical minimizers driving the variational
/// parameters.
///
/// @details `optimize` takes the number of parameters and an objective that
/// maps the parameters to a value and, for gradient-based strategies, fills
/// the gradient. Strategy-specific settings (initial parameters, tolerance,
/// iteration limit, "callback") travel in the options map. Concrete
/// strategies are created by name: "lbfgs" and "cobyla".
class optimizer : public qadapt::extension_point<optimizer> {
public:
  virtual ~optimizer() = default;

  /// Returns true if this optimization strategy requires
  /// gradients to achieve its optimization goals.
  virtual bool requiresGradients() const = 0;

  /// Run the optimization with default options.
  virtual optimization_result
  optimize(std::size_t dim, const optimizable_function &opt_function) {
    return optimize(dim, opt_function, heterogeneous_map());
  }

  /// Run the optimization strategy defined by concrete sub-type
  /// implementations.
  virtual optimization_result optimize(std::size_t dim,
                                       const optimizable_function &opt_function,
                                       const heterogeneous_map &options) = 0;

  /// @brief Value and parameters of each iteration of the last run.
  std::vector<optimization_result> history;

  /// @brief Summary of the last run.
  optimization_summary summary;
};

} // namespace qadapt::optim
