/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "qadapt/core/heterogeneous_map.h"

#include "ansatz.h"
#include "observable.h"
#include "trace.h"

namespace qadapt::solvers::adapt {

class adapt_protocol;
class optimization_protocol;

/// @brief Extension hook invoked by the protocols.
///
/// @details `on_adaptation` is called by an adapt protocol after it has
/// chosen what to append but before the ansatz is modified.
/// `on_iteration` is called by an optimization protocol once per accepted
/// iterate, with the ansatz bound to that iterate. `data` holds the values
/// computed by the protocol for this call (see the standard keys below).
///
/// Returning true terminates the run immediately. Callbacks that merely
/// decide the run has converged (stoppers) should instead call
/// `set_converged` or `set_optimized` on the ansatz and return false.
///
/// Standard keys written by `adapt`: "scores", "selected_index",
/// "selected_score", "selected_generator", "selected_parameter".
/// Standard keys written by `optimize`: "energy", "g_norm",
/// "elapsed_iterations", "elapsed_time", "elapsed_f_calls",
/// "elapsed_g_calls". Traces additionally use the reserved keys "iteration"
/// and "adaptation".
class callback {
public:
  virtual ~callback() = default;

  virtual bool on_adaptation(const heterogeneous_map &data,
                             abstract_ansatz &ansatz, trace &tr,
                             const adapt_protocol &protocol,
                             const generator_pool &pool, const observable &H,
                             const quantum_state &reference) {
    return false;
  }

  virtual bool on_iteration(const heterogeneous_map &data,
                            abstract_ansatz &ansatz, trace &tr,
                            const optimization_protocol &protocol,
                            const observable &H,
                            const quantum_state &reference) {
    return false;
  }
};

/// @brief Callbacks run in list order.
using callback_list = std::vector<std::shared_ptr<callback>>;

/// @brief Run `on_adaptation` of each callback in order, stopping at the
/// first one that returns true.
/// @return true if some callback requested termination
bool run_adaptation_callbacks(const callback_list &callbacks,
                              const heterogeneous_map &data,
                              abstract_ansatz &ansatz, trace &tr,
                              const adapt_protocol &protocol,
                              const generator_pool &pool, const observable &H,
                              const quantum_state &reference);

/// @brief Run `on_iteration` of each callback in order, stopping at the first
/// one that returns true.
/// @return true if some callback requested termination
bool run_iteration_callbacks(const callback_list &callbacks,
                             const heterogeneous_map &data,
                             abstract_ansatz &ansatz, trace &tr,
                             const optimization_protocol &protocol,
                             const observable &H,
                             const quantum_state &reference);

/// @brief Copy selected data keys into the trace, and keep the reserved
/// "iteration" and "adaptation" counters.
///
/// @details Each iteration appends its 1-based index to "iteration"; each
/// adaptation appends the number of iterations so far to "adaptation".
/// Keys missing from `data` are skipped, so one tracer serves both hooks.
/// Use at most one tracer per run.
class tracer : public callback {
private:
  std::vector<std::string> keys;

public:
  explicit tracer(std::vector<std::string> keys) : keys(std::move(keys)) {}

  bool on_adaptation(const heterogeneous_map &data, abstract_ansatz &ansatz,
                     trace &tr, const adapt_protocol &protocol,
                     const generator_pool &pool, const observable &H,
                     const quantum_state &reference) override;
  bool on_iteration(const heterogeneous_map &data, abstract_ansatz &ansatz,
                    trace &tr, const optimization_protocol &protocol,
                    const observable &H,
                    const quantum_state &reference) override;
};

/// @brief Record the ansatz parameters at every iteration in the trace
/// parameter matrix.
class parameter_tracer : public callback {
public:
  bool on_iteration(const heterogeneous_map &data, abstract_ansatz &ansatz,
                    trace &tr, const optimization_protocol &protocol,
                    const observable &H,
                    const quantum_state &reference) override;
};

/// @brief Print selected data keys, headed by the adaptation or iteration
/// number when a tracer precedes it.
class printer : public callback {
private:
  std::vector<std::string> keys;
  std::ostream &os;

  void print_keys(const heterogeneous_map &data) const;

public:
  printer(std::vector<std::string> keys, std::ostream &os = std::cout)
      : keys(std::move(keys)), os(os) {}

  bool on_adaptation(const heterogeneous_map &data, abstract_ansatz &ansatz,
                     trace &tr, const adapt_protocol &protocol,
                     const generator_pool &pool, const observable &H,
                     const quantum_state &reference) override;
  bool on_iteration(const heterogeneous_map &data, abstract_ansatz &ansatz,
                    trace &tr, const optimization_protocol &protocol,
                    const observable &H,
                    const quantum_state &reference) override;
};

/// @brief Print the ansatz parameters, `ncol` per line.
class parameter_printer : public callback {
private:
  std::ostream &os;
  bool adapt;
  bool optimize;
  std::size_t ncol;

  void print_parameters(const abstract_ansatz &ansatz) const;

public:
  /// @param adapt Print at each adaptation
  /// @param optimize Print at each optimizer iteration
  parameter_printer(std::ostream &os = std::cout, bool adapt = true,
                    bool optimize = false, std::size_t ncol = 8);

  bool on_adaptation(const heterogeneous_map &data, abstract_ansatz &ansatz,
                     trace &tr, const adapt_protocol &protocol,
                     const generator_pool &pool, const observable &H,
                     const quantum_state &reference) override;
  bool on_iteration(const heterogeneous_map &data, abstract_ansatz &ansatz,
                    trace &tr, const optimization_protocol &protocol,
                    const observable &H,
                    const quantum_state &reference) override;
};

/// @brief Flag convergence once the ansatz holds at least `n` parameters.
class parameter_stopper : public callback {
private:
  std::size_t n;

public:
  explicit parameter_stopper(std::size_t n) : n(n) {}

  bool on_adaptation(const heterogeneous_map &data, abstract_ansatz &ansatz,
                     trace &tr, const adapt_protocol &protocol,
                     const generator_pool &pool, const observable &H,
                     const quantum_state &reference) override;
};

/// @brief Flag convergence once the largest score magnitude drops below
/// `threshold`.
class score_stopper : public callback {
private:
  double threshold;

public:
  explicit score_stopper(double threshold) : threshold(threshold) {}

  bool on_adaptation(const heterogeneous_map &data, abstract_ansatz &ansatz,
                     trace &tr, const adapt_protocol &protocol,
                     const generator_pool &pool, const observable &H,
                     const quantum_state &reference) override;
};

/// @brief Flag convergence once the energies at the last `n` adaptations
/// span less than `threshold`. Needs a preceding tracer of "energy".
class slow_stopper : public callback {
private:
  double threshold;
  std::size_t n;

public:
  /// @throw std::invalid_argument for `n == 0`
  slow_stopper(double threshold, std::size_t n) : threshold(threshold), n(n) {
    if (n == 0)
      throw std::invalid_argument("slow_stopper - n must be positive.");
  }

  bool on_adaptation(const heterogeneous_map &data, abstract_ansatz &ansatz,
                     trace &tr, const adapt_protocol &protocol,
                     const generator_pool &pool, const observable &H,
                     const quantum_state &reference) override;
};

/// @brief Flag convergence once the latest traced energy lies within
/// `threshold` of `floor`. Needs a preceding tracer of "energy".
class floor_stopper : public callback {
private:
  double threshold;
  double floor;

public:
  floor_stopper(double threshold, double floor)
      : threshold(threshold), floor(floor) {}

  bool on_adaptation(const heterogeneous_map &data, abstract_ansatz &ansatz,
                     trace &tr, const adapt_protocol &protocol,
                     const generator_pool &pool, const observable &H,
                     const quantum_state &reference) override;
};

/// @brief Render a data or trace value for display.
std::string format_value(const std::any &value);

} // namespace qadapt::solvers::adapt
