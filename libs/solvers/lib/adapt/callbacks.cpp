/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/callbacks.h"

#include <algorithm>
#include <cmath>

#include <fmt/ranges.h>

namespace qadapt::solvers::adapt {

bool run_adaptation_callbacks(const callback_list &callbacks,
                              const heterogeneous_map &data,
                              abstract_ansatz &ansatz, trace &tr,
                              const adapt_protocol &protocol,
                              const generator_pool &pool, const observable &H,
                              const quantum_state &reference) {
  for (auto &cb : callbacks)
    if (cb->on_adaptation(data, ansatz, tr, protocol, pool, H, reference))
      return true;
  return false;
}

bool run_iteration_callbacks(const callback_list &callbacks,
                             const heterogeneous_map &data,
                             abstract_ansatz &ansatz, trace &tr,
                             const optimization_protocol &protocol,
                             const observable &H,
                             const quantum_state &reference) {
  for (auto &cb : callbacks)
    if (cb->on_iteration(data, ansatz, tr, protocol, H, reference))
      return true;
  return false;
}

std::string format_value(const std::any &value) {
  if (auto *v = std::any_cast<double>(&value))
    return fmt::format("{}", *v);
  if (auto *v = std::any_cast<float>(&value))
    return fmt::format("{}", *v);
  if (auto *v = std::any_cast<int>(&value))
    return fmt::format("{}", *v);
  if (auto *v = std::any_cast<std::size_t>(&value))
    return fmt::format("{}", *v);
  if (auto *v = std::any_cast<bool>(&value))
    return *v ? "true" : "false";
  if (auto *v = std::any_cast<std::string>(&value))
    return *v;
  if (auto *v = std::any_cast<const char *>(&value))
    return *v;
  if (auto *v = std::any_cast<std::vector<double>>(&value))
    return fmt::format("{}", *v);
  if (auto *v = std::any_cast<std::vector<std::size_t>>(&value))
    return fmt::format("{}", *v);
  if (auto *v = std::any_cast<std::vector<int>>(&value))
    return fmt::format("{}", *v);
  if (auto *v = std::any_cast<generator_ptr>(&value))
    return (*v)->to_string();
  if (auto *v = std::any_cast<std::vector<generator_ptr>>(&value)) {
    std::vector<std::string> strs;
    for (auto &g : *v)
      strs.push_back(g->to_string());
    return fmt::format("[{}]", fmt::join(strs, ", "));
  }
  return fmt::format("<{}>", value.type().name());
}

// tracer

bool tracer::on_adaptation(const heterogeneous_map &data, abstract_ansatz &,
                           trace &tr, const adapt_protocol &,
                           const generator_pool &, const observable &,
                           const quantum_state &) {
  tr.push("adaptation", tr.size("iteration"));
  for (auto &key : keys)
    if (data.contains(key))
      tr.push(key, data.at(key));
  return false;
}

bool tracer::on_iteration(const heterogeneous_map &data, abstract_ansatz &,
                          trace &tr, const optimization_protocol &,
                          const observable &, const quantum_state &) {
  std::size_t iteration =
      tr.size("iteration") ? tr.last<std::size_t>("iteration") + 1 : 1;
  tr.push("iteration", iteration);
  for (auto &key : keys)
    if (data.contains(key))
      tr.push(key, data.at(key));
  return false;
}

// parameter_tracer

bool parameter_tracer::on_iteration(const heterogeneous_map &,
                                    abstract_ansatz &ansatz, trace &tr,
                                    const optimization_protocol &,
                                    const observable &, const quantum_state &) {
  tr.push_parameters(ansatz.angles());
  return false;
}

// printer

void printer::print_keys(const heterogeneous_map &data) const {
  for (auto &key : keys)
    if (data.contains(key))
      os << key << ": " << format_value(data.at(key)) << "\n";
  os << "\n";
}

bool printer::on_adaptation(const heterogeneous_map &data, abstract_ansatz &,
                            trace &tr, const adapt_protocol &,
                            const generator_pool &, const observable &,
                            const quantum_state &) {
  if (tr.contains("adaptation"))
    os << "--- Adaptation #" << tr.size("adaptation") << " ---\n";
  print_keys(data);
  return false;
}

bool printer::on_iteration(const heterogeneous_map &data, abstract_ansatz &,
                           trace &tr, const optimization_protocol &,
                           const observable &, const quantum_state &) {
  if (tr.contains("iteration"))
    os << ": Iteration #" << tr.size("iteration") << " :\n";
  print_keys(data);
  return false;
}

// parameter_printer

parameter_printer::parameter_printer(std::ostream &os, bool adapt,
                                     bool optimize, std::size_t ncol)
    : os(os), adapt(adapt), optimize(optimize), ncol(ncol) {
  if (ncol == 0)
    throw std::invalid_argument("parameter_printer - ncol must be positive.");
}

void parameter_printer::print_parameters(const abstract_ansatz &ansatz) const {
  os << "*** Parameters ***\n";
  auto x = ansatz.angles();
  for (std::size_t i = 0; i < x.size(); i++) {
    os << x[i] << "\t";
    if ((i + 1) % ncol == 0)
      os << "\n";
  }
  os << "\n";
}

bool parameter_printer::on_adaptation(const heterogeneous_map &,
                                      abstract_ansatz &ansatz, trace &,
                                      const adapt_protocol &,
                                      const generator_pool &,
                                      const observable &,
                                      const quantum_state &) {
  if (adapt)
    print_parameters(ansatz);
  return false;
}

bool parameter_printer::on_iteration(const heterogeneous_map &,
                                     abstract_ansatz &ansatz, trace &,
                                     const optimization_protocol &,
                                     const observable &,
                                     const quantum_state &) {
  if (optimize)
    print_parameters(ansatz);
  return false;
}

// stoppers

bool parameter_stopper::on_adaptation(const heterogeneous_map &,
                                      abstract_ansatz &ansatz, trace &,
                                      const adapt_protocol &,
                                      const generator_pool &,
                                      const observable &,
                                      const quantum_state &) {
  if (ansatz.size() >= n)
    ansatz.set_converged(true);
  return false;
}

bool score_stopper::on_adaptation(const heterogeneous_map &data,
                                  abstract_ansatz &ansatz, trace &,
                                  const adapt_protocol &,
                                  const generator_pool &, const observable &,
                                  const quantum_state &) {
  auto scores = data.get<std::vector<double>>("scores");
  double largest = 0.0;
  for (auto s : scores)
    largest = std::max(largest, std::abs(s));
  if (largest < threshold)
    ansatz.set_converged(true);
  return false;
}

bool slow_stopper::on_adaptation(const heterogeneous_map &,
                                 abstract_ansatz &ansatz, trace &tr,
                                 const adapt_protocol &, const generator_pool &,
                                 const observable &, const quantum_state &) {
  if (tr.size("adaptation") < n || !tr.size("energy"))
    return false;

  // Energy reached at each adaptation, i.e. at the last preceding iteration.
  auto adaptations = tr.get<std::size_t>("adaptation");
  auto energies = tr.get<double>("energy");
  std::vector<double> reached;
  for (auto a : adaptations)
    if (a > 0 && a <= energies.size())
      reached.push_back(energies[a - 1]);
  if (reached.size() < n)
    return false;

  auto [lo, hi] = std::minmax_element(reached.end() - n, reached.end());
  if (*hi - *lo < threshold)
    ansatz.set_converged(true);
  return false;
}

bool floor_stopper::on_adaptation(const heterogeneous_map &,
                                  abstract_ansatz &ansatz, trace &tr,
                                  const adapt_protocol &,
                                  const generator_pool &, const observable &,
                                  const quantum_state &) {
  if (!tr.size("energy"))
    return false;
  if (std::abs(tr.last<double>("energy") - floor) < threshold)
    ansatz.set_converged(true);
  return false;
}

} // namespace qadapt::solvers::adapt
