/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/qaoa_ansatz.h"
#include "qadapt/solvers/adapt/errors.h"
#include "qadapt/solvers/adapt/evolution.h"

#include <algorithm>

namespace qadapt::solvers::adapt {

qaoa_ansatz::qaoa_ansatz(std::shared_ptr<const qaoa_observable> cost,
                         parameter gamma0)
    : abstract_ansatz(cost ? cost->num_qubits() : 0),
      costObservable(std::move(cost)), gamma0(gamma0) {
  if (!costObservable)
    throw std::invalid_argument("qaoa_ansatz - no cost observable given.");
}

bool qaoa_ansatz::is_phase_slot(std::size_t i) const {
  return std::binary_search(phaseSlots.begin(), phaseSlots.end(), i);
}

std::vector<parameter> qaoa_ansatz::get_gammas() const {
  std::vector<parameter> gammas;
  gammas.reserve(phaseSlots.size());
  for (auto i : phaseSlots)
    gammas.push_back(elements[i].second);
  return gammas;
}

std::vector<parameter> qaoa_ansatz::get_betas() const {
  std::vector<parameter> betas;
  for (std::size_t i = 0; i < elements.size(); i++)
    if (!is_phase_slot(i))
      betas.push_back(elements[i].second);
  return betas;
}

ansatz_element qaoa_ansatz::get(std::size_t i) const {
  if (i >= size())
    throw std::out_of_range("qaoa_ansatz::get - index out of range.");
  return elements[i];
}

void qaoa_ansatz::set(std::size_t i, const ansatz_element &element) {
  if (i >= size())
    throw std::out_of_range("qaoa_ansatz::set - index out of range.");
  if (is_phase_slot(i)) {
    if (!costObservable->equals(*element.first))
      throw std::invalid_argument("qaoa_ansatz::set - phase separator slots "
                                  "only hold the cost observable.");
    elements[i].second = element.second;
    return;
  }
  check_num_qubits(numQubits, element.first->num_qubits(), "qaoa_ansatz::set");
  elements[i] = element;
}

void qaoa_ansatz::add_generator(generator_ptr g, parameter beta) {
  add_generators({std::move(g)}, {beta});
}

void qaoa_ansatz::add_generators(const std::vector<generator_ptr> &batch,
                                 const std::vector<parameter> &betas) {
  if (batch.size() != betas.size())
    throw std::invalid_argument(
        "qaoa_ansatz::add_generators - expected one parameter per generator.");
  if (batch.empty())
    return;
  for (auto &g : batch)
    check_num_qubits(numQubits, g->num_qubits(),
                     "qaoa_ansatz::add_generators");

  auto gamma = next_gamma();
  phaseSlots.push_back(elements.size());
  elements.emplace_back(costObservable, gamma);
  for (std::size_t k = 0; k < batch.size(); k++)
    elements.emplace_back(batch[k], betas[k]);
  optimized = false;
}

void qaoa_ansatz::resize(std::size_t n) {
  if (n > size() || (n < size() && !is_phase_slot(n)))
    throw std::invalid_argument("qaoa_ansatz::resize - size must fall on a "
                                "layer boundary and cannot grow.");
  elements.resize(n);
  phaseSlots.erase(std::lower_bound(phaseSlots.begin(), phaseSlots.end(), n),
                   phaseSlots.end());
}

std::vector<parameter> qaoa_ansatz::angles() const {
  std::vector<parameter> x;
  x.reserve(size());
  for (auto &[g, theta] : elements)
    x.push_back(theta);
  return x;
}

void qaoa_ansatz::bind(const std::vector<parameter> &x) {
  if (x.size() != size())
    throw std::invalid_argument(
        "qaoa_ansatz::bind - expected " + std::to_string(size()) +
        " parameters, got " + std::to_string(x.size()) + ".");
  for (std::size_t i = 0; i < x.size(); i++)
    elements[i].second = x[i];
}

std::unique_ptr<abstract_ansatz> qaoa_ansatz::clone() const {
  return std::make_unique<qaoa_ansatz>(*this);
}

std::unique_ptr<quantum_state>
qaoa_ansatz::prepare_scoring_state(const quantum_state &reference) const {
  auto state = evolve_state(*this, reference);
  costObservable->evolve(next_gamma(), *state);
  return state;
}

parameter plastic_qaoa_ansatz::next_gamma() const {
  auto gammas = get_gammas();
  return gammas.empty() ? get_gamma0() : gammas.back();
}

std::unique_ptr<abstract_ansatz> plastic_qaoa_ansatz::clone() const {
  return std::make_unique<plastic_qaoa_ansatz>(*this);
}

} // namespace qadapt::solvers::adapt
