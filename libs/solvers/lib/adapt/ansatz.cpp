/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/ansatz.h"
#include "qadapt/solvers/adapt/errors.h"
#include "qadapt/solvers/adapt/evolution.h"

#include <algorithm>

namespace qadapt::solvers::adapt {

void abstract_ansatz::add_generators(const std::vector<generator_ptr> &batch,
                                     const std::vector<parameter> &thetas) {
  if (batch.size() != thetas.size())
    throw std::invalid_argument(
        "ansatz::add_generators - expected one parameter per generator.");
  for (std::size_t k = 0; k < batch.size(); k++)
    add_generator(batch[k], thetas[k]);
}

std::vector<parameter> abstract_ansatz::angles() const {
  std::vector<parameter> x(size());
  for (std::size_t i = 0; i < x.size(); i++)
    x[i] = get(i).second;
  return x;
}

void abstract_ansatz::bind(const std::vector<parameter> &x) {
  if (x.size() != size())
    throw std::invalid_argument(
        "ansatz::bind - expected " + std::to_string(size()) +
        " parameters, got " + std::to_string(x.size()) + ".");
  for (std::size_t i = 0; i < x.size(); i++)
    set(i, {get(i).first, x[i]});
}

std::unique_ptr<quantum_state>
abstract_ansatz::prepare_scoring_state(const quantum_state &reference) const {
  return evolve_state(*this, reference);
}

ansatz_element ansatz::get(std::size_t i) const {
  if (i >= size())
    throw std::out_of_range("ansatz::get - index out of range.");
  return {generators[i], parameters[i]};
}

void ansatz::set(std::size_t i, const ansatz_element &element) {
  if (i >= size())
    throw std::out_of_range("ansatz::set - index out of range.");
  check_num_qubits(numQubits, element.first->num_qubits(), "ansatz::set");
  generators[i] = element.first;
  parameters[i] = element.second;
}

void ansatz::add_generator(generator_ptr g, parameter theta) {
  check_num_qubits(numQubits, g->num_qubits(), "ansatz::add_generator");
  generators.push_back(std::move(g));
  parameters.push_back(theta);
  optimized = false;
}

void ansatz::resize(std::size_t n) {
  if (n > size())
    throw std::invalid_argument("ansatz::resize - cannot grow an ansatz.");
  generators.resize(n);
  parameters.resize(n);
}

void ansatz::bind(const std::vector<parameter> &x) {
  if (x.size() != size())
    throw std::invalid_argument(
        "ansatz::bind - expected " + std::to_string(size()) +
        " parameters, got " + std::to_string(x.size()) + ".");
  std::copy(x.begin(), x.end(), parameters.begin());
}

std::unique_ptr<abstract_ansatz> ansatz::clone() const {
  return std::make_unique<ansatz>(*this);
}

} // namespace qadapt::solvers::adapt
