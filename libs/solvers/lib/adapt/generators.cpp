/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/generators.h"
#include "qadapt/solvers/adapt/dense_state.h"
#include "qadapt/solvers/adapt/errors.h"
#include "qadapt/solvers/adapt/krylov.h"

#include <algorithm>
#include <sstream>

namespace qadapt::solvers::adapt {

namespace {
std::string format_term(double coefficient, const pauli_word &word,
                        std::size_t numQubits) {
  std::stringstream ss;
  ss << std::showpos << coefficient << std::noshowpos << " "
     << word.to_string(numQubits);
  return ss.str();
}

void check_words(std::size_t numQubits, const std::vector<pauli_word> &words,
                 const char *what) {
  if (numQubits > max_pauli_qubits)
    throw std::invalid_argument(std::string(what) +
                                " - at most 64 qubits supported.");
  const std::uint64_t outside =
      numQubits == max_pauli_qubits ? 0 : ~((std::uint64_t(1) << numQubits) - 1);
  for (const auto &w : words) {
    if (w.is_identity())
      throw std::invalid_argument(std::string(what) +
                                  " - identity words are not allowed.");
    if (w.support_mask() & outside)
      throw std::invalid_argument(std::string(what) +
                                  " - word acts outside the register.");
  }
}
} // namespace

// pauli_generator

pauli_generator::pauli_generator(std::size_t num_qubits, double coefficient,
                                 pauli_word word)
    : numQubits(num_qubits), coefficient(coefficient), word(word) {
  check_words(numQubits, {word}, "pauli_generator");
}

void pauli_generator::evolve(parameter theta, quantum_state &state) const {
  check_num_qubits(numQubits, state.num_qubits(), "pauli_generator::evolve");
  state.rotate(word, coefficient * theta);
}

void pauli_generator::apply(const quantum_state &in, quantum_state &out) const {
  check_num_qubits(numQubits, in.num_qubits(), "pauli_generator::apply");
  out.set_zero();
  in.apply_pauli(word, coefficient, out);
}

std::string pauli_generator::to_string() const {
  return format_term(coefficient, word, numQubits);
}

bool pauli_generator::equals(const generator &other) const {
  auto *o = dynamic_cast<const pauli_generator *>(&other);
  return o && o->numQubits == numQubits && o->coefficient == coefficient &&
         o->word == word;
}

// commuting_generator

commuting_generator::commuting_generator(std::size_t num_qubits,
                                         std::vector<double> coefficients,
                                         std::vector<pauli_word> words)
    : numQubits(num_qubits), coefficients(std::move(coefficients)),
      words(std::move(words)) {
  if (this->words.empty())
    throw std::invalid_argument("commuting_generator - no terms given.");
  if (this->words.size() != this->coefficients.size())
    throw std::invalid_argument(
        "commuting_generator - coefficient and word counts differ.");
  check_words(numQubits, this->words, "commuting_generator");
}

bool commuting_generator::is_commuting() const {
  for (std::size_t i = 0; i < words.size(); i++)
    for (std::size_t j = i + 1; j < words.size(); j++)
      if (!commutes(words[i], words[j]))
        return false;
  return true;
}

void commuting_generator::evolve(parameter theta, quantum_state &state) const {
  check_num_qubits(numQubits, state.num_qubits(),
                   "commuting_generator::evolve");
  for (std::size_t k = 0; k < words.size(); k++)
    state.rotate(words[k], coefficients[k] * theta);
}

void commuting_generator::unevolve(parameter theta,
                                   quantum_state &state) const {
  check_num_qubits(numQubits, state.num_qubits(),
                   "commuting_generator::unevolve");
  for (std::size_t k = words.size(); k-- > 0;)
    state.rotate(words[k], -coefficients[k] * theta);
}

void commuting_generator::apply(const quantum_state &in,
                                quantum_state &out) const {
  check_num_qubits(numQubits, in.num_qubits(), "commuting_generator::apply");
  out.set_zero();
  for (std::size_t k = 0; k < words.size(); k++)
    in.apply_pauli(words[k], coefficients[k], out);
}

void commuting_generator::differential_action(parameter theta,
                                              const quantum_state &in,
                                              quantum_state &out,
                                              quantum_state &scratch) const {
  check_num_qubits(numQubits, in.num_qubits(),
                   "commuting_generator::differential_action");
  // scratch = U_k ... U_1 in, which commutes with P_k
  scratch.assign(in);
  out.set_zero();
  for (std::size_t k = 0; k < words.size(); k++) {
    const double angle = coefficients[k] * theta;
    out.rotate(words[k], angle);
    scratch.rotate(words[k], angle);
    scratch.apply_pauli(words[k], amplitude(0.0, -coefficients[k]), out);
  }
}

std::uint64_t commuting_generator::support_mask() const {
  std::uint64_t mask = 0;
  for (const auto &w : words)
    mask |= w.support_mask();
  return mask;
}

std::string commuting_generator::to_string() const {
  std::string ret;
  for (std::size_t k = 0; k < words.size(); k++)
    ret += (k ? " " : "") + format_term(coefficients[k], words[k], numQubits);
  return ret;
}

bool commuting_generator::equals(const generator &other) const {
  auto *o = dynamic_cast<const commuting_generator *>(&other);
  return o && o->numQubits == numQubits && o->coefficients == coefficients &&
         o->words == words;
}

// pauli_sum_generator

pauli_sum_generator::pauli_sum_generator(std::size_t num_qubits,
                                         std::vector<pauli_term> terms)
    : numQubits(num_qubits), terms(std::move(terms)) {
  if (this->terms.empty())
    throw std::invalid_argument("pauli_sum_generator - no terms given.");
  std::vector<pauli_word> words;
  for (const auto &t : this->terms) {
    if (t.coefficient.imag() != 0.0)
      throw std::invalid_argument(
          "pauli_sum_generator - coefficients must be real.");
    words.push_back(t.word);
  }
  check_words(numQubits, words, "pauli_sum_generator");
}

void pauli_sum_generator::evolve(parameter theta, quantum_state &state) const {
  check_num_qubits(numQubits, state.num_qubits(),
                   "pauli_sum_generator::evolve");
  auto *dense = dynamic_cast<dense_state *>(&state);
  if (!dense)
    throw not_implemented_error(
        "pauli_sum_generator::evolve - only implemented for dense_state.");
  krylov_evolve(*this, theta, *dense);
}

void pauli_sum_generator::apply(const quantum_state &in,
                                quantum_state &out) const {
  check_num_qubits(numQubits, in.num_qubits(), "pauli_sum_generator::apply");
  out.set_zero();
  for (const auto &t : terms)
    in.apply_pauli(t.word, t.coefficient, out);
}

std::uint64_t pauli_sum_generator::support_mask() const {
  std::uint64_t mask = 0;
  for (const auto &t : terms)
    mask |= t.word.support_mask();
  return mask;
}

std::string pauli_sum_generator::to_string() const {
  std::string ret;
  for (std::size_t k = 0; k < terms.size(); k++)
    ret += (k ? " " : "") +
           format_term(terms[k].coefficient.real(), terms[k].word, numQubits);
  return ret;
}

bool pauli_sum_generator::equals(const generator &other) const {
  auto *o = dynamic_cast<const pauli_sum_generator *>(&other);
  if (!o || o->numQubits != numQubits || o->terms.size() != terms.size())
    return false;
  for (std::size_t k = 0; k < terms.size(); k++)
    if (o->terms[k].coefficient != terms[k].coefficient ||
        o->terms[k].word != terms[k].word)
      return false;
  return true;
}

// factories

generator_ptr make_generator(const cudaq::spin_op &op, std::size_t num_qubits) {
  std::vector<pauli_term> terms;
  for (auto &t : to_pauli_terms(op, num_qubits)) {
    if (t.word.is_identity())
      continue;
    if (std::abs(t.coefficient.imag()) > 0.0)
      throw std::invalid_argument(
          "make_generator - operator must have real coefficients.");
    // Merge repeated words so that the sum is canonical.
    auto iter = std::find_if(terms.begin(), terms.end(),
                             [&](const auto &e) { return e.word == t.word; });
    if (iter != terms.end())
      iter->coefficient += t.coefficient;
    else
      terms.push_back(t);
  }
  std::erase_if(terms, [](const auto &t) { return t.coefficient == 0.0; });
  if (terms.empty())
    throw std::invalid_argument(
        "make_generator - operator has no non-identity terms.");

  if (terms.size() == 1)
    return std::make_shared<pauli_generator>(
        num_qubits, terms.front().coefficient.real(), terms.front().word);

  bool commuting = true;
  for (std::size_t i = 0; i < terms.size() && commuting; i++)
    for (std::size_t j = i + 1; j < terms.size() && commuting; j++)
      commuting = commutes(terms[i].word, terms[j].word);

  if (!commuting)
    return std::make_shared<pauli_sum_generator>(num_qubits, std::move(terms));

  std::vector<double> coefficients;
  std::vector<pauli_word> words;
  for (const auto &t : terms) {
    coefficients.push_back(t.coefficient.real());
    words.push_back(t.word);
  }
  return std::make_shared<commuting_generator>(
      num_qubits, std::move(coefficients), std::move(words));
}

generator_pool make_pool(const std::vector<cudaq::spin_op> &ops,
                         std::size_t num_qubits) {
  generator_pool pool;
  for (const auto &op : ops) {
    auto g = make_generator(op, num_qubits);
    if (std::none_of(pool.begin(), pool.end(),
                     [&](const auto &p) { return p->equals(*g); }))
      pool.push_back(std::move(g));
  }
  return pool;
}

} // namespace qadapt::solvers::adapt
