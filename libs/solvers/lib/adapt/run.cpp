/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt.h"

#include "common/Logger.h"

#include <nlohmann/json.hpp>

namespace qadapt::solvers {

namespace adapt {

bool run(abstract_ansatz &ansatz, trace &tr, adapt_protocol &adapt,
         optimization_protocol &optimization, const generator_pool &pool,
         const observable &H, const quantum_state &reference,
         const callback_list &callbacks) {
  // A converged ansatz needs no candidates.
  if (pool.empty() && !ansatz.is_converged())
    throw std::runtime_error("Invalid adapt input, operator pool is empty.");
  check_num_qubits(H.num_qubits(), reference.num_qubits(), "adapt::run");
  check_num_qubits(ansatz.num_qubits(), reference.num_qubits(), "adapt::run");

  nlohmann::json initInfo = {{"num-qubits", reference.num_qubits()},
                             {"num-pool-elements", pool.size()},
                             {"num-parameters", ansatz.size()},
                             {"num-callbacks", callbacks.size()},
                             {"adapt-protocol", adapt.name()},
                             {"optimization-protocol", optimization.name()}};
  cudaq::info("[adapt] init info: {}", initInfo.dump(4));

  while (true) {
    if (ansatz.is_converged()) {
      cudaq::info("[adapt] converged with {} parameters", ansatz.size());
      return true;
    }

    if (!ansatz.is_optimized()) {
      optimization.optimize(ansatz, tr, H, reference, callbacks);
      if (!ansatz.is_optimized()) {
        cudaq::info("[adapt] optimization stopped without converging");
        return false;
      }
    }

    if (!adapt.adapt(ansatz, tr, pool, H, reference, callbacks)) {
      cudaq::info("[adapt] no adaptation made, converged = {}",
                  ansatz.is_converged());
      return ansatz.is_converged();
    }
  }
}

} // namespace adapt

namespace {
/// Hermitian generator G for an operator that is either Hermitian or purely
/// anti-Hermitian (all coefficients imaginary), the latter read as exp(θA).
cudaq::spin_op to_hermitian(const cudaq::spin_op &op) {
  bool imaginary = true;
  for (const auto &term : op) {
    auto c = term.evaluate_coefficient();
    if (std::abs(c.real()) > 1e-9 || std::abs(c.imag()) <= 1e-9)
      imaginary = false;
  }
  if (!imaginary)
    return op;
  cudaq::spin_op g = std::complex<double>{0.0, 1.0} * op;
  return g;
}
} // namespace

adapt::result adapt_vqe(const cudaq::spin_op &H,
                        const std::vector<cudaq::spin_op> &poolList,
                        const adapt::quantum_state &reference,
                        const heterogeneous_map &options) {
  using namespace adapt;
  if (poolList.empty())
    throw std::runtime_error("Invalid adapt input, operator pool is empty.");

  auto numQubits = options.get<std::size_t>(
      std::vector<std::string>{"num_qubits", "num-qubits"},
      reference.num_qubits());
  check_num_qubits(numQubits, reference.num_qubits(), "adapt_vqe");

  // Deduplicate while remembering which operator each generator came from.
  generator_pool pool;
  std::vector<cudaq::spin_op> poolOps;
  for (const auto &op : poolList) {
    auto g = make_generator(to_hermitian(op), numQubits);
    if (std::none_of(pool.begin(), pool.end(),
                     [&](const auto &p) { return p->equals(*g); })) {
      pool.push_back(std::move(g));
      poolOps.push_back(op);
    }
  }

  pauli_observable hamiltonian(H, numQubits);

  auto protocolOptions = options;
  if (!protocolOptions.contains(std::vector<std::string>{"tol", "g_tol"}))
    protocolOptions.insert("g_tol", 1e-6);
  auto adaptProtocol = adapt_protocol::get(
      options.get<std::string>("adapt", "vanilla"), protocolOptions);
  auto optimization = optimization_protocol::get("vqe", protocolOptions);

  callback_list callbacks{std::make_shared<tracer>(
      std::vector<std::string>{"energy", "selected_score"})};
  if (options.get("verbose", false))
    callbacks.push_back(std::make_shared<printer>(std::vector<std::string>{
        "energy", "selected_index", "selected_score"}));
  callbacks.push_back(std::make_shared<parameter_stopper>(
      options.get<std::size_t>("max_iter", 30)));
  callbacks.push_back(std::make_shared<score_stopper>(
      options.get<double>("grad_norm_tolerance", 1e-5)));
  callbacks.push_back(std::make_shared<slow_stopper>(
      options.get<double>("threshold_energy", 1e-6), 2));

  ansatz state(numQubits);
  trace tr;
  bool converged = run(state, tr, *adaptProtocol, *optimization, pool,
                       hamiltonian, reference, callbacks);
  if (!converged)
    cudaq::info("[adapt_vqe] stopped before convergence");

  std::vector<cudaq::spin_op> selected;
  for (std::size_t i = 0; i < state.size(); i++) {
    auto g = state.get(i).first;
    for (std::size_t k = 0; k < pool.size(); k++)
      if (pool[k] == g)
        selected.push_back(poolOps[k]);
  }

  return std::make_tuple(evaluate(state, hamiltonian, reference),
                         state.angles(), selected);
}

} // namespace qadapt::solvers
