/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "ansatz.h"
#include "observable.h"

#include <xtensor/xtensor.hpp>

/// Dense linear-algebra views of the ADAPT objects, for brute-force checks on
/// small registers. Every matrix is 2^n x 2^n, so keep n small.
namespace qadapt::solvers::adapt {

using complex_matrix = xt::xtensor<amplitude, 2>;
using complex_vector = xt::xtensor<amplitude, 1>;

/// @brief Largest register the dense conversions accept.
inline constexpr std::size_t max_matrix_qubits = 12;

/// @brief Amplitudes of `state` as a dense vector.
complex_vector state_vector(const quantum_state &state);

/// @brief The Hermitian matrix of `G`, built column by column from
/// `G.apply` on basis states.
/// @throw std::invalid_argument above `max_matrix_qubits`
complex_matrix generator_matrix(const generator &G);

/// @brief The matrix A with `H.evaluate(ψ) == <ψ|A|ψ>` for normalized ψ,
/// built from `H.apply`.
/// @throw not_implemented_error if `H` does not implement `apply`
complex_matrix observable_matrix(const observable &H);

/// @brief exp(-iθG) by diagonalization of the generator matrix.
complex_matrix evolution_matrix(const generator &G, parameter theta);

/// @brief The unitary U_k ... U_1 prepared by the ansatz.
complex_matrix ansatz_unitary(const abstract_ansatz &ansatz);

} // namespace qadapt::solvers::adapt
