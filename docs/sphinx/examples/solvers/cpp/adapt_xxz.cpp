/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt.h"

#include <cstdio>

// Build with -DQADAPT_BUILD_EXAMPLES=ON and run
// ./adapt_xxz

int main() {
  // Open XXZ chain, H = sum_i Jxy (X_i X_i+1 + Y_i Y_i+1) + Jz Z_i Z_i+1
  const std::size_t L = 4;
  const double Jxy = 1.0, Jz = 0.5;
  cudaq::spin_op h;
  for (std::size_t i = 0; i + 1 < L; i++)
    h += Jxy * (cudaq::spin::x(i) * cudaq::spin::x(i + 1) +
                cudaq::spin::y(i) * cudaq::spin::y(i + 1)) +
         Jz * cudaq::spin::z(i) * cudaq::spin::z(i + 1);

  // Qubit-excitation pool, (X_i Y_j - Y_i X_j) / 2 for every pair
  std::vector<cudaq::spin_op> opPool;
  for (std::size_t i = 0; i < L; i++)
    for (std::size_t j = i + 1; j < L; j++)
      opPool.push_back(0.5 * (cudaq::spin::x(i) * cudaq::spin::y(j) -
                              cudaq::spin::y(i) * cudaq::spin::x(j)));

  // Start from a Neel state
  qadapt::solvers::adapt::dense_state neel(L, 0b1010);

  auto [energy, thetas, ops] = qadapt::solvers::adapt_vqe(
      h, opPool, neel, {{"grad_norm_tolerance", 1e-4}, {"verbose", true}});

  printf("Final <H> = %.12lf with %zu operators\n", energy, ops.size());
}
