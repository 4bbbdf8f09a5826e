/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#pragma once

#include "qadapt/core/graph.h"
#include "cudaq/spin_op.h"

namespace qadapt::solvers {

/// @brief Generates the cost Hamiltonian for the Maximum Cut problem
///
/// H = Σ_{(i,j)∈E} w_{ij}/2 (Z_iZ_j - I)
///
/// Each qubit is a vertex and the sign of Z_i picks its partition. The
/// ground state energy is minus the maximum cut value. Every term is diagonal,
/// so the result is a valid `qaoa_observable`.
///
/// @param graph The input graph, with vertices labeled 0 .. n-1
/// @return cudaq::spin_op The MaxCut Hamiltonian, empty for an edgeless graph
cudaq::spin_op get_maxcut_hamiltonian(const qadapt::graph &graph);

} // namespace qadapt::solvers
