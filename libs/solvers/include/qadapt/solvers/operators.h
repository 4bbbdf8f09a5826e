/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#pragma once

#include "qadapt/solvers/operators/graph/max_cut.h"
#include "qadapt/solvers/operators/operator_pool.h"
#include "qadapt/solvers/operators/operator_pools/qaoa_operator_pool.h"
#include "qadapt/solvers/operators/pauli_word.h"
