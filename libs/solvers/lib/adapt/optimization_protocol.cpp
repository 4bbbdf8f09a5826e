/*******************************************************************************
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#include "qadapt/solvers/adapt/optimization_protocol.h"

QADAPT_INSTANTIATE_REGISTRY(qadapt::solvers::adapt::optimization_protocol,
                            const qadapt::heterogeneous_map &)
