/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace qadapt::solvers::adapt {

/// @brief Raised when an operation has no implementation for the given
/// combination of generator, observable and state representations. Distinct
/// from numerical failures so that validation can report missing support
/// separately from wrong results.
class not_implemented_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

/// @brief Throw `std::invalid_argument` unless the two qubit counts agree.
/// @param what Name of the operation, used in the message
inline void check_num_qubits(std::size_t expected, std::size_t actual,
                             std::string_view what) {
  if (expected != actual)
    throw std::invalid_argument(std::string(what) +
                                " - qubit count mismatch (" +
                                std::to_string(expected) + " vs " +
                                std::to_string(actual) + ").");
}

} // namespace qadapt::solvers::adapt
