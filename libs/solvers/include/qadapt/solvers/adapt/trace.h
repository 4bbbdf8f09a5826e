/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <any>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <xtensor/xtensor.hpp>

namespace qadapt::solvers::adapt {

/// @brief The append-only history of one run.
///
/// @details Each key maps to a growing list of values, e.g. "energy" holds
/// one entry per optimizer iteration and "adaptation" the iteration count at
/// which each adaptation happened. Parameter trajectories are kept
/// separately as a matrix with one row per recorded iteration; rows recorded
/// before the ansatz grew are padded with zeros. A trace is owned by the
/// caller and never reset during a run.
class trace {
private:
  std::map<std::string, std::vector<std::any>> entries;
  xt::xtensor<double, 2> parameterMatrix =
      xt::xtensor<double, 2>::from_shape({0, 0});

  const std::vector<std::any> &list(const std::string &key) const {
    auto iter = entries.find(key);
    if (iter == entries.end())
      throw std::runtime_error("trace - invalid key: " + key);
    return iter->second;
  }

  template <typename T>
  static T cast(const std::any &value, const std::string &key) {
    if (auto *ptr = std::any_cast<T>(&value))
      return *ptr;
    throw std::runtime_error("trace - invalid type for key: " + key);
  }

public:
  /// @brief Append a type-erased value.
  void push(const std::string &key, std::any value) {
    entries[key].push_back(std::move(value));
  }

  /// @brief Append `value` to the list under `key`.
  template <typename T>
  void push(const std::string &key, const T &value) {
    entries[key].emplace_back(value);
  }

  /// @brief The list under `key` converted to `T`.
  /// @throw std::runtime_error for a missing key or a mismatched type
  template <typename T>
  std::vector<T> get(const std::string &key) const {
    const auto &values = list(key);
    std::vector<T> ret;
    ret.reserve(values.size());
    for (const auto &v : values)
      ret.push_back(cast<T>(v, key));
    return ret;
  }

  /// @brief The most recent value under `key`.
  /// @throw std::runtime_error for a missing key, an empty list or a
  /// mismatched type
  template <typename T>
  T last(const std::string &key) const {
    const auto &values = list(key);
    if (values.empty())
      throw std::runtime_error("trace - no entries for key: " + key);
    return cast<T>(values.back(), key);
  }

  /// @brief The raw list under `key`.
  const std::vector<std::any> &at(const std::string &key) const {
    return list(key);
  }

  /// @brief Number of entries under `key`, zero if absent.
  std::size_t size(const std::string &key) const {
    auto iter = entries.find(key);
    return iter == entries.end() ? 0 : iter->second.size();
  }

  bool contains(const std::string &key) const { return entries.count(key); }

  /// @brief All keys, sorted.
  std::vector<std::string> keys() const;

  /// @brief Append a row of parameters, padding earlier rows with zero
  /// columns when `x` is longer than any row so far.
  void push_parameters(const std::vector<double> &x);

  /// @brief The parameter matrix, one row per `push_parameters` call.
  const xt::xtensor<double, 2> &parameters() const { return parameterMatrix; }
};

} // namespace qadapt::solvers::adapt
