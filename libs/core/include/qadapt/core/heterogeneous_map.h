/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include <algorithm>
#include <any>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "qadapt/core/tuple_utils.h"
#include "qadapt/core/type_traits.h"

namespace qadapt {

/// @brief A string-keyed map of values of any type. Used for algorithm
/// options and for the per-iteration data records handed to callbacks.
class heterogeneous_map {
private:
  std::unordered_map<std::string, std::any> items;

  /// @brief Return the value held by `t` as a `T`, if it holds exactly a `T`.
  template <typename T>
  static std::optional<T> try_cast(const std::any &t) {
    if (const T *ptr = std::any_cast<T>(&t))
      return *ptr;
    return std::nullopt;
  }

  /// @brief Look up `key` as a `T`, falling back to the related types of `T`.
  template <typename T>
  std::optional<T> find_as(const std::string &key) const {
    auto iter = items.find(key);
    if (iter == items.end())
      return std::nullopt;

    if (auto value = try_cast<T>(iter->second))
      return value;

    // The value may have been inserted as a type "related" to T, e.g. an
    // int requested as std::size_t.
    using RelatedTypes =
        typename RelatedTypesMap<std::remove_cvref_t<T>>::types;
    std::optional<T> opt;
    qadapt::tuple_for_each(RelatedTypes(), [&](auto &&el) {
      using Related = std::remove_cvref_t<decltype(el)>;
      if (opt.has_value())
        return;
      if (auto related = try_cast<Related>(iter->second))
        opt = static_cast<T>(*related);
    });
    return opt;
  }

public:
  heterogeneous_map() = default;
  heterogeneous_map(const heterogeneous_map &) = default;
  heterogeneous_map(heterogeneous_map &&) = default;
  heterogeneous_map &operator=(const heterogeneous_map &) = default;
  heterogeneous_map &operator=(heterogeneous_map &&) = default;

  /// @brief Constructor from initializer list
  /// @param list The initializer list of key-value pairs
  heterogeneous_map(
      const std::initializer_list<std::pair<std::string, std::any>> &list) {
    for (auto &l : list) {
      // String literals arrive decayed to const char *
      if (auto *str = std::any_cast<const char *>(&l.second))
        items.insert_or_assign(l.first, std::string(*str));
      else
        items.insert_or_assign(l.first, l.second);
    }
  }

  /// @brief Clear the map
  void clear() { items.clear(); }

  /// @brief Insert a key-value pair into the map, replacing any existing
  /// value for that key.
  /// @tparam T The type of the value
  /// @param key The key
  /// @param value The value
  template <typename T>
  void insert(const std::string &key, const T &value) {
    if constexpr (is_bounded_char_array<T>{}) {
      // Never store raw character arrays, convert to a string
      items.insert_or_assign(key, std::string(value));
    } else {
      items.insert_or_assign(key, value);
    }
  }

  /// @brief Remove a key, if present.
  void erase(const std::string &key) { items.erase(key); }

  /// @brief Get a value from the map
  /// @tparam T The type of the value to retrieve
  /// @param key The key of the value to retrieve
  /// @return The value associated with the key
  /// @throw std::runtime_error if the key is invalid or the type doesn't match
  template <typename T, typename KeyT,
            std::enable_if_t<std::is_convertible_v<KeyT, std::string>, int> = 0>
  T get(const KeyT &key) const {
    const std::string keyStr(key);
    if (!items.contains(keyStr))
      throw std::runtime_error("heterogeneous_map::get() error - Invalid key (" +
                               keyStr + ").");

    if (auto value = find_as<T>(keyStr))
      return *value;

    throw std::runtime_error(
        "heterogeneous_map::get() error - Invalid type for key (" + keyStr +
        ").");
  }

  /// @brief Get a value from the map, searching the provided keys in order
  /// @throw std::runtime_error if none of the keys hold a `T`
  template <typename T>
  T get(const std::vector<std::string> &keys) const {
    for (auto &key : keys)
      if (auto value = find_as<T>(key))
        return *value;

    auto keyStr = std::accumulate(keys.begin(), keys.end(), std::string(),
                                  [](std::string ss, std::string s) {
                                    return ss.empty() ? s : ss + "," + s;
                                  });
    throw std::runtime_error(
        "heterogeneous_map::get(keys) error - Invalid keys (" + keyStr + ").");
  }

  /// @brief Get a value from the first of `keys` that holds a `T`, or
  /// `defaultValue`.
  template <typename T>
  T get(const std::vector<std::string> &keys, const T &defaultValue) const {
    for (auto &key : keys)
      if (auto value = find_as<T>(key))
        return *value;
    return defaultValue;
  }

  /// @brief Get a value from the map with a default value
  /// @param key The key of the value to retrieve
  /// @param defaultValue The default value to return if the key is not found
  /// or holds an unrelated type
  template <typename T>
  T get(const std::string &key, const T &defaultValue) const {
    if (auto value = find_as<T>(key))
      return *value;
    return defaultValue;
  }

  /// @brief Access the type-erased value stored under `key`.
  /// @throw std::out_of_range if the key is not present
  const std::any &at(const std::string &key) const { return items.at(key); }

  /// @brief Get the size of the map
  std::size_t size() const { return items.size(); }

  /// @brief Return all keys, sorted.
  std::vector<std::string> keys() const {
    std::vector<std::string> ret;
    ret.reserve(items.size());
    for (auto &[key, value] : items)
      ret.push_back(key);
    std::sort(ret.begin(), ret.end());
    return ret;
  }

  /// @brief Check if the map contains a key
  bool contains(const std::string &key) const { return items.contains(key); }

  /// @brief Check if the map contains any of the keys
  bool contains(const std::vector<std::string> &keys) const {
    return std::any_of(keys.begin(), keys.end(),
                       [&](const std::string &key) { return contains(key); });
  }
};

} // namespace qadapt
