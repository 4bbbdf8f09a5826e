/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#pragma once

#include <cstdint>
#include <map>
#include <tuple>
#include <utility>
#include <vector>

namespace qadapt {

/// @brief An undirected weighted graph over integer node labels. Nodes are
/// kept ordered so that problem Hamiltonians built from a graph are
/// reproducible.
class graph {
private:
  /// Maps node ID to vector of (neighbor_id, weight) pairs
  std::map<int, std::vector<std::pair<int, double>>> adjacency_list;

  bool edge_exists(int i, int j) const;

public:
  /// @brief Add a weighted edge between two nodes. Adding an existing edge
  /// is a no-op.
  /// @param u First node
  /// @param v Second node
  /// @param weight Edge weight
  void add_edge(int u, int v, double weight = 1.0);

  /// @brief Add an isolated node to the graph
  void add_node(int node);

  /// @brief Get all edges as (u, v, weight) with u < v, sorted
  std::vector<std::tuple<int, int, double>> get_edges() const;

  /// @brief Get the number of edges in the graph
  int num_edges() const;
};

/// @brief Sample a G(n, p) Erdős–Rényi random graph with unit edge weights.
/// @details All `n` nodes are present, labelled 0 to n-1. Each of the
/// n(n-1)/2 pairs (u < v), visited in lexicographic order, is connected with
/// probability `p` using a `std::mt19937_64` stream seeded with `seed`.
graph erdos_renyi(int n, double p, std::uint64_t seed = 0);

} // namespace qadapt
