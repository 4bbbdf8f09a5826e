/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 NVIDIA Corporation & Affiliates.                         *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include "qadapt/core/graph.h"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace qadapt {

void graph::add_edge(int u, int v, double weight) {
  if (u == v)
    throw std::invalid_argument("graph::add_edge - self loops are not allowed.");

  if (edge_exists(u, v))
    return;

  adjacency_list[u].push_back({v, weight});
  adjacency_list[v].push_back({u, weight});
}

void graph::add_node(int node) { adjacency_list.try_emplace(node); }

bool graph::edge_exists(int i, int j) const {
  auto it_i = adjacency_list.find(i);
  if (it_i == adjacency_list.end())
    return false;
  return std::any_of(it_i->second.begin(), it_i->second.end(),
                     [j](const auto &pair) { return pair.first == j; });
}

std::vector<std::tuple<int, int, double>> graph::get_edges() const {
  std::vector<std::tuple<int, int, double>> edges;
  for (const auto &[u, neighbors] : adjacency_list)
    for (const auto &[v, weight] : neighbors)
      if (u < v)
        edges.emplace_back(u, v, weight);

  std::sort(edges.begin(), edges.end());
  return edges;
}

int graph::num_edges() const {
  int total = 0;
  for (const auto &pair : adjacency_list)
    total += pair.second.size();
  return total / 2; // Each edge is counted twice
}

graph erdos_renyi(int n, double p, std::uint64_t seed) {
  if (n < 0)
    throw std::invalid_argument("erdos_renyi - negative number of nodes.");
  if (p < 0.0 || p > 1.0)
    throw std::invalid_argument(
        "erdos_renyi - edge probability must lie in [0, 1].");

  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> coin(0.0, 1.0);

  graph g;
  for (int u = 0; u < n; u++)
    g.add_node(u);

  for (int u = 0; u < n; u++)
    for (int v = u + 1; v < n; v++)
      if (coin(rng) < p)
        g.add_edge(u, v);

  return g;
}

} // namespace qadapt
