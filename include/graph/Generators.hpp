#pragma once
#include "graph/Graph.hpp"      // Graph
#include <cstddef>               // std::size_t
#include <cstdint>               // std::uint32_t

// Builders for the standard graph families used by the CLI, the
// analysis strategies and the tests. Each returns a fresh Graph.

Graph makeCompleteGraph(std::size_t n);
Graph makeCycleGraph(std::size_t n);                     // throws std::invalid_argument if n < 3
Graph makePathGraph(std::size_t n);
Graph makeStarGraph(std::size_t n);                      // centre is vertex 0
Graph makePetersenGraph();
Graph makeCompleteBipartiteGraph(std::size_t left, std::size_t right);

// Edge i<j iff (i + j) % densityFactor == 0; larger factor = sparser graph
Graph makeDeterministicGraph(std::size_t n, std::size_t densityFactor);

// `edges` distinct uniformly chosen edges, reproducible from `seed`
Graph makeRandomGraph(std::size_t n, std::size_t edges, std::uint32_t seed);
