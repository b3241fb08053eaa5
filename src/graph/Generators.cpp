// ==========================
// Generators.cpp
// ==========================
// Standard graph families. All of them go through Graph::addEdge, so the
// store invariants (symmetry, no loops, edge count) hold by construction.
// ==========================

#include "graph/Generators.hpp"   // declarations
#include <random>                 // std::mt19937, std::uniform_int_distribution
#include <stdexcept>              // std::invalid_argument
#include <string>                 // std::to_string

Graph makeCompleteGraph(std::size_t n) {
    Graph g(n);
    for (std::size_t i = 0; i < n; ++i)
        for (std::size_t j = i + 1; j < n; ++j)
            g.addEdge(i, j);
    return g;
}

Graph makeCycleGraph(std::size_t n) {
    if (n < 3)
        throw std::invalid_argument("a cycle needs at least 3 vertices, got " + std::to_string(n));
    Graph g(n);
    for (std::size_t i = 0; i < n; ++i) g.addEdge(i, (i + 1) % n);
    return g;
}

Graph makePathGraph(std::size_t n) {
    Graph g(n);
    for (std::size_t i = 0; i + 1 < n; ++i) g.addEdge(i, i + 1);
    return g;
}

Graph makeStarGraph(std::size_t n) {
    Graph g(n);
    for (std::size_t i = 1; i < n; ++i) g.addEdge(0, i);
    return g;
}

// Outer pentagon 0..4, spokes i--i+5, inner pentagram on 5..9.
Graph makePetersenGraph() {
    Graph g(10);
    for (std::size_t i = 0; i < 5; ++i) {
        g.addEdge(i, (i + 1) % 5);             // outer cycle
        g.addEdge(i, i + 5);                   // spoke
    }
    g.addEdge(5, 7); g.addEdge(7, 9); g.addEdge(9, 6);
    g.addEdge(6, 8); g.addEdge(8, 5);          // pentagram
    return g;
}

// Left side is 0..left-1, right side is left..left+right-1.
Graph makeCompleteBipartiteGraph(std::size_t left, std::size_t right) {
    Graph g(left + right);
    for (std::size_t i = 0; i < left; ++i)
        for (std::size_t j = 0; j < right; ++j)
            g.addEdge(i, left + j);
    return g;
}

Graph makeDeterministicGraph(std::size_t n, std::size_t densityFactor) {
    if (densityFactor == 0)
        throw std::invalid_argument("density factor must be positive");
    Graph g(n);
    for (std::size_t i = 0; i < n; ++i)
        for (std::size_t j = i + 1; j < n; ++j)
            if ((i + j) % densityFactor == 0) g.addEdge(i, j);
    return g;
}

// ---------- Build a random graph with `edges` unique edges (no self-loops). ----------
Graph makeRandomGraph(std::size_t n, std::size_t edges, std::uint32_t seed) {
    const std::size_t maxEdges = n < 2 ? 0 : n * (n - 1) / 2;
    if (edges > maxEdges)
        throw std::invalid_argument("too many edges for a simple graph: " + std::to_string(edges) +
                                    " > " + std::to_string(maxEdges));

    Graph g(n);
    if (edges == 0) return g;

    std::mt19937 rng(seed);                                            // PRNG
    std::uniform_int_distribution<std::size_t> pick(0, n - 1);         // vertex picker
    while (g.edgeCount() < edges) {                                    // addEdge ignores duplicates
        std::size_t u = pick(rng), v = pick(rng);
        if (u == v) continue;                                          // skip self-loop
        g.addEdge(u, v);
    }
    return g;
}
