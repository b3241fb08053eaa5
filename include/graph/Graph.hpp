#pragma once                              // ensure this header is included only once per translation unit

#include "graph/GraphErrors.hpp"   // InvalidVertex, SelfLoop

#include <set>           // ordered neighbor sets (deterministic iteration)
#include <vector>        // one neighbor set per vertex
#include <cstddef>       // defines std::size_t type
#include <optional>      // std::optional for "no path" results
#include <string>        // used for std::string in label()

// ==========================
// Simple undirected Graph
// ==========================
// This class supports:
// - A fixed vertex count chosen at construction, ids in [0, n)
// - Idempotent edge insertion (no deletion, no resize)
// - Degree statistics and the first Zagreb index
// - Shape classifiers (complete, cycle, path, star, Petersen)
// - Approximate and exact (Menger) k-connectivity
// - Heuristic Hamiltonicity / traceability and the Zagreb upper bound
// Every query is const; only addEdge() mutates.
// ==========================

// Which k-connectivity strategy to run.
enum class Connectivity {
    Approximate,   // density / Zagreb-ratio heuristics, fast but uncertified
    Exact          // vertex-disjoint paths for every pair (Menger's theorem)
};

// Everything a client typically asks for in one call (see Graph::analyze).
struct AnalysisResult {
    std::size_t vertexCount = 0;
    std::size_t edgeCount = 0;
    std::size_t zagrebIndex = 0;
    std::size_t minDegree = 0;
    std::size_t maxDegree = 0;
    bool isLikelyHamiltonian = false;
    bool isLikelyTraceable = false;
    std::size_t independenceNumber = 0;
    double zagrebUpperBound = 0.0;
};

class Graph {
public:
    // Type aliases for readability
    using Vertex        = std::size_t;              // vertex index type
    using NeighborSet   = std::set<Vertex>;         // neighbors of one vertex
    using AdjacencyList = std::vector<NeighborSet>; // neighbors of every vertex
    using Path          = std::vector<Vertex>;      // vertex sequence s .. t

    // Safety cap on BFS rounds inside findVertexDisjointPaths()
    static constexpr std::size_t kMaxPathSearchAttempts = 100;

    // ---- Constructors ----

    // n isolated vertices, no edges
    explicit Graph(std::size_t n = 0)
        : m_adj(n), m_edges(0) {}

    // ---- Adjacency store ----

    // Return the number of vertices
    std::size_t vertexCount() const noexcept { return m_adj.size(); }

    // Return the number of undirected edges
    std::size_t edgeCount() const noexcept { return m_edges; }

    // Add the undirected edge u--v; adding an existing edge does nothing
    void addEdge(Vertex u, Vertex v) {
        checkIndex(u);
        checkIndex(v);

        if (u == v) {
            throw SelfLoop(u);
        }

        if (m_adj[u].count(v)) return;   // already present

        m_adj[u].insert(v);
        m_adj[v].insert(u);

        ++m_edges;
    }

    // Return true if u and v are adjacent
    bool hasEdge(Vertex u, Vertex v) const {
        checkIndex(u);
        checkIndex(v);
        return m_adj[u].count(v) != 0;
    }

    // Access the neighbor set of vertex `v`
    const NeighborSet& neighbors(Vertex v) const {
        checkIndex(v);
        return m_adj[v];
    }

    // Read-only view of the whole adjacency structure
    const AdjacencyList& adjacency() const noexcept { return m_adj; }

    // Number of neighbors of `v`
    std::size_t degree(Vertex v) const {
        checkIndex(v);
        return m_adj[v].size();
    }

    // ---- Basic metrics (Graph.cpp) ----

    std::size_t minDegree() const;
    std::size_t maxDegree() const;
    double averageDegree() const;

    // Sum over all vertices of degree(v)^2
    std::size_t firstZagrebIndex() const;

    // ---- Structural classifiers (Graph.cpp) ----
    // isCycle() and isPath() only look at the degree sequence and edge count,
    // so a disjoint union of cycles (or of paths plus cycles) with the same
    // signature is accepted as well.

    bool isComplete() const;
    bool isCycle() const;
    bool isPath() const;
    bool isStar() const;
    bool isPetersen() const;

    // ---- Connectivity (Connectivity.cpp) ----

    bool isConnected() const;

    // Shortest s..t path by BFS, or std::nullopt when t is unreachable
    std::optional<Path> findPath(Vertex s, Vertex t) const;
    bool isPathBetween(Vertex s, Vertex t) const;

    // Same BFS over an arbitrary adjacency structure (e.g. a scratch copy).
    // Throws InvalidVertex for s, t or any stored neighbor id >= adj.size().
    static std::optional<Path> findPathInSubgraph(const AdjacencyList& adj, Vertex s, Vertex t);

    // Greedy lower estimate of the number of internally vertex-disjoint s..t paths
    std::size_t findVertexDisjointPaths(Vertex s, Vertex t) const;

    bool isKConnected(std::size_t k, Connectivity mode) const;
    bool isKConnected(std::size_t k, bool exact) const {
        return isKConnected(k, exact ? Connectivity::Exact : Connectivity::Approximate);
    }
    bool isKConnectedApprox(std::size_t k) const;
    bool isKConnectedExact(std::size_t k) const;

    // ---- Theorem evaluators (Theorems.cpp) ----

    std::vector<Vertex> independentSetApprox() const;
    std::size_t independenceNumberApprox() const;

    bool isLikelyHamiltonian(Connectivity mode) const;
    bool isLikelyHamiltonian(bool exact) const {
        return isLikelyHamiltonian(exact ? Connectivity::Exact : Connectivity::Approximate);
    }
    bool isLikelyTraceable(Connectivity mode) const;
    bool isLikelyTraceable(bool exact) const {
        return isLikelyTraceable(exact ? Connectivity::Exact : Connectivity::Approximate);
    }

    // Z1 thresholds of the Hamiltonian (k=2) and traceable (k=1) criteria
    std::size_t hamiltonianThreshold(std::size_t k = 2) const;
    std::size_t traceableThreshold(std::size_t k = 1) const;

    double zagrebUpperBound() const;

    // ---- Reporting (Graph.cpp) ----

    AnalysisResult analyze(Connectivity mode = Connectivity::Approximate) const;

    // Vertices whose degree is at most minDegree() + 1
    std::vector<Vertex> lowConnectivityVertices() const;

    // Return a human-readable summary of the graph
    std::string label() const;

private:
    AdjacencyList m_adj;        // neighbor set per vertex
    std::size_t m_edges;        // number of undirected edges

    // Helper: check if vertex index is valid
    void checkIndex(Vertex v) const {
        if (v >= m_adj.size())
            throw InvalidVertex(v, m_adj.size());
    }

    // Helper: detach vertex `v` from every neighbor in a scratch adjacency
    static void isolateVertex(AdjacencyList& adj, Vertex v);
}; // end class Graph
