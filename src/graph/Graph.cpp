// ==========================
// Graph.cpp
// ==========================
// This file implements the read-only basics of the Graph class:
// degree statistics, the first Zagreb index, the shape classifiers,
// analyze(), lowConnectivityVertices() and label().
// Connectivity lives in Connectivity.cpp, the theorem-based
// evaluators in Theorems.cpp.
// ==========================

#include "graph/Graph.hpp"   // include the Graph class declaration
#include <algorithm>         // std::min_element, std::max_element, std::count_if
#include <sstream>           // used for building strings in label()

// --------------------------
// Degree statistics
// --------------------------
// Both return 0 on a graph with no vertices.
std::size_t Graph::minDegree() const {
    if (m_adj.empty()) return 0;
    auto it = std::min_element(m_adj.begin(), m_adj.end(),
                               [](const NeighborSet& a, const NeighborSet& b){ return a.size() < b.size(); });
    return it->size();
}

std::size_t Graph::maxDegree() const {
    if (m_adj.empty()) return 0;
    auto it = std::max_element(m_adj.begin(), m_adj.end(),
                               [](const NeighborSet& a, const NeighborSet& b){ return a.size() < b.size(); });
    return it->size();
}

double Graph::averageDegree() const {
    if (m_adj.empty()) return 0.0;
    return 2.0 * static_cast<double>(m_edges) / static_cast<double>(m_adj.size());
}

// --------------------------
// firstZagrebIndex
// --------------------------
// Purpose:
//   M1(G) = sum of deg(v)^2 over all vertices.
//   Every heuristic in Theorems.cpp is phrased in terms of this number.
std::size_t Graph::firstZagrebIndex() const {
    std::size_t sum = 0;
    for (const auto& nb : m_adj) {
        sum += nb.size() * nb.size();
    }
    return sum;
}

// --------------------------
// isComplete
// --------------------------
// Every vertex sees the n-1 others and the edge count agrees.
// A graph with zero or one vertex is trivially complete.
bool Graph::isComplete() const {
    const std::size_t n = vertexCount();
    if (n <= 1) return true;

    const std::size_t expected = n - 1;                 // required degree
    for (const auto& nb : m_adj) {
        if (nb.size() != expected) return false;
    }

    return m_edges == n * (n - 1) / 2;                  // double-check the edge count
}

// --------------------------
// isCycle
// --------------------------
// 2-regular with as many edges as vertices. Connectivity is not checked.
bool Graph::isCycle() const {
    return minDegree() == 2 && maxDegree() == 2 && m_edges == vertexCount();
}

// --------------------------
// isPath
// --------------------------
// n-1 edges, two leaves and n-2 vertices of degree 2.
bool Graph::isPath() const {
    const std::size_t n = vertexCount();
    if (n == 0 || m_edges != n - 1) return false;

    auto ones = std::count_if(m_adj.begin(), m_adj.end(),
                              [](const NeighborSet& nb){ return nb.size() == 1; });
    auto twos = std::count_if(m_adj.begin(), m_adj.end(),
                              [](const NeighborSet& nb){ return nb.size() == 2; });

    return ones == 2 && static_cast<std::size_t>(twos) == n - 2;
}

// --------------------------
// isStar
// --------------------------
// One centre of degree n-1, every other vertex is a leaf.
bool Graph::isStar() const {
    const std::size_t n = vertexCount();
    if (n <= 1) return false;

    auto leaves  = std::count_if(m_adj.begin(), m_adj.end(),
                                 [](const NeighborSet& nb){ return nb.size() == 1; });
    auto centres = std::count_if(m_adj.begin(), m_adj.end(),
                                 [n](const NeighborSet& nb){ return nb.size() == n - 1; });

    return static_cast<std::size_t>(leaves) == n - 1 && centres == 1;
}

// --------------------------
// isPetersen
// --------------------------
// Purpose:
//   Fingerprint of the Petersen graph: 10 vertices, 15 edges, 3-regular,
//   no triangle and no 4-cycle. Any cubic graph of girth >= 5 on ten
//   vertices passes; this is not an isomorphism test.
bool Graph::isPetersen() const {
    if (vertexCount() != 10 || m_edges != 15) return false;
    if (minDegree() != 3 || maxDegree() != 3) return false;

    // Triangles: two neighbors of u that are adjacent to each other
    for (Vertex u = 0; u < vertexCount(); ++u) {
        for (Vertex v : m_adj[u]) {
            for (Vertex w : m_adj[u]) {
                if (v != w && m_adj[v].count(w)) return false;
            }
        }
    }

    // 4-cycles: u - v - w - x - u with all four distinct
    for (Vertex u = 0; u < vertexCount(); ++u) {
        for (Vertex v : m_adj[u]) {
            for (Vertex w : m_adj[v]) {
                if (w == u) continue;
                for (Vertex x : m_adj[w]) {
                    if (x != v && x != u && m_adj[x].count(u)) return false;
                }
            }
        }
    }

    return true;
}

// --------------------------
// analyze
// --------------------------
// Collects the usual summary in one pass over the public queries.
AnalysisResult Graph::analyze(Connectivity mode) const {
    AnalysisResult r;
    r.vertexCount         = vertexCount();
    r.edgeCount           = edgeCount();
    r.zagrebIndex         = firstZagrebIndex();
    r.minDegree           = minDegree();
    r.maxDegree           = maxDegree();
    r.isLikelyHamiltonian = isLikelyHamiltonian(mode);
    r.isLikelyTraceable   = isLikelyTraceable(mode);
    r.independenceNumber  = independenceNumberApprox();
    r.zagrebUpperBound    = zagrebUpperBound();
    return r;
}

// --------------------------
// lowConnectivityVertices
// --------------------------
// Vertices within one of the minimum degree, in ascending id order.
std::vector<Graph::Vertex> Graph::lowConnectivityVertices() const {
    std::vector<Vertex> out;
    const std::size_t limit = minDegree() + 1;
    for (Vertex v = 0; v < vertexCount(); ++v) {
        if (m_adj[v].size() <= limit) out.push_back(v);
    }
    return out;
}

// --------------------------
// label
// --------------------------
// Format:
//   "UndirectedGraph(VV,EE)"
//   where VV = number of vertices, EE = number of edges.
std::string Graph::label() const {
    std::ostringstream oss;                                      // create a string stream
    oss << "UndirectedGraph(" << vertexCount() << "V," << edgeCount() << "E)";
    return oss.str();                                            // return composed string
}
