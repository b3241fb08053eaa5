// ===============================================
// Connectivity.cpp
// Reachability and vertex connectivity for Graph:
//   * isConnected            BFS from vertex 0
//   * findPath / findPathInSubgraph   BFS with parent pointers
//   * findVertexDisjointPaths greedy Menger estimate on a scratch copy
//   * isKConnected{,Approx,Exact}  the two k-connectivity strategies
// ===============================================

#include "graph/Graph.hpp"            // Graph declaration
#include <algorithm>                  // std::min, std::reverse
#include <queue>                      // std::queue used by BFS
#include <vector>                     // std::vector

// -----------------------------
// isConnected: BFS from vertex 0 must reach every vertex
// -----------------------------
bool Graph::isConnected() const {
    const std::size_t n = vertexCount();
    if (n == 0) return true;                                      // empty graph is connected by convention

    std::vector<char> seen(n, 0);                                 // visited flags
    std::queue<Vertex> q;                                         // BFS frontier
    seen[0] = 1;
    q.push(0);
    std::size_t reached = 1;                                      // vertices discovered so far

    while (!q.empty()) {
        Vertex u = q.front(); q.pop();
        for (Vertex v : m_adj[u]) {
            if (!seen[v]) {
                seen[v] = 1;
                ++reached;
                q.push(v);
            }
        }
    }

    return reached == n;
}

// -----------------------------
// findPathInSubgraph: BFS over `adj`, rebuilding the path from parent pointers
// -----------------------------
std::optional<Graph::Path>
Graph::findPathInSubgraph(const AdjacencyList& adj, Vertex s, Vertex t) {
    const std::size_t n = adj.size();
    if (s >= n) throw InvalidVertex(s, n);
    if (t >= n) throw InvalidVertex(t, n);

    std::vector<Vertex> parent(n, n);                             // n = "not discovered"
    std::queue<Vertex> q;
    parent[s] = s;                                                // source is its own parent
    q.push(s);

    while (!q.empty()) {
        Vertex u = q.front(); q.pop();
        if (u == t) {                                             // reached the target
            Path path;
            for (Vertex v = t; v != s; v = parent[v]) path.push_back(v);
            path.push_back(s);
            std::reverse(path.begin(), path.end());               // s .. t
            return path;
        }
        for (Vertex v : adj[u]) {
            if (v >= n) throw InvalidVertex(v, n);                // neighbor id outside the supplied list
            if (parent[v] == n) {
                parent[v] = u;
                q.push(v);
            }
        }
    }

    return std::nullopt;                                          // BFS exhausted
}

std::optional<Graph::Path> Graph::findPath(Vertex s, Vertex t) const {
    return findPathInSubgraph(m_adj, s, t);
}

bool Graph::isPathBetween(Vertex s, Vertex t) const {
    return findPath(s, t).has_value();
}

// -----------------------------
// isolateVertex: drop every edge incident to v (the vertex itself stays)
// -----------------------------
void Graph::isolateVertex(AdjacencyList& adj, Vertex v) {
    for (Vertex w : adj[v]) {
        adj[w].erase(v);
    }
    adj[v].clear();
}

// -----------------------------
// findVertexDisjointPaths
// -----------------------------
// Repeatedly BFS for an s..t path in a scratch copy of the adjacency and
// strip the internal vertices of each path found, so later searches cannot
// reuse them. There is no augmenting-path backtracking, so the count is a
// lower estimate of the true maximum in general graphs.
// If s and t are adjacent, the edge s--t counts as one path and the
// search runs with that edge removed.
std::size_t Graph::findVertexDisjointPaths(Vertex s, Vertex t) const {
    checkIndex(s);
    checkIndex(t);
    if (s == t) return 0;

    // Shapes with a known answer
    if (isComplete()) return vertexCount() - 1;
    if (isCycle()) return 2;
    if (isPath() && degree(s) == 1 && degree(t) == 1) return 1;

    AdjacencyList work = m_adj;                                   // scratch copy, discarded on return
    const bool adjacent = work[s].count(t) != 0;
    std::size_t bound = std::min(degree(s), degree(t));           // no more paths than the smaller degree

    if (adjacent) {
        work[s].erase(t);                                         // the direct edge is counted separately
        work[t].erase(s);
        bound -= 1;
    }

    std::size_t found = 0;
    std::size_t attempts = 0;
    while (auto path = findPathInSubgraph(work, s, t)) {
        ++found;
        if (found >= bound || attempts >= kMaxPathSearchAttempts) break;
        ++attempts;

        for (std::size_t i = 1; i + 1 < path->size(); ++i) {      // internal vertices only
            isolateVertex(work, (*path)[i]);
        }
    }

    return adjacent ? 1 + found : found;
}

// -----------------------------
// isKConnected: complete graphs answered directly, otherwise the chosen strategy
// -----------------------------
bool Graph::isKConnected(std::size_t k, Connectivity mode) const {
    if (isComplete()) {
        return k < vertexCount();                                 // K_n is (n-1)-connected
    }

    switch (mode) {
        case Connectivity::Exact:       return isKConnectedExact(k);
        case Connectivity::Approximate: return isKConnectedApprox(k);
    }
    return false;
}

// -----------------------------
// isKConnectedApprox
// -----------------------------
// Shape shortcuts, then two empirical rules:
//   (a) at least (n-1)k/2 + 1 edges  -> connected enough
//   (b) Z1 / e >= k * average degree -> connected enough
// Not a certified test; may disagree with isKConnectedExact().
bool Graph::isKConnectedApprox(std::size_t k) const {
    const std::size_t n = vertexCount();
    if (k >= n) return false;                                     // k > n-1
    if (k == 0) return true;                                      // also for edgeless graphs, matching exact mode
    if (minDegree() < k) return false;                            // necessary condition

    if (k == 1) return isConnected();

    if (isComplete()) return true;
    if (isCycle())    return k <= 2;
    if (isPath())     return k <= 1;
    if (isStar())     return k <= 1;

    const std::size_t densityThreshold = (n - 1) * k / 2 + 1;
    if (m_edges >= densityThreshold) return true;

    const double ratio = static_cast<double>(firstZagrebIndex()) / static_cast<double>(m_edges);
    return ratio >= static_cast<double>(k) * averageDegree();
}

// -----------------------------
// isKConnectedExact
// -----------------------------
// Menger: k-connected iff every pair has at least k internally
// vertex-disjoint paths. O(n^2) path searches.
bool Graph::isKConnectedExact(std::size_t k) const {
    const std::size_t n = vertexCount();
    if (k >= n) return false;
    if (k == 0) return true;                                      // every non-empty graph is 0-connected
    if (minDegree() < k) return false;

    if (isComplete()) return true;
    if (k == 1) return isConnected();

    for (Vertex s = 0; s < n; ++s) {
        for (Vertex t = s + 1; t < n; ++t) {
            if (findVertexDisjointPaths(s, t) < k) return false;
        }
    }
    return true;
}
