// ===============================================
// Theorems.cpp
// Zagreb-index based evaluators for Graph:
//   * independentSetApprox / independenceNumberApprox (greedy)
//   * isLikelyHamiltonian  (shape shortcuts + Dirac + Z1 threshold, k = 2)
//   * isLikelyTraceable    (shape shortcuts + Dirac-like + Z1 threshold, k = 1)
//   * zagrebUpperBound     (n, beta, delta, Delta, e)
// ===============================================

#include "graph/Graph.hpp"            // Graph declaration
#include <cmath>                      // std::sqrt
#include <vector>                     // std::vector

// ---------- helper: floor((sqrt(a) - sqrt(b))^2 * e) ----------
static std::size_t sqrt_gap_term(std::size_t a, std::size_t b, std::size_t e) {
    const double gap = std::sqrt(static_cast<double>(a)) - std::sqrt(static_cast<double>(b));
    return static_cast<std::size_t>(gap * gap * static_cast<double>(e));
}

// -----------------------------
// independentSetApprox
// -----------------------------
// Greedy minimum-degree selection: take the remaining vertex with the
// fewest remaining neighbors (lowest id on ties), then drop it and its
// neighbors from the pool. Returns vertices in selection order.
std::vector<Graph::Vertex> Graph::independentSetApprox() const {
    const std::size_t n = vertexCount();
    std::vector<char> remaining(n, 1);                            // 1 = still in the pool
    std::size_t left = n;
    std::vector<Vertex> chosen;

    while (left > 0) {
        Vertex best = n;
        std::size_t bestDeg = 0;
        for (Vertex v = 0; v < n; ++v) {
            if (!remaining[v]) continue;
            std::size_t d = 0;                                    // degree inside the pool
            for (Vertex w : m_adj[v]) {
                if (remaining[w]) ++d;
            }
            if (best == n || d < bestDeg) {                       // strict: first minimizer wins
                best = v;
                bestDeg = d;
            }
        }

        chosen.push_back(best);
        remaining[best] = 0;
        --left;
        for (Vertex w : m_adj[best]) {
            if (remaining[w]) {
                remaining[w] = 0;
                --left;
            }
        }
    }

    return chosen;
}

std::size_t Graph::independenceNumberApprox() const {
    return independentSetApprox().size();
}

// -----------------------------
// Thresholds
// -----------------------------
// Hamiltonian: (n-k-1) D^2 + e^2/(k+1) + floor((sqrt(n-k-1) - sqrt(d))^2 e)
// Traceable:   (n-k-2) D^2 + e^2/(k+2) + floor((sqrt(n-k-2) - sqrt(d))^2 e)
// Integer division on the middle term.
std::size_t Graph::hamiltonianThreshold(std::size_t k) const {
    const std::size_t n = vertexCount();
    if (n < k + 1) return 0;

    const std::size_t m = n - k - 1;
    const std::size_t D = maxDegree();
    const std::size_t e = edgeCount();
    return m * D * D + (e * e) / (k + 1) + sqrt_gap_term(m, minDegree(), e);
}

std::size_t Graph::traceableThreshold(std::size_t k) const {
    const std::size_t n = vertexCount();
    if (n < k + 2) return 0;

    const std::size_t m = n - k - 2;
    const std::size_t D = maxDegree();
    const std::size_t e = edgeCount();
    return m * D * D + (e * e) / (k + 2) + sqrt_gap_term(m, minDegree(), e);
}

// -----------------------------
// isLikelyHamiltonian
// -----------------------------
bool Graph::isLikelyHamiltonian(Connectivity mode) const {
    const std::size_t n = vertexCount();
    if (n < 3) return false;                                      // no cycle through fewer than 3 vertices

    if (isComplete()) return true;
    if (isCycle()) return true;
    if (isStar() && n > 3) return false;
    if (isPetersen()) return false;                               // 3-connected but not Hamiltonian

    constexpr std::size_t k = 2;
    if (!isKConnected(k, mode)) return false;

    if (minDegree() >= n / 2) return true;                        // Dirac

    return firstZagrebIndex() >= hamiltonianThreshold(k);
}

// -----------------------------
// isLikelyTraceable
// -----------------------------
bool Graph::isLikelyTraceable(Connectivity mode) const {
    const std::size_t n = vertexCount();
    if (n < 2) return false;

    if (isLikelyHamiltonian(mode)) return true;                   // a Hamiltonian cycle contains a Hamiltonian path
    if (isComplete() || isPath() || isStar() || isPetersen()) return true;

    constexpr std::size_t k = 1;
    if (!isKConnected(k, mode)) return false;

    const bool diracLike = minDegree() >= (n - 1) / 2;
    if (diracLike) return true;

    // The Z1 criterion is stated for n >= 9 only
    if (n < 9) return diracLike;

    return firstZagrebIndex() >= traceableThreshold(k);
}

// -----------------------------
// zagrebUpperBound
// -----------------------------
// (n - beta) D^2 + e^2 / beta + (sqrt(n - beta) - sqrt(d))^2 e,
// beta = greedy independence number.
double Graph::zagrebUpperBound() const {
    const std::size_t n = vertexCount();
    if (n == 0) return 0.0;

    const std::size_t beta = independenceNumberApprox();          // >= 1 whenever n >= 1
    const double D = static_cast<double>(maxDegree());
    const double e = static_cast<double>(edgeCount());
    const double rest = static_cast<double>(n - beta);

    const double gap = std::sqrt(rest) - std::sqrt(static_cast<double>(minDegree()));
    return rest * D * D + (e * e) / static_cast<double>(beta) + gap * gap * e;
}
