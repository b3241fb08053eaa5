// ===============================================
// AlgorithmFactory.cpp
// Implements the graph analyses (Strategy pattern):
//   * Degree statistics and first Zagreb index
//   * Vertex connectivity (largest k up to kMaxProbedK)
//   * Likely-Hamiltonian and likely-traceable verdicts
//   * Greedy independent set
//   * Zagreb upper bound and efficiency ratio
//   * Full analysis summary
// Exposes AlgorithmFactory::create(name, mode) to instantiate a strategy.
// ===============================================

#include "algo/GraphAlgorithm.hpp"    // Include the interface and factory declaration.
#include <cctype>                     // std::tolower for case-insensitive names
#include <iomanip>                    // std::setprecision for the bound
#include <memory>                     // std::make_unique for factory
#include <sstream>                    // std::ostringstream to build responses
#include <string>                     // std::string

static constexpr std::size_t kMaxProbedK = 5;                      // highest k the connectivity report tries

// ---------- helper: to-lower a string (safe cast to unsigned char) ----------
static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static const char* mode_name(Connectivity mode) {
    return mode == Connectivity::Exact ? "exact" : "approximate";
}

static const char* yes_no(bool b) { return b ? "yes" : "no"; }

// Base for strategies whose answer depends on the connectivity mode.
struct ModalAlgorithm : IGraphAlgorithm {
    explicit ModalAlgorithm(Connectivity m) : mode(m) {}
    Connectivity mode;
};

// =====================================================
// 1) Degree statistics and Zagreb index
// =====================================================
struct AlgoZagreb final : IGraphAlgorithm {
    std::string run(const Graph& g) override {
        std::ostringstream oss;
        oss << g.label() << ": min degree " << g.minDegree()
            << ", max degree " << g.maxDegree()
            << ", first Zagreb index " << g.firstZagrebIndex() << ".";
        return oss.str();
    }
};

// =====================================================
// 2) Vertex connectivity: largest k in [1, kMaxProbedK]
// =====================================================
struct AlgoConnectivity final : ModalAlgorithm {
    using ModalAlgorithm::ModalAlgorithm;
    std::string run(const Graph& g) override {
        std::size_t best = 0;                                      // largest k that held
        for (std::size_t k = 1; k <= kMaxProbedK; ++k) {
            if (!g.isKConnected(k, mode)) break;                  // k-connected implies (k-1)-connected
            best = k;
        }

        std::ostringstream oss;
        if (best == 0) {
            oss << "Graph is not connected (" << mode_name(mode) << ").";
        } else {
            oss << "Graph is at least " << best << "-connected";
            if (best < kMaxProbedK) oss << " but not " << best + 1 << "-connected";
            oss << " (" << mode_name(mode) << ").";
        }
        return oss.str();
    }
};

// =====================================================
// 3) Likely Hamiltonian
// =====================================================
struct AlgoHamilton final : ModalAlgorithm {
    using ModalAlgorithm::ModalAlgorithm;
    std::string run(const Graph& g) override {
        const std::size_t n = g.vertexCount();
        std::ostringstream oss;
        oss << (g.isLikelyHamiltonian(mode) ? "Likely Hamiltonian." : "Not likely Hamiltonian.");
        oss << " Dirac (min degree >= n/2): " << g.minDegree() << " >= " << n / 2
            << "? " << yes_no(g.minDegree() >= n / 2) << ".";
        if (n >= 3) {
            oss << " Z1 " << g.firstZagrebIndex() << " vs threshold " << g.hamiltonianThreshold() << ".";
        }
        return oss.str();
    }
};

// =====================================================
// 4) Likely traceable
// =====================================================
struct AlgoTrace final : ModalAlgorithm {
    using ModalAlgorithm::ModalAlgorithm;
    std::string run(const Graph& g) override {
        const bool ham = g.isLikelyHamiltonian(mode);
        const bool tr  = g.isLikelyTraceable(mode);
        if (ham) return "Likely traceable (likely Hamiltonian).";
        if (tr)  return "Likely traceable but not Hamiltonian; leader rotation may need intermediate hops.";
        return "Not likely traceable.";
    }
};

// =====================================================
// 5) Greedy independent set
// =====================================================
struct AlgoIndependence final : IGraphAlgorithm {
    std::string run(const Graph& g) override {
        const auto set = g.independentSetApprox();
        std::ostringstream oss;
        oss << "Independence number (approx): " << set.size() << " {";
        for (std::size_t i = 0; i < set.size(); ++i) {
            oss << set[i];
            if (i + 1 < set.size()) oss << ", ";
        }
        oss << "}";
        return oss.str();
    }
};

// =====================================================
// 6) Zagreb upper bound
// =====================================================
struct AlgoBound final : IGraphAlgorithm {
    std::string run(const Graph& g) override {
        const double bound = g.zagrebUpperBound();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "Zagreb upper bound: " << bound;
        if (bound > 0.0) {
            oss << " (efficiency " << 100.0 * static_cast<double>(g.firstZagrebIndex()) / bound << "%)";
        }
        oss << ".";
        return oss.str();
    }
};

// =====================================================
// 7) Everything at once, one "key: value" per line
// =====================================================
struct AlgoAnalyze final : ModalAlgorithm {
    using ModalAlgorithm::ModalAlgorithm;
    std::string run(const Graph& g) override {
        const AnalysisResult r = g.analyze(mode);
        std::ostringstream oss;
        oss << "vertex_count: " << r.vertexCount << "\n"
            << "edge_count: " << r.edgeCount << "\n"
            << "zagreb_index: " << r.zagrebIndex << "\n"
            << "min_degree: " << r.minDegree << "\n"
            << "max_degree: " << r.maxDegree << "\n"
            << "is_likely_hamiltonian: " << std::boolalpha << r.isLikelyHamiltonian << "\n"
            << "is_likely_traceable: " << r.isLikelyTraceable << "\n"
            << "independence_number: " << r.independenceNumber << "\n"
            << std::fixed << std::setprecision(2)
            << "zagreb_upper_bound: " << r.zagrebUpperBound;
        return oss.str();
    }
};

// =====================================================
// Factory definition (matches header declaration)
// =====================================================
std::unique_ptr<IGraphAlgorithm>
AlgorithmFactory::create(const std::string& name, Connectivity mode) {
    const auto n = to_lower(name);                                  // Normalize the name to lowercase.
    if (n == "zagreb")       return std::make_unique<AlgoZagreb>();
    if (n == "connectivity") return std::make_unique<AlgoConnectivity>(mode);
    if (n == "hamilton")     return std::make_unique<AlgoHamilton>(mode);
    if (n == "trace")        return std::make_unique<AlgoTrace>(mode);
    if (n == "independence") return std::make_unique<AlgoIndependence>();
    if (n == "bound")        return std::make_unique<AlgoBound>();
    if (n == "analyze")      return std::make_unique<AlgoAnalyze>(mode);
    return nullptr;                                                 // Unknown name → caller handles error.
}
