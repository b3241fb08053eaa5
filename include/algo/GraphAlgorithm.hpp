#pragma once
#include "graph/Graph.hpp"      // Graph, Connectivity
#include <memory>
#include <string>

// Strategy interface all analyses implement
struct IGraphAlgorithm {
    virtual ~IGraphAlgorithm() = default;
    virtual std::string run(const Graph& g) = 0;
};

// Factory that returns a concrete strategy by name
// Accepts: "ZAGREB", "CONNECTIVITY", "HAMILTON", "TRACE",
//          "INDEPENDENCE", "BOUND", "ANALYZE" (case-insensitive)
// `mode` selects the k-connectivity strategy used by the analysis.
struct AlgorithmFactory {
    static std::unique_ptr<IGraphAlgorithm> create(const std::string& name,
                                                   Connectivity mode = Connectivity::Approximate);
};
