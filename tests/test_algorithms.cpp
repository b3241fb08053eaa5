// tests/test_algorithms.cpp
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "graph/Graph.hpp"
#include "graph/Generators.hpp"
#include "algo/GraphAlgorithm.hpp"

#include <stdexcept>
#include <string>

// Small helper to create & run an algorithm by name
static std::string run_algo(const char* name, const Graph& g,
                            Connectivity mode = Connectivity::Approximate) {
    auto p = AlgorithmFactory::create(name, mode);
    REQUIRE(p != nullptr);
    return p->run(g);
}

// ---------------- Generators ----------------

TEST_CASE("Generators build the expected families") {
    CHECK(makeCompleteGraph(6).edgeCount() == 15);
    CHECK(makeCycleGraph(7).isCycle());
    CHECK(makePathGraph(7).isPath());
    CHECK(makeStarGraph(7).isStar());
    CHECK(makePetersenGraph().isPetersen());

    Graph kb = makeCompleteBipartiteGraph(2, 3);
    CHECK(kb.vertexCount() == 5);
    CHECK(kb.edgeCount() == 6);
    CHECK_FALSE(kb.hasEdge(0, 1));        // same side
    CHECK_FALSE(kb.hasEdge(2, 4));
    CHECK(kb.hasEdge(1, 4));
}

TEST_CASE("Generators reject impossible parameters") {
    CHECK_THROWS_AS(makeCycleGraph(2), std::invalid_argument);
    CHECK_THROWS_AS(makeDeterministicGraph(5, 0), std::invalid_argument);
    CHECK_THROWS_AS(makeRandomGraph(4, 7, 1), std::invalid_argument);   // K4 has 6 edges
}

TEST_CASE("Deterministic graph keeps edges with (i+j) % f == 0") {
    Graph g = makeDeterministicGraph(6, 3);
    CHECK(g.edgeCount() == 5);            // 0-3, 1-2, 1-5, 2-4, 4-5
    CHECK(g.hasEdge(0, 3));
    CHECK(g.hasEdge(4, 5));
    CHECK_FALSE(g.hasEdge(0, 1));
    CHECK(makeDeterministicGraph(6, 1).isComplete());
}

TEST_CASE("Random graph has exactly E edges and is reproducible") {
    Graph a = makeRandomGraph(20, 40, 42);
    Graph b = makeRandomGraph(20, 40, 42);
    CHECK(a.edgeCount() == 40);
    CHECK(a.adjacency() == b.adjacency());
    CHECK(makeRandomGraph(5, 10, 3).isComplete());
    CHECK(makeRandomGraph(5, 0, 3).edgeCount() == 0);
}

// ---------------- ZAGREB ----------------

TEST_CASE("ZAGREB reports degree statistics") {
    auto out = run_algo("ZAGREB", makeCompleteGraph(6));
    CHECK(out.find("UndirectedGraph(6V,15E)") != std::string::npos);
    CHECK(out.find("first Zagreb index 150") != std::string::npos);
}

// ---------------- CONNECTIVITY ----------------

TEST_CASE("CONNECTIVITY finds the largest k") {
    auto out = run_algo("CONNECTIVITY", makeCycleGraph(5));
    CHECK(out.find("at least 2-connected but not 3-connected") != std::string::npos);

    out = run_algo("CONNECTIVITY", makePetersenGraph(), Connectivity::Exact);
    CHECK(out.find("at least 3-connected") != std::string::npos);
    CHECK(out.find("(exact)") != std::string::npos);

    out = run_algo("CONNECTIVITY", makeCompleteGraph(7));
    CHECK(out.find("at least 5-connected (approximate)") != std::string::npos);
}

TEST_CASE("CONNECTIVITY reports disconnected graphs") {
    Graph g(4);
    g.addEdge(0, 1);
    auto out = run_algo("CONNECTIVITY", g, Connectivity::Exact);
    CHECK(out.find("not connected") != std::string::npos);
}

// ---------------- HAMILTON / TRACE ----------------

TEST_CASE("HAMILTON on K5 and Petersen") {
    auto out = run_algo("HAMILTON", makeCompleteGraph(5));
    CHECK(out.find("Likely Hamiltonian.") == 0);

    out = run_algo("HAMILTON", makePetersenGraph());
    CHECK(out.find("Not likely Hamiltonian.") == 0);
    CHECK(out.find("3 >= 5? no") != std::string::npos);
    CHECK(out.find("threshold 150") != std::string::npos);
}

TEST_CASE("TRACE distinguishes Hamiltonian, traceable and neither") {
    CHECK(run_algo("TRACE", makeCycleGraph(6)).find("likely Hamiltonian") != std::string::npos);
    CHECK(run_algo("TRACE", makeStarGraph(6)).find("not Hamiltonian") != std::string::npos);

    Graph g(4);
    g.addEdge(0, 1); g.addEdge(2, 3);
    CHECK(run_algo("TRACE", g) == "Not likely traceable.");
}

// ---------------- INDEPENDENCE / BOUND / ANALYZE ----------------

TEST_CASE("INDEPENDENCE lists the greedy set") {
    auto out = run_algo("INDEPENDENCE", makePathGraph(5));
    CHECK(out == "Independence number (approx): 3 {0, 2, 4}");
}

TEST_CASE("BOUND prints the bound and efficiency") {
    auto out = run_algo("BOUND", makeCompleteGraph(6));
    CHECK(out.find("350.00") != std::string::npos);
    CHECK(out.find("efficiency 42.86%") != std::string::npos);

    out = run_algo("BOUND", Graph(0));
    CHECK(out.find("efficiency") == std::string::npos);
}

TEST_CASE("ANALYZE prints every summary field") {
    auto out = run_algo("ANALYZE", makePetersenGraph(), Connectivity::Exact);
    CHECK(out.find("vertex_count: 10") != std::string::npos);
    CHECK(out.find("edge_count: 15") != std::string::npos);
    CHECK(out.find("zagreb_index: 90") != std::string::npos);
    CHECK(out.find("min_degree: 3") != std::string::npos);
    CHECK(out.find("max_degree: 3") != std::string::npos);
    CHECK(out.find("is_likely_hamiltonian: false") != std::string::npos);
    CHECK(out.find("is_likely_traceable: true") != std::string::npos);
    CHECK(out.find("independence_number: ") != std::string::npos);
    CHECK(out.find("zagreb_upper_bound: 117.97") != std::string::npos);
}

// ---------------- Factory ----------------

TEST_CASE("Factory recognizes algorithm names (case-insensitive)") {
    CHECK(AlgorithmFactory::create("ZAGREB"));
    CHECK(AlgorithmFactory::create("zagreb"));
    CHECK(AlgorithmFactory::create("Connectivity", Connectivity::Exact));
    CHECK(AlgorithmFactory::create("HAMILTON"));
    CHECK(AlgorithmFactory::create("trace"));
    CHECK(AlgorithmFactory::create("Independence"));
    CHECK(AlgorithmFactory::create("BOUND"));
    CHECK(AlgorithmFactory::create("analyze"));
    CHECK_FALSE(AlgorithmFactory::create("MST"));
    CHECK_FALSE(AlgorithmFactory::create("not_an_algo"));
}
