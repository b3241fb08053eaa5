#pragma once                              // ensure this header is included only once per translation unit

#include <cstddef>       // std::size_t
#include <stdexcept>     // std::out_of_range, std::invalid_argument
#include <string>        // std::string, std::to_string

// ==========================
// Graph errors
// ==========================
// The only two failures the Graph API reports. Both are thrown before
// anything is mutated, so the caller can recover and keep using the graph.
// ==========================

// A vertex id that is not in [0, n).
class InvalidVertex : public std::out_of_range {
public:
    InvalidVertex(std::size_t v, std::size_t n)
        : std::out_of_range("vertex index " + std::to_string(v) +
                            " out of range (graph has " + std::to_string(n) + " vertices)"),
          m_vertex(v) {}

    std::size_t vertex() const noexcept { return m_vertex; }

private:
    std::size_t m_vertex;
};

// An edge u--u was requested; the graph is simple.
class SelfLoop : public std::invalid_argument {
public:
    explicit SelfLoop(std::size_t v)
        : std::invalid_argument("self-loop on vertex " + std::to_string(v) +
                                " is not allowed in a simple graph"),
          m_vertex(v) {}

    std::size_t vertex() const noexcept { return m_vertex; }

private:
    std::size_t m_vertex;
};
