/**
 * @file directed_graph.hpp
 * @brief Definition of the DirectedGraph class template.
 * @see directed_graph.inline.hpp for implementations of the member templates.
 */
#ifndef RDGRAPH_COMMON_DIRECTED_GRAPH_HPP
#define RDGRAPH_COMMON_DIRECTED_GRAPH_HPP

#include "rdgraph/common/common.hpp"
#include "rdgraph/common/digraph_enums.hpp"
#include "rdgraph/common/digraph_exceptions.hpp"
#include "rdgraph/common/directed_graph.fwd.hpp"
#include "rdgraph/common/traversal_result.hpp"
#include "rdgraph/common/vertex_traits.hpp"

namespace rdgraph {

/**
 * @brief A directed graph over arbitrary value-typed vertices, permitting
 *        self-loops and parallel edges.
 *
 * @details
 * Every distinct vertex (by `KeyEqual`) is assigned a `VertexIdx` on first
 * insertion. Indices are sequential from 0, never reused, and are the only
 * keys used for adjacency storage. Vertex insertion order is preserved, which
 * makes traversal output deterministic.
 *
 * @par Edges
 * - `add_edge(a, b)` always appends a new edge instance, so calling it twice
 *   yields two parallel edges and counts twice toward both degrees.
 * - `add_edge(a, a)` is a self-loop and counts toward both degrees of `a`.
 * - `add_edge(a, std::nullopt)` only adds the vertex `a`.
 *
 * @par Traversal
 * `cycle()` and `topological_order()` are answered by one shared depth-first
 * search (`traverse()`), using an explicit stack. Roots are taken in index
 * order and successors in insertion order. The result is cached until the
 * next mutation. Queries never modify vertices or edges.
 *
 * @par Null vertices
 * Pointer-like vertex types (raw pointers, `std::shared_ptr`) are checked;
 * passing a null vertex throws `DigraphError` with `NullArgument` before any
 * mutation.
 *
 * @par Value semantics
 * Copies are deep and fully independent. `clone()` is provided as a named
 * alias for the copy constructor.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 * - Const queries update the traversal cache, so concurrent const calls also
 *   require external synchronization.
 *
 * @tparam T The vertex type.
 * @tparam Hash Hash function object for T.
 * @tparam KeyEqual Equality function object for T.
 */
template <typename T, typename Hash, typename KeyEqual>
class DirectedGraph {
public:
    using Edge = std::pair<T, T>;

    /**
     * @brief Creates an empty graph.
     */
    DirectedGraph() = default;

    /**
     * @brief Creates an empty graph with room for `initial_capacity` vertices.
     * @param initial_capacity Number of vertices to reserve storage for.
     * @throw DigraphError with `InvalidCapacity` if initial_capacity is negative.
     */
    explicit DirectedGraph(std::ptrdiff_t initial_capacity);

    // =========================================================================
    // Vertex Queries
    // =========================================================================

    /**
     * @brief Returns the number of vertices.
     */
    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] bool contains(const T& vertex) const;

    /**
     * @brief Returns all vertices, indexed by `VertexIdx`.
     */
    [[nodiscard]] const std::vector<T>& vertices() const noexcept;

    /**
     * @brief Returns the index assigned to a vertex.
     * @throw DigraphError with `NotFound` if the vertex was never added.
     */
    [[nodiscard]] VertexIdx index_of(const T& vertex) const;

    /**
     * @brief Returns the heads of all edges leaving `vertex`, in insertion order.
     * @throw DigraphError with `NotFound` if the vertex was never added.
     * @note Parallel edges produce repeated entries.
     */
    [[nodiscard]] std::vector<T> successors(const T& vertex) const;

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Adds a vertex if it is not present yet.
     * @param vertex The vertex to add.
     * @return true if the vertex was added, false if it already existed.
     * @throw DigraphError with `NullArgument` if the vertex is null.
     */
    bool add_vertex(const T& vertex);

    /**
     * @brief Adds the directed edge (from -> to).
     *
     * Both endpoints are added as vertices if absent. If `to` is
     * `std::nullopt` this is equivalent to `add_vertex(from)`.
     *
     * @param from The tail vertex.
     * @param to The head vertex, or `std::nullopt`.
     * @return true if a new edge instance was added. With a head vertex this is
     *         always true since parallel edges are kept. With `std::nullopt` it
     *         is the result of `add_vertex(from)`.
     * @throw DigraphError with `NullArgument` if either endpoint is null.
     */
    bool add_edge(const T& from, const std::optional<T>& to);

    /**
     * @brief Re-keys an existing vertex so that its index is identified by
     *        `replacement`. Edges are left untouched.
     * @param vertex The vertex to rename.
     * @param replacement The new identity for the vertex.
     * @return true if the vertex was renamed. false if `replacement` equals
     *         `vertex` or already names another vertex.
     * @throw DigraphError with `NotFound` if `vertex` was never added, or
     *        `NullArgument` if `replacement` is null.
     */
    bool relabel_vertex(const T& vertex, const T& replacement);

    // =========================================================================
    // Edge Queries
    // =========================================================================

    /**
     * @brief Returns a snapshot of all edges as (from, to), in insertion order.
     */
    [[nodiscard]] std::vector<Edge> edges() const;

    /**
     * @brief Returns the number of edge instances ending at `vertex`.
     * @throw DigraphError with `NotFound` if the vertex was never added.
     */
    [[nodiscard]] size_t in_degree(const T& vertex) const;

    /**
     * @brief Returns the number of edge instances leaving `vertex`.
     * @throw DigraphError with `NotFound` if the vertex was never added.
     */
    [[nodiscard]] size_t out_degree(const T& vertex) const;

    // =========================================================================
    // Traversal
    // =========================================================================

    /**
     * @brief Returns one directed cycle, if the graph has any.
     * @return The vertices of the cycle with the first vertex repeated at the
     *         end, or `std::nullopt` if the graph is acyclic.
     */
    [[nodiscard]] std::optional<std::vector<T>> cycle() const;

    [[nodiscard]] bool has_cycle() const;

    /**
     * @brief Returns all vertices in topological order.
     * @return A permutation of the vertices in which every edge (u, v) has `u`
     *         before `v`, or `std::nullopt` if the graph has a cycle.
     */
    [[nodiscard]] std::optional<std::vector<T>> topological_order() const;

    /**
     * @brief Runs (or reuses) the depth-first search behind `cycle()` and
     *        `topological_order()`.
     * @return Index-based traversal result, valid until the next mutation.
     */
    const TraversalResult& traverse() const;

    // =========================================================================
    // Copies and Rendering
    // =========================================================================

    /**
     * @brief Returns an independent deep copy of this graph.
     */
    [[nodiscard]] DirectedGraph clone() const;

    /**
     * @brief Returns a graph with the same vertices (same indices) and every
     *        edge reversed.
     */
    [[nodiscard]] DirectedGraph reverse() const;

    /**
     * @brief Renders one line per vertex, in index order: `v -> s1, s2`.
     *
     * Vertices whose type has no `operator<<` are rendered as `#index`.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Structural equality: same vertices in the same index order and
     *        the same successor lists.
     */
    bool operator==(const DirectedGraph& other) const;

    bool operator!=(const DirectedGraph& other) const;

private:
    /// Index of `vertex`, inserting it if absent.
    VertexIdx insert_vertex(const T& vertex);

    /// Index of `vertex`; throws NotFound naming `operation` if absent.
    VertexIdx require_index(const T& vertex, const char* operation) const;

    /// Throws NullArgument naming `argument` if `vertex` is null.
    static void require_non_null(const T& vertex, const char* argument);

    std::vector<T> to_vertices(const std::vector<VertexIdx>& indices) const;

    TraversalResult run_traversal() const;

    /// Vertex identities. Indexed by vertex index.
    std::vector<T> m_vertices;

    /// Vertex identity to vertex index.
    std::unordered_map<T, VertexIdx, Hash, KeyEqual> m_index;

    /// Successor indices per vertex, in edge insertion order. Indexed by vertex index.
    std::vector<std::vector<VertexIdx>> m_successors;

    /// Incoming edge instance count per vertex. Indexed by vertex index.
    std::vector<size_t> m_in_degree;

    /// All edges in insertion order.
    std::vector<EdgeIdxPair> m_edges;

    /// Cached traversal; reset by every mutation that changes edges or vertex count.
    mutable std::optional<TraversalResult> m_traversal;
};

template <typename T, typename Hash, typename KeyEqual>
std::ostream& operator<<(std::ostream& os, const DirectedGraph<T, Hash, KeyEqual>& graph);

} // namespace rdgraph

#endif // RDGRAPH_COMMON_DIRECTED_GRAPH_HPP
