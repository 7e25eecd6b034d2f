/**
 * @file reference_graph.hpp
 * @brief Definition of the ReferenceGraph class template.
 * @see reference_graph.inline.hpp for implementations of the member templates.
 */
#ifndef RDGRAPH_COMMON_REFERENCE_GRAPH_HPP
#define RDGRAPH_COMMON_REFERENCE_GRAPH_HPP

#include "rdgraph/common/common.hpp"
#include "rdgraph/common/digraph_exceptions.hpp"
#include "rdgraph/common/directed_graph.hpp"
#include "rdgraph/common/reference_slot.hpp"

namespace rdgraph {

/**
 * @brief A directed graph whose edges may name vertices through lightweight
 *        reference values before the vertex objects themselves are added.
 *
 * @details
 * `ReferenceGraph` adds a layer of indirection between the vertex type `T`
 * and a reference type `R` by which edges can be declared. The resolver
 * passed to the constructor maps every object to its reference. All
 * structural work is delegated to a `DirectedGraph<ReferenceSlot<T, R>>`.
 *
 * @par Construction workflow
 * 1. Add objects via `add_vertex()` / `add_edge()`.
 * 2. Declare edges to objects that may not exist yet via `add_edge_ref()`
 *    (or bare references via `add_vertex_ref()`).
 * 3. Add the remaining objects.
 * 4. Query. Every query first runs the resolution pass, which swaps each
 *    reference for the object that resolves to it.
 *
 * @par Resolution
 * Every reference passed to `add_vertex_ref()` or `add_edge_ref()` must be
 * matched by an object `t` with `resolver(t) == r` by the time of the next
 * query. Otherwise the query throws `IncompleteResolutionError<R>` listing
 * the unmatched references, and no state is changed: the caller may add the
 * missing objects and query again. A reference whose object has already been
 * resolved by an earlier pass is satisfied immediately.
 *
 * @par Resolver contract
 * The resolver must be pure and stable, and should map distinct objects to
 * distinct references. Objects sharing a reference are merged into the first
 * one resolved.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Queries mutate (they run the resolution pass); all access requires
 *   external synchronization.
 *
 * @tparam T The vertex object type. Must be hashable with std::hash.
 * @tparam R The reference type. Must be hashable with std::hash.
 */
template <typename T, typename R>
class ReferenceGraph {
public:
    using Resolver = std::function<R(const T&)>;
    using Slot = ReferenceSlot<T, R>;
    using Delegate = DirectedGraph<Slot>;
    using Edge = std::pair<T, T>;

    /**
     * @brief Creates an empty graph.
     * @param resolver Maps an object to its reference.
     * @throw DigraphError with `NullArgument` if resolver is empty.
     */
    explicit ReferenceGraph(Resolver resolver);

    /**
     * @brief Creates an empty graph with room for `initial_capacity` vertices.
     * @param initial_capacity Number of vertices to reserve storage for.
     * @param resolver Maps an object to its reference.
     * @throw DigraphError with `InvalidCapacity` if initial_capacity is negative,
     *        or `NullArgument` if resolver is empty.
     */
    ReferenceGraph(std::ptrdiff_t initial_capacity, Resolver resolver);

    // =========================================================================
    // State Queries (no resolution)
    // =========================================================================

    /**
     * @brief Returns the number of vertices, counting unresolved references.
     */
    [[nodiscard]] size_t size() const noexcept;

    /**
     * @brief Checks whether `object` has been added, resolved or not.
     */
    [[nodiscard]] bool contains(const T& object) const;

    /**
     * @brief Returns references still waiting for their object, in the order
     *        they were first added.
     */
    [[nodiscard]] const std::vector<R>& pending_references() const noexcept;

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Adds an object as a vertex.
     * @return true if the underlying graph changed.
     * @throw DigraphError with `NullArgument` if object is null.
     */
    bool add_vertex(const T& object);

    /**
     * @brief Adds a vertex by reference only. Its object must be added before
     *        the next query.
     * @return true if the underlying graph changed.
     * @throw DigraphError with `NullArgument` if reference is null.
     */
    bool add_vertex_ref(const R& reference);

    /**
     * @brief Adds the directed edge (from -> to) between two objects.
     *
     * If `to` is `std::nullopt` this is equivalent to `add_vertex(from)`.
     *
     * @return true if the underlying graph changed.
     * @throw DigraphError with `NullArgument` if either endpoint is null.
     */
    bool add_edge(const T& from, const std::optional<T>& to);

    /**
     * @brief Adds the directed edge (from -> object referenced by `to`).
     *
     * If `to` is `std::nullopt` this is equivalent to `add_vertex(from)`.
     * The object for `to` may be added later, but before the next query.
     *
     * @return true if the underlying graph changed.
     * @throw DigraphError with `NullArgument` if either endpoint is null.
     */
    bool add_edge_ref(const T& from, const std::optional<R>& to);

    /**
     * @brief Runs the resolution pass explicitly.
     * @throw IncompleteResolutionError<R> if some references have no object.
     *        The graph is left unchanged in that case.
     */
    void resolve_references();

    // =========================================================================
    // Queries (run the resolution pass first)
    // =========================================================================

    /**
     * @brief Returns all edges as (from, to) objects, in insertion order.
     * @throw IncompleteResolutionError<R> if some references have no object.
     */
    std::vector<Edge> edges();

    /**
     * @throw IncompleteResolutionError<R> if some references have no object, or
     *        DigraphError with `NotFound` if the object was never added.
     */
    size_t in_degree(const T& object);

    /**
     * @throw IncompleteResolutionError<R> if some references have no object, or
     *        DigraphError with `NotFound` if the object was never added.
     */
    size_t out_degree(const T& object);

    /**
     * @brief Returns one directed cycle of objects, first object repeated at
     *        the end, or `std::nullopt` if the graph is acyclic.
     * @throw IncompleteResolutionError<R> if some references have no object.
     */
    std::optional<std::vector<T>> cycle();

    bool has_cycle();

    /**
     * @brief Same as `cycle()`, with every object mapped to its reference.
     * @throw IncompleteResolutionError<R> if some references have no object.
     */
    std::optional<std::vector<R>> cycle_refs();

    /**
     * @brief Returns all objects in topological order, or `std::nullopt` if
     *        the graph has a cycle.
     * @throw IncompleteResolutionError<R> if some references have no object.
     */
    std::optional<std::vector<T>> topological_order();

    // =========================================================================
    // Copies and Rendering
    // =========================================================================

    /**
     * @brief Returns an independent deep copy, pending state included.
     */
    [[nodiscard]] ReferenceGraph clone() const;

    /**
     * @brief Renders the underlying graph; unresolved references print as `&ref`.
     */
    [[nodiscard]] std::string to_string() const;

private:
    Slot slot_for_object(const T& object) const;
    Slot slot_for_reference(const R& reference) const;
    void remember_reference(const R& reference);

    /// Object of a resolved slot; throws InvariantViolation otherwise.
    const T& object_of(const Slot& slot) const;

    std::vector<T> to_objects(const std::vector<Slot>& slots) const;

    Resolver m_resolver;

    /// Objects added since the last resolution pass, in insertion order.
    std::vector<T> m_pending_objects;

    /// References awaiting their object, in insertion order, without duplicates.
    std::vector<R> m_pending_references;
    std::unordered_set<R> m_pending_reference_set;

    /// References already swapped for their object.
    std::unordered_map<R, T> m_bound_references;

    Delegate m_delegate;
};

template <typename T, typename R>
std::ostream& operator<<(std::ostream& os, const ReferenceGraph<T, R>& graph);

} // namespace rdgraph

#endif // RDGRAPH_COMMON_REFERENCE_GRAPH_HPP
