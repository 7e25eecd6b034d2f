/**
 * @file traversal_result.hpp
 */
#pragma once
#include "rdgraph/common/common.hpp"
#include "rdgraph/common/digraph_enums.hpp"

namespace rdgraph
{

/**
 * @brief Outcome of one depth-first traversal over a `DirectedGraph`.
 *
 * @details
 * `TraversalResult` is produced by `DirectedGraph::traverse()`. A single DFS
 * answers both cycle detection and topological sort, which are mutually
 * exclusive outcomes:
 * - If a back edge was found, `cycle` holds the vertex indices of one cycle,
 *   with the first vertex repeated at the end, and `order` is empty.
 * - Otherwise `cycle` is empty and `order` holds every vertex index in
 *   topological order (reverse postorder).
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is conceptually immutable.
 */
struct TraversalResult
{
    /// Vertex indices of the first cycle found, closed (front == back).
    std::vector<VertexIdx> cycle;

    /// Vertex indices in topological order. Empty if a cycle was found.
    std::vector<VertexIdx> order;

    bool has_cycle() const noexcept
    {
        return !cycle.empty();
    }
};

} // namespace rdgraph
