/**
 * @file digraph_enums.hpp
 */
#pragma once
#include "rdgraph/common/common.hpp"

namespace rdgraph
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for vertex indices.
 *
 * @details
 * `VertexIdx` is a type alias for `size_t` used to identify vertices inside a
 * `DirectedGraph`. Indices are assigned sequentially starting from 0 on first
 * insertion of a vertex and are never reused.
 * This alias exists for clarity in API signatures and documentation, not for
 * compile-time type safety.
 */
using VertexIdx = size_t;

/**
 * @brief Directed edge between two vertex indices, as (from, to).
 */
using EdgeIdxPair = std::pair<VertexIdx, VertexIdx>;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Visit state of a vertex during depth-first search.
 *
 * @details
 * - `Unvisited`: not reached yet.
 * - `OnStack`: on the active DFS path. An edge into such a vertex is a back
 *   edge and closes a cycle.
 * - `Done`: all successors explored; the vertex has been appended to the
 *   postorder.
 */
enum class VisitState
{
    Unvisited,
    OnStack,
    Done
};

} // namespace rdgraph
