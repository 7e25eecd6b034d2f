#ifndef RDGRAPH_COMMON_DIRECTED_GRAPH_INLINE_HPP
#define RDGRAPH_COMMON_DIRECTED_GRAPH_INLINE_HPP

#include "rdgraph/common/directed_graph.hpp"

namespace rdgraph {

// =============================================================================
// Construction
// =============================================================================

template <typename T, typename Hash, typename KeyEqual>
DirectedGraph<T, Hash, KeyEqual>::DirectedGraph(std::ptrdiff_t initial_capacity)
{
    if (initial_capacity < 0) {
        throw DigraphError(
            DigraphErrorCode::InvalidCapacity,
            "Illegal capacity: " + std::to_string(initial_capacity));
    }

    const auto capacity = static_cast<size_t>(initial_capacity);
    m_vertices.reserve(capacity);
    m_index.reserve(capacity);
    m_successors.reserve(capacity);
    m_in_degree.reserve(capacity);
}

// =============================================================================
// Vertex Queries
// =============================================================================

template <typename T, typename Hash, typename KeyEqual>
size_t DirectedGraph<T, Hash, KeyEqual>::size() const noexcept
{
    return m_vertices.size();
}

template <typename T, typename Hash, typename KeyEqual>
bool DirectedGraph<T, Hash, KeyEqual>::empty() const noexcept
{
    return m_vertices.empty();
}

template <typename T, typename Hash, typename KeyEqual>
bool DirectedGraph<T, Hash, KeyEqual>::contains(const T& vertex) const
{
    return m_index.find(vertex) != m_index.end();
}

template <typename T, typename Hash, typename KeyEqual>
const std::vector<T>& DirectedGraph<T, Hash, KeyEqual>::vertices() const noexcept
{
    return m_vertices;
}

template <typename T, typename Hash, typename KeyEqual>
VertexIdx DirectedGraph<T, Hash, KeyEqual>::index_of(const T& vertex) const
{
    return require_index(vertex, "index_of");
}

template <typename T, typename Hash, typename KeyEqual>
std::vector<T> DirectedGraph<T, Hash, KeyEqual>::successors(const T& vertex) const
{
    return to_vertices(m_successors[require_index(vertex, "successors")]);
}

// =============================================================================
// Mutation
// =============================================================================

template <typename T, typename Hash, typename KeyEqual>
bool DirectedGraph<T, Hash, KeyEqual>::add_vertex(const T& vertex)
{
    require_non_null(vertex, "vertex");
    const size_t before = m_vertices.size();
    insert_vertex(vertex);
    return m_vertices.size() != before;
}

template <typename T, typename Hash, typename KeyEqual>
bool DirectedGraph<T, Hash, KeyEqual>::add_edge(const T& from, const std::optional<T>& to)
{
    if (!to) {
        return add_vertex(from);
    }

    // Validate both endpoints before touching any state
    require_non_null(from, "from");
    require_non_null(*to, "to");

    const VertexIdx from_idx = insert_vertex(from);
    const VertexIdx to_idx = insert_vertex(*to);

    m_successors[from_idx].push_back(to_idx);
    ++m_in_degree[to_idx];
    m_edges.emplace_back(from_idx, to_idx);
    m_traversal.reset();
    return true;
}

template <typename T, typename Hash, typename KeyEqual>
bool DirectedGraph<T, Hash, KeyEqual>::relabel_vertex(const T& vertex, const T& replacement)
{
    require_non_null(replacement, "replacement");

    auto it = m_index.find(vertex);
    if (it == m_index.end()) {
        throw DigraphError(
            DigraphErrorCode::NotFound,
            "relabel_vertex: vertex " + display_string(vertex, "<vertex>") + " does not exist");
    }

    if (KeyEqual()(vertex, replacement) || m_index.find(replacement) != m_index.end()) {
        return false;
    }

    // Indices, and therefore edges and the cached traversal, stay valid
    const VertexIdx idx = it->second;
    m_index.erase(it);
    m_index.emplace(replacement, idx);
    m_vertices[idx] = replacement;
    return true;
}

// =============================================================================
// Edge Queries
// =============================================================================

template <typename T, typename Hash, typename KeyEqual>
std::vector<typename DirectedGraph<T, Hash, KeyEqual>::Edge>
DirectedGraph<T, Hash, KeyEqual>::edges() const
{
    std::vector<Edge> result;
    result.reserve(m_edges.size());
    for (const auto& [from, to] : m_edges) {
        result.emplace_back(m_vertices[from], m_vertices[to]);
    }
    return result;
}

template <typename T, typename Hash, typename KeyEqual>
size_t DirectedGraph<T, Hash, KeyEqual>::in_degree(const T& vertex) const
{
    return m_in_degree[require_index(vertex, "in_degree")];
}

template <typename T, typename Hash, typename KeyEqual>
size_t DirectedGraph<T, Hash, KeyEqual>::out_degree(const T& vertex) const
{
    return m_successors[require_index(vertex, "out_degree")].size();
}

// =============================================================================
// Traversal
// =============================================================================

template <typename T, typename Hash, typename KeyEqual>
std::optional<std::vector<T>> DirectedGraph<T, Hash, KeyEqual>::cycle() const
{
    const TraversalResult& result = traverse();
    if (!result.has_cycle()) {
        return std::nullopt;
    }
    return to_vertices(result.cycle);
}

template <typename T, typename Hash, typename KeyEqual>
bool DirectedGraph<T, Hash, KeyEqual>::has_cycle() const
{
    return traverse().has_cycle();
}

template <typename T, typename Hash, typename KeyEqual>
std::optional<std::vector<T>> DirectedGraph<T, Hash, KeyEqual>::topological_order() const
{
    const TraversalResult& result = traverse();
    if (result.has_cycle()) {
        return std::nullopt;
    }
    return to_vertices(result.order);
}

template <typename T, typename Hash, typename KeyEqual>
const TraversalResult& DirectedGraph<T, Hash, KeyEqual>::traverse() const
{
    if (!m_traversal) {
        m_traversal = run_traversal();
    }
    return *m_traversal;
}

template <typename T, typename Hash, typename KeyEqual>
TraversalResult DirectedGraph<T, Hash, KeyEqual>::run_traversal() const
{
    const size_t n = m_vertices.size();
    TraversalResult result;
    std::vector<VisitState> state(n, VisitState::Unvisited);
    std::vector<VertexIdx> postorder;
    postorder.reserve(n);

    // Active DFS path: (vertex, position of the next successor to explore)
    std::vector<std::pair<VertexIdx, size_t>> path;

    for (VertexIdx root = 0; root < n; ++root) {
        if (state[root] != VisitState::Unvisited) {
            continue;
        }

        state[root] = VisitState::OnStack;
        path.emplace_back(root, 0);

        while (!path.empty()) {
            const VertexIdx current = path.back().first;
            size_t& next = path.back().second;
            const std::vector<VertexIdx>& succs = m_successors[current];

            if (next == succs.size()) {
                state[current] = VisitState::Done;
                postorder.push_back(current);
                path.pop_back();
                continue;
            }

            const VertexIdx succ = succs[next++];
            if (state[succ] == VisitState::Unvisited) {
                state[succ] = VisitState::OnStack;
                path.emplace_back(succ, 0);
            } else if (state[succ] == VisitState::OnStack) {
                // Back edge: the cycle is the active path from succ to current
                auto start = std::find_if(path.begin(), path.end(),
                                          [succ](const auto& frame) { return frame.first == succ; });
                for (auto it = start; it != path.end(); ++it) {
                    result.cycle.push_back(it->first);
                }
                result.cycle.push_back(succ);
                return result;
            }
        }
    }

    result.order.assign(postorder.rbegin(), postorder.rend());
    return result;
}

// =============================================================================
// Copies and Rendering
// =============================================================================

template <typename T, typename Hash, typename KeyEqual>
DirectedGraph<T, Hash, KeyEqual> DirectedGraph<T, Hash, KeyEqual>::clone() const
{
    return *this;
}

template <typename T, typename Hash, typename KeyEqual>
DirectedGraph<T, Hash, KeyEqual> DirectedGraph<T, Hash, KeyEqual>::reverse() const
{
    DirectedGraph reversed(static_cast<std::ptrdiff_t>(m_vertices.size()));
    for (const T& vertex : m_vertices) {
        reversed.insert_vertex(vertex);
    }
    for (const auto& [from, to] : m_edges) {
        reversed.m_successors[to].push_back(from);
        ++reversed.m_in_degree[from];
        reversed.m_edges.emplace_back(to, from);
    }
    return reversed;
}

template <typename T, typename Hash, typename KeyEqual>
std::string DirectedGraph<T, Hash, KeyEqual>::to_string() const
{
    auto render = [this](VertexIdx idx) {
        return display_string(m_vertices[idx], "#" + std::to_string(idx));
    };

    std::string result;
    for (VertexIdx idx = 0; idx < m_vertices.size(); ++idx) {
        result += render(idx);
        const auto& succs = m_successors[idx];
        for (size_t i = 0; i < succs.size(); ++i) {
            result += (i == 0) ? " -> " : ", ";
            result += render(succs[i]);
        }
        result += "\n";
    }
    return result;
}

template <typename T, typename Hash, typename KeyEqual>
bool DirectedGraph<T, Hash, KeyEqual>::operator==(const DirectedGraph& other) const
{
    if (m_vertices.size() != other.m_vertices.size() || m_successors != other.m_successors) {
        return false;
    }
    KeyEqual equal;
    for (VertexIdx idx = 0; idx < m_vertices.size(); ++idx) {
        if (!equal(m_vertices[idx], other.m_vertices[idx])) {
            return false;
        }
    }
    return true;
}

template <typename T, typename Hash, typename KeyEqual>
bool DirectedGraph<T, Hash, KeyEqual>::operator!=(const DirectedGraph& other) const
{
    return !(*this == other);
}

template <typename T, typename Hash, typename KeyEqual>
std::ostream& operator<<(std::ostream& os, const DirectedGraph<T, Hash, KeyEqual>& graph)
{
    return os << graph.to_string();
}

// =============================================================================
// Private Helpers
// =============================================================================

template <typename T, typename Hash, typename KeyEqual>
VertexIdx DirectedGraph<T, Hash, KeyEqual>::insert_vertex(const T& vertex)
{
    auto it = m_index.find(vertex);
    if (it != m_index.end()) {
        return it->second;
    }

    const VertexIdx idx = m_vertices.size();
    m_vertices.push_back(vertex);
    m_index.emplace(vertex, idx);
    m_successors.emplace_back();
    m_in_degree.push_back(0);
    m_traversal.reset();
    return idx;
}

template <typename T, typename Hash, typename KeyEqual>
VertexIdx DirectedGraph<T, Hash, KeyEqual>::require_index(const T& vertex, const char* operation) const
{
    auto it = m_index.find(vertex);
    if (it == m_index.end()) {
        throw DigraphError(
            DigraphErrorCode::NotFound,
            std::string(operation) + ": vertex " + display_string(vertex, "<vertex>") +
                " does not exist");
    }
    return it->second;
}

template <typename T, typename Hash, typename KeyEqual>
void DirectedGraph<T, Hash, KeyEqual>::require_non_null(const T& vertex, const char* argument)
{
    if (is_null_value(vertex)) {
        throw DigraphError(
            DigraphErrorCode::NullArgument,
            std::string(argument) + " must not be null");
    }
}

template <typename T, typename Hash, typename KeyEqual>
std::vector<T> DirectedGraph<T, Hash, KeyEqual>::to_vertices(const std::vector<VertexIdx>& indices) const
{
    std::vector<T> result;
    result.reserve(indices.size());
    for (VertexIdx idx : indices) {
        result.push_back(m_vertices[idx]);
    }
    return result;
}

} // namespace rdgraph

#endif // RDGRAPH_COMMON_DIRECTED_GRAPH_INLINE_HPP
