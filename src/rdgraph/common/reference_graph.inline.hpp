#ifndef RDGRAPH_COMMON_REFERENCE_GRAPH_INLINE_HPP
#define RDGRAPH_COMMON_REFERENCE_GRAPH_INLINE_HPP

#include "rdgraph/common/directed_graph.inline.hpp"
#include "rdgraph/common/reference_graph.hpp"

namespace rdgraph {

namespace detail {

inline void require_non_null_argument(bool is_null, const char* argument)
{
    if (is_null) {
        throw DigraphError(
            DigraphErrorCode::NullArgument,
            std::string(argument) + " must not be null");
    }
}

} // namespace detail

// =============================================================================
// Construction
// =============================================================================

template <typename T, typename R>
ReferenceGraph<T, R>::ReferenceGraph(Resolver resolver)
    : m_resolver(std::move(resolver))
{
    detail::require_non_null_argument(!m_resolver, "resolver");
}

template <typename T, typename R>
ReferenceGraph<T, R>::ReferenceGraph(std::ptrdiff_t initial_capacity, Resolver resolver)
    : m_resolver(std::move(resolver))
    , m_delegate(initial_capacity)
{
    detail::require_non_null_argument(!m_resolver, "resolver");
}

// =============================================================================
// State Queries
// =============================================================================

template <typename T, typename R>
size_t ReferenceGraph<T, R>::size() const noexcept
{
    return m_delegate.size();
}

template <typename T, typename R>
bool ReferenceGraph<T, R>::contains(const T& object) const
{
    return m_delegate.contains(Slot::resolved(object)) ||
           std::find(m_pending_objects.begin(), m_pending_objects.end(), object) !=
               m_pending_objects.end();
}

template <typename T, typename R>
const std::vector<R>& ReferenceGraph<T, R>::pending_references() const noexcept
{
    return m_pending_references;
}

// =============================================================================
// Mutation
// =============================================================================

template <typename T, typename R>
bool ReferenceGraph<T, R>::add_vertex(const T& object)
{
    detail::require_non_null_argument(is_null_value(object), "vertex");
    Slot slot = slot_for_object(object);
    m_pending_objects.push_back(object);
    return m_delegate.add_vertex(slot);
}

template <typename T, typename R>
bool ReferenceGraph<T, R>::add_vertex_ref(const R& reference)
{
    detail::require_non_null_argument(is_null_value(reference), "vertex reference");
    Slot slot = slot_for_reference(reference);
    if (!slot.is_resolved()) {
        remember_reference(reference);
    }
    return m_delegate.add_vertex(slot);
}

template <typename T, typename R>
bool ReferenceGraph<T, R>::add_edge(const T& from, const std::optional<T>& to)
{
    if (!to) {
        return add_vertex(from);
    }

    detail::require_non_null_argument(is_null_value(from), "from");
    detail::require_non_null_argument(is_null_value(*to), "to");
    Slot from_slot = slot_for_object(from);
    Slot to_slot = slot_for_object(*to);

    m_pending_objects.push_back(from);
    m_pending_objects.push_back(*to);
    return m_delegate.add_edge(from_slot, to_slot);
}

template <typename T, typename R>
bool ReferenceGraph<T, R>::add_edge_ref(const T& from, const std::optional<R>& to)
{
    if (!to) {
        return add_vertex(from);
    }

    detail::require_non_null_argument(is_null_value(from), "from");
    detail::require_non_null_argument(is_null_value(*to), "to");
    Slot from_slot = slot_for_object(from);
    Slot to_slot = slot_for_reference(*to);

    m_pending_objects.push_back(from);
    if (!to_slot.is_resolved()) {
        remember_reference(*to);
    }
    return m_delegate.add_edge(from_slot, to_slot);
}

// =============================================================================
// Resolution
// =============================================================================

template <typename T, typename R>
void ReferenceGraph<T, R>::resolve_references()
{
    // Pass 1: check that every pending reference is matched, without touching state
    std::vector<R> derived;
    derived.reserve(m_pending_objects.size());
    std::unordered_set<R> matched;
    for (const T& object : m_pending_objects) {
        derived.push_back(m_resolver(object));
        matched.insert(derived.back());
    }

    std::vector<R> unresolved;
    for (const R& reference : m_pending_references) {
        if (matched.count(reference) == 0) {
            unresolved.push_back(reference);
        }
    }
    if (!unresolved.empty()) {
        throw IncompleteResolutionError<R>(std::move(unresolved));
    }

    // Pass 2: swap each reference-keyed vertex for its object
    for (size_t i = 0; i < m_pending_objects.size(); ++i) {
        Slot target = Slot::resolved(m_pending_objects[i]);
        Slot source = Slot::unresolved(derived[i]);
        if (!m_delegate.contains(target) && m_delegate.contains(source)) {
            m_delegate.relabel_vertex(source, target);
        }
        if (m_delegate.contains(target) && m_bound_references.count(derived[i]) == 0) {
            m_bound_references.emplace(derived[i], m_pending_objects[i]);
        }
    }

    m_pending_objects.clear();
    m_pending_references.clear();
    m_pending_reference_set.clear();
}

// =============================================================================
// Queries
// =============================================================================

template <typename T, typename R>
std::vector<typename ReferenceGraph<T, R>::Edge> ReferenceGraph<T, R>::edges()
{
    resolve_references();
    std::vector<Edge> result;
    for (const auto& [from, to] : m_delegate.edges()) {
        result.emplace_back(object_of(from), object_of(to));
    }
    return result;
}

template <typename T, typename R>
size_t ReferenceGraph<T, R>::in_degree(const T& object)
{
    resolve_references();
    return m_delegate.in_degree(Slot::resolved(object));
}

template <typename T, typename R>
size_t ReferenceGraph<T, R>::out_degree(const T& object)
{
    resolve_references();
    return m_delegate.out_degree(Slot::resolved(object));
}

template <typename T, typename R>
std::optional<std::vector<T>> ReferenceGraph<T, R>::cycle()
{
    resolve_references();
    auto slots = m_delegate.cycle();
    if (!slots) {
        return std::nullopt;
    }
    return to_objects(*slots);
}

template <typename T, typename R>
bool ReferenceGraph<T, R>::has_cycle()
{
    resolve_references();
    return m_delegate.has_cycle();
}

template <typename T, typename R>
std::optional<std::vector<R>> ReferenceGraph<T, R>::cycle_refs()
{
    auto objects = cycle();
    if (!objects) {
        return std::nullopt;
    }

    std::vector<R> references;
    references.reserve(objects->size());
    for (const T& object : *objects) {
        references.push_back(m_resolver(object));
    }
    return references;
}

template <typename T, typename R>
std::optional<std::vector<T>> ReferenceGraph<T, R>::topological_order()
{
    resolve_references();
    auto slots = m_delegate.topological_order();
    if (!slots) {
        return std::nullopt;
    }
    return to_objects(*slots);
}

// =============================================================================
// Copies and Rendering
// =============================================================================

template <typename T, typename R>
ReferenceGraph<T, R> ReferenceGraph<T, R>::clone() const
{
    return *this;
}

template <typename T, typename R>
std::string ReferenceGraph<T, R>::to_string() const
{
    return m_delegate.to_string();
}

template <typename T, typename R>
std::ostream& operator<<(std::ostream& os, const ReferenceGraph<T, R>& graph)
{
    return os << graph.to_string();
}

// =============================================================================
// Private Helpers
// =============================================================================

template <typename T, typename R>
typename ReferenceGraph<T, R>::Slot ReferenceGraph<T, R>::slot_for_object(const T& object) const
{
    Slot resolved = Slot::resolved(object);
    if (m_delegate.contains(resolved)) {
        return resolved;
    }

    R reference = m_resolver(object);
    detail::require_non_null_argument(is_null_value(reference), "resolved reference");
    return slot_for_reference(reference);
}

template <typename T, typename R>
typename ReferenceGraph<T, R>::Slot ReferenceGraph<T, R>::slot_for_reference(const R& reference) const
{
    auto it = m_bound_references.find(reference);
    if (it != m_bound_references.end()) {
        return Slot::resolved(it->second);
    }
    return Slot::unresolved(reference);
}

template <typename T, typename R>
void ReferenceGraph<T, R>::remember_reference(const R& reference)
{
    if (m_pending_reference_set.insert(reference).second) {
        m_pending_references.push_back(reference);
    }
}

template <typename T, typename R>
const T& ReferenceGraph<T, R>::object_of(const Slot& slot) const
{
    if (!slot.is_resolved()) {
        throw DigraphError(
            DigraphErrorCode::InvariantViolation,
            "Vertex reference " + display_string(slot.reference()) +
                " is still unresolved after the resolution pass");
    }
    return slot.object();
}

template <typename T, typename R>
std::vector<T> ReferenceGraph<T, R>::to_objects(const std::vector<Slot>& slots) const
{
    std::vector<T> result;
    result.reserve(slots.size());
    for (const Slot& slot : slots) {
        result.push_back(object_of(slot));
    }
    return result;
}

} // namespace rdgraph

#endif // RDGRAPH_COMMON_REFERENCE_GRAPH_INLINE_HPP
