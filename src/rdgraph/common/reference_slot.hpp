/**
 * @file reference_slot.hpp
 */
#pragma once
#include "rdgraph/common/common.hpp"
#include "rdgraph/common/vertex_traits.hpp"

namespace rdgraph
{

/**
 * @brief Vertex identity inside a `ReferenceGraph` delegate: either an
 *        unresolved reference `R` or a resolved object `T`.
 *
 * @details
 * A `ReferenceGraph` stores its vertices in a `DirectedGraph<ReferenceSlot<T, R>>`.
 * A vertex starts out keyed by its reference and is re-keyed to its object by
 * the resolution pass. The two alternatives never compare equal, even when
 * `T` and `R` are the same type.
 *
 * @par Value semantics
 * - Copyable and assignable; equality compares the alternative and its value.
 * - `std::hash<ReferenceSlot<T, R>>` specialization provided.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe; concurrent read/write requires external synchronization.
 */
template <typename T, typename R>
class ReferenceSlot
{
public:
    static ReferenceSlot unresolved(R reference)
    {
        return ReferenceSlot(Storage(std::in_place_index<0>, std::move(reference)));
    }

    static ReferenceSlot resolved(T object)
    {
        return ReferenceSlot(Storage(std::in_place_index<1>, std::move(object)));
    }

    bool is_resolved() const noexcept
    {
        return m_value.index() == 1;
    }

    /**
     * @brief Get the reference held by an unresolved slot.
     * @throw std::bad_variant_access if the slot is resolved.
     */
    const R& reference() const
    {
        return std::get<0>(m_value);
    }

    /**
     * @brief Get the object held by a resolved slot.
     * @throw std::bad_variant_access if the slot is unresolved.
     */
    const T& object() const
    {
        return std::get<1>(m_value);
    }

    bool operator==(const ReferenceSlot& other) const
    {
        return m_value == other.m_value;
    }

    bool operator!=(const ReferenceSlot& other) const
    {
        return !(*this == other);
    }

    std::size_t hash() const
    {
        const std::size_t value_hash = is_resolved()
            ? std::hash<T>()(object())
            : std::hash<R>()(reference());
        return value_hash ^ (m_value.index() + 0x9e3779b9u + (value_hash << 6) + (value_hash >> 2));
    }

private:
    using Storage = std::variant<R, T>;

    explicit ReferenceSlot(Storage value)
        : m_value(std::move(value))
    {
    }

    Storage m_value;
};

/**
 * @brief Stream a slot: resolved objects as themselves, references prefixed by `&`.
 */
template <typename T, typename R>
std::ostream& operator<<(std::ostream& os, const ReferenceSlot<T, R>& slot)
{
    if (slot.is_resolved())
    {
        return os << display_string(slot.object());
    }
    return os << "&" << display_string(slot.reference());
}

} // namespace rdgraph

namespace std
{

template <typename T, typename R>
struct hash<rdgraph::ReferenceSlot<T, R>>
{
    std::size_t operator()(const rdgraph::ReferenceSlot<T, R>& slot) const
    {
        return slot.hash();
    }
};

} // namespace std
