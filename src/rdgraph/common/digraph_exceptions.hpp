/**
 * @file digraph_exceptions.hpp
 */
#pragma once
#include "rdgraph/common/common.hpp"
#include "rdgraph/common/vertex_traits.hpp"

namespace rdgraph
{

/**
 * @brief What went wrong in a graph operation.
 */
enum class DigraphErrorCode
{
    /// Null vertex, endpoint or reference, or an empty resolver.
    NullArgument,
    /// Degree, index, successor or relabel query on a vertex never added.
    NotFound,
    /// Query on a ReferenceGraph with references no object resolves to.
    IncompleteResolution,
    /// Negative initial capacity (a "capacity error").
    InvalidCapacity,
    /// A slot still unresolved after a successful resolution pass.
    InvariantViolation
};

/**
 * @brief Get the name of an error code.
 * @param code The error code.
 * @return The enumerator name, e.g. "NotFound".
 */
const char* to_string(DigraphErrorCode code) noexcept;

/**
 * @brief The one exception type thrown by rdgraph.
 *
 * @details
 * Constructors throw `InvalidCapacity` or `NullArgument`. `add_*` methods
 * throw `NullArgument` before touching the graph. Per-vertex queries on
 * `DirectedGraph` throw `NotFound`. `ReferenceGraph` queries throw the
 * `IncompleteResolutionError` subclass, which also lists the references.
 * Switch on `code()` rather than parsing `what()`.
 */
class DigraphError : public std::exception
{
public:
    DigraphError(DigraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    DigraphErrorCode code() const noexcept
    {
        return m_code;
    }

    /// Message naming the operation and the offending vertex or argument.
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    DigraphErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when pending references have no matching object.
 *
 * @details
 * Raised by the resolution pass of `ReferenceGraph` when an edge or vertex was
 * declared through a reference whose real object was never added. The error
 * code is always `DigraphErrorCode::IncompleteResolution`.
 *
 * The condition is recoverable: the graph state is left untouched, so the
 * caller may add the missing objects and repeat the query.
 *
 * @tparam R The reference type.
 */
template <typename R>
class IncompleteResolutionError : public DigraphError
{
public:
    explicit IncompleteResolutionError(std::vector<R> unresolved)
        : DigraphError(DigraphErrorCode::IncompleteResolution,
                       "Missing vertex references: " + join_display(unresolved))
        , m_unresolved(std::move(unresolved))
    {
    }

    /**
     * @brief Get the references that could not be resolved.
     * @return The references in the order they were first added.
     */
    const std::vector<R>& unresolved_references() const noexcept
    {
        return m_unresolved;
    }

private:
    std::vector<R> m_unresolved;
};

} // namespace rdgraph
