/**
 * @file directed_graph.fwd.hpp
 * @brief Forward declaration of the DirectedGraph class template.
 */
#pragma once
#include <functional>

namespace rdgraph {

/**
 * @brief Forward declaration of DirectedGraph.
 *
 * @tparam T The vertex type. Must be copyable and equality-comparable.
 * @tparam Hash Hash function object for T, defaults to std::hash<T>.
 * @tparam KeyEqual Equality function object for T, defaults to std::equal_to<T>.
 */
template <typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
class DirectedGraph;

} // namespace rdgraph
