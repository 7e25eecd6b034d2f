/**
 * @file dependency_listing.hpp
 * @brief Reading and analysing plain-text dependency listings.
 */
#pragma once
#include "rdgraph/common/common.hpp"
#include "rdgraph/common/reference_graph.inline.hpp"

namespace rdgraph
{

/// Graph of names, where a name is its own reference.
using NameGraph = ReferenceGraph<std::string, std::string>;

/**
 * @brief Outcome of analysing a dependency listing.
 */
enum class ListingOutcome
{
    /// Acyclic and fully resolved; names hold the build order.
    BuildOrder,
    /// Names hold a cycle, first name repeated at the end.
    Cycle,
    /// Names hold the dependencies that no line declares.
    Unresolved
};

struct ListingReport
{
    ListingOutcome outcome;
    std::vector<std::string> names;
    size_t vertex_count = 0;
};

/**
 * @brief Create an empty NameGraph with the identity resolver.
 */
NameGraph make_name_graph();

/**
 * @brief Read a dependency listing into a graph.
 *
 * @details
 * Each line is `name [dependency ...]`, separated by whitespace. Blank lines
 * and lines whose first token starts with `#` are skipped. A dependency may
 * name a line that appears later; it is added as a reference and resolved on
 * the next query. Edges point from a name to each of its dependencies.
 */
void read_listing(std::istream& in, NameGraph& graph);

/**
 * @brief Classify a graph as a build order, a cycle, or a set of unresolved names.
 *
 * @details
 * The build order lists dependencies before their dependents. A graph that is
 * both cyclic and incomplete is reported as `Unresolved`, since the cycle
 * cannot be searched before every reference is resolved.
 */
ListingReport analyze_listing(NameGraph& graph);

/**
 * @brief Read a listing, print its report, and return the process exit status.
 * @param in The listing.
 * @param out Receives the build order or the cycle.
 * @param err Receives the unresolved names.
 * @return `EXIT_SUCCESS` for an acyclic, fully resolved listing, otherwise `EXIT_FAILURE`.
 */
int run_listing(std::istream& in, std::ostream& out, std::ostream& err);

} // namespace rdgraph
