/**
 * @file dependency_listing.cpp
 */
#include "rdgraph/common/dependency_listing.hpp"

namespace rdgraph
{

NameGraph make_name_graph()
{
    return NameGraph([](const std::string& name) { return name; });
}

void read_listing(std::istream& in, NameGraph& graph)
{
    std::string line;
    while (std::getline(in, line))
    {
        std::istringstream tokens(line);
        std::string name;
        if (!(tokens >> name) || name[0] == '#')
        {
            continue;
        }

        graph.add_vertex(name);
        std::string dependency;
        while (tokens >> dependency)
        {
            graph.add_edge_ref(name, dependency);
        }
    }
}

ListingReport analyze_listing(NameGraph& graph)
{
    ListingReport report{ListingOutcome::BuildOrder, {}, graph.size()};
    try
    {
        if (auto cycle = graph.cycle_refs())
        {
            report.outcome = ListingOutcome::Cycle;
            report.names = std::move(*cycle);
            return report;
        }
    }
    catch (const IncompleteResolutionError<std::string>& e)
    {
        report.outcome = ListingOutcome::Unresolved;
        report.names = e.unresolved_references();
        return report;
    }

    // Edges point from a name to its dependencies, so build order is reversed
    auto order = graph.topological_order();
    if (!order)
    {
        throw DigraphError(
            DigraphErrorCode::InvariantViolation,
            "Acyclic listing produced no topological order");
    }
    report.vertex_count = graph.size();
    report.names.assign(order->rbegin(), order->rend());
    return report;
}

int run_listing(std::istream& in, std::ostream& out, std::ostream& err)
{
    NameGraph graph = make_name_graph();
    read_listing(in, graph);
    ListingReport report = analyze_listing(graph);

    switch (report.outcome)
    {
    case ListingOutcome::Cycle:
        out << "Cycle: " << join_display(report.names, " -> ") << "\n";
        return EXIT_FAILURE;
    case ListingOutcome::Unresolved:
        err << "Unresolved names: " << join_display(report.names) << "\n";
        return EXIT_FAILURE;
    case ListingOutcome::BuildOrder:
        break;
    }

    out << "Vertices: " << report.vertex_count << "\n";
    out << "Build order:";
    for (const auto& name : report.names)
    {
        out << " " << name;
    }
    out << "\n";
    return EXIT_SUCCESS;
}

} // namespace rdgraph
