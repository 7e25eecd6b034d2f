/**
 * @file dependency_listing_tests.cpp
 * @brief Unit tests for reading and analysing dependency listings
 */
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "rdgraph/common/dependency_listing.hpp"

using namespace rdgraph;

namespace {

ListingReport analyze_text(const std::string& text)
{
    std::istringstream in(text);
    NameGraph graph = make_name_graph();
    read_listing(in, graph);
    return analyze_listing(graph);
}

} // namespace

// =============================================================================
// read_listing Tests
// =============================================================================

TEST(DependencyListingTests, ReadListing_CommentAndBlankLines_AreSkipped)
{
    std::istringstream in("# modules for the demo\n\n   \napp core\n#core lib\ncore\n");
    NameGraph graph = make_name_graph();
    read_listing(in, graph);

    EXPECT_EQ(graph.size(), 2u);
    EXPECT_TRUE(graph.pending_references().empty());
    auto edges = graph.edges();
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].first, "app");
    EXPECT_EQ(edges[0].second, "core");
}

TEST(DependencyListingTests, ReadListing_ForwardDependency_IsPendingUntilDeclared)
{
    std::istringstream in("app core\n");
    NameGraph graph = make_name_graph();
    read_listing(in, graph);
    ASSERT_EQ(graph.pending_references().size(), 1u);
    EXPECT_EQ(graph.pending_references()[0], "core");

    std::istringstream rest("core\n");
    read_listing(rest, graph);
    EXPECT_EQ(graph.out_degree("app"), 1u);
    EXPECT_EQ(graph.in_degree("core"), 1u);
}

// =============================================================================
// analyze_listing Tests
// =============================================================================

TEST(DependencyListingTests, Analyze_CommentLine_DoesNotAddVertex)
{
    ListingReport report = analyze_text("# app lib\napp core\ncore\n");

    EXPECT_EQ(report.outcome, ListingOutcome::BuildOrder);
    EXPECT_EQ(report.vertex_count, 2u);
    EXPECT_EQ(report.names, (std::vector<std::string>{"core", "app"}));
}

TEST(DependencyListingTests, Analyze_ForwardDependencies_DependenciesFirst)
{
    ListingReport report = analyze_text("app core net\ncore\nnet core\n");

    EXPECT_EQ(report.outcome, ListingOutcome::BuildOrder);
    EXPECT_EQ(report.vertex_count, 3u);
    EXPECT_EQ(report.names, (std::vector<std::string>{"core", "net", "app"}));
}

TEST(DependencyListingTests, Analyze_Cycle_ReportsClosedCycle)
{
    ListingReport report = analyze_text("a b\nb a\nc\n");

    EXPECT_EQ(report.outcome, ListingOutcome::Cycle);
    EXPECT_EQ(report.names, (std::vector<std::string>{"a", "b", "a"}));
}

TEST(DependencyListingTests, Analyze_MissingName_ReportsUnresolved)
{
    ListingReport report = analyze_text("app core lib\ncore\napp zlib\n");

    EXPECT_EQ(report.outcome, ListingOutcome::Unresolved);
    EXPECT_EQ(report.names, (std::vector<std::string>{"lib", "zlib"}));
}

TEST(DependencyListingTests, Analyze_EmptyListing_EmptyBuildOrder)
{
    ListingReport report = analyze_text("# nothing here\n");

    EXPECT_EQ(report.outcome, ListingOutcome::BuildOrder);
    EXPECT_EQ(report.vertex_count, 0u);
    EXPECT_TRUE(report.names.empty());
}

// =============================================================================
// run_listing Tests
// =============================================================================

TEST(DependencyListingTests, Run_Acyclic_PrintsBuildOrderAndSucceeds)
{
    std::istringstream in("# build\napp core\ncore\n");
    std::ostringstream out;
    std::ostringstream err;

    EXPECT_EQ(run_listing(in, out, err), EXIT_SUCCESS);
    EXPECT_EQ(out.str(), "Vertices: 2\nBuild order: core app\n");
    EXPECT_TRUE(err.str().empty());
}

TEST(DependencyListingTests, Run_Cycle_PrintsCycleAndFails)
{
    std::istringstream in("a b\nb a\n");
    std::ostringstream out;
    std::ostringstream err;

    EXPECT_EQ(run_listing(in, out, err), EXIT_FAILURE);
    EXPECT_EQ(out.str(), "Cycle: a -> b -> a\n");
    EXPECT_TRUE(err.str().empty());
}

TEST(DependencyListingTests, Run_MissingName_PrintsUnresolvedAndFails)
{
    std::istringstream in("app lib\n");
    std::ostringstream out;
    std::ostringstream err;

    EXPECT_EQ(run_listing(in, out, err), EXIT_FAILURE);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Unresolved names: lib\n");
}
