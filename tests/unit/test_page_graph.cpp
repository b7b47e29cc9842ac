#include <filesystem>
#include <gtest/gtest.h>
#include "../../src/core/types/errors.hpp"
#include "../../src/graph/edge_classifier.hpp"
#include "../../src/graph/page_graph.hpp"

using namespace Folio::Graph;
using Folio::Core::ContractViolation;
namespace fs = std::filesystem;

namespace {

std::string page(const std::string& name, char id) {
    return "https://docs.example.com/" + name + "-" + std::string(32, id);
}

}  // namespace

class PageGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_  = graph_.add_root(page("Home", '0'), "Home");
        guide_ = graph_.add_child(root_, page("Guide", '1'), "Guide");
        api_   = graph_.add_child(root_, page("API", '2'), "API");
        intro_ = graph_.add_child(guide_, page("Intro", '3'), "Intro");
        graph_.add_edge(root_, guide_, EdgeClassifier::forward(graph_, root_, guide_));
        graph_.add_edge(root_, api_, EdgeClassifier::forward(graph_, root_, api_));
        graph_.add_edge(guide_, intro_, EdgeClassifier::forward(graph_, guide_, intro_));
        graph_.add_edge(intro_, root_, EdgeClassifier::classify(graph_, intro_, root_));
        graph_.add_edge(intro_, api_, EdgeClassifier::classify(graph_, intro_, api_));
    }

    void TearDown() override {
        if (fs::exists("test_graph_out"))
            fs::remove_all("test_graph_out");
    }

    PageGraph  graph_;
    NodeHandle root_{}, guide_{}, api_{}, intro_{};
};

TEST_F(PageGraphTest, NodesCarryDepthAndParent) {
    EXPECT_EQ(graph_.size(), 4u);
    EXPECT_TRUE(graph_.node(root_).is_root());
    EXPECT_EQ(graph_.node(intro_).depth, 2);
    EXPECT_EQ(*graph_.node(intro_).parent, guide_);
    EXPECT_EQ(graph_.node(root_).children, (std::vector<NodeHandle>{guide_, api_}));
}

TEST_F(PageGraphTest, IdsComeFromUrls) {
    EXPECT_EQ(graph_.node(guide_).id, std::string(32, '1'));
    EXPECT_EQ(graph_.find(std::string(32, '2')), api_);
    EXPECT_EQ(graph_.find_by_url(page("Intro", '3') + "#section"), intro_);
    EXPECT_FALSE(graph_.find("missing").has_value());
}

TEST_F(PageGraphTest, DuplicatePageIsRejected) {
    EXPECT_THROW(graph_.add_child(api_, page("Guide-again", '1'), "Guide"), ContractViolation);
}

TEST_F(PageGraphTest, FirstEdgeClassificationWins) {
    EXPECT_FALSE(graph_.add_edge(root_, guide_, EdgeInfo{EdgeType::Cross, 1, false}));
    EXPECT_EQ(graph_.edge(graph_.node(root_).id, graph_.node(guide_).id)->type, EdgeType::Forward);
}

TEST_F(PageGraphTest, RejectedEdgesAreKept) {
    auto back = graph_.edge(graph_.node(intro_).id, graph_.node(root_).id);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->type, EdgeType::Back);
    EXPECT_TRUE(back->is_ancestor);
    EXPECT_EQ(back->depth_delta, 2);

    auto cross = graph_.edge(graph_.node(intro_).id, graph_.node(api_).id);
    ASSERT_TRUE(cross.has_value());
    EXPECT_EQ(cross->type, EdgeType::Cross);
    EXPECT_EQ(graph_.edges_from(graph_.node(intro_).id).size(), 2u);
}

TEST_F(PageGraphTest, StatisticsCountEdgeTypes) {
    GraphStatistics stats = graph_.statistics();
    EXPECT_EQ(stats.nodes, 4u);
    EXPECT_EQ(stats.leaves, 2u);
    EXPECT_EQ(stats.max_depth, 2);
    EXPECT_EQ(stats.forward_edges, 3u);
    EXPECT_EQ(stats.back_edges, 1u);
    EXPECT_EQ(stats.cross_edges, 1u);
}

TEST_F(PageGraphTest, SegmentsFollowTitleChain) {
    graph_.freeze();
    EXPECT_TRUE(graph_.node(root_).path_segments.empty());
    EXPECT_EQ(graph_.node(intro_).path_segments, (std::vector<std::string>{"Guide", "Intro"}));
}

TEST_F(PageGraphTest, ChildBeforeParentIsRejected) {
    EXPECT_THROW(graph_.finalize_segments(intro_), ContractViolation);
}

TEST_F(PageGraphTest, SiblingCollisionsGetSuffixes) {
    NodeHandle twin  = graph_.add_child(root_, page("Guide-copy", '4'), "Guide");
    NodeHandle index = graph_.add_child(root_, page("Index", '5'), "index.html");
    graph_.freeze();

    EXPECT_EQ(graph_.node(guide_).path_segments.back(), "Guide");
    EXPECT_EQ(graph_.node(twin).path_segments.back(), "Guide_2");
    EXPECT_EQ(graph_.node(index).path_segments.back(), "index.html_2");
}

TEST_F(PageGraphTest, AnnotatedTitleReplacesLinkText) {
    graph_.annotate_title(api_, "API Reference");
    graph_.annotate_title(guide_, "");
    graph_.freeze();
    EXPECT_EQ(graph_.node(api_).path_segments.back(), "API_Reference");
    EXPECT_EQ(graph_.node(guide_).title, "Guide");
}

TEST_F(PageGraphTest, FrozenGraphRejectsShapeChanges) {
    graph_.freeze();
    EXPECT_TRUE(graph_.frozen());
    EXPECT_THROW(graph_.add_child(root_, page("Late", '6'), "Late"), ContractViolation);
    EXPECT_THROW(graph_.add_edge(api_, root_, EdgeInfo{}), ContractViolation);
    EXPECT_NO_THROW(graph_.annotate_title(api_, "Renamed"));
}

TEST_F(PageGraphTest, JsonRoundTripKeepsEverything) {
    graph_.freeze();
    graph_.save("test_graph_out/.site-graph.json");

    PageGraph loaded = PageGraph::load("test_graph_out/.site-graph.json");
    EXPECT_TRUE(loaded.frozen());
    ASSERT_EQ(loaded.size(), graph_.size());
    for (NodeHandle h = 0; h < graph_.size(); ++h) {
        EXPECT_EQ(loaded.node(h).id, graph_.node(h).id);
        EXPECT_EQ(loaded.node(h).path_segments, graph_.node(h).path_segments);
        EXPECT_EQ(loaded.node(h).children, graph_.node(h).children);
    }
    EXPECT_EQ(loaded.edge_metadata(), graph_.edge_metadata());
}

TEST_F(PageGraphTest, MalformedJsonIsRejected) {
    nlohmann::json json = graph_.to_json();
    json["nodes"][3]["depth"] = 7;
    EXPECT_THROW(PageGraph::from_json(json), std::runtime_error);

    json = graph_.to_json();
    json["edgeMetadata"][0]["type"] = "SIDEWAYS";
    EXPECT_THROW(PageGraph::from_json(json), std::runtime_error);

    EXPECT_THROW(PageGraph::from_json(nlohmann::json::object()), std::runtime_error);
}

TEST_F(PageGraphTest, InvalidHandleThrows) {
    EXPECT_THROW(graph_.node(99), std::out_of_range);
}
