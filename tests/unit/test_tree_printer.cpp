#include <gtest/gtest.h>
#include <sstream>
#include "../../src/graph/tree_printer.hpp"

using namespace Folio::Graph;
using Folio::Core::Logger;

TEST(TreePrinterTest, RendersHierarchy) {
    PageGraph  graph;
    NodeHandle root = graph.add_root("https://docs.example.com/", "Docs");
    NodeHandle a    = graph.add_child(root, "https://docs.example.com/a", "Guide");
    graph.add_child(a, "https://docs.example.com/a/1", "Setup");
    graph.add_child(root, "https://docs.example.com/b", "");

    std::vector<std::string> lines = TreePrinter::render(graph);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "└─ Docs");
    EXPECT_EQ(lines[1], "   ├─ Guide");
    EXPECT_EQ(lines[2], "   │  └─ Setup");
    EXPECT_EQ(lines[3], "   └─ https://docs.example.com/b");
}

TEST(TreePrinterTest, EmptyGraphRendersNothing) {
    PageGraph graph;
    EXPECT_TRUE(TreePrinter::render(graph).empty());
}

TEST(TreePrinterTest, PrintsThroughLogger) {
    PageGraph graph;
    graph.add_root("https://docs.example.com/", "Docs");

    std::ostringstream out, err;
    Logger             logger(Folio::Core::LOG_ALL, out, err);
    TreePrinter::print(graph, logger);
    EXPECT_NE(out.str().find("└─ Docs"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}
