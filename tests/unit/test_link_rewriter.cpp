#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include "../../src/rewrite/html_links.hpp"
#include "../../src/rewrite/link_rewriter.hpp"
#include "../../src/storage/disk_storage.hpp"

using namespace Folio::Rewrite;
using Folio::Graph::NodeHandle;
using Folio::Graph::PageGraph;
namespace fs = std::filesystem;

namespace {

std::string page(const std::string& name, char id) {
    return "https://docs.example.com/" + name + "-" + std::string(32, id);
}

const std::string kRaw    = "29d979eeca9e4b7d9a1b1ffb6b2e1f00";
const std::string kDashed = "29d979ee-ca9e-4b7d-9a1b-1ffb6b2e1f00";

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace

class LinkRewriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_shared<Folio::Core::Logger>(Folio::Core::LOG_VERBOSE, out_, err_);

        home_  = graph_.add_root(page("Home", '0'), "Home");
        guide_ = graph_.add_child(home_, page("Guide", '1'), "Guide");
        api_   = graph_.add_child(home_, page("API", '2'), "API");
        intro_ = graph_.add_child(guide_, page("Intro", '3'), "Intro");
        graph_.freeze();

        saved_ = {id(home_), id(guide_), id(intro_)};
        block_maps_[id(guide_)] = {{kRaw, "29D979EE-CA9E-4B7D-9A1B-1FFB6B2E1F00"}};

        if (fs::exists("test_rewrite_out"))
            fs::remove_all("test_rewrite_out");
    }

    void TearDown() override {
        if (fs::exists("test_rewrite_out"))
            fs::remove_all("test_rewrite_out");
    }

    const std::string& id(NodeHandle handle) const {
        return graph_.node(handle).id;
    }

    LinkRewriter make_rewriter() const {
        return LinkRewriter(graph_, factory_, block_maps_, saved_, logger_);
    }

    std::ostringstream           out_, err_;
    Folio::Core::LoggerPtr       logger_;
    PageGraph                    graph_;
    NodeHandle                   home_{}, guide_{}, api_{}, intro_{};
    std::set<std::string>        saved_;
    Folio::Blocks::BlockMapCache block_maps_;
    Folio::Path::ResolverFactory factory_{std::make_shared<Folio::Core::Logger>(0)};
};

TEST_F(LinkRewriterTest, FindsHrefSpansWithQuotes) {
    std::string html  = "<p><a href='/a'>A</a><a class=x href=\"/b?x=1&amp;y=2\">B</a><a>C</a></p>";
    auto        spans = find_hrefs(html);
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(html.substr(spans[0].offset, spans[0].length), "'/a'");
    EXPECT_EQ(spans[0].value, "/a");
    EXPECT_EQ(html.substr(spans[1].offset, spans[1].length), "\"/b?x=1&amp;y=2\"");
    EXPECT_EQ(spans[1].value, "/b?x=1&y=2");
}

TEST_F(LinkRewriterTest, RewritesOnlyLinksToSavedPages) {
    std::string html =
        "<html><head><title>Intro</title></head><body>\n"
        "<p><a class=\"nav\" href=\"" + page("Home", '0') + "\">Home</a></p>\n"
        "<a href='/Guide-" + std::string(32, '1') + "#" + kDashed + "'>Guide block</a>\n"
        "<a href=\"#" + kRaw + "\">Here</a>\n"
        "<a href=\"" + page("API", '2') + "\">API</a>\n"
        "<a href=\"https://elsewhere.org/x?a=1&amp;b=2\">Elsewhere</a>\n"
        "<a href=\"mailto:team@example.com\">Mail</a>\n"
        "</body></html>";

    std::string expected =
        "<html><head><title>Intro</title></head><body>\n"
        "<p><a class=\"nav\" href=\"../../index.html\">Home</a></p>\n"
        "<a href=\"../index.html#29D979EE-CA9E-4B7D-9A1B-1FFB6B2E1F00\">Guide block</a>\n"
        "<a href=\"#" + kDashed + "\">Here</a>\n"
        "<a href=\"" + page("API", '2') + "\">API</a>\n"
        "<a href=\"https://elsewhere.org/x?a=1&amp;b=2\">Elsewhere</a>\n"
        "<a href=\"mailto:team@example.com\">Mail</a>\n"
        "</body></html>";

    RewriteStats stats;
    EXPECT_EQ(make_rewriter().rewrite(graph_.node(intro_), html, stats), expected);
    EXPECT_EQ(stats.links, 6u);
    EXPECT_EQ(stats.rewritten, 3u);
    EXPECT_EQ(stats.unchanged, 3u);
    EXPECT_EQ(stats.external, 3u);
    EXPECT_EQ(stats.anchors, 1u);
}

TEST_F(LinkRewriterTest, RelativeExternalLinksBecomeAbsolute) {
    std::string  html = "<a href=\"/blog/post?id=7\">Blog</a>";
    RewriteStats stats;
    EXPECT_EQ(make_rewriter().rewrite(graph_.node(guide_), html, stats),
              "<a href=\"https://docs.example.com/blog/post?id=7\">Blog</a>");
    EXPECT_EQ(stats.external, 1u);
}

TEST_F(LinkRewriterTest, SelfLinkWithoutBlockPointsAtCurrentDocument) {
    std::string  html = "<a href=\"" + page("Guide", '1') + "\">Guide</a><a href=\"#top\">Top</a>";
    RewriteStats stats;
    EXPECT_EQ(make_rewriter().rewrite(graph_.node(guide_), html, stats),
              "<a href=\"\">Guide</a><a href=\"#top\">Top</a>");
    EXPECT_EQ(stats.anchors, 2u);
    EXPECT_EQ(stats.rewritten, 1u);
}

TEST_F(LinkRewriterTest, UnquotedAndEscapedValues) {
    std::string  html = "<a href=" + page("Intro", '3') + "?a=1&amp;b=2>Intro</a>";
    RewriteStats stats;
    EXPECT_EQ(make_rewriter().rewrite(graph_.node(home_), html, stats),
              "<a href=\"Guide/Intro/index.html\">Intro</a>");
}

TEST_F(LinkRewriterTest, ContextForNonHttpHasNoTarget) {
    LinkRewriter rewriter = make_rewriter();
    auto         ctx      = rewriter.context_for(graph_.node(home_), "javascript:void(0)");
    EXPECT_EQ(ctx.target, nullptr);
    EXPECT_EQ(ctx.href, "javascript:void(0)");

    ctx = rewriter.context_for(graph_.node(home_), "Guide-" + std::string(32, '1') + "#" + kDashed);
    ASSERT_NE(ctx.target, nullptr);
    EXPECT_EQ(ctx.target->id, id(guide_));
    EXPECT_EQ(ctx.block_id, kRaw);

    ctx = rewriter.context_for(graph_.node(home_), page("Guide", '1') + "#not-a-block");
    ASSERT_NE(ctx.target, nullptr);
    EXPECT_TRUE(ctx.block_id.empty());
}

TEST_F(LinkRewriterTest, RewriteAllUpdatesSavedDocuments) {
    Folio::Storage::DiskStorage storage("test_rewrite_out", logger_);
    ASSERT_TRUE(storage.save("index.html", "<a href=\"/Intro-" + std::string(32, '3') + "\">Intro</a>"));
    ASSERT_TRUE(storage.save("Guide/Intro/index.html", "<a href=\"" + page("API", '2') + "\">API</a>"));

    RewriteStats stats = make_rewriter().rewrite_all(storage);
    EXPECT_EQ(stats.documents, 2u);
    EXPECT_EQ(stats.missing, 1u);  // Guide was saved but its document is gone
    EXPECT_EQ(stats.rewritten, 1u);

    EXPECT_EQ(read_file("test_rewrite_out/index.html"), "<a href=\"Guide/Intro/index.html\">Intro</a>");
    EXPECT_EQ(read_file("test_rewrite_out/Guide/Intro/index.html"),
              "<a href=\"" + page("API", '2') + "\">API</a>");
    EXPECT_NE(err_.str().find("saved document missing"), std::string::npos);
}

TEST_F(LinkRewriterTest, EmptyDocumentIsLeftAlone) {
    RewriteStats stats;
    EXPECT_EQ(make_rewriter().rewrite(graph_.node(home_), "", stats), "");
    EXPECT_EQ(stats.links, 0u);
}
