#include <catch2/catch.hpp>
#include "converters/edge_converter.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "zip_fixture.hpp"
#include <set>
#include <string>

using namespace x5;
using namespace x5::testing;

namespace {
    const std::string EDGE_HTML = R"HTML(<!DOCTYPE html>
<html>
<head>
<meta http-equiv="X-UA-Compatible" content="IE=Edge"/>
<title>Banner</title>
<!--Adobe Edge Runtime-->
    <script type="text/javascript" charset="utf-8" src="edge_includes/edge.6.0.0.min.js"></script>
    <style>
        .edgeLoad-EDGE-1 { visibility:hidden; }
    </style>
<script>
   AdobeEdge.loadComposition('banner', 'EDGE-1', {
    scaleToFit: "none",
    width: "300px",
    height: "250px"
}, {"dom":{}}, {"dom":{}});
</script>
<!--Adobe Edge Runtime End-->
</head>
<body style="margin:0;padding:0;">
	<div id="Stage" class="EDGE-1">
	</div>
</body>
</html>
)HTML";

    const std::string EDGE_JS = R"JS((function($,Edge,compId){var Composition=Edge.Composition,Symbol=Edge.Symbol;
var im='images/',aud='media/',vid='media/',js='js/',fonts={},opts={},resources=[];
var symbols={"stage":{content:{dom:[
{id:'bg',type:'image',fill:["rgba(0,0,0,0)",im+"bg.png",'0px','0px']},
{id:'logo',type:'image',fill:["rgba(0,0,0,0)",im+"logo.png",'0px','0px']},
{id:'Text',type:'text',text:'<a href=\"logo.png\">x</a>'}]}}};
$("Stage").click(function(){window.open("http://example.com","_blank");});
})(AdobeEdge.$,AdobeEdge,"EDGE-1");)JS";

    ZipMembers edge_archive(const std::string& html = EDGE_HTML) {
        return {
            {"index.html", html},
            {"edge_includes/edge.6.0.0.min.js", "/*! Edge Animate runtime */"},
            {"banner_edge.js", EDGE_JS},
            {"images/bg.png", "bg"},
            {"images/logo.png", "logo"}
        };
    }

    std::string replace_first(std::string text, const std::string& from, const std::string& to) {
        auto pos = text.find(from);
        if (pos != std::string::npos) {
            text.replace(pos, from.size(), to);
        }
        return text;
    }
}

// ============================================================================
// Detection
// ============================================================================

TEST_CASE("Edge compositions use the edge converter", "[converter][edge]") {
    auto bundle = load_bundle(edge_archive());
    bundle->transform();
    REQUIRE(bundle->find_snippet("index.html")->x5type() == "edge");
}

TEST_CASE("Edge runtime is served from the CDN", "[converter][edge]") {
    auto bundle = load_bundle(edge_archive());
    bundle->transform();

    const std::string& parsed = *bundle->find_snippet("index.html")->parsed_content();
    REQUIRE(parsed.find("src=\"https://animate.adobe.com/runtime/6.0.0/edge.6.0.0.min.js\"") !=
            std::string::npos);
    REQUIRE(parsed.find("edge_includes/") == std::string::npos);
}

TEST_CASE("Edge runtime URL template comes from the options", "[converter][edge]") {
    BundleOptions options;
    options.edge_runtime_url = "https://cdn.example.com/edge/{version}/edge.min.js";
    auto bundle = load_bundle(edge_archive(), "tid", options);
    bundle->transform();

    const std::string& parsed = *bundle->find_snippet("index.html")->parsed_content();
    REQUIRE(parsed.find("https://cdn.example.com/edge/6.0.0/edge.min.js") != std::string::npos);
}

// ============================================================================
// Snippet injection
// ============================================================================

TEST_CASE("Edge snippet gets click tags and macro variables", "[converter][edge]") {
    auto bundle = load_bundle(edge_archive());
    bundle->transform();

    const std::string& parsed = *bundle->find_snippet("index.html")->parsed_content();
    REQUIRE(parsed.find("// start x5 injected variables") != std::string::npos);
    REQUIRE(parsed.find("var clickTag=\"%%CLICK_URL_UNESC%%\" + \"%%DEST_URL_ESC%%\";") !=
            std::string::npos);
    REQUIRE(parsed.find("var clickTarget=\"_blank\";") != std::string::npos);
    REQUIRE(parsed.find("var __x5__ = {};") != std::string::npos);
    REQUIRE(parsed.find("__x5__.macro_PNG1 = \"%%FILE:PNG1%%\";") != std::string::npos);
    REQUIRE(parsed.find("__x5__.macro_PNG2 = \"%%FILE:PNG2%%\";") != std::string::npos);
    REQUIRE(parsed.find("AdobeEdge.yepnope.errorTimeout = 5e2;") != std::string::npos);
}

TEST_CASE("Edge loader fetches the generated script through its macro", "[converter][edge]") {
    auto bundle = load_bundle(edge_archive());
    bundle->transform();

    const std::string& parsed = *bundle->find_snippet("index.html")->parsed_content();
    auto loader_pos = parsed.find("AdobeEdge.loadComposition('%%FILE:JS2%%&_=', 'EDGE-1', {");
    auto variables_pos = parsed.find("var __x5__ = {};");
    REQUIRE(loader_pos != std::string::npos);
    REQUIRE(variables_pos < loader_pos);
    REQUIRE(parsed.find("loadComposition('banner'") == std::string::npos);
    REQUIRE(parsed.find("<!--Adobe Edge Runtime End-->") != std::string::npos);
}

TEST_CASE("Edge snippet collects the generated script references", "[converter][edge]") {
    auto bundle = load_bundle(edge_archive());
    bundle->transform();

    Snippet* index = bundle->find_snippet("index.html");
    std::set<std::string> references(index->assets().begin(), index->assets().end());
    std::set<std::string> expected = {"banner_edge.js", "images/bg.png", "images/logo.png"};
    REQUIRE(references == expected);
    REQUIRE(bundle->find_asset("banner_edge.js")->assets().empty());
}

// ============================================================================
// Generated script rewriting
// ============================================================================

TEST_CASE("Edge folder variables are blanked", "[converter][edge][js]") {
    auto bundle = load_bundle(edge_archive());
    bundle->transform();

    const std::string& js = *bundle->find_asset("banner_edge.js")->parsed_content();
    REQUIRE(js.find("var im='',aud='',vid='',js=''") != std::string::npos);
    REQUIRE(js.find("images/") == std::string::npos);
}

TEST_CASE("Edge asset literals become macro variables", "[converter][edge][js]") {
    auto bundle = load_bundle(edge_archive());
    bundle->transform();

    const std::string& js = *bundle->find_asset("banner_edge.js")->parsed_content();
    REQUIRE(js.find("im+__x5__.macro_PNG1,'0px'") != std::string::npos);
    REQUIRE(js.find("im+__x5__.macro_PNG2,'0px'") != std::string::npos);
    REQUIRE(js.find("text:'<a href=' + __x5__.macro_PNG2 + '>x</a>'") != std::string::npos);
    REQUIRE(js.find("\"bg.png\"") == std::string::npos);
}

TEST_CASE("Edge resolves percent-encoded literals inside their quotes", "[converter][edge][js]") {
    ZipMembers members = edge_archive();
    members[2].second = replace_first(EDGE_JS, "im+\"logo.png\"", "im+\"my%20logo.png\"");
    members.push_back({"images/my logo.png", "spaced"});
    auto bundle = load_bundle(members);
    bundle->transform();

    const std::string& js = *bundle->find_asset("banner_edge.js")->parsed_content();
    REQUIRE(js.find("im+__x5__.macro_PNG3,'0px'") != std::string::npos);
    REQUIRE(js.find("my%20logo.png") == std::string::npos);

    Snippet* index = bundle->find_snippet("index.html");
    std::set<std::string> references(index->assets().begin(), index->assets().end());
    REQUIRE(references.count("images/my logo.png") == 1);
    REQUIRE(index->parsed_content()->find("__x5__.macro_PNG3 = \"%%FILE:PNG3%%\";") !=
            std::string::npos);
}

TEST_CASE("Edge click-throughs use the clickTag", "[converter][edge][js]") {
    auto bundle = load_bundle(edge_archive());
    bundle->transform();

    const std::string& js = *bundle->find_asset("banner_edge.js")->parsed_content();
    REQUIRE(js.find("window.open(clickTag,\"_blank\")") != std::string::npos);
    REQUIRE(js.find("http://example.com") == std::string::npos);
}

TEST_CASE("fix_click_url keeps trailing arguments", "[converter][edge][js]") {
    using converters::EdgeConverter;
    REQUIRE(EdgeConverter::fix_click_url("window.open('http://a.b')") == "window.open(clickTag)");
    REQUIRE(EdgeConverter::fix_click_url("window.open(\"http://a.b\", \"_top\")") ==
            "window.open(clickTag, \"_top\")");
    REQUIRE(EdgeConverter::fix_click_url("window.open(url)") == "window.open(url)");
}

TEST_CASE("Edge payload ships the rewritten script, not the runtime", "[converter][edge][payload]") {
    BundleFixture fixture(edge_archive());
    fixture.bundle->transform();

    CreativePart part = fixture.creative_part("index.html");
    REQUIRE(part.assets.size() == 3);
    REQUIRE(BundleFixture::find(part, "JS1") == nullptr);

    const CreativeAsset* js = BundleFixture::find(part, "JS2");
    REQUIRE(js != nullptr);
    REQUIRE(js->file_name == "JS2-tid.js");
    REQUIRE(js->asset_byte_array ==
            base64_encode(*fixture.bundle->find_asset("banner_edge.js")->parsed_content()));
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("Edge without a runtime script tag fails", "[converter][edge][errors]") {
    std::string html = replace_first(EDGE_HTML,
        "<script type=\"text/javascript\" charset=\"utf-8\" src=\"edge_includes/edge.6.0.0.min.js\"></script>",
        "<!-- edge.6.0.0.min.js -->");
    auto bundle = load_bundle(edge_archive(html));
    REQUIRE_THROWS_AS(bundle->transform(), BundleError);

    auto again = load_bundle(edge_archive(html));
    REQUIRE_THROWS_WITH(again->transform(), Catch::Contains("but no runtime found"));
}

TEST_CASE("Edge without the generated script fails", "[converter][edge][errors]") {
    std::string html = replace_first(EDGE_HTML, "loadComposition('banner'", "loadComposition('other'");
    auto bundle = load_bundle(edge_archive(html));
    REQUIRE_THROWS_WITH(bundle->transform(), Catch::Contains("Error converting tid") &&
                                             Catch::Contains("but no js asset found"));
}

TEST_CASE("Edge loader without a composition name fails", "[converter][edge][errors]") {
    std::string html = replace_first(EDGE_HTML, "loadComposition('banner', 'EDGE-1', {",
                                     "loadComposition(\"banner\", \"EDGE-1\", {");
    auto bundle = load_bundle(edge_archive(html));
    REQUIRE(bundle->find_snippet("index.html")->content().find("AdobeEdge.loadComposition") !=
            std::string::npos);
    REQUIRE_THROWS_WITH(bundle->transform(), Catch::Contains("Error converting tid") &&
                                             Catch::Contains("but no js found"));
}
