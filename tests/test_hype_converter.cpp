#include <catch2/catch.hpp>
#include "converters/hype_converter.hpp"
#include "errors.hpp"
#include "zip_fixture.hpp"
#include <string>

using namespace x5;
using namespace x5::testing;

namespace {
    const std::string HYPE_HTML = R"HTML(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>Banner</title>
<style>html,body{margin:0;}</style>
</head>
<body>
<div id="banner_hype_container" style="position:relative;width:300px;height:250px;overflow:hidden;">
<script type="text/javascript" charset="utf-8" src="banner.hyperesources/banner_hype_generated_script.js?84523"></script>
</div>
<img src="banner.hyperesources/logo.png">
</body>
</html>
)HTML";

    const std::string HYPE_JS =
        "(function(){var f=\"banner.hyperesources\",g=false;"
        "var h={n:\"logo.png\",w:300};})();";

    ZipMembers hype_archive(const std::string& html = HYPE_HTML) {
        return {
            {"index.html", html},
            {"banner.hyperesources/banner_hype_generated_script.js", HYPE_JS},
            {"banner.hyperesources/logo.png", "logo"},
            {"banner.hyperesources/HYPE-596.full.min.js", "var HYPE={};"}
        };
    }
}

TEST_CASE("Hype documents use the hype converter", "[converter][hype]") {
    auto bundle = load_bundle(hype_archive());
    bundle->transform();
    REQUIRE(bundle->find_snippet("index.html")->x5type() == "hype");
}

TEST_CASE("Hype script tag is replaced by an inline block before </body>", "[converter][hype]") {
    auto bundle = load_bundle(hype_archive());
    bundle->transform();

    const std::string& parsed = *bundle->find_snippet("index.html")->parsed_content();
    REQUIRE(parsed.find("_hype_generated_script.js") == std::string::npos);
    REQUIRE(parsed.find("<script>\n(function(){var f=\"\",g=false;") != std::string::npos);
    REQUIRE(parsed.find("var hypeElementContainer = 'banner_hype_container';") != std::string::npos);
    REQUIRE(parsed.find("onload=hypeUpdate;\n\n</script>\n</body>") != std::string::npos);
}

TEST_CASE("Hype generated script is dropped from the bundle", "[converter][hype]") {
    BundleFixture fixture(hype_archive());
    fixture.bundle->transform();

    REQUIRE(fixture.bundle->find_asset("banner.hyperesources/banner_hype_generated_script.js") == nullptr);
    REQUIRE(fixture.bundle->assets().size() == 2);

    CreativePart part = fixture.creative_part("index.html");
    REQUIRE(part.assets.size() == 1);
    REQUIRE(part.assets[0].macro_name == "PNG1");
    REQUIRE(BundleFixture::find(part, "JS1") == nullptr);
}

TEST_CASE("Hype references resolve from the page and the resources folder", "[converter][hype]") {
    auto bundle = load_bundle(hype_archive());
    bundle->transform();

    Snippet* index = bundle->find_snippet("index.html");
    const std::string& parsed = *index->parsed_content();
    REQUIRE(parsed.find("<img src=\"%%FILE:PNG1%%\">") != std::string::npos);
    REQUIRE(parsed.find("{n:\"%%FILE:PNG1%%\",w:300}") != std::string::npos);
    REQUIRE(parsed.find("banner.hyperesources/") == std::string::npos);
    REQUIRE(count_occurrences(parsed, "%%FILE:PNG1%%") == 2);
}

TEST_CASE("Hype payload html carries the inline script", "[converter][hype][payload]") {
    BundleFixture fixture(hype_archive());
    fixture.bundle->transform();

    std::string html = fixture.creative_part("index.html").html_snippet;
    REQUIRE(html.find("hypeUpdate") != std::string::npos);
    REQUIRE(html.find("%%FILE:PNG1%%") != std::string::npos);
    REQUIRE(html.find("<title>") == std::string::npos);
}

TEST_CASE("Hype script is found at the archive root as a fallback", "[converter][hype]") {
    auto bundle = load_bundle({
        {"ad/index.html",
         "<html><body><script src=\"res/ad_hype_generated_script.js?1\"></script></body></html>"},
        {"ad_hype_generated_script.js", "var f=\"res\",x=1;"},
        {"ad/logo.png", "logo"}
    });
    bundle->transform();

    Snippet* index = bundle->find_snippet("ad/index.html");
    REQUIRE(index->x5type() == "hype");
    REQUIRE(index->parsed_content()->find("var f=\"\",x=1;") != std::string::npos);
    REQUIRE(bundle->find_asset("ad_hype_generated_script.js") == nullptr);
}

TEST_CASE("Hype block is appended when there is no </body>", "[converter][hype]") {
    auto bundle = load_bundle({
        {"index.html", "<div><script src=\"x_hype_generated_script.js?7\"></script></div>"},
        {"x_hype_generated_script.js", "var a=1;"}
    });
    bundle->transform();

    const std::string& parsed = *bundle->find_snippet("index.html")->parsed_content();
    REQUIRE(parsed.rfind("<div></div><script>\nvar a=1;\n", 0) == 0);
    REQUIRE(parsed.size() >= 10);
    REQUIRE(parsed.compare(parsed.size() - 10, 10, "</script>\n") == 0);
}

TEST_CASE("Hype without its generated script fails", "[converter][hype][errors]") {
    auto bundle = load_bundle({
        {"index.html",
         "<html><body><script src=\"banner_hype_generated_script.js?1\"></script></body></html>"},
        {"logo.png", "logo"}
    });
    REQUIRE_THROWS_WITH(bundle->transform(),
                        Catch::Contains("Hype script banner_hype_generated_script.js not found."));
}

TEST_CASE("Hype domain fix names the container", "[converter][hype]") {
    std::string script = converters::HypeConverter::domain_fix_script("promo");
    REQUIRE(script.rfind("var hypeElementContainer = 'promo_hype_container';\n", 0) == 0);
    REQUIRE(script.find("onload=hypeUpdate;") != std::string::npos);
}
