#include <catch2/catch.hpp>
#include "errors.hpp"
#include "transform.hpp"
#include "zip_fixture.hpp"
#include <string>

using namespace x5;
using namespace x5::testing;

namespace {
    std::string banner_archive_path() {
        return write_temp_file("x5_transform_banner.zip", make_zip({
            {"index.html",
             "<html><head><title>Banner</title></head>"
             "<body><a href=\"%%CLICK_URL_UNESC%%\"><img src=\"img/logo.png\"></a></body></html>"},
            {"img/logo.png", "logo"}
        }));
    }
}

// ============================================================================
// Request validation
// ============================================================================

TEST_CASE("Advertiser ids must be integers", "[transform][validation]") {
    REQUIRE(Transform::parse_advertiser_id("42") == 42);
    REQUIRE(Transform::parse_advertiser_id(" 7 ") == 7);
    REQUIRE(Transform::parse_advertiser_id("9007199254740993") == 9007199254740993LL);
    REQUIRE_THROWS_AS(Transform::parse_advertiser_id("abc"), TransformError);
    REQUIRE_THROWS_AS(Transform::parse_advertiser_id("12x"), TransformError);
    REQUIRE_THROWS_WITH(Transform::parse_advertiser_id(""), Catch::Contains("Invalid advertiser id"));
}

TEST_CASE("Sizes are two positive integers", "[transform][validation]") {
    CreativeSize size = Transform::parse_size("300x250");
    REQUIRE(size.width == 300);
    REQUIRE(size.height == 250);

    for (const char* bad : {"300", "300x", "x250", "0x250", "-1x5", "300x250x1", "axb", "300X250"}) {
        REQUIRE_THROWS_AS(Transform::parse_size(bad), TransformError);
    }
    REQUIRE_THROWS_WITH(Transform::parse_size("0x0"), Catch::Contains("Invalid size '0x0'"));
}

TEST_CASE("URLs need a scheme and a host", "[transform][validation]") {
    REQUIRE_NOTHROW(Transform::validate_url("https://example.com/landing?utm=1"));
    REQUIRE_NOTHROW(Transform::validate_url("http://shop.example.org"));

    REQUIRE_THROWS_WITH(Transform::validate_url("example.com/landing"),
                        Catch::Contains("Incorrect URL"));
    REQUIRE_THROWS_AS(Transform::validate_url("mailto:someone@example.com"), TransformError);
    REQUIRE_THROWS_AS(Transform::validate_url("https://"), TransformError);
    REQUIRE_THROWS_AS(Transform::validate_url(""), TransformError);
    REQUIRE_THROWS_AS(Transform::validate_url("1http://example.com"), TransformError);
    REQUIRE_THROWS_WITH(Transform::validate_url("https://[::1/landing"),
                        Catch::Contains("Invalid URL"));
}

TEST_CASE("Only the scheme and host of a URL are checked", "[transform][validation]") {
    for (const char* url : {"https://example.com/landing?q=a b",
                            "https://example.com/caf\xc3\xa9",
                            "https://example.com/?x={id}",
                            "https://example.com/?x=a|b",
                            "https://example.com/?v=100%",
                            "https://user@example.com:8443/#top",
                            "https://[::1]:8080/landing"}) {
        INFO(url);
        REQUIRE_NOTHROW(Transform::validate_url(url));
    }
    REQUIRE_THROWS_WITH(Transform::validate_url("https:///landing"),
                        Catch::Contains("Incorrect URL"));
    REQUIRE_THROWS_WITH(Transform::validate_url("https:example.com"),
                        Catch::Contains("Incorrect URL"));
}

// ============================================================================
// Creative assembly
// ============================================================================

TEST_CASE("Creative merges request metadata into the part", "[transform]") {
    Transform transform("t-100", banner_archive_path(), "banner.zip");

    nlohmann::json creative = transform.get_creative(
        "index.html", "42", "https://example.com/landing", "300x250");

    REQUIRE(creative["xsi_type"].get<std::string>() == "CustomCreative");
    REQUIRE(creative["name"].get<std::string>() == "X5 banner.zip t-100");
    REQUIRE(creative["advertiserId"].get<int64_t>() == 42);
    REQUIRE(creative["size"]["width"].get<int>() == 300);
    REQUIRE(creative["size"]["height"].get<int>() == 250);
    REQUIRE(creative["destinationUrl"].get<std::string>() == "https://example.com/landing");

    std::string html = creative["htmlSnippet"].get<std::string>();
    REQUIRE(html.find("%%FILE:PNG1%%") != std::string::npos);
    REQUIRE(html.find("%%CLICK_URL_UNESC%%") != std::string::npos);

    REQUIRE(creative["customCreativeAssets"].size() == 1);
    REQUIRE(creative["customCreativeAssets"][0]["asset"]["fileName"].get<std::string>() ==
            "PNG1-t-100.png");
}

TEST_CASE("Creative names are stripped of markup", "[transform]") {
    Transform transform("t-101", banner_archive_path(), "banner.zip");

    nlohmann::json creative = transform.get_creative(
        "index.html", "42", "https://example.com", "300x250", "<b>Summer</b> sale");
    REQUIRE(creative["name"].get<std::string>() == "Summer sale");
}

TEST_CASE("Invalid metadata is rejected before conversion", "[transform]") {
    Transform transform("t-102", banner_archive_path(), "banner.zip");

    REQUIRE_THROWS_AS(transform.get_creative("index.html", "x", "https://example.com", "300x250"),
                      TransformError);
    REQUIRE_THROWS_AS(transform.get_creative("index.html", "42", "example", "300x250"),
                      TransformError);
    REQUIRE_THROWS_AS(transform.get_creative("index.html", "42", "https://example.com", "big"),
                      TransformError);
}

TEST_CASE("Bundle is built once per transform", "[transform]") {
    Transform transform("t-103", banner_archive_path(), "banner.zip");

    Bundle& first = transform.bundle();
    Bundle& second = transform.bundle();
    REQUIRE(&first == &second);
    REQUIRE(first.find_snippet("index.html")->x5type() == "default");

    CreativePart once = transform.get_creative_part("index.html");
    CreativePart twice = transform.get_creative_part("index.html");
    REQUIRE(once.html_snippet == twice.html_snippet);
    REQUIRE(once.assets.size() == twice.assets.size());
}

TEST_CASE("Unknown snippets surface as transform errors", "[transform][errors]") {
    Transform transform("t-104", banner_archive_path(), "banner.zip");
    REQUIRE_THROWS_WITH(transform.get_creative_part("other.html"),
                        Catch::Contains("Invalid snippet name"));
}

TEST_CASE("Broken archives surface as transform errors", "[transform][errors]") {
    std::string no_html = write_temp_file("x5_transform_no_html.zip",
                                          make_zip({{"img/logo.png", "logo"}}));
    Transform transform("t-105", no_html, "no_html.zip");
    REQUIRE_THROWS_WITH(transform.bundle(), Catch::Contains("Cannot transform the archive") &&
                                            Catch::Contains("No snippets found in bundle t-105"));

    Transform missing("t-106", "/nonexistent/x5/archive.zip", "archive.zip");
    REQUIRE_THROWS_AS(missing.bundle(), TransformError);
}
