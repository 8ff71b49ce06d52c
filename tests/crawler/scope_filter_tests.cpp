#include <catch2/catch_test_macros.hpp>
#include "ScopeFilter.h"
#include "../../include/site_audit/common/Errors.h"

using namespace site_audit;
using namespace site_audit::crawler;

TEST_CASE("ScopeFilter keeps the crawl on one origin", "[ScopeFilter]") {
    ScopeFilter scope("https://example.com/");

    REQUIRE(scope.origin() == "https://example.com");
    REQUIRE(scope.checkLink("https://example.com/about") == ScopeDecision::Accepted);
    REQUIRE(scope.checkLink("https://EXAMPLE.com:443/contact") == ScopeDecision::Accepted);
    REQUIRE(scope.checkLink("http://example.com/about") == ScopeDecision::WrongScheme);
    REQUIRE(scope.checkLink("https://blog.example.com/") == ScopeDecision::CrossOrigin);
    REQUIRE(scope.checkLink("https://example.com:8443/") == ScopeDecision::CrossOrigin);
    REQUIRE(scope.checkLink("https://other.org/") == ScopeDecision::CrossOrigin);
    REQUIRE(scope.checkLink("not a url") == ScopeDecision::Invalid);
}

TEST_CASE("ScopeFilter rejects links to non-HTML resources", "[ScopeFilter]") {
    ScopeFilter scope("https://example.com/");

    REQUIRE(scope.checkLink("https://example.com/brochure.pdf") == ScopeDecision::NonHtml);
    REQUIRE(scope.checkLink("https://example.com/img/hero.webp") == ScopeDecision::NonHtml);
    REQUIRE(scope.checkLink("https://example.com/styles/site.css") == ScopeDecision::NonHtml);
    REQUIRE(scope.inScope("https://example.com/page.html"));
    REQUIRE(scope.inScope("https://example.com/products?id=7"));
    REQUIRE(scopeDecisionToString(ScopeDecision::NonHtml) == "non-html");
}

TEST_CASE("ScopeFilter recognizes HTML content types", "[ScopeFilter]") {
    REQUIRE(ScopeFilter::isHtmlContentType("text/html"));
    REQUIRE(ScopeFilter::isHtmlContentType("Text/HTML; charset=UTF-8"));
    REQUIRE(ScopeFilter::isHtmlContentType("application/xhtml+xml"));
    REQUIRE(ScopeFilter::isHtmlContentType(""));
    REQUIRE_FALSE(ScopeFilter::isHtmlContentType("application/pdf"));
    REQUIRE_FALSE(ScopeFilter::isHtmlContentType("image/png"));
    REQUIRE_FALSE(ScopeFilter::isHtmlContentType("application/json"));
}

TEST_CASE("ScopeFilter refuses an invalid target", "[ScopeFilter]") {
    REQUIRE_THROWS_AS(ScopeFilter("example.com"), InvalidUrlError);
}
