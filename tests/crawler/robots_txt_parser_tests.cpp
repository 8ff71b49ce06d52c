#include <catch2/catch_test_macros.hpp>
#include "RobotsTxtParser.h"

using site_audit::crawler::RobotsTxtParser;

TEST_CASE("RobotsTxtParser handles basic rules", "[RobotsTxtParser]") {
    RobotsTxtParser parser;

    SECTION("Parses simple disallow rules") {
        parser.parse(R"(
            User-agent: *
            Disallow: /private/
            Disallow: /admin/
        )");

        REQUIRE_FALSE(parser.isAllowed("https://example.com/private/page", "MyBot"));
        REQUIRE_FALSE(parser.isAllowed("https://example.com/admin/dashboard", "MyBot"));
        REQUIRE(parser.isAllowed("https://example.com/public/page", "MyBot"));
    }

    SECTION("Parses user-agent specific rules") {
        parser.parse(R"(
            User-agent: MyBot
            Disallow: /mybot-private/

            User-agent: *
            Disallow: /private/
        )");

        REQUIRE_FALSE(parser.isAllowed("https://example.com/mybot-private/page", "MyBot/2.1 (+https://bot.example)"));
        REQUIRE(parser.isAllowed("https://example.com/private/page", "MyBot"));
        REQUIRE_FALSE(parser.isAllowed("https://example.com/private/page", "OtherBot"));
    }

    SECTION("Empty Disallow allows everything") {
        parser.parse("User-agent: *\nDisallow:\n");
        REQUIRE(parser.isAllowed("https://example.com/anything", "MyBot"));
    }

    SECTION("Disallow of the root blocks the whole site") {
        parser.parse("User-agent: *\nDisallow: /\n");
        REQUIRE_FALSE(parser.isAllowed("https://example.com/", "MyBot"));
        REQUIRE_FALSE(parser.isAllowed("https://example.com/deep/page", "MyBot"));
    }
}

TEST_CASE("RobotsTxtParser handles allow rules", "[RobotsTxtParser]") {
    RobotsTxtParser parser;

    SECTION("Longer allow rules override disallow rules") {
        parser.parse(R"(
            User-agent: *
            Disallow: /private/
            Allow: /private/public/
        )");

        REQUIRE_FALSE(parser.isAllowed("https://example.com/private/secret", "MyBot"));
        REQUIRE(parser.isAllowed("https://example.com/private/public/page", "MyBot"));
    }

    SECTION("Allow wins a tie of equal length") {
        parser.parse("User-agent: *\nDisallow: /page\nAllow: /page\n");
        REQUIRE(parser.isAllowed("https://example.com/page", "MyBot"));
    }
}

TEST_CASE("RobotsTxtParser supports wildcards and end anchors", "[RobotsTxtParser]") {
    RobotsTxtParser parser;
    parser.parse(R"(
        User-agent: *
        Disallow: /*.pdf$
        Disallow: /search?*q=
    )");

    REQUIRE_FALSE(parser.isAllowed("https://example.com/docs/file.pdf", "MyBot"));
    REQUIRE(parser.isAllowed("https://example.com/docs/file.pdf?download=1", "MyBot"));
    REQUIRE_FALSE(parser.isAllowed("https://example.com/search?lang=en&q=shoes", "MyBot"));
    REQUIRE(parser.isAllowed("https://example.com/search", "MyBot"));
}

TEST_CASE("RobotsTxtParser collects sitemaps and ignores noise", "[RobotsTxtParser]") {
    RobotsTxtParser parser;
    parser.parse(R"(
        # comment line
        Sitemap: https://example.com/sitemap.xml
        Disallow: /orphan-rule
        USER-AGENT: *
        disallow: /tmp/   # trailing comment
        this line has no directive
        Sitemap: https://example.com/news-sitemap.xml
    )");

    REQUIRE(parser.getSitemaps().size() == 2);
    REQUIRE(parser.getSitemaps()[0] == "https://example.com/sitemap.xml");
    REQUIRE(parser.groupCount() == 1);
    REQUIRE(parser.isAllowed("https://example.com/orphan-rule", "MyBot"));
    REQUIRE_FALSE(parser.isAllowed("https://example.com/tmp/file", "MyBot"));
}

TEST_CASE("RobotsTxtParser without groups allows everything", "[RobotsTxtParser]") {
    RobotsTxtParser parser;
    parser.parse("");
    REQUIRE(parser.isAllowed("https://example.com/", "MyBot"));
    REQUIRE(parser.isAllowed("/relative/path", "MyBot"));
}
