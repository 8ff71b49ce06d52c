#include <catch2/catch_test_macros.hpp>
#include "URLFrontier.h"

using site_audit::crawler::URLFrontier;

TEST_CASE("URLFrontier handles basic URL operations", "[URLFrontier]") {
    URLFrontier frontier;

    SECTION("Adds and retrieves URLs in FIFO order") {
        REQUIRE(frontier.addURL("https://example.com/page1", 0));
        REQUIRE(frontier.addURL("https://example.com/page2", 1));

        REQUIRE(frontier.size() == 2);
        REQUIRE_FALSE(frontier.isEmpty());

        auto first = frontier.next();
        REQUIRE(first.has_value());
        REQUIRE(first->url == "https://example.com/page1");
        REQUIRE(first->depth == 0);
        REQUIRE(frontier.next()->url == "https://example.com/page2");
        REQUIRE(frontier.isEmpty());
    }

    SECTION("Handles an empty frontier") {
        REQUIRE(frontier.isEmpty());
        REQUIRE(frontier.size() == 0);
        REQUIRE_FALSE(frontier.next().has_value());
    }
}

TEST_CASE("URLFrontier admits each URL once", "[URLFrontier]") {
    URLFrontier frontier;

    SECTION("Equivalent spellings are duplicates") {
        REQUIRE(frontier.addURL("https://example.com/page1", 0));
        REQUIRE_FALSE(frontier.addURL("https://EXAMPLE.com/page1#section", 1));
        REQUIRE_FALSE(frontier.addURL("https://example.com:443/page1", 1));
        REQUIRE(frontier.size() == 1);
    }

    SECTION("Taken URLs stay seen") {
        frontier.addURL("https://example.com/", 0);
        frontier.next();
        REQUIRE(frontier.isEmpty());
        REQUIRE_FALSE(frontier.addURL("https://example.com", 1));
        REQUIRE_FALSE(frontier.markSeen("https://example.com/"));
    }

    SECTION("Query strings make URLs distinct") {
        REQUIRE(frontier.addURL("https://example.com/list?page=1", 1));
        REQUIRE(frontier.addURL("https://example.com/list?page=2", 1));
        REQUIRE(frontier.size() == 2);
    }

    SECTION("Unparsable URLs are rejected") {
        REQUIRE_FALSE(frontier.addURL("mailto:info@example.com", 1));
        REQUIRE_FALSE(frontier.addURL("", 1));
        REQUIRE_FALSE(frontier.markSeen("mailto:info@example.com"));
        REQUIRE(frontier.isEmpty());
    }
}

TEST_CASE("URLFrontier never queues URLs marked as seen", "[URLFrontier]") {
    URLFrontier frontier;

    REQUIRE(frontier.markSeen("https://www.example.com/"));
    REQUIRE(frontier.isEmpty());
    REQUIRE_FALSE(frontier.addURL("https://WWW.example.com/#main", 1));
    REQUIRE_FALSE(frontier.markSeen("https://www.example.com:443/"));

    REQUIRE(frontier.addURL("https://www.example.com/a", 1));
    REQUIRE(frontier.size() == 1);
}
