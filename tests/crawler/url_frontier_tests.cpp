#include <catch2/catch_test_macros.hpp>
#include "URLFrontier.h"

using mailsift::crawler::FrontierEntry;
using mailsift::crawler::URLFrontier;

TEST_CASE("URLFrontier handles basic URL operations", "[URLFrontier]") {
    URLFrontier frontier;

    SECTION("Adds and retrieves URLs in FIFO order") {
        REQUIRE(frontier.addURL("https://example.com/page1", 0));
        REQUIRE(frontier.addURL("https://example.com/page2", 1));

        REQUIRE(frontier.size() == 2);
        REQUIRE_FALSE(frontier.isEmpty());

        auto batch = frontier.nextBatch(10);
        REQUIRE(batch.size() == 2);
        REQUIRE(batch[0].url == "https://example.com/page1");
        REQUIRE(batch[0].depth == 0);
        REQUIRE(batch[1].url == "https://example.com/page2");
        REQUIRE(batch[1].depth == 1);
        REQUIRE(frontier.isEmpty());
    }

    SECTION("Batches never exceed the requested size") {
        for (int i = 0; i < 5; ++i) {
            frontier.addURL("https://example.com/p" + std::to_string(i), 1);
        }
        REQUIRE(frontier.nextBatch(2).size() == 2);
        REQUIRE(frontier.nextBatch(2).size() == 2);
        auto last = frontier.nextBatch(2);
        REQUIRE(last.size() == 1);
        REQUIRE(last[0].url == "https://example.com/p4");
    }

    SECTION("Handles empty frontier") {
        REQUIRE(frontier.isEmpty());
        REQUIRE(frontier.size() == 0);
        REQUIRE(frontier.nextBatch(4).empty());
    }
}

TEST_CASE("URLFrontier handles URL normalization", "[URLFrontier]") {
    URLFrontier frontier;

    SECTION("Fragments and host case do not create new entries") {
        REQUIRE(frontier.addURL("https://example.com/page1", 1));
        REQUIRE_FALSE(frontier.addURL("https://example.com/page1#section", 1));
        REQUIRE_FALSE(frontier.addURL("https://EXAMPLE.com/page1", 1));

        REQUIRE(frontier.size() == 1);
        REQUIRE(frontier.nextBatch(1)[0].url == "https://example.com/page1");
    }

    SECTION("Scheme, path case and trailing slash are significant") {
        frontier.addURL("http://example.com/a", 1);
        frontier.addURL("https://example.com/a", 1);
        frontier.addURL("https://example.com/A", 1);
        frontier.addURL("https://example.com/a/", 1);

        REQUIRE(frontier.size() == 4);
    }

    SECTION("Unparsable URLs are rejected") {
        REQUIRE_FALSE(frontier.addURL("www.example.com", 0));
        REQUIRE_FALSE(frontier.addURL("", 0));
        REQUIRE(frontier.isEmpty());
    }
}

TEST_CASE("URLFrontier handles visited URLs", "[URLFrontier]") {
    URLFrontier frontier;

    SECTION("Tracks visited URLs") {
        std::string url = "https://example.com/page1";
        frontier.addURL(url, 0);

        REQUIRE_FALSE(frontier.isVisited(url));
        frontier.markVisited(url);
        REQUIRE(frontier.isVisited(url));
        REQUIRE(frontier.isVisited(url + "#frag"));
        REQUIRE(frontier.visitedCount() == 1);
    }

    SECTION("Marking twice counts once") {
        frontier.markVisited("https://example.com/x");
        frontier.markVisited("https://example.com/x");
        REQUIRE(frontier.visitedCount() == 1);
    }

    SECTION("Doesn't add already visited URLs") {
        std::string url = "https://example.com/page1";
        frontier.markVisited(url);
        REQUIRE_FALSE(frontier.addURL(url, 1));
        REQUIRE(frontier.size() == 0);
    }

    SECTION("Dequeued URLs are no longer reported as queued") {
        frontier.addURL("https://example.com/q", 0);
        REQUIRE(frontier.isQueued("https://example.com/q"));
        frontier.nextBatch(1);
        REQUIRE_FALSE(frontier.isQueued("https://example.com/q"));
    }
}
