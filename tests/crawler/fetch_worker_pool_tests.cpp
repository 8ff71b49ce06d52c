#include <catch2/catch_test_macros.hpp>
#include "FetchWorkerPool.h"
#include "FakeFetchPort.h"
#include <stdexcept>

using namespace site_audit;
using namespace site_audit::crawler;
using site_audit::testing::FakeFetchPort;
using site_audit::testing::htmlPage;

namespace {

using Clock = std::chrono::steady_clock;

class ThrowingFetchPort : public FetchPort {
public:
    FetchResult fetch(const std::string&, std::chrono::milliseconds) override {
        throw std::runtime_error("socket exploded");
    }
};

} // namespace

TEST_CASE("FetchWorkerPool fetches and extracts a batch", "[FetchWorkerPool]") {
    FakeFetchPort fetcher;
    fetcher.addHtml("https://example.com/", htmlPage("Home", {"/a"}));
    fetcher.addText("https://example.com/data.json", "{}", "application/json");
    fetcher.addStatus("https://example.com/gone", 410);

    extraction::SignalExtractor extractor;
    FetchWorkerPool pool(fetcher, extractor, 3);
    REQUIRE(pool.workerCount() == 3);

    const std::chrono::milliseconds timeout{1000};
    const uint64_t batch = pool.submitBatch({
        FetchTask{0, "https://example.com/", timeout},
        FetchTask{1, "https://example.com/data.json", timeout},
        FetchTask{2, "https://example.com/gone", timeout},
    });

    auto completions = pool.awaitBatch(batch, 3, Clock::now() + std::chrono::seconds(5));
    REQUIRE(completions.size() == 3);

    for (const auto& completion : completions) {
        REQUIRE(completion.batch == batch);
        REQUIRE(completion.fetch.html.empty());
        if (completion.slot == 0) {
            REQUIRE(completion.fetch.success);
            REQUIRE(completion.signals.has_value());
            REQUIRE(completion.signals->title == std::optional<std::string>("Home"));
            REQUIRE(completion.signals->links.size() == 1);
        } else if (completion.slot == 1) {
            REQUIRE(completion.fetch.success);
            REQUIRE_FALSE(completion.signals.has_value());
        } else {
            REQUIRE_FALSE(completion.fetch.success);
            REQUIRE(completion.fetch.statusCode == 410);
            REQUIRE_FALSE(completion.signals.has_value());
        }
    }
}

TEST_CASE("FetchWorkerPool stops waiting at the deadline", "[FetchWorkerPool]") {
    FakeFetchPort fetcher;
    fetcher.addHtml("https://example.com/fast", htmlPage("Fast"));
    fetcher.addSlowHtml("https://example.com/slow", htmlPage("Slow"), std::chrono::milliseconds(600));

    extraction::SignalExtractor extractor;
    FetchWorkerPool pool(fetcher, extractor, 2);

    const std::chrono::milliseconds timeout{2000};
    const uint64_t first = pool.submitBatch({
        FetchTask{0, "https://example.com/fast", timeout},
        FetchTask{1, "https://example.com/slow", timeout},
    });

    const auto started = Clock::now();
    auto completions = pool.awaitBatch(first, 2, started + std::chrono::milliseconds(200));
    REQUIRE(completions.size() == 1);
    REQUIRE(completions[0].slot == 0);
    REQUIRE(Clock::now() - started < std::chrono::milliseconds(550));

    SECTION("Late completions of an abandoned batch are dropped") {
        const uint64_t second = pool.submitBatch({FetchTask{0, "https://example.com/fast", timeout}});
        // Long enough for the slow fetch of the first batch to land as well
        std::this_thread::sleep_for(std::chrono::milliseconds(700));
        auto next = pool.awaitBatch(second, 1, Clock::now() + std::chrono::seconds(2));
        REQUIRE(next.size() == 1);
        REQUIRE(next[0].batch == second);
    }
}

TEST_CASE("FetchWorkerPool turns a throwing port into a network failure", "[FetchWorkerPool]") {
    ThrowingFetchPort fetcher;
    extraction::SignalExtractor extractor;
    FetchWorkerPool pool(fetcher, extractor, 1);

    const uint64_t batch = pool.submitBatch({FetchTask{0, "https://example.com/", std::chrono::milliseconds(500)}});
    auto completions = pool.awaitBatch(batch, 1, Clock::now() + std::chrono::seconds(2));

    REQUIRE(completions.size() == 1);
    REQUIRE_FALSE(completions[0].fetch.success);
    REQUIRE(completions[0].fetch.errorKind == FetchErrorKind::Network);
    REQUIRE(completions[0].fetch.finalUrl == "https://example.com/");
}

TEST_CASE("FetchWorkerPool cancels tasks no worker has started", "[FetchWorkerPool]") {
    FakeFetchPort fetcher;
    fetcher.addSlowHtml("https://example.com/busy", htmlPage("Busy"), std::chrono::milliseconds(300));
    fetcher.addHtml("https://example.com/queued", htmlPage("Queued"));

    extraction::SignalExtractor extractor;
    {
        FetchWorkerPool pool(fetcher, extractor, 1);
        const std::chrono::milliseconds timeout{1000};
        pool.submitBatch({
            FetchTask{0, "https://example.com/busy", timeout},
            FetchTask{1, "https://example.com/queued", timeout},
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        pool.cancelPending();
    }

    REQUIRE(fetcher.callCount("https://example.com/busy") == 1);
    REQUIRE(fetcher.callCount("https://example.com/queued") == 0);
}
