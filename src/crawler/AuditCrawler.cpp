#include "AuditCrawler.h"
#include "FetchWorkerPool.h"
#include "RobotsGate.h"
#include "ScopeFilter.h"
#include "URLFrontier.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/Errors.h"
#include "../../include/site_audit/common/UrlUtils.h"
#include <algorithm>
#include <set>
#include <unordered_map>

namespace site_audit::crawler {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

PageRecord& appendRecord(CrawlResult& result, const FrontierEntry& entry) {
    PageRecord record;
    record.index = result.pages.size();
    record.url = entry.url;
    record.finalUrl = entry.url;
    record.depth = entry.depth;
    result.pages.push_back(std::move(record));
    return result.pages.back();
}

void addLimitNote(CrawlResult& result, const std::string& note) {
    if (std::find(result.limitNotes.begin(), result.limitNotes.end(), note) == result.limitNotes.end()) {
        result.limitNotes.push_back(note);
        LOG_INFO("Crawl of " + result.request.targetUrl + " stopped: " + note);
    }
}

} // namespace

AuditCrawler::AuditCrawler(FetchPort& pageFetcher,
                           FetchPort& resourceFetcher,
                           std::string userAgent,
                           size_t workerCount)
    : pageFetcher_(pageFetcher)
    , resourceFetcher_(resourceFetcher)
    , userAgent_(std::move(userAgent))
    , workerCount_(workerCount) {
}

CrawlResult AuditCrawler::run(const CrawlRequest& request) const {
    return run(request, CrawlBudget::forProfile(request.profile));
}

CrawlResult AuditCrawler::run(const CrawlRequest& request, const CrawlBudget& budget) const {
    if (!budget.isValid()) {
        throw AuditError("crawl budget must have positive page, depth and time limits");
    }

    CrawlResult result;
    result.request = request;
    result.budget = budget;
    result.startedAt = std::chrono::system_clock::now();
    const auto start = Clock::now();

    LOG_INFO("Starting " + profileToString(request.profile) + " crawl of " + request.targetUrl +
             " (max pages " + std::to_string(budget.maxPages) +
             ", max depth " + std::to_string(budget.maxDepth) +
             ", runtime " + std::to_string(budget.maxRuntime.count()) + "ms)");

    ScopeFilter scope(request.targetUrl);
    RobotsGate robots(resourceFetcher_, userAgent_, budget.perPageTimeout);
    URLFrontier frontier;
    frontier.addURL(request.targetUrl, 0);

    bool seedNetworkFailure = false;
    std::string seedFailureReason;

    // Every accepted internal link, and the status each fetched URL answered with
    std::set<std::string> internalLinks;
    std::unordered_map<std::string, int> knownStatus;

    {
        FetchWorkerPool pool(pageFetcher_, extractor_, workerCount_);

        while (!frontier.isEmpty()) {
            if (elapsedSince(start) >= budget.maxRuntime) {
                addLimitNote(result, "max runtime reached");
                break;
            }
            if (result.pagesFetched >= budget.maxPages) {
                addLimitNote(result, "max pages reached");
                break;
            }

            // Dequeue a batch; scope and robots rejections are recorded without using page budget
            std::vector<FetchTask> tasks;
            std::vector<size_t> recordForSlot;
            while (tasks.size() < pool.workerCount() &&
                   result.pagesFetched + tasks.size() < budget.maxPages &&
                   !frontier.isEmpty()) {
                FrontierEntry entry = *frontier.next();
                PageRecord& record = appendRecord(result, entry);

                if (!scope.inScope(entry.url)) {
                    record.outcome = FetchOutcome::SkippedScope;
                    continue;
                }
                if (!robots.isAllowed(entry.url)) {
                    record.outcome = FetchOutcome::SkippedRobots;
                    continue;
                }

                tasks.push_back(FetchTask{tasks.size(), entry.url, budget.perPageTimeout});
                recordForSlot.push_back(record.index);
            }

            if (tasks.empty()) {
                continue;
            }

            const size_t expected = tasks.size();
            result.pagesFetched += expected;
            const auto deadline = std::min(Clock::now() + budget.perPageTimeout + kBatchGrace,
                                           start + budget.maxRuntime + budget.perPageTimeout);
            const uint64_t batch = pool.submitBatch(std::move(tasks));
            std::vector<FetchCompletion> completions = pool.awaitBatch(batch, expected, deadline);

            std::unordered_map<size_t, FetchCompletion*> bySlot;
            for (auto& completion : completions) {
                bySlot[completion.slot] = &completion;
            }

            for (size_t slot = 0; slot < recordForSlot.size(); ++slot) {
                PageRecord& record = result.pages[recordForSlot[slot]];
                auto found = bySlot.find(slot);
                if (found == bySlot.end()) {
                    knownStatus[record.url] = 0;
                    record.outcome = FetchOutcome::Timeout;
                    record.elapsed = budget.perPageTimeout;
                    record.errorMessage = "no response within " + std::to_string(budget.perPageTimeout.count()) + "ms";
                    LOG_WARNING("Timed out waiting for " + record.url);
                    continue;
                }

                FetchCompletion& completion = *found->second;
                const FetchResult& fetch = completion.fetch;
                record.statusCode = fetch.statusCode;
                record.contentType = fetch.contentType;
                record.finalUrl = fetch.finalUrl.empty() ? record.url : common::normalizeUrl(fetch.finalUrl);
                record.elapsed = fetch.elapsed;
                record.errorMessage = fetch.errorMessage;
                knownStatus[record.url] = fetch.statusCode;
                knownStatus[record.finalUrl] = fetch.statusCode;

                if (fetch.errorKind == FetchErrorKind::Timeout || fetch.elapsed > budget.perPageTimeout) {
                    record.outcome = FetchOutcome::Timeout;
                    if (record.errorMessage.empty()) {
                        record.errorMessage = "response took " + std::to_string(fetch.elapsed.count()) + "ms";
                    }
                    LOG_WARNING("Fetch timed out for " + record.url);
                    continue;
                }
                if (!fetch.success) {
                    record.outcome = FetchOutcome::Error;
                    if (record.index == 0 && fetch.errorKind == FetchErrorKind::Network) {
                        seedNetworkFailure = true;
                        seedFailureReason = fetch.errorMessage;
                    }
                    LOG_WARNING("Fetch failed for " + record.url + ": " + fetch.errorMessage);
                    continue;
                }
                if (common::originOf(record.finalUrl) != scope.origin()) {
                    if (record.index != 0) {
                        record.outcome = FetchOutcome::SkippedScope;
                        LOG_DEBUG(record.url + " redirected out of scope to " + record.finalUrl);
                        continue;
                    }
                    // The seed's final origin (apex to www, http to https) becomes the crawl scope
                    scope = ScopeFilter(record.finalUrl);
                    LOG_INFO("Seed " + record.url + " redirected to " + record.finalUrl +
                             ", crawling " + scope.origin());
                }
                frontier.markSeen(record.finalUrl);
                if (!completion.signals) {
                    record.outcome = FetchOutcome::SkippedNonHtml;
                    LOG_DEBUG("Skipping non-HTML response (" + fetch.contentType + ") for " + record.url);
                    continue;
                }

                PageSignals signals = std::move(*completion.signals);
                signals.statusCode = fetch.statusCode;
                signals.responseTime = fetch.elapsed;
                signals.redirectCount = fetch.redirectCount;

                const size_t childDepth = record.depth + 1;
                for (const auto& link : signals.links) {
                    switch (scope.checkLink(link)) {
                        case ScopeDecision::Accepted:
                            ++result.internalLinksDiscovered;
                            internalLinks.insert(common::normalizeUrl(link));
                            if (childDepth <= budget.maxDepth && result.pagesFetched < budget.maxPages) {
                                frontier.addURL(link, childDepth);
                            }
                            break;
                        case ScopeDecision::CrossOrigin:
                            ++result.linksCrossOrigin;
                            break;
                        case ScopeDecision::WrongScheme:
                            ++result.linksWrongScheme;
                            break;
                        case ScopeDecision::NonHtml:
                            ++result.linksNonHtml;
                            break;
                        case ScopeDecision::Invalid:
                            break;
                    }
                }

                record.signals = std::move(signals);
                record.outcome = FetchOutcome::Success;
            }
        }

        pool.cancelPending();
    }

    const bool anySuccess = result.countOutcome(FetchOutcome::Success) > 0;
    if (seedNetworkFailure && !anySuccess) {
        LOG_ERROR("Seed unreachable for " + request.targetUrl + ": " + seedFailureReason);
        throw SeedUnreachableError(request.targetUrl, seedFailureReason);
    }

    checkInternalLinks(internalLinks, knownStatus, robots, budget, start, result);

    const std::string origin = scope.origin();
    result.robotsUrl = origin + "/robots.txt";
    result.robotsPresent = robots.robotsPresent(result.robotsUrl);

    const auto declared = robots.declaredSitemaps(result.robotsUrl);
    if (!declared.empty()) {
        result.sitemapPresent = true;
    } else if (budget.probeSitemap && elapsedSince(start) + budget.perPageTimeout <= budget.maxRuntime) {
        FetchResult sitemap = resourceFetcher_.fetch(origin + "/sitemap.xml", budget.perPageTimeout);
        result.sitemapPresent = sitemap.success;
        LOG_DEBUG("Sitemap probe for " + origin + ": " + (sitemap.success ? "found" : "missing"));
    }

    result.duration = elapsedSince(start);
    LOG_INFO("Finished crawl of " + request.targetUrl + ": " +
             std::to_string(result.pages.size()) + " records, " +
             std::to_string(result.pagesFetched) + " fetched, " +
             std::to_string(result.evaluatedPageCount()) + " evaluated in " +
             std::to_string(result.duration.count()) + "ms");
    return result;
}

void AuditCrawler::checkInternalLinks(const std::set<std::string>& links,
                                      std::unordered_map<std::string, int>& knownStatus,
                                      RobotsGate& robots,
                                      const CrawlBudget& budget,
                                      std::chrono::steady_clock::time_point start,
                                      CrawlResult& result) const {
    if (budget.maxLinkChecks == 0) {
        return;
    }

    for (const auto& link : links) {
        if (result.linksCheckedInternal >= budget.maxLinkChecks) {
            addLimitNote(result, "max link checks reached");
            break;
        }
        if (elapsedSince(start) >= budget.maxRuntime) {
            addLimitNote(result, "max runtime reached while checking links");
            break;
        }
        if (!robots.isAllowed(link)) {
            continue;
        }

        ++result.linksCheckedInternal;
        auto known = knownStatus.find(link);
        int status = 0;
        if (known != knownStatus.end()) {
            status = known->second;
        } else {
            status = resourceFetcher_.checkStatus(link, budget.perPageTimeout).statusCode;
            knownStatus.emplace(link, status);
        }

        if (status == 0 || status >= 400) {
            result.brokenInternalLinks.push_back(BrokenLink{link, status});
        }
    }

    LOG_DEBUG("Checked " + std::to_string(result.linksCheckedInternal) + " of " +
              std::to_string(links.size()) + " internal links, " +
              std::to_string(result.brokenInternalLinks.size()) + " broken");
}

} // namespace site_audit::crawler
