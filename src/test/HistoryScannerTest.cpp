#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/CancellationToken.hpp"
#include "application/HistoryScanner.hpp"
#include "test/FakeGitDataSource.hpp"

using namespace gitdu::application;
using namespace gitdu::domain;
using gitdu::test::Diff;
using gitdu::test::FakeGitDataSource;

namespace {

ScanCursor Cursor(const std::string& last, std::uint64_t count, const std::string& tip, const std::string& base) {
    ScanCursor c;
    c.lastProcessedCommitId = last;
    c.processedCount = count;
    c.repoHeadAtScanStart = tip;
    c.scanBase = base;
    return c;
}

std::vector<ScannedCommit> Drain(HistoryScanner& scanner) {
    std::vector<ScannedCommit> items;
    while (auto item = scanner.next()) items.push_back(std::move(*item));
    return items;
}

} // namespace

int main() {
    FakeGitDataSource git;
    git.commit("c1", "ann@x", 100, {Diff("src/main.cpp", 10, 0), Diff("README.md", 3, 0)});
    git.commit("c2", "bob@x", 200, {Diff("src/util.cpp", 5, 0)});
    git.commit("c3", "ann@x", 300, {Diff("docs/guide.md", 7, 2)});
    git.commit("c4", "cid@x", 400, {Diff("src/main.cpp", 1, 1), Diff("docs/guide.md", 1, 0)});
    git.commit("c5", "bob@x", 500, {Diff("src/util.cpp", 2, 2)});

    std::cout << "[Test] A first scan covers the whole history oldest first..." << std::endl;
    {
        ScanPlan plan = HistoryScanner::PlanResume(git, std::nullopt);
        assert(plan.liveHead && *plan.liveHead == "c5");
        assert(plan.segments.size() == 1);
        assert(plan.segments[0].base.empty());
        assert(plan.pendingCommits() == 5);
        assert(!plan.upToDate());

        HistoryScanner scanner(git, PathFilter("*.cpp"));
        scanner.start(plan);
        auto items = Drain(scanner);
        assert(items.size() == 5);
        assert(items[0].commitId == "c1");
        assert(items[4].commitId == "c5");
        assert(items[0].events.size() == 1 && items[0].events[0].path == "src/main.cpp");
        assert(items[2].events.empty());
        assert(items[3].events.size() == 1);
        assert(items[3].events[0].author == "cid@x" && items[3].events[0].timestamp == 400);

        assert(items[1].cursor.processedCount == 2);
        assert(items[1].cursor.lastProcessedCommitId == "c2");
        assert(!items[1].cursor.segmentComplete());
        assert(items[4].cursor.segmentComplete());
        assert(items[4].cursor.scanBase == "c5");
        assert(scanner.finished());
        assert(scanner.processed() == 5);
    }

    std::cout << "[Test] An unreadable commit is skipped and recorded..." << std::endl;
    {
        FakeGitDataSource broken;
        broken.commit("b1", "ann@x", 1, {Diff("a.txt", 1, 0)});
        broken.commit("b2", "ann@x", 2, {Diff("b.txt", 1, 0)});
        broken.commit("b3", "ann@x", 3, {Diff("c.txt", 1, 0)});
        broken.failOn("b2");

        HistoryScanner scanner(broken, PathFilter());
        scanner.start(HistoryScanner::PlanResume(broken, std::nullopt));
        auto items = Drain(scanner);
        assert(items.size() == 3);
        assert(items[1].skipped);
        assert(!items[1].skipReason.empty());
        assert(items[1].events.empty());
        assert(!items[2].skipped && items[2].events.size() == 1);
        assert(scanner.skipped() == 1);
        assert(scanner.processed() == 3);
    }

    std::cout << "[Test] Resuming an interrupted segment continues after the cursor..." << std::endl;
    {
        ScanPlan plan = HistoryScanner::PlanResume(git, Cursor("c2", 2, "c5", ""));
        assert(plan.segments.size() == 1);
        assert((plan.segments[0].commits == std::vector<std::string>{"c3", "c4", "c5"}));
        assert(plan.alreadyProcessed == 2);

        HistoryScanner scanner(git, PathFilter());
        scanner.start(plan);
        auto items = Drain(scanner);
        assert(items.size() == 3 && items.front().commitId == "c3");
        assert(items.back().cursor.processedCount == 5);
        assert(items.back().cursor.segmentComplete());
    }

    std::cout << "[Test] A completed segment with no commit left still checkpoints..." << std::endl;
    {
        ScanPlan plan = HistoryScanner::PlanResume(git, Cursor("c5", 5, "c5", ""));
        assert(plan.hasBoundaryOnly());
        assert(plan.pendingCommits() == 0);
        assert(!plan.upToDate());

        HistoryScanner scanner(git, PathFilter());
        scanner.start(plan);
        auto boundary = scanner.next();
        assert(boundary && boundary->commitId.empty());
        assert(boundary->cursor.segmentComplete());
        assert(boundary->cursor.processedCount == 5);
        assert(boundary->cursor.lastProcessedCommitId == "c5");
        assert(!scanner.next());
    }

    std::cout << "[Test] A fresh cache plans nothing..." << std::endl;
    {
        ScanPlan plan = HistoryScanner::PlanResume(git, Cursor("c5", 5, "c5", "c5"));
        assert(plan.upToDate());
    }

    std::cout << "[Test] New commits on top of a complete scan form a delta segment..." << std::endl;
    git.commit("c6", "ann@x", 600, {Diff("src/new.cpp", 30, 0)});
    git.commit("c7", "ann@x", 700, {Diff("docs/guide.md", 1, 1)});
    {
        ScanPlan plan = HistoryScanner::PlanResume(git, Cursor("c5", 5, "c5", "c5"));
        assert(plan.segments.size() == 1);
        assert(plan.segments[0].base == "c5");
        assert((plan.segments[0].commits == std::vector<std::string>{"c6", "c7"}));

        HistoryScanner scanner(git, PathFilter());
        scanner.start(plan);
        auto items = Drain(scanner);
        assert(items.size() == 2);
        assert(items[0].cursor.scanBase == "c5");
        assert(items[1].cursor.scanBase == "c7");
        assert(items[1].cursor.processedCount == 7);
    }

    std::cout << "[Test] An interrupted scan and a moved head give two segments..." << std::endl;
    {
        ScanPlan plan = HistoryScanner::PlanResume(git, Cursor("c3", 3, "c5", ""));
        assert(plan.segments.size() == 2);
        assert((plan.segments[0].commits == std::vector<std::string>{"c4", "c5"}));
        assert(plan.segments[1].base == "c5");
        assert(plan.pendingCommits() == 4);
    }

    std::cout << "[Test] Rewritten history requires a full refresh..." << std::endl;
    {
        CommitRecord rewritten;
        rewritten.commitId = "x4";
        rewritten.parentIds = {"c3"};
        rewritten.author = "ann@x";
        rewritten.timestamp = 450;
        rewritten.files = {Diff("src/main.cpp", 9, 9)};
        FakeGitDataSource forked;
        forked.commit("c1", "ann@x", 100, {Diff("src/main.cpp", 10, 0)});
        forked.commit("c2", "ann@x", 200, {Diff("src/main.cpp", 1, 0)});
        forked.commit("c3", "ann@x", 300, {Diff("src/main.cpp", 1, 0)});
        forked.commit("c4", "ann@x", 400, {Diff("src/main.cpp", 1, 0)});
        forked.add(rewritten);
        forked.setHead(std::string("x4"));

        ScanPlan plan = HistoryScanner::PlanResume(forked, Cursor("c4", 4, "c4", "c4"));
        assert(plan.requiresFullRefresh);
        assert(!plan.refreshReason.empty());

        forked.remove("c4");
        plan = HistoryScanner::PlanResume(forked, Cursor("c4", 4, "c4", "c4"));
        assert(plan.requiresFullRefresh);
    }

    std::cout << "[Test] An empty repository has nothing to scan..." << std::endl;
    {
        FakeGitDataSource empty;
        ScanPlan plan = HistoryScanner::PlanResume(empty, std::nullopt);
        assert(!plan.liveHead);
        assert(plan.upToDate());
    }

    std::cout << "[Test] Scoped plans list only commits touching the prefix..." << std::endl;
    {
        ScanPlan plan = HistoryScanner::PlanScoped(git, "docs", {});
        assert(plan.segments.size() == 1);
        assert((plan.segments[0].commits == std::vector<std::string>{"c3", "c4", "c7"}));

        HistoryScanner scanner(git, PathFilter());
        scanner.start(plan);
        auto items = Drain(scanner);
        assert(items.size() == 3);
        for (const auto& item : items) {
            for (const auto& e : item.events) assert(IsUnderPrefix(e.path, "docs"));
        }
        assert(items[1].events.size() == 1);

        ScanPlan delta = HistoryScanner::PlanScoped(git, "docs", {"c5"});
        assert((delta.segments[0].commits == std::vector<std::string>{"c7"}));

        ScanPlan covered = HistoryScanner::PlanScoped(git, "docs", {"c7"});
        assert(covered.segments.empty());
        assert(covered.upToDate());
    }

    std::cout << "[Test] Cancellation stops at a commit boundary..." << std::endl;
    {
        CancellationToken token;
        HistoryScanner scanner(git, PathFilter(), &token);
        scanner.start(HistoryScanner::PlanResume(git, std::nullopt));
        auto first = scanner.next();
        assert(first && first->commitId == "c1");
        token.cancel();
        assert(!scanner.next());
        assert(scanner.cancelled());
        assert(!scanner.finished());
        assert(scanner.processed() == 1);
    }

    std::cout << "[PASS] HistoryScanner tests passed." << std::endl;
    return 0;
}
