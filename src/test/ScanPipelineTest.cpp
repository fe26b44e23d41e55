#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/CancellationToken.hpp"
#include "application/GitDuSession.hpp"
#include "application/HistoryScanner.hpp"
#include "application/ScanPipeline.hpp"
#include "application/StatsAggregator.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CacheStore.hpp"
#include "test/FakeGitDataSource.hpp"

using namespace gitdu::application;
using namespace gitdu::domain;
using gitdu::infrastructure::CacheStore;
using gitdu::infrastructure::PersistenceService;
using gitdu::test::Diff;
using gitdu::test::FakeGitDataSource;

namespace {

CacheHeader Scope() {
    CacheHeader header;
    header.repo = "/fake/repo";
    header.glob = PathFilter::MatchAll;
    return header;
}

void BuildHistory(FakeGitDataSource& git, int count) {
    const char* files[] = {"src/core/engine.cpp", "src/core/engine.hpp", "src/ui/view.cpp", "docs/notes.md"};
    for (int i = 1; i <= count; ++i) {
        std::vector<FileDiffStat> diff = {Diff(files[i % 4], i, i % 3)};
        if (i % 3 == 0) diff.push_back(Diff(files[(i + 1) % 4], 2, 0));
        git.commit("C" + std::to_string(i), i % 2 ? "ann@x" : "bob@x", 1000 + i * 10, diff);
    }
}

bool SameTree(const PathNode& a, const PathNode& b) {
    if (a.stats() != b.stats() || a.children().size() != b.children().size()) return false;
    for (const auto& [name, child] : a.children()) {
        const PathNode* other = b.child(name);
        if (!other || !SameTree(*child, *other)) return false;
    }
    return true;
}

PipelineResult RunScan(FakeGitDataSource& git, CacheStore& store, StatsAggregator& agg,
                       const CancellationToken* cancel, std::size_t batchSize) {
    HistoryScanner scanner(git, PathFilter(), cancel);
    scanner.start(HistoryScanner::PlanResume(git, store.cursor()));
    PipelineOptions options;
    options.batchSize = batchSize;
    options.queueCapacity = 2;
    ScanPipeline pipeline(scanner, store, [&agg](const std::vector<ChangeEvent>& events) {
        agg.applyAll(events);
    }, options);
    return pipeline.run();
}

} // namespace

int main() {
    const std::string dir = gitdu::test::ScratchDir("scan_pipeline");
    auto persistence = std::make_shared<PersistenceService>();

    FakeGitDataSource git;
    BuildHistory(git, 10);

    std::cout << "[Test] Uninterrupted scan of C1..C10..." << std::endl;
    StatsAggregator reference;
    {
        CacheStore store(std::filesystem::path(dir) / "full.jsonl", Scope(), persistence);
        store.open();
        PipelineResult result = RunScan(git, store, reference, nullptr, 3);
        assert(!result.cancelled);
        assert(result.commitsProcessed == 10);
        assert(result.finalCursor && result.finalCursor->segmentComplete());
        assert(store.status(std::string("C10")) == CacheStore::Status::Fresh);
        assert(reference.root().stats().commitCount() == 10);
    }

    std::cout << "[Test] Cancel after C6, then resume..." << std::endl;
    const std::filesystem::path log = std::filesystem::path(dir) / "resumed.jsonl";
    {
        CancellationToken token;
        git.onRead([&token](const std::string& id) {
            if (id == "C6") token.cancel();
        });
        CacheStore store(log, Scope(), persistence);
        store.open();
        StatsAggregator partial;
        PipelineResult result = RunScan(git, store, partial, &token, 4);
        git.onRead(nullptr);

        assert(result.cancelled);
        assert(result.commitsProcessed == 6);
        assert(store.cursor() && store.cursor()->processedCount == 6);
        assert(store.cursor()->lastProcessedCommitId == "C6");
        assert(store.status(std::string("C10")) == CacheStore::Status::Incomplete);
        assert(partial.root().stats().commitCount() == 6);
    }
    {
        const int readsBefore = git.readCount();
        CacheStore store(log, Scope(), persistence);
        store.open();
        StatsAggregator resumed;
        resumed.rebuild(store.events());
        PipelineResult result = RunScan(git, store, resumed, nullptr, 4);
        assert(!result.cancelled);
        assert(result.commitsProcessed == 4);
        assert(git.readCount() - readsBefore == 4);
        assert(store.cursor()->processedCount == 10);
        assert(store.status(std::string("C10")) == CacheStore::Status::Fresh);
        assert(SameTree(resumed.root(), reference.root()));

        StatsAggregator fromDisk;
        fromDisk.rebuild(store.events());
        assert(SameTree(fromDisk.root(), reference.root()));
    }

    std::cout << "[Test] A Latin-1 file name keeps one node across cancel and resume..." << std::endl;
    {
        const std::string latin1 = "caf\xe9.txt";
        FakeGitDataSource raw;
        for (int i = 1; i <= 4; ++i) {
            raw.commit("L" + std::to_string(i), "ann@x", 2000 + i, {Diff("docs/" + latin1, i, 0)});
        }
        const std::filesystem::path rawLog = std::filesystem::path(dir) / "latin1.jsonl";
        {
            CancellationToken token;
            raw.onRead([&token](const std::string& id) {
                if (id == "L2") token.cancel();
            });
            CacheStore store(rawLog, Scope(), persistence);
            store.open();
            StatsAggregator partial;
            PipelineResult result = RunScan(raw, store, partial, &token, 1);
            raw.onRead(nullptr);
            assert(result.cancelled);
            assert(result.commitsProcessed == 2);
        }
        CacheStore store(rawLog, Scope(), persistence);
        store.open();
        StatsAggregator resumed;
        resumed.rebuild(store.events());
        PipelineResult result = RunScan(raw, store, resumed, nullptr, 1);
        assert(!result.cancelled);
        assert(result.commitsProcessed == 2);

        const PathNode* docs = resumed.root().child("docs");
        assert(docs && docs->children().size() == 1);
        const PathNode* file = docs->child(latin1);
        assert(file && file->stats().commitCount() == 4);
        assert(store.eventCount() == 4);
    }

    std::cout << "[Test] Stage errors surface from run()..." << std::endl;
    {
        CacheStore store(std::filesystem::path(dir) / "closed.jsonl", Scope(), persistence);
        store.open();
        store.close();
        StatsAggregator agg;
        bool threw = false;
        try {
            RunScan(git, store, agg, nullptr, 2);
        } catch (const CacheIoError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[Test] Session goes stale when the head moves and catches up..." << std::endl;
    {
        auto repo = std::make_shared<FakeGitDataSource>();
        BuildHistory(*repo, 5);

        SessionOptions options;
        options.lazyOverride = false;
        options.cacheFile = std::filesystem::path(dir) / "session.jsonl";
        {
            GitDuSession session(repo, options, persistence);
            session.open();
            auto task = session.startBackgroundScan();
            assert(task);
            session.waitForIdle();
            assert(session.cacheStatus() == CacheStore::Status::Fresh);
            assert(session.getNode("")->commitCount == 5);
            assert(!session.status().stale);
        }

        repo->commit("H2", "cid@x", 9000, {Diff("src/core/engine.cpp", 100, 0)});
        {
            int updates = 0;
            GitDuSession session(repo, options, persistence);
            session.open();
            assert(session.cacheStatus() == CacheStore::Status::Stale);
            assert(session.status().stale);
            // Aggregates from the cache are shown before the delta arrives.
            assert(session.getNode("")->commitCount == 5);

            session.onUpdate([&updates](const std::string&) { ++updates; });
            session.startBackgroundScan();
            session.waitForIdle();
            assert(updates > 0);
            assert(session.cacheStatus() == CacheStore::Status::Fresh);
            assert(session.getNode("")->commitCount == 6);
            auto engine = session.getNode("src/core/engine.cpp");
            assert(engine && engine->latestCommitId == "H2" && engine->latestAuthor == "cid@x");
            auto top = session.children("");
            assert(!top.empty() && top.front().name == "src");
        }
        {
            GitDuSession session(repo, options, persistence);
            session.open();
            assert(session.cacheStatus() == CacheStore::Status::Fresh);
            assert(!session.startBackgroundScan());
        }

        std::cout << "[Test] Rewritten history triggers a full refresh..." << std::endl;
        CommitRecord amended;
        amended.commitId = "H2b";
        amended.parentIds = {"C5"};
        amended.author = "cid@x";
        amended.timestamp = 9001;
        amended.files = {Diff("README.md", 1, 0)};
        repo->add(amended);
        repo->setHead(std::string("H2b"));
        {
            GitDuSession session(repo, options, persistence);
            session.open();
            session.startBackgroundScan();
            session.waitForIdle();
            assert(session.cacheStatus() == CacheStore::Status::Fresh);
            assert(session.getNode("")->commitCount == 6);
            assert(session.getNode("README.md"));
            assert(session.getNode("src/core/engine.cpp")->latestCommitId != "H2");
        }
    }

    std::cout << "[Test] Refresh option discards the cache..." << std::endl;
    {
        auto repo = std::make_shared<FakeGitDataSource>();
        BuildHistory(*repo, 3);
        SessionOptions options;
        options.lazyOverride = false;
        options.refresh = true;
        options.cacheFile = std::filesystem::path(dir) / "refresh.jsonl";
        for (int run = 0; run < 2; ++run) {
            GitDuSession session(repo, options, persistence);
            session.open();
            assert(session.cacheStatus() == CacheStore::Status::Empty);
            session.startBackgroundScan();
            session.waitForIdle();
            assert(session.getNode("")->commitCount == 3);
        }
    }

    persistence->stop();
    std::filesystem::remove_all(dir);
    std::cout << "[PASS] ScanPipeline tests passed." << std::endl;
    return 0;
}
