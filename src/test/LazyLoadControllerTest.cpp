#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/GitDuSession.hpp"
#include "application/LazyLoadController.hpp"
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

std::shared_ptr<FakeGitDataSource> BuildRepo() {
    auto git = std::make_shared<FakeGitDataSource>();
    git->commit("k1", "ann@x", 100, {Diff("src/core/a.cpp", 10, 0), Diff("docs/intro.md", 5, 0)});
    git->commit("k2", "bob@x", 200, {Diff("src/core/b.cpp", 4, 1)});
    git->commit("k3", "ann@x", 300, {Diff("src/ui/panel.cpp", 8, 2), Diff("src/core/a.cpp", 1, 1)});
    git->commit("k4", "cid@x", 400, {Diff("docs/intro.md", 2, 2), Diff("tools/gen.py", 9, 0)});
    git->commit("k5", "bob@x", 500, {Diff("src/core/b.cpp", 3, 0)});
    return git;
}

void AssertSameStats(const NodeSnapshot& a, const NodeSnapshot& b) {
    assert(a.commitCount == b.commitCount);
    assert(a.insertions == b.insertions);
    assert(a.deletions == b.deletions);
    assert(a.latestTimestamp == b.latestTimestamp);
    assert(a.firstTimestamp == b.firstTimestamp);
    assert(a.latestCommitId == b.latestCommitId);
    assert(a.authorCount == b.authorCount);
}

SessionOptions Options(const std::string& dir, const std::string& name, bool lazy) {
    SessionOptions options;
    options.lazyOverride = lazy;
    options.cacheFile = std::filesystem::path(dir) / name;
    return options;
}

bool OpensLazy(const std::shared_ptr<FakeGitDataSource>& git, const std::string& dir, const std::string& name,
               LazyMode mode, std::size_t threshold, const std::string& glob,
               const std::shared_ptr<PersistenceService>& persistence) {
    SessionOptions options;
    options.cacheFile = std::filesystem::path(dir) / name;
    options.glob = glob;
    options.config.lazyMode = mode;
    options.config.lazyFileThreshold = threshold;
    GitDuSession session(git, options, persistence);
    session.open();
    return session.lazy();
}

} // namespace

int main() {
    const std::string dir = gitdu::test::ScratchDir("lazy_load");
    auto persistence = std::make_shared<PersistenceService>();
    auto git = BuildRepo();

    GitDuSession full(git, Options(dir, "full.jsonl", false), persistence);
    full.open();
    full.startBackgroundScan();
    full.waitForIdle();

    std::cout << "[Test] Lazy sessions start from an unloaded skeleton..." << std::endl;
    {
        GitDuSession lazy(git, Options(dir, "lazy.jsonl", true), persistence);
        lazy.open();
        assert(lazy.lazy());
        assert(!lazy.startBackgroundScan());
        auto src = lazy.getNode("src");
        assert(src && src->isDirectory && src->loadState == LoadState::Unloaded);
        assert(src->commitCount == 0);
        assert(lazy.getNode("src/core/a.cpp"));

        bool threw = false;
        try {
            lazy.requestExpand("no/such/dir");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        std::cout << "[Test] An expanded subtree matches the full scan..." << std::endl;
        auto task = lazy.requestExpand("src");
        assert(task);
        lazy.waitForIdle();
        assert(task->isCompleted && !task->failed);

        for (const std::string path : {"src", "src/core", "src/core/a.cpp", "src/core/b.cpp", "src/ui/panel.cpp"}) {
            auto lhs = lazy.getNode(path);
            auto rhs = full.getNode(path);
            assert(lhs && rhs);
            assert(lhs->loadState == LoadState::Loaded);
            AssertSameStats(*lhs, *rhs);
        }
        assert(lazy.getNode("docs")->loadState == LoadState::Unloaded);
        // Ancestors only cover what has been loaded.
        assert(lazy.getNode("")->commitCount == 4);

        auto nested = lazy.requestExpand("src/core");
        assert(nested->isCompleted);
        assert(lazy.getNode("src")->expanded);
        lazy.collapse("src");
        assert(!lazy.getNode("src")->expanded);
        assert(lazy.getNode("src")->loadState == LoadState::Loaded);
    }

    std::cout << "[Test] Concurrent expansions of sibling subtrees..." << std::endl;
    {
        GitDuSession lazy(git, Options(dir, "concurrent.jsonl", true), persistence);
        lazy.open();

        std::vector<std::shared_ptr<TaskStatus>> tasks(4);
        std::vector<std::thread> threads;
        const std::vector<std::string> paths = {"src", "docs", "tools", "src"};
        for (std::size_t i = 0; i < paths.size(); ++i) {
            threads.emplace_back([&lazy, &tasks, &paths, i]() {
                tasks[i] = lazy.requestExpand(paths[i]);
            });
        }
        for (auto& t : threads) t.join();
        lazy.waitForIdle();

        for (const auto& task : tasks) {
            assert(task && task->isCompleted && !task->failed);
        }
        for (const std::string path : {"", "src", "docs", "docs/intro.md", "tools/gen.py"}) {
            AssertSameStats(*lazy.getNode(path), *full.getNode(path));
        }
        assert(lazy.status().expansionsRunning == 0);
        assert(!lazy.status().error);
    }

    std::cout << "[Test] A second lazy session reuses the cached subtree..." << std::endl;
    {
        const int readsBefore = git->readCount();
        GitDuSession lazy(git, Options(dir, "concurrent.jsonl", true), persistence);
        lazy.open();
        lazy.requestExpand("src");
        lazy.waitForIdle();
        assert(git->readCount() == readsBefore);
        AssertSameStats(*lazy.getNode("src"), *full.getNode("src"));
    }

    std::cout << "[Test] Expansion picks up commits made since the scope was recorded..." << std::endl;
    {
        git->commit("k6", "dee@x", 600, {Diff("src/ui/panel.cpp", 1, 0)});
        const int readsBefore = git->readCount();
        GitDuSession lazy(git, Options(dir, "concurrent.jsonl", true), persistence);
        lazy.open();
        lazy.requestExpand("src");
        lazy.waitForIdle();
        assert(git->readCount() - readsBefore == 1);
        auto panel = lazy.getNode("src/ui/panel.cpp");
        assert(panel->commitCount == 2 && panel->latestCommitId == "k6");
    }

    std::cout << "[Test] Scoped scans reuse events of a full scan..." << std::endl;
    {
        auto repo = BuildRepo();
        CacheHeader scope;
        scope.repo = repo->repositoryRoot();
        scope.glob = PathFilter::MatchAll;
        CacheStore store(std::filesystem::path(dir) / "reuse.jsonl", scope, persistence);
        store.open();
        SubtreeAggregate first = LazyLoadController::ComputeSubtree(*repo, store, PathFilter(), "docs");
        assert(first.commitsScanned == 2);
        assert(first.aggregate->find("docs")->stats().commitCount() == 2);
        SubtreeAggregate again = LazyLoadController::ComputeSubtree(*repo, store, PathFilter(), "docs/intro.md");
        assert(again.commitsScanned == 0);
        assert(again.events.size() == 2);
    }

    std::cout << "[Test] A failed expansion returns the node to unloaded..." << std::endl;
    {
        auto repo = BuildRepo();
        repo->onRead([](const std::string&) {
            throw RepositoryAccessError("git went away");
        });
        GitDuSession lazy(repo, Options(dir, "failing.jsonl", true), persistence);
        lazy.open();
        auto task = lazy.requestExpand("docs");
        lazy.waitForIdle();
        assert(task->isCompleted && task->failed);
        assert(task->errorMessage().find("git went away") != std::string::npos);
        assert(lazy.getNode("docs")->loadState == LoadState::Unloaded);
        auto status = lazy.status();
        assert(status.error && status.error->find("docs") != std::string::npos);

        repo->onRead(nullptr);
        auto retry = lazy.requestExpand("docs");
        lazy.waitForIdle();
        assert(!retry->failed);
        assert(lazy.getNode("docs")->loadState == LoadState::Loaded);
    }

    std::cout << "[Test] Automatic lazy mode follows the tracked file threshold..." << std::endl;
    {
        // BuildRepo tracks five files, three of them *.cpp.
        auto repo = BuildRepo();
        assert(OpensLazy(repo, dir, "auto_over.jsonl", LazyMode::Auto, 4, PathFilter::MatchAll, persistence));
        assert(!OpensLazy(repo, dir, "auto_at.jsonl", LazyMode::Auto, 5, PathFilter::MatchAll, persistence));
        assert(!OpensLazy(repo, dir, "auto_glob.jsonl", LazyMode::Auto, 4, "*.cpp", persistence));
        assert(OpensLazy(repo, dir, "auto_glob_low.jsonl", LazyMode::Auto, 2, "*.cpp", persistence));
        assert(OpensLazy(repo, dir, "forced_on.jsonl", LazyMode::On, 1000, PathFilter::MatchAll, persistence));
        assert(!OpensLazy(repo, dir, "forced_off.jsonl", LazyMode::Off, 0, PathFilter::MatchAll, persistence));
    }

    std::cout << "[Test] Finished task threads are joined, not accumulated..." << std::endl;
    {
        AsyncTaskManager tasks;
        for (int i = 0; i < 50; ++i) {
            auto status = tasks.SubmitTask(TaskType::SubtreeExpansion, "noop",
                [](std::shared_ptr<TaskStatus>) {});
            while (!status->isCompleted) std::this_thread::yield();
        }
        std::size_t remaining = tasks.ThreadCount();
        for (int spins = 0; remaining > 0 && spins < 2000; ++spins) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            remaining = tasks.ThreadCount();
        }
        assert(remaining == 0);
        assert(tasks.GetActiveTasks().empty());
    }

    full.cancel();
    full.waitForIdle();
    std::cout << "[PASS] LazyLoadController tests passed." << std::endl;
    return 0;
}
