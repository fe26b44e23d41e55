#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/StatsAggregator.hpp"

using namespace gitdu::application;
using namespace gitdu::domain;

namespace {

ChangeEvent Event(const std::string& path, const std::string& commit, const std::string& author,
                  std::int64_t ts, std::int64_t ins, std::int64_t del) {
    ChangeEvent e;
    e.path = path;
    e.commitId = commit;
    e.author = author;
    e.timestamp = ts;
    e.insertions = ins;
    e.deletions = del;
    return e;
}

bool SameTree(const PathNode& a, const PathNode& b) {
    if (a.name() != b.name() || a.isDirectory() != b.isDirectory()) return false;
    if (a.stats() != b.stats()) return false;
    if (a.children().size() != b.children().size()) return false;
    for (const auto& [name, child] : a.children()) {
        const PathNode* other = b.child(name);
        if (!other || !SameTree(*child, *other)) return false;
    }
    return true;
}

std::vector<std::string> Names(const std::vector<const PathNode*>& nodes) {
    std::vector<std::string> names;
    for (const auto* n : nodes) names.push_back(n->name());
    return names;
}

} // namespace

int main() {
    std::cout << "[Test] A commit touching two files of a directory counts once..." << std::endl;
    StatsAggregator agg;
    assert(agg.apply(Event("a/x", "c1", "ann@x", 100, 3, 1)));
    assert(agg.apply(Event("a/y", "c1", "ann@x", 100, 2, 0)));

    const PathNode* a = agg.find("a");
    assert(a && a->isDirectory());
    assert(a->stats().commitCount() == 1);
    assert(a->stats().insertions() == 5);
    assert(a->stats().deletions() == 1);
    assert(a->stats().totalChanges() == 6);
    assert(agg.root().stats().commitCount() == 1);
    assert(agg.find("a/x")->stats().commitCount() == 1);
    assert(!agg.find("a/x")->isDirectory());

    std::cout << "[Test] Re-applying an event changes nothing..." << std::endl;
    assert(!agg.apply(Event("a/x", "c1", "ann@x", 100, 3, 1)));
    assert(a->stats().insertions() == 5);
    assert(agg.appliedEvents() == 2);

    std::cout << "[Test] Latest change, first change and authors..." << std::endl;
    agg.apply(Event("a/x", "c2", "bob@x", 200, 1, 1));
    agg.apply(Event("b/z", "c3", "ann@x", 150, 10, 0));
    assert(a->stats().commitCount() == 2);
    assert(a->stats().latestTimestamp() == 200);
    assert(a->stats().latestCommitId() == "c2");
    assert(a->stats().latestAuthor() == "bob@x");
    assert(a->stats().firstTimestamp() == 100);
    assert(a->stats().authorCount() == 2);
    assert(agg.root().stats().commitCount() == 3);
    assert(agg.root().stats().authorCount() == 2);

    std::cout << "[Test] Sorting is descending with a name tie-break..." << std::endl;
    StatsAggregator ties;
    ties.apply(Event("b", "c1", "ann@x", 100, 1, 0));
    ties.apply(Event("a", "c2", "ann@x", 100, 1, 0));
    ties.apply(Event("c", "c3", "ann@x", 300, 5, 0));
    ties.apply(Event("c", "c4", "bob@x", 300, 5, 0));
    auto byCommits = Names(StatsAggregator::SortedChildren(ties.root(), SortKey::CommitCount));
    assert((byCommits == std::vector<std::string>{"c", "a", "b"}));
    auto byLatest = Names(StatsAggregator::SortedChildren(ties.root(), SortKey::LatestChange));
    assert((byLatest == std::vector<std::string>{"c", "a", "b"}));
    auto byAuthors = Names(StatsAggregator::SortedChildren(ties.root(), SortKey::AuthorCount));
    assert((byAuthors == std::vector<std::string>{"c", "a", "b"}));
    for (int i = 0; i < 5; ++i) {
        assert(Names(StatsAggregator::SortedChildren(ties.root(), SortKey::TotalChanges)) ==
               (std::vector<std::string>{"c", "a", "b"}));
    }

    std::cout << "[Test] Incremental application equals a rebuild..." << std::endl;
    std::vector<ChangeEvent> events = {
        Event("src/main.cpp", "c1", "ann@x", 10, 50, 0),
        Event("src/util/io.cpp", "c1", "ann@x", 10, 20, 0),
        Event("src/main.cpp", "c2", "bob@x", 20, 5, 2),
        Event("docs/readme.md", "c3", "cid@x", 30, 8, 0),
        Event("src/util/io.cpp", "c4", "ann@x", 40, 1, 1),
    };
    StatsAggregator incremental;
    incremental.applyAll({events.begin(), events.begin() + 2});
    incremental.applyAll({events.begin() + 2, events.end()});
    incremental.applyAll(events);
    StatsAggregator rebuilt;
    rebuilt.rebuild(events);
    assert(SameTree(incremental.root(), rebuilt.root()));

    std::cout << "[Test] Grafting a computed subtree into a skeleton..." << std::endl;
    StatsAggregator skeleton;
    skeleton.ensurePath("src/main.cpp");
    skeleton.ensurePath("src/util/io.cpp");
    skeleton.ensurePath("docs/readme.md");
    assert(skeleton.find("src")->stats().empty());

    std::vector<ChangeEvent> srcEvents;
    for (const auto& e : events) {
        if (IsUnderPrefix(e.path, "src")) srcEvents.push_back(e);
    }
    StatsAggregator computed;
    computed.applyAll(srcEvents);
    skeleton.graft("src", computed, srcEvents);

    assert(skeleton.find("src")->stats() == rebuilt.find("src")->stats());
    assert(skeleton.find("src/util/io.cpp")->stats() == rebuilt.find("src/util/io.cpp")->stats());
    assert(skeleton.root().stats().commitCount() == 3);
    assert(skeleton.find("docs")->stats().empty());

    // A second graft of the same subtree does not double count the ancestors.
    skeleton.graft("src", computed, srcEvents);
    assert(skeleton.root().stats().commitCount() == 3);
    assert(skeleton.root().stats().insertions() == 76);

    std::cout << "[PASS] StatsAggregator tests passed." << std::endl;
    return 0;
}
