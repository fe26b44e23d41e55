#include <cassert>
#include <iostream>

#include "domain/Errors.hpp"
#include "domain/PathFilter.hpp"

using gitdu::domain::GlobPatternError;
using gitdu::domain::PathFilter;

namespace {

bool Rejects(const std::string& pattern) {
    try {
        PathFilter filter(pattern);
    } catch (const GlobPatternError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Default pattern selects everything..." << std::endl;
    PathFilter all;
    assert(all.matchesEverything());
    assert(all.matches("README.md"));
    assert(all.matches("a/b/c/d.txt"));
    assert(PathFilter("**").matchesEverything());
    assert(PathFilter("*").matchesEverything());

    std::cout << "[Test] Unanchored patterns match a trailing run of segments..." << std::endl;
    PathFilter cpp("*.cpp");
    assert(!cpp.matchesEverything());
    assert(cpp.matches("main.cpp"));
    assert(cpp.matches("src/app/main.cpp"));
    assert(!cpp.matches("src/app/main.hpp"));
    assert(!cpp.matches("src/main.cpp/notes.txt"));

    PathFilter nested("app/*.cpp");
    assert(nested.matches("src/app/main.cpp"));
    assert(!nested.matches("src/app/sub/main.cpp"));

    std::cout << "[Test] Anchored patterns and double star..." << std::endl;
    PathFilter anchored("/src/**/*.cpp");
    assert(anchored.matches("src/main.cpp"));
    assert(anchored.matches("src/a/b/main.cpp"));
    assert(!anchored.matches("lib/src/main.cpp"));

    PathFilter docs("/docs/**");
    assert(docs.matches("docs/index.md"));
    assert(docs.matches("docs/api/types.md"));
    assert(!docs.matches("src/docs/index.md"));

    std::cout << "[Test] Character classes and single-character wildcards..." << std::endl;
    PathFilter klass("file[0-9].?xt");
    assert(klass.matches("dir/file3.txt"));
    assert(!klass.matches("dir/fileA.txt"));

    std::cout << "[Test] Malformed patterns are rejected..." << std::endl;
    assert(Rejects(""));
    assert(Rejects("/"));
    assert(Rejects("src/[abc"));
    assert(Rejects("trailing\\"));
    assert(!Rejects("[]]x"));

    std::cout << "[PASS] PathFilter tests passed." << std::endl;
    return 0;
}
