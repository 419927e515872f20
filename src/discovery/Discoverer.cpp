#include "discovery/Discoverer.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>

using namespace lc::discovery;
using namespace lc::config;
using namespace lc::logging;

namespace stdfs = std::filesystem;

FileList Discoverer::discover(const stdfs::path& root) {
    return discover(root, {.follow_symlinks = ConfigRegistry::get().discovery.follow_symlinks});
}

FileList Discoverer::discover(const stdfs::path& root, const DiscoveryOptions& opts) {
    FileList files;

    std::error_code ec;
    if (!stdfs::is_directory(root, ec)) {
        LogRegistry::discovery()->debug("[Discoverer] {} is not a directory, nothing to scan", root.string());
        return files;
    }

    // Canonical paths of the directories currently open on the stack. Only a link back
    // to one of them is a cycle; an alias to a sibling tree is walked again.
    std::unordered_set<std::string> ancestors;
    std::vector<stdfs::directory_iterator> stack;
    std::vector<std::string> stackCanon;

    const auto enter = [&](const stdfs::path& dir) {
        std::string canon;
        if (opts.follow_symlinks) {
            std::error_code canonEc;
            canon = stdfs::canonical(dir, canonEc).string();
            if (canonEc)
                throw std::runtime_error("[Discoverer] Failed to resolve directory " + dir.string() + ": " + canonEc.message());
            if (ancestors.contains(canon)) {
                LogRegistry::discovery()->warn("[Discoverer] Skipping {}: links back to {}", dir.string(), canon);
                return;
            }
        }

        std::error_code openEc;
        stdfs::directory_iterator it(dir, openEc);
        if (openEc)
            throw std::runtime_error("[Discoverer] Failed to read directory " + dir.string() + ": " + openEc.message());

        if (opts.follow_symlinks) ancestors.insert(canon);
        stack.push_back(std::move(it));
        stackCanon.push_back(std::move(canon));
    };

    const auto leave = [&] {
        if (opts.follow_symlinks) ancestors.erase(stackCanon.back());
        stack.pop_back();
        stackCanon.pop_back();
    };

    enter(root);

    while (!stack.empty()) {
        auto& it = stack.back();
        if (it == stdfs::directory_iterator()) {
            leave();
            continue;
        }

        const stdfs::directory_entry entry = *it;

        std::error_code incEc;
        it.increment(incEc);
        if (incEc)
            throw std::runtime_error("[Discoverer] Failed to read directory " + entry.path().parent_path().string() +
                                     ": " + incEc.message());

        // descend immediately so the order matches a recursive walk
        if (isTraversable(entry, opts)) enter(entry.path());
        else files.push_back(entry.path());
    }

    LogRegistry::discovery()->debug("[Discoverer] Found {} files under {}", files.size(), root.string());
    return files;
}

bool Discoverer::isTraversable(const stdfs::directory_entry& entry, const DiscoveryOptions& opts) {
    // A failed stat means the entry is listed as a file; opening it later decides its fate
    std::error_code ec;
    if (!entry.is_directory(ec) || ec) return false;
    if (opts.follow_symlinks) return true;

    std::error_code linkEc;
    return !entry.is_symlink(linkEc) && !linkEc;
}
