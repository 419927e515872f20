#pragma once

#include <filesystem>
#include <vector>

namespace lc::discovery {

using FileList = std::vector<std::filesystem::path>;

struct DiscoveryOptions {
    bool follow_symlinks = true;
};

class Discoverer {
public:
    // Uses the discovery section of the registered config
    static FileList discover(const std::filesystem::path& root);

    /*
     * Depth-first listing of every non-directory entry under root, in traversal order.
     * A root that is not a directory yields an empty list. Any directory that cannot
     * be opened or iterated throws std::runtime_error.
     */
    static FileList discover(const std::filesystem::path& root, const DiscoveryOptions& opts);

private:
    static bool isTraversable(const std::filesystem::directory_entry& entry, const DiscoveryOptions& opts);
};

}
