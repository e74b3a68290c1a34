#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "spindle/constants.hpp"
#include "spindle/url.hpp"

namespace Spindle {
namespace Engine {

/**
 * Canonical URLs claimed during one crawl run. Grows monotonically.
 *
 * try_claim() is the only mutator: it inserts the URL if absent and reports
 * whether this caller won the claim. Lookups are exact (no false positives),
 * and the set is split into independently locked shards so concurrent
 * workers rarely contend.
 */
class VisitedSet {
public:
    explicit VisitedSet(size_t shard_count = Core::Constants::VISITED_SET_SHARDS);

    VisitedSet(const VisitedSet&)            = delete;
    VisitedSet& operator=(const VisitedSet&) = delete;

    bool try_claim(const Url& url);
    bool contains(const Url& url) const;

    size_t size() const {
        return size_.load();
    }

private:
    struct Shard {
        mutable std::mutex              mutex;
        std::unordered_set<std::string> urls;
    };

    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<size_t>                 size_{0};

    Shard& shard_for(const std::string& key) const;
};

}  // namespace Engine
}  // namespace Spindle
