#include "visited_set.hpp"
#include <functional>

namespace Spindle {
namespace Engine {

VisitedSet::VisitedSet(size_t shard_count) {
    if (shard_count == 0)
        shard_count = 1;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

VisitedSet::Shard& VisitedSet::shard_for(const std::string& key) const {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

bool VisitedSet::try_claim(const Url& url) {
    Shard&                      shard = shard_for(url.str());
    std::lock_guard<std::mutex> lock(shard.mutex);
    if (!shard.urls.insert(url.str()).second)
        return false;
    ++size_;
    return true;
}

bool VisitedSet::contains(const Url& url) const {
    Shard&                      shard = shard_for(url.str());
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.urls.count(url.str()) > 0;
}

}  // namespace Engine
}  // namespace Spindle
