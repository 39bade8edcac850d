#include "FaultDecisionCache.hpp"
#include "RandomUtils.hpp"

size_t FaultDecisionCache::KeyHash::operator()(const Key& key) const {
    return static_cast<size_t>(RandomUtils::combine(std::hash<std::string>{}(key.module_id),
                                                    static_cast<uint64_t>(key.bucket)));
}

FaultDecisionCache::FaultDecisionCache(const FaultInjector& injector, size_t capacity)
    : injector_(injector), capacity_(capacity == 0 ? 1 : capacity) {}

FaultState FaultDecisionCache::decide(const std::string& module_id, Timestamp timestamp) {
    Key key{module_id, injector_.bucket_of(timestamp)};
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    if (entries_.size() >= capacity_) {
        entries_.clear();
    }
    FaultState state = injector_.decide_bucket(RandomUtils::hash_string(module_id), key.bucket,
                                               injector_.fault_ratio());
    entries_.emplace(std::move(key), state);
    return state;
}
