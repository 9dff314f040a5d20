#include "stratum/di/tag.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <string>

namespace stratum::di {

namespace {

std::atomic<std::uint64_t> g_anonymous_counter{0};

}  // namespace

TagKey TagKey::make(std::string label) {
    return TagKey(std::make_shared<const Identity>(Identity{std::move(label)}));
}

TagKey TagKey::make_anonymous() {
    auto id = g_anonymous_counter.fetch_add(1, std::memory_order_relaxed) + 1;
    return make("anonymous#" + std::to_string(id));
}

std::string describe(const TagKeySet& keys) {
    std::vector<std::string> labels;
    labels.reserve(keys.size());
    for (const auto& key : keys) {
        labels.push_back(key.label());
    }
    std::sort(labels.begin(), labels.end());

    std::string result;
    for (const auto& label : labels) {
        if (!result.empty()) {
            result += ", ";
        }
        result += label;
    }
    return result;
}

std::string describe_chain(const std::vector<TagKey>& keys) {
    std::string result;
    for (const auto& key : keys) {
        if (!result.empty()) {
            result += " -> ";
        }
        result += key.label();
    }
    return result;
}

}  // namespace stratum::di
