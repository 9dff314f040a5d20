#include "stratum/di/scoped_container.hpp"

#include <algorithm>
#include <future>

#include "stratum/log/logger.hpp"

namespace stratum::di {

namespace {

// Finalization errors are flattened so callers see individual failures
void collect_failure(std::vector<std::exception_ptr>& failures,
                     std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const DependencyFinalizationError& e) {
        failures.insert(failures.end(), e.errors().begin(), e.errors().end());
    } catch (...) {
        failures.push_back(std::current_exception());
    }
}

}  // namespace

ScopedContainer::ScopedContainer(std::shared_ptr<ScopedContainer> parent,
                                 std::string scope, ContainerOptions options)
    : Container(options), scope_(std::move(scope)), parent_(std::move(parent)) {}

ScopedContainer::~ScopedContainer() = default;

std::shared_ptr<ScopedContainer> ScopedContainer::create(
    std::string scope, ContainerOptions options) {
    return std::make_shared<ScopedContainer>(nullptr, std::move(scope),
                                             options);
}

std::shared_ptr<ScopedContainer> ScopedContainer::parent() const {
    std::lock_guard<std::mutex> lock(family_mutex_);
    return parent_;
}

std::shared_ptr<ScopedContainer> ScopedContainer::child(std::string scope) {
    if (is_destroyed()) {
        throw ContainerDestroyedError(
            "Cannot create child containers from a destroyed container");
    }

    auto created = std::make_shared<ScopedContainer>(
        shared_from_this(), std::move(scope), options());

    std::lock_guard<std::mutex> lock(family_mutex_);
    if (closing_) {
        throw ContainerDestroyedError(
            "Cannot create child containers from a destroyed container");
    }
    children_.erase(
        std::remove_if(children_.begin(), children_.end(),
                       [](const std::weak_ptr<ScopedContainer>& weak) {
                           return weak.expired();
                       }),
        children_.end());
    children_.push_back(created);
    return created;
}

std::size_t ScopedContainer::live_children() const {
    std::lock_guard<std::mutex> lock(family_mutex_);
    std::size_t count = 0;
    for (const auto& weak : children_) {
        if (!weak.expired()) {
            ++count;
        }
    }
    return count;
}

bool ScopedContainer::has(const TagKey& tag) const {
    if (Container::has(tag)) {
        return true;
    }
    auto parent_scope = parent();
    return parent_scope != nullptr && parent_scope->has(tag);
}

bool ScopedContainer::exists(const TagKey& tag) const {
    if (Container::exists(tag)) {
        return true;
    }
    auto parent_scope = parent();
    return parent_scope != nullptr && parent_scope->exists(tag);
}

Instance ScopedContainer::resolve(const TagKey& tag,
                                  const ResolutionChain& chain) {
    if (is_destroyed()) {
        throw ContainerDestroyedError(
            "Cannot resolve dependencies from a destroyed container");
    }
    if (has_local(tag)) {
        return resolve_local(tag, chain);
    }
    if (auto parent_scope = parent()) {
        return parent_scope->resolve(tag, chain);
    }
    throw UnknownDependencyError(tag);
}

void ScopedContainer::check_can_register(const TagKey& tag) const {
    auto parent_scope = parent();
    if (parent_scope != nullptr && parent_scope->exists(tag)) {
        throw DependencyAlreadyInstantiatedError(tag);
    }
}

void ScopedContainer::destroy() {
    std::lock_guard<std::mutex> teardown(teardown_mutex_);
    if (is_destroyed()) {
        return;
    }

    std::vector<std::shared_ptr<ScopedContainer>> live;
    {
        std::lock_guard<std::mutex> lock(family_mutex_);
        closing_ = true;
        for (const auto& weak : children_) {
            if (auto alive = weak.lock()) {
                live.push_back(std::move(alive));
            }
        }
        children_.clear();
    }

    if (!live.empty()) {
        STRATUM_LOG_DEBUG << "Destroying " << live.size()
                          << " child scope(s) of " << name();
    }

    std::vector<std::future<void>> runs;
    runs.reserve(live.size());
    for (const auto& child_scope : live) {
        runs.push_back(std::async(std::launch::async,
                                  [child_scope]() { child_scope->destroy(); }));
    }

    std::vector<std::exception_ptr> failures;
    for (auto& run : runs) {
        try {
            run.get();
        } catch (...) {
            collect_failure(failures, std::current_exception());
        }
    }

    try {
        Container::destroy();
    } catch (const DependencyFinalizationError&) {
        collect_failure(failures, std::current_exception());
    }

    {
        std::lock_guard<std::mutex> lock(family_mutex_);
        parent_.reset();
    }

    if (!failures.empty()) {
        throw DependencyFinalizationError(std::move(failures));
    }
}

std::shared_ptr<ScopedContainer> ScopedContainer::merge(
    const Container& other) const {
    if (is_destroyed() || other.is_destroyed()) {
        throw ContainerDestroyedError(
            "Cannot merge from a destroyed container");
    }

    auto merged = std::make_shared<ScopedContainer>(nullptr, scope_, options());
    other.copy_registrations_to(*merged);
    copy_registrations_to(*merged);
    return merged;
}

std::shared_ptr<ScopedContainer> scoped(const Container& container,
                                        std::string scope) {
    if (container.is_destroyed()) {
        throw ContainerDestroyedError(
            "Cannot create a scope from a destroyed container");
    }

    auto result = ScopedContainer::create(std::move(scope), container.options());
    container.copy_registrations_to(*result);
    return result;
}

}  // namespace stratum::di
