#include "stratum/di/container.hpp"

#include <algorithm>
#include <cstdint>

#include "stratum/log/logger.hpp"

namespace stratum::di {

namespace {

bool same_step(const ResolutionStep& a, const ResolutionStep& b) {
    return a.owner == b.owner && a.tag == b.tag;
}

bool on_chain(const std::vector<ResolutionStep>& steps,
              const ResolutionStep& step) {
    return std::any_of(steps.begin(), steps.end(),
                       [&step](const ResolutionStep& candidate) {
                           return same_step(candidate, step);
                       });
}

/**
 * @brief Creations blocked on a pending entry owned by another creation
 *
 * Shared by every container so that waits crossing scopes are seen too. A
 * caller blocking on a pending entry records an edge from each step of its
 * chain to the step that owns the entry, since none of those creations can
 * finish before that entry settles. A cycle exists when the owner of the
 * entry, following these edges, is waiting on a step of the caller's chain.
 */
class WaitGraph {
public:
    static WaitGraph& instance() {
        static WaitGraph graph;
        return graph;
    }

    // Records the wait and returns its ticket
    // @throws CircularDependencyError if the wait would close a cycle
    std::uint64_t enter(const ResolutionChain& chain,
                        const ResolutionStep& target) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<ResolutionStep> path;
        std::vector<ResolutionStep> visited;
        if (find_path(target, chain, path, visited)) {
            std::vector<TagKey> tags;
            tags.reserve(chain.size() + path.size());
            for (const auto& step : chain) {
                tags.push_back(step.tag);
            }
            for (std::size_t i = 0; i + 1 < path.size(); ++i) {
                tags.push_back(path[i].tag);
            }
            throw CircularDependencyError(path.back().tag, std::move(tags));
        }

        const std::uint64_t ticket = ++next_ticket_;
        for (const auto& step : chain) {
            edges_.push_back(Edge{ticket, step, target});
        }
        return ticket;
    }

    void leave(std::uint64_t ticket) {
        std::lock_guard<std::mutex> lock(mutex_);
        edges_.erase(std::remove_if(edges_.begin(), edges_.end(),
                                    [ticket](const Edge& edge) {
                                        return edge.ticket == ticket;
                                    }),
                     edges_.end());
    }

private:
    struct Edge {
        std::uint64_t ticket;
        ResolutionStep from;
        ResolutionStep to;
    };

    bool find_path(const ResolutionStep& from, const ResolutionChain& chain,
                   std::vector<ResolutionStep>& path,
                   std::vector<ResolutionStep>& visited) const {
        path.push_back(from);
        if (on_chain(chain, from)) {
            return true;
        }
        if (!on_chain(visited, from)) {
            visited.push_back(from);
            for (const auto& edge : edges_) {
                if (same_step(edge.from, from) &&
                    find_path(edge.to, chain, path, visited)) {
                    return true;
                }
            }
        }
        path.pop_back();
        return false;
    }

    std::mutex mutex_;
    std::vector<Edge> edges_;
    std::uint64_t next_ticket_ = 0;
};

class WaitGuard {
public:
    WaitGuard(const ResolutionChain& chain, const ResolutionStep& target)
        : ticket_(WaitGraph::instance().enter(chain, target)) {}
    ~WaitGuard() { WaitGraph::instance().leave(ticket_); }

    WaitGuard(const WaitGuard&) = delete;
    WaitGuard& operator=(const WaitGuard&) = delete;

private:
    std::uint64_t ticket_;
};

}  // namespace

ResolutionContext::ResolutionContext(Container& container,
                                     ResolutionChain chain)
    : container_(&container), chain_(std::move(chain)) {}

Instance ResolutionContext::resolve(const TagKey& tag) const {
    return container_->resolve(tag, chain_);
}

bool ResolutionContext::has(const TagKey& tag) const {
    return container_->has(tag);
}

bool ResolutionContext::exists(const TagKey& tag) const {
    return container_->exists(tag);
}

Container::Container(ContainerOptions options) : options_(options) {}

Container::~Container() = default;

Container& Container::add(const TagKey& tag, Registration registration) {
    check_can_register(tag);

    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        throw ContainerDestroyedError(
            "Cannot register dependencies on a destroyed container");
    }
    if (cache_.count(tag) != 0) {
        throw DependencyAlreadyInstantiatedError(tag);
    }
    registrations_[tag] = std::move(registration);
    return *this;
}

void Container::check_can_register(const TagKey&) const {}

bool Container::has(const TagKey& tag) const { return has_local(tag); }

bool Container::exists(const TagKey& tag) const { return exists_local(tag); }

bool Container::has_local(const TagKey& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.count(tag) != 0;
}

bool Container::exists_local(const TagKey& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.count(tag) != 0;
}

bool Container::is_destroyed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destroyed_;
}

std::size_t Container::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

std::vector<TagKey> Container::registered_tags() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TagKey> tags;
    tags.reserve(registrations_.size());
    for (const auto& [tag, registration] : registrations_) {
        tags.push_back(tag);
    }
    return tags;
}

Instance Container::resolve(const TagKey& tag, const ResolutionChain& chain) {
    return resolve_local(tag, chain);
}

Instance Container::resolve_local(const TagKey& tag,
                                  const ResolutionChain& chain) {
    auto in_chain = std::find_if(chain.begin(), chain.end(),
                                 [this, &tag](const ResolutionStep& step) {
                                     return step.owner == this &&
                                            step.tag == tag;
                                 });
    if (in_chain != chain.end()) {
        std::vector<TagKey> tags;
        tags.reserve(chain.size());
        for (const auto& step : chain) {
            tags.push_back(step.tag);
        }
        throw CircularDependencyError(tag, std::move(tags));
    }

    std::promise<Instance> promise;
    std::shared_future<Instance> pending;
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            throw ContainerDestroyedError(
                "Cannot resolve dependencies from a destroyed container");
        }

        auto cached = cache_.find(tag);
        if (cached != cache_.end()) {
            pending = cached->second;
        } else {
            auto registration = registrations_.find(tag);
            if (registration == registrations_.end()) {
                throw UnknownDependencyError(tag);
            }
            factory = registration->second.factory;
            pending = promise.get_future().share();
            cache_.emplace(tag, pending);
        }
    }

    if (factory) {
        create(tag, factory, chain, promise);
        return pending.get();
    }

    // Someone else's creation; a root caller owns nothing and cannot close
    // a cycle
    if (chain.empty() || pending.wait_for(std::chrono::seconds(0)) ==
                             std::future_status::ready) {
        return pending.get();
    }
    WaitGuard waiting(chain, ResolutionStep{this, tag});
    return pending.get();
}

void Container::create(const TagKey& tag, const Factory& factory,
                       const ResolutionChain& chain,
                       std::promise<Instance>& promise) {
    ResolutionChain next = chain;
    next.push_back(ResolutionStep{this, tag});
    ResolutionContext context(*this, std::move(next));

    const auto started = std::chrono::steady_clock::now();
    try {
        Instance instance = factory(context);

        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
        if (options_.slow_creation_warning.count() > 0 &&
            elapsed >= options_.slow_creation_warning) {
            STRATUM_LOG_WARN << "Creating " << tag.label() << " in " << name()
                             << " took " << elapsed.count() << "ms";
        }
        if (options_.log_resolutions) {
            STRATUM_LOG_DEBUG << "Created " << tag.label() << " in "
                              << name();
        }

        promise.set_value(std::move(instance));
    } catch (const UnknownDependencyError&) {
        promise.set_exception(std::current_exception());
    } catch (const CircularDependencyError&) {
        promise.set_exception(std::current_exception());
    } catch (const ContainerDestroyedError&) {
        promise.set_exception(std::current_exception());
    } catch (const DependencyContainerError&) {
        promise.set_exception(std::make_exception_ptr(
            DependencyCreationError(tag, std::current_exception())));
    } catch (const std::exception& e) {
        STRATUM_LOG_ERROR << "Factory for " << tag.label() << " in " << name()
                          << " failed: " << e.what();
        promise.set_exception(std::make_exception_ptr(
            DependencyCreationError(tag, std::current_exception())));
    } catch (...) {
        STRATUM_LOG_ERROR << "Factory for " << tag.label() << " in " << name()
                          << " failed with a non-standard exception";
        promise.set_exception(std::make_exception_ptr(
            DependencyCreationError(tag, std::current_exception())));
    }
}

void Container::destroy() {
    struct Target {
        TagKey tag;
        std::shared_future<Instance> pending;
        Finalizer finalizer;
    };

    std::lock_guard<std::mutex> teardown(teardown_mutex_);

    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return;
        }
        destroyed_ = true;

        for (const auto& [tag, pending] : cache_) {
            auto registration = registrations_.find(tag);
            if (registration != registrations_.end() &&
                registration->second.finalizer) {
                targets.push_back(
                    Target{tag, pending, registration->second.finalizer});
            }
        }
    }

    std::vector<std::future<void>> runs;
    runs.reserve(targets.size());
    for (auto& target : targets) {
        runs.push_back(std::async(std::launch::async, [target]() {
            Instance instance;
            try {
                instance = target.pending.get();
            } catch (const std::exception&) {
                // Creation failed; its error already went to the caller of
                // get()
                return;
            }
            target.finalizer(instance);
        }));
    }

    std::vector<std::exception_ptr> failures;
    for (std::size_t i = 0; i < runs.size(); ++i) {
        try {
            runs[i].get();
        } catch (...) {
            STRATUM_LOG_WARN << "Finalizer for " << targets[i].tag.label()
                             << " in " << name() << " failed: "
                             << describe_exception(std::current_exception());
            failures.push_back(std::current_exception());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.clear();
    }

    STRATUM_LOG_DEBUG << "Destroyed " << name() << " (" << targets.size()
                      << " finalizer(s), " << failures.size()
                      << " failure(s))";

    if (!failures.empty()) {
        throw DependencyFinalizationError(std::move(failures));
    }
}

void Container::copy_registrations_to(Container& target) const {
    std::vector<std::pair<TagKey, Registration>> copied;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copied.assign(registrations_.begin(), registrations_.end());
    }

    std::lock_guard<std::mutex> lock(target.mutex_);
    for (auto& [tag, registration] : copied) {
        target.registrations_[tag] = std::move(registration);
    }
}

std::unique_ptr<Container> Container::merge(const Container& other) const {
    if (is_destroyed() || other.is_destroyed()) {
        throw ContainerDestroyedError(
            "Cannot merge from a destroyed container");
    }

    auto merged = std::make_unique<Container>(options_);
    other.copy_registrations_to(*merged);
    copy_registrations_to(*merged);
    return merged;
}

}  // namespace stratum::di
