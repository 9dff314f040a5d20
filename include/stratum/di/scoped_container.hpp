#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "stratum/di/container.hpp"

namespace stratum::di {

/**
 * @brief Container that is part of a parent/child scope hierarchy
 *
 * Lookups check this scope's own registrations first and delegate to the
 * parent only for tags this scope does not register, so a child shadows its
 * parent per tag. Instances live in the scope that registered them and are
 * shared with every descendant that delegates to it.
 *
 * A parent tracks its children weakly: it can destroy the ones still alive
 * without keeping any of them alive. Children hold their parent strongly
 * until they are destroyed.
 */
class ScopedContainer : public Container,
                        public std::enable_shared_from_this<ScopedContainer> {
public:
    ScopedContainer(std::shared_ptr<ScopedContainer> parent, std::string scope,
                    ContainerOptions options = {});
    ~ScopedContainer() override;

    /**
     * @brief Create a root scope
     */
    static std::shared_ptr<ScopedContainer> create(
        std::string scope, ContainerOptions options = {});

    template <typename... Args>
    ScopedContainer& add_factory(Args&&... args) {
        Container::add_factory(std::forward<Args>(args)...);
        return *this;
    }

    template <typename... Args>
    ScopedContainer& add_instance(Args&&... args) {
        Container::add_instance(std::forward<Args>(args)...);
        return *this;
    }

    const std::string& scope() const { return scope_; }
    std::shared_ptr<ScopedContainer> parent() const;

    /**
     * @brief Create a child scope delegating to this one
     * @throws ContainerDestroyedError if this scope has been destroyed
     */
    std::shared_ptr<ScopedContainer> child(std::string scope);

    // Children that have not been released by their owners
    std::size_t live_children() const;

    bool has(const TagKey& tag) const override;
    bool exists(const TagKey& tag) const override;

    /**
     * @brief Destroy live children, then this scope
     *
     * Children are destroyed concurrently and fully before this scope's
     * finalizers run. Failures from children and from this scope are
     * reported together. The parent link is dropped afterwards.
     *
     * @throws DependencyFinalizationError if anything failed
     */
    void destroy() override;

    /**
     * @brief New root scope with this scope's label and both registration
     * sets, this scope winning on collisions
     */
    std::shared_ptr<ScopedContainer> merge(const Container& other) const;

    std::string name() const override { return "scope '" + scope_ + "'"; }

protected:
    Instance resolve(const TagKey& tag, const ResolutionChain& chain) override;
    void check_can_register(const TagKey& tag) const override;

private:
    std::string scope_;
    mutable std::mutex family_mutex_;
    std::mutex teardown_mutex_;
    std::shared_ptr<ScopedContainer> parent_;
    std::vector<std::weak_ptr<ScopedContainer>> children_;
    bool closing_ = false;
};

/**
 * @brief Root scope with the registrations of a plain container
 *
 * The new scope has its own cache; no instance is shared with the source.
 */
std::shared_ptr<ScopedContainer> scoped(const Container& container,
                                        std::string scope);

}  // namespace stratum::di
