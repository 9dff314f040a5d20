#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stratum/di/errors.hpp"
#include "stratum/di/tag.hpp"

namespace stratum::di {

class Container;

using Instance = std::shared_ptr<void>;

/**
 * @brief Tuning knobs shared by a container and the scopes derived from it
 */
struct ContainerOptions {
    // Creations slower than this are logged as warnings; zero disables
    std::chrono::milliseconds slow_creation_warning{0};
    // Log every successful creation at debug level
    bool log_resolutions = false;
};

/**
 * @brief A tag being created by a specific container
 */
struct ResolutionStep {
    const Container* owner;
    TagKey tag;
};

using ResolutionChain = std::vector<ResolutionStep>;

/**
 * @brief Handle passed to factories for resolving their own dependencies
 *
 * A context resolves through the container that owns the running factory and
 * carries the chain of tags under creation on the current path, which is
 * how cycles are detected. Contexts are cheap to copy and may be captured by
 * asynchronous work the factory starts; the container must outlive them.
 */
class ResolutionContext {
public:
    ResolutionContext(Container& container, ResolutionChain chain);

    template <typename T>
    std::shared_ptr<T> get(const Tag<T>& tag) const {
        return std::static_pointer_cast<T>(resolve(tag.key()));
    }

    template <typename T>
    std::future<std::shared_ptr<T>> get_async(const Tag<T>& tag) const {
        return std::async(std::launch::async, [context = *this, tag]() {
            return context.get(tag);
        });
    }

    bool has(const TagKey& tag) const;
    bool exists(const TagKey& tag) const;

    Container& container() const { return *container_; }
    const ResolutionChain& chain() const { return chain_; }

private:
    Instance resolve(const TagKey& tag) const;

    Container* container_;
    ResolutionChain chain_;
};

using Factory = std::function<Instance(const ResolutionContext&)>;
using Finalizer = std::function<void(const Instance&)>;

/**
 * @brief Factory and optional finalizer held for one tag
 */
struct Registration {
    Factory factory;
    Finalizer finalizer;
};

namespace detail {

template <typename T>
struct is_future : std::false_type {};
template <typename T>
struct is_future<std::future<T>> : std::true_type {};
template <typename T>
struct is_future<std::shared_future<T>> : std::true_type {};

template <typename T, typename R>
std::shared_ptr<T> to_instance(R result) {
    if constexpr (std::is_convertible_v<R, std::shared_ptr<T>>) {
        return std::shared_ptr<T>(std::move(result));
    } else {
        return std::make_shared<T>(std::move(result));
    }
}

template <typename F>
decltype(auto) invoke_factory(const F& factory,
                              const ResolutionContext& context) {
    if constexpr (std::is_invocable_v<const F&, const ResolutionContext&>) {
        return factory(context);
    } else {
        return factory();
    }
}

// Accepts factories with or without a context parameter, returning a value,
// a shared_ptr or a future of either.
template <typename T, typename F>
Factory make_factory(F factory) {
    return [factory = std::move(factory)](
               const ResolutionContext& context) -> Instance {
        auto result = invoke_factory(factory, context);
        if constexpr (is_future<decltype(result)>::value) {
            return to_instance<T>(result.get());
        } else {
            return to_instance<T>(std::move(result));
        }
    };
}

template <typename T, typename F>
Finalizer make_finalizer(F finalizer) {
    return [finalizer = std::move(finalizer)](const Instance& instance) {
        auto typed = std::static_pointer_cast<T>(instance);
        if constexpr (std::is_invocable_v<const F&,
                                          const std::shared_ptr<T>&>) {
            if constexpr (is_future<std::invoke_result_t<
                              const F&, const std::shared_ptr<T>&>>::value) {
                finalizer(typed).get();
            } else {
                finalizer(typed);
            }
        } else {
            if constexpr (is_future<std::invoke_result_t<const F&, T&>>::value) {
                finalizer(*typed).get();
            } else {
                finalizer(*typed);
            }
        }
    };
}

}  // namespace detail

/**
 * @brief Dependency injection container
 *
 * Maps tags to factories and caches one instance per tag. A factory runs at
 * most once: the pending entry is installed before the factory is invoked,
 * so concurrent callers wait on the same creation. A failed creation stays
 * cached, and every later get() rethrows the same error.
 *
 * After destroy() the container keeps its registrations but refuses any
 * further registration, resolution or merge.
 */
class Container {
public:
    explicit Container(ContainerOptions options = {});
    virtual ~Container();

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    /**
     * @brief Register a factory for a tag
     *
     * The factory may take a const ResolutionContext& or nothing, and may
     * return a std::shared_ptr<T>, a T, or a std::future of either.
     *
     * @throws ContainerDestroyedError if the container has been destroyed
     * @throws DependencyAlreadyInstantiatedError if a creation of the tag was
     * already started, even a failed one
     */
    template <typename T, typename F>
    Container& add_factory(const Tag<T>& tag, F factory) {
        return add(tag.key(),
                   Registration{detail::make_factory<T>(std::move(factory)),
                                Finalizer{}});
    }

    /**
     * @brief Register a factory and a finalizer run by destroy()
     *
     * The finalizer may take the instance as std::shared_ptr<T> or T&, and
     * may return void or std::future<void>.
     */
    template <typename T, typename F, typename Fin>
    Container& add_factory(const Tag<T>& tag, F factory, Fin finalizer) {
        return add(tag.key(),
                   Registration{detail::make_factory<T>(std::move(factory)),
                                detail::make_finalizer<T>(
                                    std::move(finalizer))});
    }

    /**
     * @brief Register an already constructed instance
     */
    template <typename T>
    Container& add_instance(const Tag<T>& tag, std::shared_ptr<T> instance) {
        return add(tag.key(),
                   Registration{[instance = std::move(instance)](
                                    const ResolutionContext&) -> Instance {
                                    return instance;
                                },
                                Finalizer{}});
    }

    Container& add(const TagKey& tag, Registration registration);

    // A registration exists; never triggers creation
    virtual bool has(const TagKey& tag) const;

    // A creation was started, whether pending, ready or failed; never
    // triggers creation
    virtual bool exists(const TagKey& tag) const;

    /**
     * @brief Resolve an instance, creating it on first use
     *
     * Blocks while another caller's creation of the same tag is in flight,
     * unless that creation is itself waiting on this path.
     *
     * @throws UnknownDependencyError if no factory is registered
     * @throws CircularDependencyError if the tag is already being created on
     * this path, or waiting for it would close a cycle with another thread
     * @throws DependencyCreationError if the factory failed
     * @throws ContainerDestroyedError if the container has been destroyed
     */
    template <typename T>
    std::shared_ptr<T> get(const Tag<T>& tag) {
        return std::static_pointer_cast<T>(resolve(tag.key(), {}));
    }

    template <typename T>
    std::future<std::shared_ptr<T>> get_async(const Tag<T>& tag) {
        return std::async(std::launch::async,
                          [this, tag]() { return get(tag); });
    }

    /**
     * @brief Resolve several tags concurrently
     * @return The instances in argument order
     */
    template <typename... Ts>
    std::tuple<std::shared_ptr<Ts>...> resolve_all(const Tag<Ts>&... tags) {
        auto pending = std::make_tuple(get_async(tags)...);
        return std::apply(
            [](auto&... futures) {
                return std::tuple<std::shared_ptr<Ts>...>(futures.get()...);
            },
            pending);
    }

    /**
     * @brief Run finalizers of created instances and retire the container
     *
     * Finalizers run concurrently; every failure is collected and reported
     * once all of them have finished. Idempotent; a concurrent second call
     * returns once the first teardown has completed.
     *
     * @throws DependencyFinalizationError if any finalizer failed
     */
    virtual void destroy();

    /**
     * @brief New container with the registrations of both containers
     *
     * On collisions this container's registration wins. Instances are not
     * shared with either source.
     *
     * @throws ContainerDestroyedError if either container has been destroyed
     */
    std::unique_ptr<Container> merge(const Container& other) const;

    // Overlays this container's registrations onto target; no instances
    void copy_registrations_to(Container& target) const;

    bool is_destroyed() const;
    std::size_t size() const;
    std::vector<TagKey> registered_tags() const;
    const ContainerOptions& options() const { return options_; }

    // Used in log lines
    virtual std::string name() const { return "container"; }

protected:
    friend class ResolutionContext;

    virtual Instance resolve(const TagKey& tag, const ResolutionChain& chain);

    // Resolution against this container's own registrations and cache
    Instance resolve_local(const TagKey& tag, const ResolutionChain& chain);

    bool has_local(const TagKey& tag) const;
    bool exists_local(const TagKey& tag) const;

    // Called before a registration is stored
    virtual void check_can_register(const TagKey& tag) const;

private:
    void create(const TagKey& tag, const Factory& factory,
                const ResolutionChain& chain,
                std::promise<Instance>& promise);

    ContainerOptions options_;
    mutable std::mutex mutex_;
    // Held for a whole destroy()
    std::mutex teardown_mutex_;
    std::unordered_map<TagKey, Registration> registrations_;
    std::unordered_map<TagKey, std::shared_future<Instance>> cache_;
    bool destroyed_ = false;
};

/**
 * @brief Create an empty container
 */
inline std::unique_ptr<Container> create_container(
    ContainerOptions options = {}) {
    return std::make_unique<Container>(options);
}

}  // namespace stratum::di
