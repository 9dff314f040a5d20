#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "stratum/di/container.hpp"
#include "stratum/di/layer.hpp"
#include "stratum/di/tag.hpp"

namespace stratum::di {

/**
 * @brief Layer providing one tag from a factory
 *
 * The factory accepts the same shapes as Container::add_factory. The listed
 * dependencies become the layer's requirements; the factory is expected to
 * resolve them through its ResolutionContext.
 */
template <typename T, typename F>
Layer service(const Tag<T>& tag, TagKeySet dependencies, F factory) {
    return Layer(std::move(dependencies), TagKeySet{tag.key()},
                 [tag, factory](Container& container) {
                     container.add_factory(tag, factory);
                 });
}

template <typename T, typename F, typename Fin>
Layer service(const Tag<T>& tag, TagKeySet dependencies, F factory,
              Fin finalizer) {
    return Layer(std::move(dependencies), TagKeySet{tag.key()},
                 [tag, factory, finalizer](Container& container) {
                     container.add_factory(tag, factory, finalizer);
                 });
}

/**
 * @brief Layer constructing T from its dependencies in declaration order
 *
 * Equivalent to a service whose factory resolves each dependency tag and
 * passes the instances to T's constructor as std::shared_ptr arguments.
 */
template <typename T, typename... Deps>
Layer auto_service(const Tag<T>& tag, const Tag<Deps>&... dependencies) {
    return service(tag, TagKeySet{dependencies.key()...},
                   [dependencies...](const ResolutionContext& context) {
                       return std::make_shared<T>(context.get(dependencies)...);
                   });
}

// Layer providing a constant
template <typename T>
Layer value(const Tag<T>& tag, std::type_identity_t<T> constant) {
    auto instance = std::make_shared<T>(std::move(constant));
    return Layer(TagKeySet{}, TagKeySet{tag.key()},
                 [tag, instance](Container& container) {
                     container.add_instance(tag, instance);
                 });
}

}  // namespace stratum::di
