#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "stratum/di/container.hpp"
#include "stratum/di/tag.hpp"

namespace stratum::di {

/**
 * @brief Reusable, composable set of registrations
 *
 * A layer declares which tags it requires from the container it is applied
 * to and which tags it provides. apply() checks both sides of that manifest:
 * missing requirements are reported before anything is registered, and
 * declared provisions that were not registered are reported afterwards.
 *
 * Layers are immutable; every composition returns a new layer and leaves its
 * operands untouched.
 */
class Layer {
public:
    using ApplyFn = std::function<void(Container&)>;

    Layer(TagKeySet requirements, TagKeySet provisions, ApplyFn apply);

    // Requires and provides nothing; apply() returns the container unchanged
    static Layer empty();

    /**
     * @brief Merge any number of layers
     *
     * Operands are applied in order to the same container; requirements and
     * provisions are the unions of the operands'. When two operands provide
     * the same tag the later one wins.
     */
    template <typename... Rest>
    static Layer merge_all(const Layer& first, const Rest&... rest) {
        Layer result = first;
        ((result = result.merge(rest)), ...);
        return result;
    }

    /**
     * @brief Register this layer's provisions into a container
     * @throws LayerContractError if a requirement is missing or a declared
     * provision was not registered
     */
    Container& apply(Container& container) const;

    Layer merge(const Layer& other) const;

    /**
     * @brief Feed source's provisions into this layer
     *
     * Requirements become source's plus whatever this layer still needs
     * beyond what source provides. Only this layer's provisions are
     * declared, although source's registrations are applied as well.
     */
    Layer provide(const Layer& source) const;

    // Like provide(), declaring the provisions of both layers
    Layer provide_merge(const Layer& source) const;

    // Source-side spelling of target.provide_merge(*this)
    Layer to(const Layer& target) const;

    const TagKeySet& requirements() const { return requirements_; }
    const TagKeySet& provisions() const { return provisions_; }

    bool requires_tag(const TagKey& tag) const {
        return requirements_.count(tag) != 0;
    }
    bool provides_tag(const TagKey& tag) const {
        return provisions_.count(tag) != 0;
    }

    // Nothing left to satisfy from outside
    bool is_complete() const { return requirements_.empty(); }

    /**
     * @brief Apply a complete layer to a fresh container
     * @throws LayerContractError if requirements remain
     */
    std::unique_ptr<Container> build(ContainerOptions options = {}) const;

private:
    TagKeySet requirements_;
    TagKeySet provisions_;
    std::shared_ptr<const ApplyFn> apply_;
};

/**
 * @brief Wrap a raw registration function with its manifest
 */
Layer layer(TagKeySet requirements, TagKeySet provisions, Layer::ApplyFn apply);

template <typename... Rest>
Layer merge(const Layer& first, const Layer& second, const Rest&... rest) {
    return Layer::merge_all(first, second, rest...);
}

}  // namespace stratum::di
