#include "stratum/di/layer.hpp"

#include "stratum/log/logger.hpp"

namespace stratum::di {

namespace {

TagKeySet unite(const TagKeySet& a, const TagKeySet& b) {
    TagKeySet result = a;
    result.insert(b.begin(), b.end());
    return result;
}

TagKeySet subtract(const TagKeySet& a, const TagKeySet& b) {
    TagKeySet result;
    for (const auto& tag : a) {
        if (b.count(tag) == 0) {
            result.insert(tag);
        }
    }
    return result;
}

}  // namespace

Layer::Layer(TagKeySet requirements, TagKeySet provisions, ApplyFn apply)
    : requirements_(std::move(requirements)),
      provisions_(std::move(provisions)),
      apply_(std::make_shared<const ApplyFn>(std::move(apply))) {}

Layer Layer::empty() { return Layer({}, {}, [](Container&) {}); }

Container& Layer::apply(Container& container) const {
    TagKeySet missing;
    for (const auto& tag : requirements_) {
        if (!container.has(tag)) {
            missing.insert(tag);
        }
    }
    if (!missing.empty()) {
        throw LayerContractError("Layer requirements not satisfied", missing);
    }

    (*apply_)(container);

    TagKeySet undelivered;
    for (const auto& tag : provisions_) {
        if (!container.has(tag)) {
            undelivered.insert(tag);
        }
    }
    if (!undelivered.empty()) {
        throw LayerContractError("Layer did not register declared provisions",
                                 undelivered);
    }
    return container;
}

Layer Layer::merge(const Layer& other) const {
    auto first = apply_;
    auto second = other.apply_;
    return Layer(unite(requirements_, other.requirements_),
                 unite(provisions_, other.provisions_),
                 [first, second](Container& container) {
                     (*first)(container);
                     (*second)(container);
                 });
}

Layer Layer::provide(const Layer& source) const {
    Layer target = *this;
    return Layer(unite(source.requirements_,
                       subtract(requirements_, source.provisions_)),
                 provisions_, [source, target](Container& container) {
                     source.apply(container);
                     target.apply(container);
                 });
}

Layer Layer::provide_merge(const Layer& source) const {
    Layer sequenced = provide(source);
    return Layer(sequenced.requirements_,
                 unite(provisions_, source.provisions_),
                 *sequenced.apply_);
}

Layer Layer::to(const Layer& target) const {
    return target.provide_merge(*this);
}

std::unique_ptr<Container> Layer::build(ContainerOptions options) const {
    if (!is_complete()) {
        throw LayerContractError(
            "Cannot build a container from a layer with open requirements",
            requirements_);
    }

    auto container = std::make_unique<Container>(options);
    apply(*container);
    const auto registered = container->registered_tags();
    STRATUM_LOG_DEBUG << "Built container with " << registered.size()
                      << " registration(s): "
                      << describe(TagKeySet(registered.begin(),
                                            registered.end()));
    return container;
}

Layer layer(TagKeySet requirements, TagKeySet provisions,
            Layer::ApplyFn apply) {
    return Layer(std::move(requirements), std::move(provisions),
                 std::move(apply));
}

}  // namespace stratum::di
