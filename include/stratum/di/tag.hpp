#pragma once

#include <boost/core/demangle.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <typeinfo>
#include <unordered_set>
#include <vector>

namespace stratum::di {

/**
 * @brief Runtime identity of a dependency slot
 *
 * Two keys are equal only when they share the same identity token. The label
 * is informational and is never compared: keys created separately with the
 * same label are different keys.
 */
class TagKey {
public:
    /**
     * @brief Create a key with a fresh identity
     * @param label Human-readable label used in diagnostics
     */
    static TagKey make(std::string label);

    /**
     * @brief Create a key with a fresh identity and a generated label
     */
    static TagKey make_anonymous();

    const std::string& label() const { return identity_->label; }

    std::size_t hash() const {
        return std::hash<const void*>{}(identity_.get());
    }

    bool operator==(const TagKey& other) const {
        return identity_ == other.identity_;
    }
    bool operator!=(const TagKey& other) const { return !(*this == other); }

private:
    struct Identity {
        std::string label;
    };

    explicit TagKey(std::shared_ptr<const Identity> identity)
        : identity_(std::move(identity)) {}

    std::shared_ptr<const Identity> identity_;
};

}  // namespace stratum::di

namespace std {

template <>
struct hash<stratum::di::TagKey> {
    size_t operator()(const stratum::di::TagKey& key) const noexcept {
        return key.hash();
    }
};

}  // namespace std

namespace stratum::di {

using TagKeySet = std::unordered_set<TagKey>;

// Labels sorted and joined with ", "
std::string describe(const TagKeySet& keys);

// Labels in order joined with " -> "
std::string describe_chain(const std::vector<TagKey>& keys);

/**
 * @brief Typed handle for a dependency slot
 *
 * The value type is only enforced at the call sites that register and
 * resolve through the tag; containers store and look up the underlying
 * TagKey. Copies of a tag share its identity.
 *
 * @tparam T Type of the value identified by the tag
 */
template <typename T>
class Tag {
public:
    using value_type = T;

    /**
     * @brief Create a value tag with a fresh identity
     */
    static Tag of(std::string label) {
        return Tag(TagKey::make(std::move(label)));
    }

    /**
     * @brief Create a value tag whose label is generated
     */
    static Tag anonymous() { return Tag(TagKey::make_anonymous()); }

    const TagKey& key() const { return key_; }
    const std::string& label() const { return key_.label(); }

    operator const TagKey&() const { return key_; }

    bool operator==(const Tag& other) const { return key_ == other.key_; }
    bool operator!=(const Tag& other) const { return key_ != other.key_; }

private:
    explicit Tag(TagKey key) : key_(std::move(key)) {}

    TagKey key_;
};

namespace detail {

template <typename T>
std::string service_tag_label() {
    if constexpr (requires { T::tag_name; }) {
        return std::string(T::tag_name);
    } else {
        return boost::core::demangle(typeid(T).name());
    }
}

}  // namespace detail

/**
 * @brief Process-wide tag identifying the service type T
 *
 * The label is T::tag_name when the type declares one, otherwise the
 * demangled type name.
 */
template <typename T>
const Tag<T>& service_tag() {
    static const Tag<T> tag = Tag<T>::of(detail::service_tag_label<T>());
    return tag;
}

}  // namespace stratum::di
