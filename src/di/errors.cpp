#include "stratum/di/errors.hpp"

#include <algorithm>

namespace stratum::di {

namespace {

std::vector<std::string> labels_of(const std::vector<TagKey>& keys) {
    std::vector<std::string> labels;
    labels.reserve(keys.size());
    for (const auto& key : keys) {
        labels.push_back(key.label());
    }
    return labels;
}

nlohmann::json dump_all(const std::vector<std::exception_ptr>& errors) {
    auto dumped = nlohmann::json::array();
    for (const auto& error : errors) {
        dumped.push_back(dump_exception(error));
    }
    return dumped;
}

std::string describe_all(const std::vector<std::exception_ptr>& errors) {
    std::string result;
    for (const auto& error : errors) {
        if (!result.empty()) {
            result += "; ";
        }
        result += describe_exception(error);
    }
    return result;
}

std::vector<std::string> sorted_labels(const TagKeySet& tags) {
    std::vector<std::string> labels;
    labels.reserve(tags.size());
    for (const auto& tag : tags) {
        labels.push_back(tag.label());
    }
    std::sort(labels.begin(), labels.end());
    return labels;
}

}  // namespace

DependencyContainerError::DependencyContainerError(const std::string& message,
                                                   nlohmann::json detail)
    : std::runtime_error(message), detail_(std::move(detail)) {}

nlohmann::json DependencyContainerError::dump() const {
    return nlohmann::json{
        {"name", name()}, {"message", what()}, {"detail", detail_}};
}

UnknownDependencyError::UnknownDependencyError(const TagKey& tag)
    : DependencyContainerError(
          "No factory registered for dependency " + tag.label(),
          nlohmann::json{{"tag", tag.label()}}),
      tag_(tag) {}

CircularDependencyError::CircularDependencyError(const TagKey& tag,
                                                 std::vector<TagKey> chain)
    : DependencyContainerError(
          "Circular dependency detected for " + tag.label() + ": " +
              describe_chain(chain) + " -> " + tag.label(),
          nlohmann::json{{"tag", tag.label()},
                         {"dependency_chain", labels_of(chain)}}),
      tag_(tag),
      chain_(std::move(chain)) {}

std::vector<std::string> CircularDependencyError::chain_labels() const {
    return labels_of(chain_);
}

DependencyCreationError::DependencyCreationError(const TagKey& tag,
                                                 std::exception_ptr cause)
    : DependencyContainerError(
          "Error creating instance of " + tag.label() + ": " +
              describe_exception(cause),
          nlohmann::json{{"tag", tag.label()},
                         {"cause", dump_exception(cause)}}),
      tag_(tag),
      cause_(std::move(cause)) {}

ContainerDestroyedError::ContainerDestroyedError(const std::string& message)
    : DependencyContainerError(message) {}

DependencyAlreadyInstantiatedError::DependencyAlreadyInstantiatedError(
    const TagKey& tag)
    : DependencyContainerError(
          "Cannot register dependency " + tag.label() +
              " - it has already been instantiated",
          nlohmann::json{{"tag", tag.label()}}),
      tag_(tag) {}

DependencyFinalizationError::DependencyFinalizationError(
    std::vector<std::exception_ptr> errors)
    : DependencyContainerError(
          "Error destroying dependency container: " +
              std::to_string(errors.size()) + " failure(s): " +
              describe_all(errors),
          nlohmann::json{{"errors", dump_all(errors)}}),
      errors_(std::move(errors)) {}

LayerContractError::LayerContractError(const std::string& message,
                                       const TagKeySet& tags)
    : DependencyContainerError(message + ": " + describe(tags),
                               nlohmann::json{{"tags", sorted_labels(tags)}}),
      tags_(sorted_labels(tags)) {}

std::string describe_exception(std::exception_ptr error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

nlohmann::json dump_exception(std::exception_ptr error) {
    if (!error) {
        return nullptr;
    }
    try {
        std::rethrow_exception(error);
    } catch (const DependencyContainerError& e) {
        return e.dump();
    } catch (const std::exception& e) {
        return nlohmann::json{{"message", e.what()}};
    } catch (...) {
        return nlohmann::json{{"message", "non-standard exception"}};
    }
}

}  // namespace stratum::di
