#pragma once

#include <exception>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "stratum/di/tag.hpp"

namespace stratum::di {

/**
 * @brief Base class for every failure raised by the container engine
 *
 * Besides the message, each error carries a structured detail object that
 * callers can log or return as-is.
 */
class DependencyContainerError : public std::runtime_error {
public:
    explicit DependencyContainerError(
        const std::string& message,
        nlohmann::json detail = nlohmann::json::object());

    const nlohmann::json& detail() const noexcept { return detail_; }

    virtual const char* name() const noexcept {
        return "DependencyContainerError";
    }

    /**
     * @brief Name, message and detail as one JSON object
     */
    nlohmann::json dump() const;

private:
    nlohmann::json detail_;
};

/**
 * @brief No factory is registered for the requested tag
 */
class UnknownDependencyError : public DependencyContainerError {
public:
    explicit UnknownDependencyError(const TagKey& tag);

    const TagKey& tag() const noexcept { return tag_; }
    const char* name() const noexcept override {
        return "UnknownDependencyError";
    }

private:
    TagKey tag_;
};

/**
 * @brief A tag was requested again while it was being created
 *
 * chain() lists the tags under creation on the offending path, outermost
 * first; tag() is the tag that closed the cycle.
 */
class CircularDependencyError : public DependencyContainerError {
public:
    CircularDependencyError(const TagKey& tag, std::vector<TagKey> chain);

    const TagKey& tag() const noexcept { return tag_; }
    const std::vector<TagKey>& chain() const noexcept { return chain_; }
    std::vector<std::string> chain_labels() const;

    const char* name() const noexcept override {
        return "CircularDependencyError";
    }

private:
    TagKey tag_;
    std::vector<TagKey> chain_;
};

/**
 * @brief A factory failed; the original failure is kept as cause()
 */
class DependencyCreationError : public DependencyContainerError {
public:
    DependencyCreationError(const TagKey& tag, std::exception_ptr cause);

    const TagKey& tag() const noexcept { return tag_; }
    std::exception_ptr cause() const noexcept { return cause_; }

    const char* name() const noexcept override {
        return "DependencyCreationError";
    }

private:
    TagKey tag_;
    std::exception_ptr cause_;
};

class ContainerDestroyedError : public DependencyContainerError {
public:
    explicit ContainerDestroyedError(const std::string& message);

    const char* name() const noexcept override {
        return "ContainerDestroyedError";
    }
};

/**
 * @brief Registration refused because the tag already has an instance
 */
class DependencyAlreadyInstantiatedError : public DependencyContainerError {
public:
    explicit DependencyAlreadyInstantiatedError(const TagKey& tag);

    const TagKey& tag() const noexcept { return tag_; }
    const char* name() const noexcept override {
        return "DependencyAlreadyInstantiatedError";
    }

private:
    TagKey tag_;
};

/**
 * @brief One or more finalizers (or child scopes) failed during destroy
 *
 * Every failure of the destroy call is kept, in no particular order.
 */
class DependencyFinalizationError : public DependencyContainerError {
public:
    explicit DependencyFinalizationError(
        std::vector<std::exception_ptr> errors);

    const std::vector<std::exception_ptr>& errors() const noexcept {
        return errors_;
    }

    const char* name() const noexcept override {
        return "DependencyFinalizationError";
    }

private:
    std::vector<std::exception_ptr> errors_;
};

/**
 * @brief A layer's declared manifest does not match the container
 */
class LayerContractError : public DependencyContainerError {
public:
    LayerContractError(const std::string& message, const TagKeySet& tags);

    const std::vector<std::string>& tags() const noexcept { return tags_; }

    const char* name() const noexcept override { return "LayerContractError"; }

private:
    std::vector<std::string> tags_;
};

// what() of the stored exception, or a placeholder for non-standard ones
std::string describe_exception(std::exception_ptr error);

// dump() for container errors, {"message": what()} for anything else
nlohmann::json dump_exception(std::exception_ptr error);

}  // namespace stratum::di
