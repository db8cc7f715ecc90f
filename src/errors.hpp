#pragma once

/**
 * Exception types crossing the bundle and converter boundaries.
 */

#include <stdexcept>
#include <string>

namespace x5 {

/**
 * Archive or structural problem with a creative bundle.
 */
class BundleError : public std::runtime_error {
public:
    explicit BundleError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A tool-specific converter could not find a marker it depends on.
 */
class ConverterError : public std::runtime_error {
public:
    explicit ConverterError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Invalid request metadata, or a bundle failure seen through the transform.
 */
class TransformError : public std::runtime_error {
public:
    explicit TransformError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace x5
