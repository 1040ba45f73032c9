#pragma once

/**
 * @file errors.h
 * @brief Exception hierarchy for the scenex model and synchronization engine
 *
 * Only ValidationError, StructuralError, AdaptorNotFoundError and
 * SerializationError reach code that mutates or queries the model.
 * Backend failures raised inside an adaptor setter are converted into
 * SetterStatus values by the dispatcher and never escape a model mutation.
 */

#include <stdexcept>
#include <string>

namespace scenex {

/// Base class of every scenex exception
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// A field value was rejected before it was applied; the model is unchanged
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

/// A tree query or mutation is impossible (no common ancestor, cycle, ...)
class StructuralError : public Error {
public:
    explicit StructuralError(const std::string& message) : Error(message) {}
};

/// Transform::inverse() was called on a non-invertible matrix
class SingularTransformError : public StructuralError {
public:
    explicit SingularTransformError(const std::string& message) : StructuralError(message) {}
};

/// AdaptorRegistry lookup with create=false found nothing
class AdaptorNotFoundError : public Error {
public:
    explicit AdaptorNotFoundError(const std::string& message) : Error(message) {}
};

/// The backend cannot honor a field or has no adaptor for a model kind
class UnsupportedCapabilityError : public Error {
public:
    explicit UnsupportedCapabilityError(const std::string& message) : Error(message) {}
};

/// One or more adaptor setters failed while applying model state
class BackendSyncError : public Error {
public:
    explicit BackendSyncError(const std::string& message) : Error(message) {}
};

/// A JSON document could not be turned into model objects
class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& message) : Error(message) {}
};

} // namespace scenex
