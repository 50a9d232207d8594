/**
 * oino/errors.hpp - Exception types
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * Construction-time errors (SchemaParseError, CryptoConfigError) escape
 * from factory functions. Everything raised while serving a request is
 * caught by QueryEngine and turned into an ApiResult.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace oino {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// Schema
// ============================================================================

/// Table description could not be matched at all. The resource cannot start.
class SchemaParseError : public Error {
public:
    using Error::Error;
};

/// A single column or constraint was not understood. Logged and skipped.
class UnsupportedFieldDefinition : public Error {
public:
    using Error::Error;
};

// ============================================================================
// Client input
// ============================================================================

/// Base for errors that point at a piece of client input.
class InputError : public Error {
public:
    InputError(const std::string& message, const std::string& fragment)
        : Error(fragment.empty() ? message : message + ": " + fragment),
          fragment_(fragment) {}

    const std::string& fragment() const { return fragment_; }

private:
    std::string fragment_;
};

class FilterSyntaxError : public InputError {
public:
    using InputError::InputError;
};

class UnknownFieldError : public InputError {
public:
    explicit UnknownFieldError(const std::string& field)
        : InputError("Unknown field", field) {}
};

class SerializationError : public InputError {
public:
    using InputError::InputError;
};

class InvalidIdError : public InputError {
public:
    using InputError::InputError;
};

class UnsupportedMediaTypeError : public InputError {
public:
    UnsupportedMediaTypeError(const std::string& content_type, bool for_response)
        : InputError(for_response ? "Not acceptable" : "Unsupported media type", content_type),
          for_response_(for_response) {}

    /// True when the caller asked for a response type we cannot produce.
    bool for_response() const { return for_response_; }

private:
    bool for_response_;
};

// ============================================================================
// Crypto
// ============================================================================

class CryptoConfigError : public Error {
public:
    using Error::Error;
};

/// Authentication failure while decoding an id token.
class CryptoIntegrityError : public Error {
public:
    using Error::Error;
};

// ============================================================================
// Data source
// ============================================================================

class DataSourceError : public Error {
public:
    using Error::Error;
};

} // namespace oino
