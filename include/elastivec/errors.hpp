/**
 * @file errors.hpp
 * @brief Exception hierarchy for the Elastivec connector
 *
 * Structural errors (schema, types, filters, configuration) are thrown
 * synchronously and indicate a programming error in the caller's model or
 * filter. Backing-store failures are reported by clients as TransportError
 * and wrapped by the collection layer into StorageOperationError.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace elastivec {

/**
 * Base class of every error raised by the connector.
 */
class VectorStoreError : public std::runtime_error {
public:
    explicit VectorStoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Malformed or ambiguous collection model (zero/multiple keys, duplicate
 * storage names, unknown property referenced by name).
 */
class SchemaError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * A key, data or vector property has a type outside the supported set.
 */
class UnsupportedTypeError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * A vector index kind or distance function has no backing-store equivalent.
 */
class UnsupportedConfigurationError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * A filter expression node or shape that cannot be translated.
 */
class UnsupportedExpressionError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * A filter casts a bound property to an incompatible type.
 */
class TypeMismatchError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * A search needs "the one" vector or text property but zero or several exist.
 */
class AmbiguousPropertyError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * Search input is not a vector and no embedding generator is configured.
 */
class NoEmbeddingGeneratorError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * An embedding generator is configured but does not accept the input type.
 */
class IncompatibleGeneratorError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * Vectors were requested back from a collection that generates embeddings.
 */
class UnsupportedCombinationError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * A storage id cannot be parsed into the requested key type.
 */
class InvalidKeyError : public VectorStoreError {
public:
    using VectorStoreError::VectorStoreError;
};

/**
 * The caller's stop token was triggered before a store or generator call.
 */
class OperationCancelledError : public VectorStoreError {
public:
    explicit OperationCancelledError(const std::string& operation)
        : VectorStoreError("Operation '" + operation + "' was cancelled")
        , operation_(operation) {}

    const std::string& operation_name() const { return operation_; }

private:
    std::string operation_;
};

/**
 * Failure reported by a DocumentStore client.
 * status_code is the HTTP-like status of the failed call (0 if none).
 */
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }
    bool is_not_found() const { return status_code_ == 404; }

private:
    int status_code_;
};

/**
 * A backing-store call failed. The TransportError is attached as the nested
 * exception (see std::rethrow_if_nested).
 */
class StorageOperationError : public VectorStoreError {
public:
    StorageOperationError(const std::string& collection_name,
                          const std::string& operation_name,
                          const std::string& cause,
                          int status_code = 0)
        : VectorStoreError("Call to vector store failed. Operation '" + operation_name +
                           "' on collection '" + collection_name + "': " + cause)
        , collection_name_(collection_name)
        , operation_name_(operation_name)
        , status_code_(status_code) {}

    const std::string& collection_name() const { return collection_name_; }
    const std::string& operation_name() const { return operation_name_; }
    int status_code() const { return status_code_; }

private:
    std::string collection_name_;
    std::string operation_name_;
    int status_code_;
};

} // namespace elastivec
