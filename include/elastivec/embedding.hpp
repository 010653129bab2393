/**
 * @file embedding.hpp
 * @brief Embedding generator boundary
 *
 * Generators turn a non-vector property value (usually text) into an
 * Embedding. They are called at upsert time for generator-backed vector
 * properties and at search time when the query input is not a vector.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace elastivec {

class EmbeddingGenerator {
public:
    virtual ~EmbeddingGenerator() = default;

    /**
     * Whether values of the given declared type can be embedded.
     */
    virtual bool accepts(const TypeInfo& input_type) const = 0;

    /**
     * Produce an embedding for one input value.
     * @param dimensions requested output size, if the property declares one
     * @param stop cooperative cancellation; implementations may ignore it
     */
    virtual Embedding generate(const FieldValue& input,
                               std::optional<uint32_t> dimensions,
                               std::stop_token stop) = 0;
};

using EmbeddingGeneratorPtr = std::shared_ptr<EmbeddingGenerator>;

/**
 * Generator backed by a callable, accepting a single input kind.
 */
class FunctionEmbeddingGenerator : public EmbeddingGenerator {
public:
    using Function = std::function<std::vector<float>(const FieldValue&, std::optional<uint32_t>)>;

    FunctionEmbeddingGenerator(TypeKind input_kind, Function fn)
        : input_kind_(input_kind), fn_(std::move(fn)) {}

    bool accepts(const TypeInfo& input_type) const override {
        return input_type.kind == input_kind_;
    }

    Embedding generate(const FieldValue& input,
                       std::optional<uint32_t> dimensions,
                       std::stop_token stop) override {
        if (stop.stop_requested()) {
            throw OperationCancelledError("GenerateEmbedding");
        }
        return Embedding(fn_(input, dimensions));
    }

    TypeKind input_kind() const { return input_kind_; }

private:
    TypeKind input_kind_;
    Function fn_;
};

} // namespace elastivec
