#include "enumtag/codec/decoder.hpp"

#include <exception>

#include "enumtag/codec/errors.hpp"
#include "enumtag/codec/raw_envelope.hpp"

namespace enumtag::codec {

void Decoder::decode(std::string_view data, void *destination) const {
    if (destination == nullptr) {
        throw InvalidTargetException(schema_.enum_name());
    }

    Json document;
    try {
        document = Json::parse(data);
    } catch (const Json::parse_error &e) {
        std::throw_with_nested(
            TagExtractionException(schema_.tag_field(), e.what()));
    }
    decode_document(document, destination);
}

void Decoder::decode_document(const Json &document,
                              void *destination) const {
    if (destination == nullptr) {
        throw InvalidTargetException(schema_.enum_name());
    }

    RawEnvelope envelope = read_envelope(document, schema_);
    const auto *variant = schema_.find_by_tag(envelope.tag);
    if (variant == nullptr) {
        throw UnknownTagException(envelope.tag, schema_.enum_name());
    }

    // Embedded variants read their fields from the enum object itself; the
    // tag field is not declared by the variant and is skipped by it
    const Json *payload = schema_.embedded() ? &document : envelope.value;

    std::shared_ptr<const void> value;
    if (payload == nullptr || payload->is_null()) {
        value = variant->shape.make_zero();
    } else {
        try {
            value = variant->shape.decode(*payload);
        } catch (const std::exception &e) {
            std::throw_with_nested(
                VariantDecodeException(variant->shape.type_name, e.what()));
        }
    }

    schema_.store(destination, variant->shape, std::move(value));
}

}  // namespace enumtag::codec
