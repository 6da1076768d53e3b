#include "enumtag/codec/raw_envelope.hpp"

#include "enumtag/codec/errors.hpp"

namespace enumtag::codec {

RawEnvelope read_envelope(const Json &document, const EnumSchema &schema) {
    if (!document.is_object()) {
        throw TagExtractionException(
            schema.tag_field(), "expected a JSON object, got " +
                                    std::string(document.type_name()));
    }

    auto tag = document.find(schema.tag_field());
    if (tag == document.end()) {
        throw TagExtractionException(schema.tag_field(), "field is missing");
    }
    if (!tag->is_string()) {
        throw TagExtractionException(
            schema.tag_field(),
            "expected a string, got " + std::string(tag->type_name()));
    }

    RawEnvelope envelope;
    envelope.tag = tag->get<std::string>();
    if (!schema.embedded()) {
        auto value = document.find(schema.value_field());
        if (value != document.end()) {
            envelope.value = &*value;
        }
    }
    return envelope;
}

Json make_envelope(const EnumSchema &schema, const EnumSchema::Variant &variant,
                   Json payload) {
    Json envelope = Json::object();
    envelope[schema.tag_field()] = variant.tag;

    if (!schema.embedded()) {
        envelope[schema.value_field()] = std::move(payload);
        return envelope;
    }

    if (!payload.is_object()) {
        throw VariantEncodeException(
            variant.shape.type_name,
            "embedded value encodes as a JSON " +
                std::string(payload.type_name()) + ", not an object");
    }
    for (auto &field : payload.items()) {
        if (field.key() == schema.tag_field()) {
            throw VariantEncodeException(
                variant.shape.type_name,
                "field \"" + field.key() + "\" collides with the tag field");
        }
        envelope[field.key()] = std::move(field.value());
    }
    return envelope;
}

}  // namespace enumtag::codec
