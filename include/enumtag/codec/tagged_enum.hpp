#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <type_traits>

#include "enumtag/codec/decoder.hpp"
#include "enumtag/codec/encoder.hpp"
#include "enumtag/codec/enum_description.hpp"
#include "enumtag/codec/errors.hpp"
#include "enumtag/codec/schema_registry.hpp"
#include "enumtag/codec/variant_slot.hpp"

namespace enumtag {

using codec::AnyCapability;
using codec::VariantSlot;

template <codec::DescribedEnum Enum>
std::string marshal_json(const Enum &value) {
    auto schema = codec::SchemaRegistry::instance().schema_for<Enum>();
    return codec::Encoder(*schema).encode_to_string(&value);
}

template <codec::DescribedEnum Enum>
void unmarshal_json(std::string_view data, Enum *destination) {
    auto schema = codec::SchemaRegistry::instance().schema_for<Enum>();
    codec::Decoder(*schema).decode(data, destination);
}

// Throws MalformedSchemaException if Enum's description is not well-formed.
// Does not populate the schema cache.
template <codec::DescribedEnum Enum>
void validate() {
    codec::SchemaIntrospector::validate(
        Enum::describe(), codec::SchemaRegistry::instance().options());
}

}  // namespace enumtag

namespace nlohmann {

// Lets described enums appear anywhere nlohmann::json converts values,
// including as fields of their own variants
template <typename Enum>
struct adl_serializer<Enum,
                      std::enable_if_t<enumtag::codec::DescribedEnum<Enum>>> {
    template <typename BasicJsonType>
    static void to_json(BasicJsonType &j, const Enum &value) {
        auto schema =
            enumtag::codec::SchemaRegistry::instance().schema_for<Enum>();
        auto document = enumtag::codec::Encoder(*schema).encode(&value);
        if constexpr (std::is_same_v<BasicJsonType, enumtag::codec::Json>) {
            j = std::move(document);
        } else {
            j = BasicJsonType::parse(document.dump());
        }
    }

    template <typename BasicJsonType>
    static void from_json(const BasicJsonType &j, Enum &value) {
        auto schema =
            enumtag::codec::SchemaRegistry::instance().schema_for<Enum>();
        if constexpr (std::is_same_v<BasicJsonType, enumtag::codec::Json>) {
            enumtag::codec::Decoder(*schema).decode_document(j, &value);
        } else {
            enumtag::codec::Decoder(*schema).decode(j.dump(), &value);
        }
    }
};

}  // namespace nlohmann
