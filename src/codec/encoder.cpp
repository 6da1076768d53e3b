#include "enumtag/codec/encoder.hpp"

#include <boost/core/demangle.hpp>
#include <exception>

#include "enumtag/codec/errors.hpp"
#include "enumtag/codec/raw_envelope.hpp"

namespace enumtag::codec {

Json Encoder::encode(const void *host) const {
    SlotContent content = schema_.load(host);
    const auto *variant =
        content.data != nullptr ? schema_.find_by_type(content.type) : nullptr;
    if (variant == nullptr) {
        throw UntaggedVariantException(
            boost::core::demangle(content.type.name()), schema_.enum_name());
    }

    Json payload;
    try {
        payload = variant->shape.encode(content.data);
    } catch (const std::exception &e) {
        std::throw_with_nested(
            VariantEncodeException(variant->shape.type_name, e.what()));
    }
    return make_envelope(schema_, *variant, std::move(payload));
}

std::string Encoder::encode_to_string(const void *host) const {
    Json document = encode(host);
    try {
        return document.dump();
    } catch (const Json::type_error &e) {
        // Invalid UTF-8 in a string value
        std::throw_with_nested(VariantEncodeException(
            boost::core::demangle(schema_.load(host).type.name()), e.what()));
    }
}

}  // namespace enumtag::codec
