#pragma once

#include <string_view>

#include "enumtag/codec/enum_schema.hpp"

namespace enumtag::codec {

// Decodes enum objects into a host enum's value slot. The destination is
// left untouched when decoding fails.
class Decoder {
public:
    explicit Decoder(const EnumSchema &schema) : schema_(schema) {}

    void decode(std::string_view data, void *destination) const;
    void decode_document(const Json &document, void *destination) const;

private:
    const EnumSchema &schema_;
};

}  // namespace enumtag::codec
