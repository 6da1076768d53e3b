#pragma once

#include <string>

#include "enumtag/codec/enum_schema.hpp"

namespace enumtag::codec {

// Encodes a host enum's value slot as an enum object, tag field first
class Encoder {
public:
    explicit Encoder(const EnumSchema &schema) : schema_(schema) {}

    Json encode(const void *host) const;
    std::string encode_to_string(const void *host) const;

private:
    const EnumSchema &schema_;
};

}  // namespace enumtag::codec
