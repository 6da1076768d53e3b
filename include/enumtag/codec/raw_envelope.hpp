#pragma once

#include <string>

#include "enumtag/codec/enum_schema.hpp"

namespace enumtag::codec {

// Tag and undecoded value of one enum object. `value` points into the
// document it was read from and is null in embedded mode or when the value
// field is absent.
struct RawEnvelope {
    std::string tag;
    const Json *value = nullptr;
};

// Throws TagExtractionException when the document is not an object or its
// tag field is missing or not a string
RawEnvelope read_envelope(const Json &document, const EnumSchema &schema);

// Builds the enum object for an encoded variant: the tag field first, then
// either the value field or, in embedded mode, every field of the payload
// in order
Json make_envelope(const EnumSchema &schema, const EnumSchema::Variant &variant,
                   Json payload);

}  // namespace enumtag::codec
