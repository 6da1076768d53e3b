#include "enumtag/codec/errors.hpp"

namespace enumtag::codec {

std::string error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::MALFORMED_SCHEMA:
            return "MalformedSchema";
        case ErrorCode::INVALID_TARGET:
            return "InvalidTarget";
        case ErrorCode::TAG_EXTRACTION_FAILED:
            return "TagExtractionFailed";
        case ErrorCode::UNKNOWN_TAG:
            return "UnknownTag";
        case ErrorCode::VARIANT_DECODE_FAILED:
            return "VariantDecodeFailed";
        case ErrorCode::UNTAGGED_VARIANT:
            return "UntaggedVariant";
        case ErrorCode::VARIANT_ENCODE_FAILED:
            return "VariantEncodeFailed";
        default:
            return "Unknown";
    }
}

}  // namespace enumtag::codec
