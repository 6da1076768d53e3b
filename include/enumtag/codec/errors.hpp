#pragma once

#include <stdexcept>
#include <string>

namespace enumtag::codec {

enum class ErrorCode {
    MALFORMED_SCHEMA,
    INVALID_TARGET,
    TAG_EXTRACTION_FAILED,
    UNKNOWN_TAG,
    VARIANT_DECODE_FAILED,
    UNTAGGED_VARIANT,
    VARIANT_ENCODE_FAILED
};

std::string error_code_name(ErrorCode code);

// Base of every error raised by the tagged enum codec. Errors that wrap a
// lower-level failure are thrown with std::throw_with_nested, so the cause
// can be recovered with std::rethrow_if_nested.
class EnumTagException : public std::runtime_error {
public:
    EnumTagException(ErrorCode code, const std::string &message)
        : std::runtime_error("enumtag: " + message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// The host enum description violates the structural contract
class MalformedSchemaException : public EnumTagException {
public:
    MalformedSchemaException(const std::string &enum_name,
                             const std::string &reason)
        : EnumTagException(ErrorCode::MALFORMED_SCHEMA,
                           "malformed enum type " + enum_name + ": " + reason),
          enum_name_(enum_name),
          reason_(reason) {}

    const std::string &enum_name() const noexcept { return enum_name_; }
    const std::string &reason() const noexcept { return reason_; }

private:
    std::string enum_name_;
    std::string reason_;
};

class InvalidTargetException : public EnumTagException {
public:
    explicit InvalidTargetException(const std::string &enum_name)
        : EnumTagException(
              ErrorCode::INVALID_TARGET,
              "malformed enum type " + enum_name +
                  ": unmarshal destination must be a non-null pointer"),
          enum_name_(enum_name) {}

    const std::string &enum_name() const noexcept { return enum_name_; }

private:
    std::string enum_name_;
};

class TagExtractionException : public EnumTagException {
public:
    TagExtractionException(const std::string &tag_field,
                           const std::string &cause)
        : EnumTagException(ErrorCode::TAG_EXTRACTION_FAILED,
                           "unmarshaling enum tag from field \"" + tag_field +
                               "\": " + cause),
          tag_field_(tag_field) {}

    const std::string &tag_field() const noexcept { return tag_field_; }

private:
    std::string tag_field_;
};

class UnknownTagException : public EnumTagException {
public:
    UnknownTagException(const std::string &tag, const std::string &enum_name)
        : EnumTagException(ErrorCode::UNKNOWN_TAG, "unknown tag \"" + tag +
                                                       "\" for enum type " +
                                                       enum_name),
          tag_(tag),
          enum_name_(enum_name) {}

    const std::string &tag() const noexcept { return tag_; }
    const std::string &enum_name() const noexcept { return enum_name_; }

private:
    std::string tag_;
    std::string enum_name_;
};

class VariantDecodeException : public EnumTagException {
public:
    VariantDecodeException(const std::string &variant_type,
                           const std::string &cause)
        : EnumTagException(ErrorCode::VARIANT_DECODE_FAILED,
                           "unmarshaling enum value into type " +
                               variant_type + ": " + cause),
          variant_type_(variant_type) {}

    const std::string &variant_type() const noexcept { return variant_type_; }

private:
    std::string variant_type_;
};

class UntaggedVariantException : public EnumTagException {
public:
    UntaggedVariantException(const std::string &variant_type,
                             const std::string &enum_name)
        : EnumTagException(ErrorCode::UNTAGGED_VARIANT,
                           "value type " + variant_type +
                               " doesn't have an associated tag in enum type " +
                               enum_name),
          variant_type_(variant_type) {}

    const std::string &variant_type() const noexcept { return variant_type_; }

private:
    std::string variant_type_;
};

class VariantEncodeException : public EnumTagException {
public:
    VariantEncodeException(const std::string &variant_type,
                           const std::string &cause)
        : EnumTagException(ErrorCode::VARIANT_ENCODE_FAILED,
                           "marshaling enum value of type " + variant_type +
                               ": " + cause),
          variant_type_(variant_type) {}

    const std::string &variant_type() const noexcept { return variant_type_; }

private:
    std::string variant_type_;
};

}  // namespace enumtag::codec
