#pragma once

#include "enumtag/codec/enum_description.hpp"
#include "enumtag/codec/enum_schema.hpp"

namespace enumtag::codec {

struct IntrospectionOptions {
    // Two tags mapping to one concrete type make encoding ambiguous. When
    // off, the first declaration wins.
    bool reject_duplicate_variant_types = true;
};

// Derives an EnumSchema from a host enum description, throwing
// MalformedSchemaException when the description is not well-formed.
// Derivation is pure: the description is only read.
class SchemaIntrospector {
public:
    static EnumSchema derive(const EnumDescription &description,
                             const IntrospectionOptions &options = {});

    // Same checks as derive, without keeping the result
    static void validate(const EnumDescription &description,
                         const IntrospectionOptions &options = {});

private:
    static void check_variant_set(const EnumDescription &description);
    static void check_value_slot(const EnumDescription &description);
    static void check_embeddable(const EnumDescription &description,
                                 const VariantShape &shape);
};

}  // namespace enumtag::codec
