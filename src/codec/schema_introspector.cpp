#include "enumtag/codec/schema_introspector.hpp"

#include "enumtag/codec/errors.hpp"

namespace enumtag::codec {

namespace {

[[noreturn]] void malformed(const EnumDescription &description,
                            const std::string &reason) {
    throw MalformedSchemaException(description.enum_name, reason);
}

}  // namespace

void SchemaIntrospector::check_variant_set(
    const EnumDescription &description) {
    if (description.variant_sets == 0) {
        malformed(description, "doesn't declare a variant set");
    }
    if (description.variant_sets > 1) {
        malformed(description, "declares more than one variant set");
    }
    if (!description.tag_field) {
        malformed(description, "variant set doesn't declare a tag field");
    }
    if (*description.tag_field == ABSENT_FIELD) {
        malformed(description, "variant set tag field cannot be \"-\"");
    }
    if (description.tag_field->empty()) {
        malformed(description, "variant set tag field cannot be empty");
    }
}

void SchemaIntrospector::check_value_slot(
    const EnumDescription &description) {
    if (!description.slot) {
        malformed(description, "doesn't declare a value slot");
    }
    if (description.slot_declarations > 1) {
        malformed(description, "declares more than one value slot");
    }

    const SlotDeclaration &slot = *description.slot;
    if (!slot.is_variant_slot) {
        malformed(description, "value slot's type " + slot.member_type_name +
                                   " isn't a VariantSlot");
    }
    if (!slot.polymorphic) {
        malformed(description, "value slot's capability " +
                                   slot.capability_name +
                                   " isn't a polymorphic type");
    }
    if (slot.value_field.empty()) {
        malformed(description, "value slot's field name cannot be empty");
    }

    for (const auto &variant : description.variants) {
        if (!variant.after_slot) {
            malformed(description, "variant " + variant.name +
                                       " is declared before the value slot");
        }
        if (!variant.shape.satisfies_capability) {
            malformed(description, "variant type " + variant.shape.type_name +
                                       " can't be set to value slot of "
                                       "capability " +
                                       slot.capability_name);
        }
    }
}

// An embedded variant's fields are merged into the enum object, so the
// variant must be an object-like type
void SchemaIntrospector::check_embeddable(const EnumDescription &description,
                                          const VariantShape &shape) {
    if (!shape.structured) {
        malformed(description, "variant type " + shape.type_name +
                                   " can't be embedded: it isn't an "
                                   "object-like class type");
    }
}

EnumSchema SchemaIntrospector::derive(const EnumDescription &description,
                                      const IntrospectionOptions &options) {
    if (!description.structured) {
        malformed(description, "isn't a class type");
    }
    check_variant_set(description);

    EnumSchema schema;
    schema.enum_name_ = description.enum_name;
    schema.enum_type_ = description.enum_type;
    schema.tag_field_ = *description.tag_field;

    for (const auto &variant : description.variants) {
        if (!variant.in_variant_set) {
            malformed(description, "variant " + variant.name +
                                       " is declared outside the variant set");
        }

        std::string tag;
        if (variant.tag) {
            tag = *variant.tag;
        } else if (variant.inline_declared) {
            malformed(description, "variant " + variant.name +
                                       " is inline and doesn't declare a tag");
        } else {
            tag = variant.name;
        }

        if (const auto *existing = schema.find_by_tag(tag)) {
            malformed(description, "tag \"" + tag + "\" is declared by both " +
                                       existing->shape.type_name + " and " +
                                       variant.shape.type_name);
        }
        if (const auto *existing = schema.find_by_type(variant.shape.type)) {
            if (options.reject_duplicate_variant_types) {
                malformed(description, "type " + variant.shape.type_name +
                                           " is declared by both tags \"" +
                                           existing->tag + "\" and \"" + tag +
                                           "\"");
            }
        } else {
            schema.by_type_.emplace(variant.shape.type,
                                    schema.variants_.size());
        }

        schema.by_tag_.emplace(tag, schema.variants_.size());
        schema.variants_.push_back({tag, variant.shape});
    }

    check_value_slot(description);
    const SlotDeclaration &slot = *description.slot;
    if (slot.value_field == ABSENT_FIELD) {
        schema.value_mode_ = ValueMode::EMBEDDED;
        for (const auto &variant : schema.variants_) {
            check_embeddable(description, variant.shape);
        }
    } else {
        schema.value_mode_ = ValueMode::NESTED;
        schema.value_field_ = slot.value_field;
    }
    schema.slot_ = slot;

    return schema;
}

void SchemaIntrospector::validate(const EnumDescription &description,
                                  const IntrospectionOptions &options) {
    derive(description, options);
}

}  // namespace enumtag::codec
