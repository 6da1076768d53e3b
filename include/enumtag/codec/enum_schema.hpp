#pragma once

#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "enumtag/codec/enum_description.hpp"
#include "enumtag/codec/variant_shape.hpp"

namespace enumtag::codec {

enum class ValueMode { NESTED, EMBEDDED };

// Derived, immutable metadata of one tagged enum type, shared by the
// Decoder and the Encoder
class EnumSchema {
public:
    struct Variant {
        std::string tag;
        VariantShape shape;
    };

    const std::string &enum_name() const noexcept { return enum_name_; }
    std::type_index enum_type() const noexcept { return enum_type_; }
    const std::string &tag_field() const noexcept { return tag_field_; }
    ValueMode value_mode() const noexcept { return value_mode_; }
    bool embedded() const noexcept {
        return value_mode_ == ValueMode::EMBEDDED;
    }
    // Empty in embedded mode
    const std::string &value_field() const noexcept { return value_field_; }

    // Variants in declaration order
    const std::vector<Variant> &variants() const noexcept { return variants_; }

    const Variant *find_by_tag(const std::string &tag) const;
    // First variant declared with exactly this type
    const Variant *find_by_type(std::type_index type) const;

    // Places a decoded variant instance into the host enum's slot
    void store(void *host, const VariantShape &shape,
               std::shared_ptr<const void> value) const;
    SlotContent load(const void *host) const;

private:
    friend class SchemaIntrospector;

    EnumSchema() = default;

    std::string enum_name_;
    std::type_index enum_type_ = typeid(void);
    std::string tag_field_;
    ValueMode value_mode_ = ValueMode::NESTED;
    std::string value_field_;
    std::vector<Variant> variants_;
    std::unordered_map<std::string, size_t> by_tag_;
    std::unordered_map<std::type_index, size_t> by_type_;
    SlotDeclaration slot_;
};

}  // namespace enumtag::codec
