#pragma once

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#include "enumtag/codec/variant_shape.hpp"
#include "enumtag/codec/variant_slot.hpp"

namespace enumtag::codec {

// Tag field and value field name meaning "absent"; as a value field it
// selects embedded mode
inline constexpr const char *ABSENT_FIELD = "-";

// Current content of a host enum's slot; data is null when the slot is empty
struct SlotContent {
    std::type_index type = typeid(void);
    const void *data = nullptr;
};

struct VariantDeclaration {
    // Declared name of a named entry, or the type name of an inline one
    std::string name;
    bool inline_declared = false;
    std::optional<std::string> tag;
    bool in_variant_set = false;
    bool after_slot = false;
    VariantShape shape;
};

struct SlotDeclaration {
    std::string member_type_name;
    std::string capability_name;
    bool is_variant_slot = false;
    bool polymorphic = false;
    std::string value_field = ABSENT_FIELD;

    std::function<void(void *host, std::shared_ptr<const void> value,
                       std::type_index type, const void *view)>
        store;
    std::function<SlotContent(const void *host)> load;
};

// Host-supplied description of a tagged enum, as declared through
// EnumDescriptor. Nothing here is checked until SchemaIntrospector::derive.
struct EnumDescription {
    std::string enum_name;
    std::type_index enum_type = typeid(void);
    bool structured = false;
    int variant_sets = 0;
    std::optional<std::string> tag_field;
    int slot_declarations = 0;
    std::optional<SlotDeclaration> slot;
    std::vector<VariantDeclaration> variants;
};

// An enum type takes part in the codec by exposing
//     static enumtag::codec::EnumDescription describe();
template <typename T>
concept DescribedEnum = requires {
    { T::describe() } -> std::convertible_to<EnumDescription>;
};

namespace detail {

struct NoSlot {};

template <typename Member>
struct slot_traits {
    static constexpr bool is_slot = false;
    using capability = NoSlot;
};

template <typename Capability>
struct slot_traits<VariantSlot<Capability>> {
    static constexpr bool is_slot = true;
    using capability = Capability;
};

}  // namespace detail

// Builder for an EnumDescription:
//
//     return describe<ShoppingCartEvent>()
//         .value_slot(&ShoppingCartEvent::value, "value")
//         .variants("type")
//         .inline_variant<ItemAdded>("item_added")
//         .variant<Checkout>("checkout");
//
// The value slot must be declared before the variants, since satisfying
// the slot's capability is recorded per variant as it is declared.
template <typename Enum, typename Capability = detail::NoSlot>
class EnumDescriptor {
public:
    explicit EnumDescriptor(EnumDescription description)
        : description_(std::move(description)) {}

    // Declares the polymorphic value slot. `value_field` names the JSON
    // field holding the variant's value; "-" embeds the variant's fields in
    // the enum object instead.
    template <typename Member, typename Host>
    EnumDescriptor<Enum, typename detail::slot_traits<Member>::capability>
    value_slot(Member Host::*member, std::string value_field = ABSENT_FIELD) {
        static_assert(std::is_base_of_v<Host, Enum>,
                      "value slot must be a member of the enum type");
        using traits = detail::slot_traits<Member>;
        using SlotCapability = typename traits::capability;

        SlotDeclaration slot;
        slot.member_type_name = type_name<Member>();
        slot.value_field = std::move(value_field);
        slot.is_variant_slot = traits::is_slot;
        if constexpr (traits::is_slot) {
            slot.capability_name = type_name<SlotCapability>();
            slot.polymorphic = is_polymorphic_capability_v<SlotCapability>;
            slot.store = [member](void *host, std::shared_ptr<const void> value,
                                  std::type_index type, const void *view) {
                (static_cast<Enum *>(host)->*member)
                    .assign(std::move(value), type, view);
            };
            slot.load = [member](const void *host) {
                const auto &held = static_cast<const Enum *>(host)->*member;
                return SlotContent{held.type(), held.data()};
            };
        }

        ++description_.slot_declarations;
        description_.slot = std::move(slot);
        return EnumDescriptor<Enum, SlotCapability>(std::move(description_));
    }

    // Opens the variant set; `tag_field` names the JSON field that holds
    // the tag
    EnumDescriptor &variants(std::optional<std::string> tag_field =
                                 std::nullopt) {
        ++description_.variant_sets;
        description_.tag_field = std::move(tag_field);
        return *this;
    }

    // Named variant entry; the tag defaults to `name`
    template <typename T>
    EnumDescriptor &variant(std::string name,
                            std::optional<std::string> tag = std::nullopt) {
        add_variant<T>(std::move(name), false, std::move(tag));
        return *this;
    }

    // Inline variant entry, which has no name to fall back on and must
    // declare its tag
    template <typename T>
    EnumDescriptor &inline_variant(
        std::optional<std::string> tag = std::nullopt) {
        add_variant<T>(type_name<T>(), true, std::move(tag));
        return *this;
    }

    const EnumDescription &description() const { return description_; }

    operator EnumDescription() const { return description_; }

private:
    template <typename T>
    void add_variant(std::string name, bool inline_declared,
                     std::optional<std::string> tag) {
        VariantDeclaration declaration;
        declaration.name = std::move(name);
        declaration.inline_declared = inline_declared;
        declaration.tag = std::move(tag);
        declaration.in_variant_set = description_.variant_sets > 0;
        declaration.after_slot = description_.slot.has_value();
        declaration.shape = make_variant_shape<T, Capability>();
        description_.variants.push_back(std::move(declaration));
    }

    EnumDescription description_;
};

template <typename Enum>
EnumDescriptor<Enum> describe() {
    EnumDescription description;
    description.enum_name = type_name<Enum>();
    description.enum_type = typeid(Enum);
    description.structured = std::is_class_v<Enum>;
    return EnumDescriptor<Enum>(std::move(description));
}

}  // namespace enumtag::codec
