#include "enumtag/codec/enum_schema.hpp"

namespace enumtag::codec {

const EnumSchema::Variant *EnumSchema::find_by_tag(
    const std::string &tag) const {
    auto it = by_tag_.find(tag);
    return it != by_tag_.end() ? &variants_[it->second] : nullptr;
}

const EnumSchema::Variant *EnumSchema::find_by_type(
    std::type_index type) const {
    auto it = by_type_.find(type);
    return it != by_type_.end() ? &variants_[it->second] : nullptr;
}

void EnumSchema::store(void *host, const VariantShape &shape,
                       std::shared_ptr<const void> value) const {
    const void *view = shape.view(value.get());
    slot_.store(host, std::move(value), shape.type, view);
}

SlotContent EnumSchema::load(const void *host) const {
    return slot_.load(host);
}

}  // namespace enumtag::codec
