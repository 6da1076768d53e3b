#pragma once

#include <boost/core/demangle.hpp>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <typeindex>

#include "enumtag/codec/variant_slot.hpp"

namespace enumtag::codec {

// Ordered so that the tag field stays in front and embedded fields keep
// their declared order
using Json = nlohmann::ordered_json;

// NLOHMANN_DEFINE_TYPE_* converters work with ordered_json from 3.11.3 on
static_assert(NLOHMANN_JSON_VERSION_MAJOR > 3 ||
                  (NLOHMANN_JSON_VERSION_MAJOR == 3 &&
                   (NLOHMANN_JSON_VERSION_MINOR > 11 ||
                    (NLOHMANN_JSON_VERSION_MINOR == 11 &&
                     NLOHMANN_JSON_VERSION_PATCH >= 3))),
              "enumtag requires nlohmann_json 3.11.3 or newer");

// A variant can be embedded only if it is an object-like class: a class
// type that is neither a JSON value nor a range
template <typename T>
inline constexpr bool is_structured_v =
    std::is_class_v<T> && !std::is_same_v<T, Json> &&
    !std::is_same_v<T, nlohmann::json> && !requires(const T &t) {
        t.begin();
        t.end();
    };

template <typename T>
std::string type_name() {
    return boost::core::demangle(typeid(T).name());
}

// Type-erased description of one candidate variant type
struct VariantShape {
    std::type_index type = typeid(void);
    std::string type_name;
    bool satisfies_capability = false;
    bool structured = false;

    std::function<std::shared_ptr<const void>()> make_zero;
    std::function<std::shared_ptr<const void>(const Json &)> decode;
    std::function<Json(const void *)> encode;
    // Converts a pointer to the variant into a pointer to the slot's
    // capability; null for AnyCapability slots
    std::function<const void *(const void *)> view;
};

template <typename T, typename Capability>
VariantShape make_variant_shape() {
    static_assert(std::is_default_constructible_v<T>,
                  "variant types must be default constructible");

    VariantShape shape;
    shape.type = typeid(T);
    shape.type_name = codec::type_name<T>();
    shape.satisfies_capability = capability_accepts_v<Capability, T>;
    shape.structured = is_structured_v<T>;
    shape.make_zero = []() -> std::shared_ptr<const void> {
        return std::make_shared<const T>();
    };
    shape.decode = [](const Json &payload) -> std::shared_ptr<const void> {
        auto value = std::make_shared<T>();
        payload.get_to(*value);
        return value;
    };
    shape.encode = [](const void *value) -> Json {
        return Json(*static_cast<const T *>(value));
    };
    shape.view = []([[maybe_unused]] const void *value) -> const void * {
        if constexpr (capability_accepts_v<Capability, T> &&
                      !std::is_same_v<Capability, AnyCapability>) {
            return static_cast<const Capability *>(
                static_cast<const T *>(value));
        } else {
            return nullptr;
        }
    };
    return shape;
}

}  // namespace enumtag::codec
