#pragma once

#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace enumtag::codec {

// Capability of a slot that accepts a value of any type
struct AnyCapability {};

// A slot capability must be AnyCapability or a polymorphic class that every
// variant derives from
template <typename Capability>
inline constexpr bool is_polymorphic_capability_v =
    std::is_same_v<Capability, AnyCapability> ||
    (std::is_class_v<Capability> && std::is_polymorphic_v<Capability>);

template <typename Capability, typename T>
inline constexpr bool capability_accepts_v =
    std::is_same_v<Capability, AnyCapability> ||
    (is_polymorphic_capability_v<Capability> &&
     std::is_base_of_v<Capability, T> &&
     std::is_convertible_v<const T *, const Capability *>);

// Polymorphic value slot of a tagged enum. Holds at most one immutable
// variant instance; copies share the instance.
template <typename Capability = AnyCapability>
class VariantSlot {
public:
    using capability_type = Capability;

    VariantSlot() = default;
    VariantSlot(const VariantSlot &) = default;
    VariantSlot &operator=(const VariantSlot &) = default;

    // A moved-from slot is empty
    VariantSlot(VariantSlot &&other) noexcept
        : storage_(std::move(other.storage_)),
          type_(other.type_),
          view_(other.view_) {
        other.reset();
    }

    VariantSlot &operator=(VariantSlot &&other) noexcept {
        if (this != &other) {
            storage_ = std::move(other.storage_);
            type_ = other.type_;
            view_ = other.view_;
            other.reset();
        }
        return *this;
    }

    template <typename T, typename = std::enable_if_t<
                              !std::is_same_v<std::decay_t<T>, VariantSlot>>>
    VariantSlot(T &&value) {
        emplace<std::decay_t<T>>(std::forward<T>(value));
    }

    template <typename T, typename... Args>
    const T &emplace(Args &&...args) {
        static_assert(capability_accepts_v<Capability, T>,
                      "variant type doesn't satisfy the slot's capability");
        auto storage = std::make_shared<const T>(std::forward<Args>(args)...);
        const T *typed = storage.get();
        if constexpr (std::is_same_v<Capability, AnyCapability>) {
            assign(std::move(storage), typeid(T), nullptr);
        } else {
            assign(std::move(storage), typeid(T),
                   static_cast<const Capability *>(typed));
        }
        return *typed;
    }

    bool has_value() const noexcept { return storage_ != nullptr; }

    // Exact type of the held value, typeid(void) when empty
    std::type_index type() const noexcept { return type_; }

    template <typename T>
    bool holds() const noexcept {
        return has_value() && type_ == std::type_index(typeid(T));
    }

    template <typename T>
    const T *get_if() const noexcept {
        return holds<T>() ? static_cast<const T *>(storage_.get()) : nullptr;
    }

    template <typename T>
    const T &get() const {
        if (!holds<T>()) {
            throw std::bad_cast();
        }
        return *static_cast<const T *>(storage_.get());
    }

    const Capability *operator->() const
        requires(!std::is_same_v<Capability, AnyCapability>)
    {
        return view_;
    }

    const Capability &operator*() const
        requires(!std::is_same_v<Capability, AnyCapability>)
    {
        return *view_;
    }

    void reset() noexcept {
        storage_.reset();
        type_ = typeid(void);
        view_ = nullptr;
    }

    // Type-erased access used by the codec. `view` must point into
    // `storage` as a Capability, or be null for AnyCapability slots.
    void assign(std::shared_ptr<const void> storage, std::type_index type,
                const void *view) noexcept {
        storage_ = std::move(storage);
        type_ = type;
        view_ = static_cast<const Capability *>(view);
    }

    const void *data() const noexcept { return storage_.get(); }

private:
    std::shared_ptr<const void> storage_;
    std::type_index type_ = typeid(void);
    const Capability *view_ = nullptr;
};

}  // namespace enumtag::codec
