#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "enumtag/codec/codec_config.hpp"
#include "enumtag/codec/enum_description.hpp"
#include "enumtag/codec/enum_schema.hpp"
#include "enumtag/codec/schema_introspector.hpp"

namespace enumtag::codec {

// Process-wide cache of derived schemas. Schemas are derived outside the
// lock and published insert-once, so concurrent first use yields a single
// schema per enum type.
class SchemaRegistry {
public:
    static SchemaRegistry &instance() {
        static SchemaRegistry registry;
        return registry;
    }

    template <DescribedEnum Enum>
    std::shared_ptr<const EnumSchema> schema_for() {
        const std::type_index key(typeid(Enum));
        if (auto cached = find(key)) {
            return cached;
        }
        const Snapshot snapshot = current();
        return publish(key,
                       std::make_shared<const EnumSchema>(
                           SchemaIntrospector::derive(Enum::describe(),
                                                      snapshot.options)),
                       snapshot);
    }

    // Records an enum for validate_all(); derives it right away when
    // validate_on_register is set
    template <DescribedEnum Enum>
    void register_enum() {
        add_registration(typeid(Enum), type_name<Enum>(),
                         [] { return EnumDescription(Enum::describe()); });
        if (validate_on_register()) {
            schema_for<Enum>();
        }
    }

    // Derives every registered enum, throwing the first
    // MalformedSchemaException
    void validate_all() const;

    // Applies codec options and drops cached schemas derived under the old
    // ones
    void configure(const CodecConfig &config);

    // Applies the manager's CodecConfig and follows its reloads. Binding
    // again replaces the previous reload subscription.
    void bind(config::ConfigManager &manager);

    void clear();

    IntrospectionOptions options() const;
    size_t cached_count() const;
    std::vector<std::string> registered_names() const;

private:
    SchemaRegistry() = default;
    SchemaRegistry(const SchemaRegistry &) = delete;
    SchemaRegistry &operator=(const SchemaRegistry &) = delete;

    struct Snapshot {
        IntrospectionOptions options;
        bool cache = true;
        uint64_t generation = 0;
    };

    struct Registration {
        std::type_index type;
        std::string name;
        std::function<EnumDescription()> describe;
    };

    std::shared_ptr<const EnumSchema> find(std::type_index type) const;
    std::shared_ptr<const EnumSchema> publish(
        std::type_index type, std::shared_ptr<const EnumSchema> schema,
        const Snapshot &snapshot);
    Snapshot current() const;
    void add_registration(std::type_index type, std::string name,
                          std::function<EnumDescription()> describe);
    bool validate_on_register() const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<const EnumSchema>>
        schemas_;
    std::vector<Registration> registrations_;
    CodecConfig config_;
    // Bumped by configure() and clear(); a schema derived under an older
    // generation is returned but not cached
    uint64_t generation_ = 0;

    std::mutex bind_mutex_;
    config::ConfigManager *bound_manager_ = nullptr;
    config::ConfigManager::SubscriptionId reload_subscription_ = 0;
};

}  // namespace enumtag::codec
