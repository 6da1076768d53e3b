#include "enumtag/codec/schema_registry.hpp"

#include <algorithm>
#include <ios>
#include <mutex>

#include "enumtag/log/logger.hpp"

namespace enumtag::codec {

std::shared_ptr<const EnumSchema> SchemaRegistry::find(
    std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = schemas_.find(type);
    return it != schemas_.end() ? it->second : nullptr;
}

std::shared_ptr<const EnumSchema> SchemaRegistry::publish(
    std::type_index type, std::shared_ptr<const EnumSchema> schema,
    const Snapshot &snapshot) {
    if (!snapshot.cache) {
        return schema;
    }

    std::unique_lock lock(mutex_);
    if (snapshot.generation != generation_) {
        return schema;
    }
    auto [it, inserted] = schemas_.try_emplace(type, std::move(schema));
    if (inserted) {
        ENUMTAG_LOG_DEBUG << "Derived schema for enum type "
                          << it->second->enum_name() << " with "
                          << it->second->variants().size() << " variants";
    }
    return it->second;
}

SchemaRegistry::Snapshot SchemaRegistry::current() const {
    std::shared_lock lock(mutex_);
    Snapshot snapshot;
    snapshot.options.reject_duplicate_variant_types =
        config_.reject_duplicate_variant_types;
    snapshot.cache = config_.schema_cache;
    snapshot.generation = generation_;
    return snapshot;
}

IntrospectionOptions SchemaRegistry::options() const {
    return current().options;
}

bool SchemaRegistry::validate_on_register() const {
    std::shared_lock lock(mutex_);
    return config_.validate_on_register;
}

void SchemaRegistry::add_registration(
    std::type_index type, std::string name,
    std::function<EnumDescription()> describe) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(
        registrations_.begin(), registrations_.end(),
        [&](const Registration &entry) { return entry.type == type; });
    if (it != registrations_.end()) {
        return;
    }
    ENUMTAG_LOG_DEBUG << "Registered enum type " << name;
    registrations_.push_back({type, std::move(name), std::move(describe)});
}

void SchemaRegistry::validate_all() const {
    std::vector<Registration> registrations;
    {
        std::shared_lock lock(mutex_);
        registrations = registrations_;
    }

    const IntrospectionOptions opts = options();
    for (const auto &registration : registrations) {
        SchemaIntrospector::validate(registration.describe(), opts);
    }
    ENUMTAG_LOG_INFO << "Validated " << registrations.size()
                     << " enum types";
}

void SchemaRegistry::configure(const CodecConfig &config) {
    std::unique_lock lock(mutex_);
    config_ = config;
    schemas_.clear();
    ++generation_;
    ENUMTAG_LOG_INFO << "Schema registry configured: schema_cache="
                     << std::boolalpha << config.schema_cache
                     << ", reject_duplicate_variant_types="
                     << config.reject_duplicate_variant_types
                     << ", validate_on_register="
                     << config.validate_on_register;
}

void SchemaRegistry::bind(config::ConfigManager &manager) {
    auto config = manager.get_configuration_properties<CodecConfig>();
    if (!config) {
        ENUMTAG_LOG_WARN << "No CodecConfig registered, using defaults";
        config = std::make_shared<CodecConfig>();
        manager.register_configuration_properties(config);
    }
    configure(*config);

    std::lock_guard<std::mutex> lock(bind_mutex_);
    if (bound_manager_ != nullptr) {
        bound_manager_->unsubscribe_from_reloads(reload_subscription_);
    }
    reload_subscription_ = manager.subscribe_to_reloads<CodecConfig>(
        [this](const CodecConfig &reloaded) { configure(reloaded); });
    bound_manager_ = &manager;
}

void SchemaRegistry::clear() {
    std::unique_lock lock(mutex_);
    schemas_.clear();
    registrations_.clear();
    ++generation_;
    ENUMTAG_LOG_DEBUG << "Schema registry cleared";
}

size_t SchemaRegistry::cached_count() const {
    std::shared_lock lock(mutex_);
    return schemas_.size();
}

std::vector<std::string> SchemaRegistry::registered_names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(registrations_.size());
    for (const auto &registration : registrations_) {
        names.push_back(registration.name);
    }
    return names;
}

}  // namespace enumtag::codec
