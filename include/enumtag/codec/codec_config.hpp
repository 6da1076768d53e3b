#pragma once

#include <string>

#include "enumtag/config/config.hpp"

namespace enumtag::codec {

// Codec options, loaded from the "enumtag" section
class CodecConfig
    : public config::ReloadableConfigurationProperties<CodecConfig> {
public:
    // Keep derived schemas for the life of the process
    bool schema_cache = true;
    bool reject_duplicate_variant_types = true;
    // Derive a schema as soon as its enum is registered, so a malformed
    // enum fails at startup
    bool validate_on_register = true;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    std::string properties_name() const override { return "enumtag"; }
};

}  // namespace enumtag::codec
