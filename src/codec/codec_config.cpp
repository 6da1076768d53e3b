#include "enumtag/codec/codec_config.hpp"

namespace enumtag::codec {

void CodecConfig::from_ptree(const boost::property_tree::ptree& pt) {
    schema_cache = get_value(pt, "schema_cache", schema_cache);
    reject_duplicate_variant_types = get_value(
        pt, "reject_duplicate_variant_types", reject_duplicate_variant_types);
    validate_on_register =
        get_value(pt, "validate_on_register", validate_on_register);
}

}  // namespace enumtag::codec
