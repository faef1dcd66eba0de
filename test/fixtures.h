#pragma once

#include <memory>
#include <kvorm/mapping/ClassMetadata.h>
#include <kvorm/mapping/ClassMetadataFactory.h>

namespace kvorm::test {

/// User(id; name, address: Address, session: transient), stored in "users".
inline
std::shared_ptr<ClassMetadata> user_metadata() {
    auto p_meta = std::make_shared<ClassMetadata>("User");
    p_meta->set_storage_name("users");
    p_meta->map_identifier("id");
    p_meta->map_field("name");
    p_meta->map_embedded("address", "Address");
    p_meta->skip_transient_field("session");
    return p_meta;
}

inline
std::shared_ptr<ClassMetadata> address_metadata() {
    auto p_meta = std::make_shared<ClassMetadata>("Address");
    p_meta->set_embeddable(true);
    p_meta->map_field("street");
    p_meta->map_field("city");
    return p_meta;
}

/// Item(id; a, b), stored in "items".
inline
std::shared_ptr<ClassMetadata> item_metadata() {
    auto p_meta = std::make_shared<ClassMetadata>("Item");
    p_meta->set_storage_name("items");
    p_meta->map_identifier("id");
    p_meta->map_field("a");
    p_meta->map_field("b");
    return p_meta;
}

/// Point(x, y; label), stored in "points".
inline
std::shared_ptr<ClassMetadata> point_metadata() {
    auto p_meta = std::make_shared<ClassMetadata>("Point");
    p_meta->set_storage_name("points");
    p_meta->map_identifier("x");
    p_meta->map_identifier("y");
    p_meta->map_field("label");
    return p_meta;
}

inline
void register_all(ClassMetadataFactory& factory) {
    factory.set_metadata_for(user_metadata());
    factory.set_metadata_for(address_metadata());
    factory.set_metadata_for(item_metadata());
    factory.set_metadata_for(point_metadata());
}

} // namespace kvorm::test
