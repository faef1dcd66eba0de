/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/core/Value.h>
#include <kvorm/core/Entity.h>
#include <kvorm/mapping/ClassMetadataFactory.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Returns the persistent state of an instance.
/// - Declared fields in declaration order, excluding identifier and transient
///   fields. Unset plain fields are nil.
/// - Embedded fields hold the snapshot of the nested instance, or an empty
///   Record when the nested instance is null.
/// - Extra attributes follow, and never replace a declared field.
/// - A null instance yields an empty Record.
/////////////////////////////////////////////////////////////////////////////
inline
Record take_snapshot(ClassMetadataFactory& factory, const ClassMetadata& meta, const Entity* p_entity) {
    Record data;
    if (p_entity == nullptr) return data;

    for (auto& [name, field] : meta.fields()) {
        if (field.is_id) continue;
        switch (field.kind) {
            case FieldKind::TRANSIENT: break;
            case FieldKind::EMBEDDED: {
                auto p_target = factory.get_metadata_for(field.target);
                auto p_embedded = p_entity->get_embedded(name);
                data.insert({name, take_snapshot(factory, *p_target, p_embedded.get())});
                break;
            }
            case FieldKind::PLAIN:
                data.insert({name, p_entity->get(name)});
                break;
        }
    }

    for (auto& [name, value] : p_entity->extras()) {
        if (data.find(name) == data.end())
            data.insert({name, value});
    }

    return data;
}

/// Returns the fields of a snapshot that are absent from, or not strictly
/// equal to, the original.
inline
Record diff(const Record& snapshot, const Record& original) {
    Record changes;
    for (auto& [name, value] : snapshot) {
        auto it = original.find(name);
        if (it == original.end() || !(it->second == value))
            changes.insert({name, value});
    }
    return changes;
}

/// As `diff`, except that an embedded field whose snapshot is an empty Record
/// is unchanged when the original holds nil. Both mean a null embedded instance.
inline
Record diff(const ClassMetadata& meta, const Record& snapshot, const Record& original) {
    Record changes;
    for (auto& [name, value] : snapshot) {
        auto it = original.find(name);
        if (it != original.end()) {
            if (it->second == value) continue;
            if (meta.has_association(name) && it->second.is_nil() && value.is_map() && value.size() == 0)
                continue;
        }
        changes.insert({name, value});
    }
    return changes;
}

} // namespace kvorm
