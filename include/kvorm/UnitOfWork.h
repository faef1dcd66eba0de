/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <memory>
#include <vector>
#include <tsl/ordered_map.h>

#include <kvorm/core/Value.h>
#include <kvorm/core/Identifier.h>
#include <kvorm/core/Entity.h>
#include <kvorm/core/IdentityMap.h>
#include <kvorm/core/snapshot.h>
#include <kvorm/core/errors.h>
#include <kvorm/id/IdHandler.h>
#include <kvorm/id/IdConverter.h>
#include <kvorm/mapping/ClassMetadataFactory.h>
#include <kvorm/storage/Storage.h>
#include <kvorm/support/logging.h>
#include <kvorm/Configuration.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Tracks the instances loaded from, or scheduled for, one storage.
/// - Registered instances are identified by a Handle assigned on first
///   registration. All tracking tables are keyed by Handle.
/// - `commit` applies pending work in three passes: updates of changed
///   managed instances, then insertions, then deletions.
/// - A storage failure aborts the commit. Work already applied stands, and
///   is not applied again by a later commit.
/// - Not safe for concurrent use.
/////////////////////////////////////////////////////////////////////////////
class UnitOfWork
{
  public:
    UnitOfWork(ClassMetadataFactory& factory, Storage& storage, const Configuration& config = {});
    ~UnitOfWork();

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator = (const UnitOfWork&) = delete;

    std::shared_ptr<const ClassMetadata> get_class_metadata(const String& class_name);

    /// Returns the registered instance with the specified identity, or nullptr.
    std::shared_ptr<Entity> try_get_by_id(const String& class_name, const Identifier& id) const;

    /// Load an instance from storage.
    /// - An identity already registered, including one pending insertion, is
    ///   returned without calling Storage::find.
    /// @throws NotFound if the storage has no record for the key.
    std::shared_ptr<Entity> reconstitute(const String& class_name, const Value& raw_key);

    /// Build and register an instance from a raw storage record, or return the
    /// instance already registered for the identity.
    std::shared_ptr<Entity> create_entity(const ClassMetadata& meta, const Identifier& id, const Record& raw_data);

    /// Build an embedded instance, which has no identity and is not registered.
    std::shared_ptr<Entity> create_embedded_entity(const ClassMetadata& meta, const Record& raw_data);

    void schedule_for_insert(const std::shared_ptr<Entity>& p_entity);
    void schedule_for_delete(const std::shared_ptr<Entity>& p_entity);

    void commit();

    /// Detach all instances. No storage calls are made.
    void clear();

    bool is_managed(const Entity& entity) const;
    bool is_scheduled_for_insert(const Entity& entity) const;
    bool is_scheduled_for_delete(const Entity& entity) const;

    const IdentityMap& identity_map() const { return m_identity_map; }
    const IdHandler& id_handler() const     { return *mp_id_handler; }
    const IdConverter& id_converter() const { return *mp_id_converter; }

    bool supports_partial_updates() const        { return m_partial_updates; }
    bool supports_composite_primary_keys() const { return m_composite_keys; }
    bool requires_composite_primary_keys() const { return m_requires_composite_keys; }

  private:
    struct IdEntry
    {
        Identifier id;          // normalized
        Identifier storage_id;  // serialized
        String hash;
    };

    struct PendingInsert
    {
        std::shared_ptr<Entity> p_entity;
        String hash;
    };

    Handle handle_of(const Entity& entity) const;
    Handle attach(Entity& entity);
    void detach(Entity& entity);

    void hydrate(const ClassMetadata& meta, Entity& entity, const Record& data);
    Record compute_change_set(const ClassMetadata& meta, const Entity& entity, const Record& original);

    void process_identity_map();
    void process_insertions();
    void process_deletions();

  private:
    ClassMetadataFactory& m_factory;
    Storage& m_storage;
    std::shared_ptr<const IdConverter> mp_id_converter;
    std::unique_ptr<IdHandler> mp_id_handler;
    bool m_partial_updates;
    bool m_composite_keys;
    bool m_requires_composite_keys;

    Handle m_next_handle = 1;
    IdentityMap m_identity_map;
    tsl::ordered_map<Handle, IdEntry> m_identifiers;
    tsl::ordered_map<Handle, Record> m_original_data;
    tsl::ordered_map<Handle, PendingInsert> m_insertions;
    tsl::ordered_map<Handle, std::shared_ptr<Entity>> m_deletions;
};


inline
UnitOfWork::UnitOfWork(ClassMetadataFactory& factory, Storage& storage, const Configuration& config)
  : m_factory{factory}
  , m_storage{storage}
  , mp_id_converter{config.id_converter()}
  , m_partial_updates{storage.supports_partial_updates()}
  , m_composite_keys{storage.supports_composite_primary_keys()}
  , m_requires_composite_keys{storage.requires_composite_primary_keys()}
{
    if (m_composite_keys || m_requires_composite_keys) {
        mp_id_handler = std::make_unique<CompositeIdHandler>(m_requires_composite_keys);
    } else {
        mp_id_handler = std::make_unique<SingleIdHandler>();
    }
}

inline
UnitOfWork::~UnitOfWork() {
    clear();
}

inline
Handle UnitOfWork::handle_of(const Entity& entity) const {
    return entity.mp_owner == this? entity.m_handle: 0;
}

inline
Handle UnitOfWork::attach(Entity& entity) {
    if (entity.mp_owner == this) return entity.m_handle;
    if (entity.mp_owner != nullptr)
        throw KvormException(fmt::format("{} entity is attached to another unit of work", entity.class_name()));
    entity.mp_owner = this;
    entity.m_handle = m_next_handle++;
    return entity.m_handle;
}

inline
void UnitOfWork::detach(Entity& entity) {
    if (entity.mp_owner != this) return;
    entity.mp_owner = nullptr;
    entity.m_handle = 0;
}

inline
std::shared_ptr<const ClassMetadata> UnitOfWork::get_class_metadata(const String& class_name) {
    return m_factory.get_metadata_for(class_name);
}

inline
std::shared_ptr<Entity> UnitOfWork::try_get_by_id(const String& class_name, const Identifier& id) const {
    return m_identity_map.get(class_name, mp_id_handler->hash(id));
}

inline
std::shared_ptr<Entity> UnitOfWork::reconstitute(const String& class_name, const Value& raw_key) {
    auto p_meta = get_class_metadata(class_name);
    auto id = mp_id_handler->normalize_id(*p_meta, raw_key);

    if (auto p_entity = try_get_by_id(class_name, id); p_entity != nullptr)
        return p_entity;

    auto storage_id = mp_id_converter->serialize(*p_meta, id);
    DEBUG("find {} {}", p_meta->storage_name(), storage_id.to_str());
    auto data = m_storage.find(p_meta->storage_name(), storage_id);
    if (data.empty())
        throw NotFound(class_name, id.to_str());

    return create_entity(*p_meta, id, data);
}

inline
std::shared_ptr<Entity> UnitOfWork::create_entity(const ClassMetadata& meta, const Identifier& id, const Record& raw_data) {
    auto hash = mp_id_handler->hash(id);
    if (auto p_entity = m_identity_map.get(meta.name(), hash); p_entity != nullptr)
        return p_entity;

    auto p_entity = meta.new_instance();
    hydrate(meta, *p_entity, mp_id_converter->unserialize(meta, raw_data));
    mp_id_handler->set_identifier(meta, *p_entity, id);

    auto handle = attach(*p_entity);
    m_original_data[handle] = raw_data;
    m_identifiers[handle] = IdEntry{id, mp_id_converter->serialize(meta, id), hash};
    m_identity_map.add(meta.name(), hash, p_entity);
    return p_entity;
}

inline
std::shared_ptr<Entity> UnitOfWork::create_embedded_entity(const ClassMetadata& meta, const Record& raw_data) {
    auto p_entity = meta.new_instance();
    hydrate(meta, *p_entity, mp_id_converter->unserialize(meta, raw_data));
    return p_entity;
}

inline
void UnitOfWork::hydrate(const ClassMetadata& meta, Entity& entity, const Record& data) {
    for (auto& [name, value] : data) {
        if (!meta.has_field(name)) {
            entity.set(name, value);
        } else if (meta.is_transient(name)) {
            continue;
        } else if (meta.has_association(name)) {
            if (value.is_nil() || (value.is_map() && value.size() == 0)) {
                entity.set_embedded(name, nullptr);
            } else if (value.is_map()) {
                auto p_target = m_factory.get_metadata_for(meta.association_target(name));
                entity.set_embedded(name, create_embedded_entity(*p_target, value.as_map()));
            } else {
                throw MappingError(fmt::format("{}::{} is embedded, but the stored value is a {}",
                                               meta.name(), name, value.type_name()));
            }
        } else {
            entity.set(name, value);
        }
    }
}

inline
void UnitOfWork::schedule_for_insert(const std::shared_ptr<Entity>& p_entity) {
    ASSERT(p_entity != nullptr);

    auto handle = handle_of(*p_entity);
    if (handle != 0 && (m_identifiers.count(handle) > 0 || m_insertions.count(handle) > 0))
        return;

    auto p_meta = get_class_metadata(p_entity->class_name());
    auto id = mp_id_handler->get_identifier(*p_meta, *p_entity);
    if (id.is_empty())
        throw MissingIdentifier(p_meta->name());

    auto hash = mp_id_handler->hash(id);
    if (m_identity_map.contains(p_meta->name(), hash))
        throw DuplicateIdentifier(p_meta->name(), id.to_str());

    handle = attach(*p_entity);
    m_identity_map.add(p_meta->name(), hash, p_entity);
    m_insertions[handle] = PendingInsert{p_entity, hash};
}

inline
void UnitOfWork::schedule_for_delete(const std::shared_ptr<Entity>& p_entity) {
    ASSERT(p_entity != nullptr);

    auto handle = handle_of(*p_entity);
    if (handle == 0 || m_identifiers.count(handle) == 0)
        throw NotManaged(p_entity->class_name());

    m_deletions[handle] = p_entity;
}

inline
Record UnitOfWork::compute_change_set(const ClassMetadata& meta, const Entity& entity, const Record& original) {
    auto changes = diff(meta, take_snapshot(m_factory, meta, &entity), original);
    if (!changes.empty() && !m_partial_updates)
        return merge(original, changes);
    return changes;
}

inline
void UnitOfWork::process_identity_map() {
    std::vector<std::shared_ptr<Entity>> entities;
    m_identity_map.for_each([&entities] (const String&, const String&, const std::shared_ptr<Entity>& p_entity) {
        entities.push_back(p_entity);
    });

    for (auto& p_entity : entities) {
        auto handle = handle_of(*p_entity);
        if (m_insertions.count(handle) > 0) continue;

        auto id_it = m_identifiers.find(handle);
        auto data_it = m_original_data.find(handle);
        ASSERT(id_it != m_identifiers.end() && data_it != m_original_data.end());

        auto p_meta = get_class_metadata(p_entity->class_name());
        auto changes = compute_change_set(*p_meta, *p_entity, data_it->second);
        if (changes.empty()) continue;

        DEBUG("update {} {} {}", p_meta->storage_name(), id_it->second.storage_id.to_str(), Value{changes}.to_json());
        m_storage.update(p_meta->storage_name(), id_it->second.storage_id, changes);

        if (m_partial_updates) {
            m_original_data[handle] = merge(data_it->second, changes);
        } else {
            m_original_data[handle] = std::move(changes);
        }
    }
}

inline
void UnitOfWork::process_insertions() {
    std::vector<std::pair<Handle, PendingInsert>> pending(m_insertions.begin(), m_insertions.end());

    for (auto& [handle, insert] : pending) {
        auto& entity = *insert.p_entity;
        auto p_meta = get_class_metadata(entity.class_name());
        auto id = mp_id_handler->get_identifier(*p_meta, entity);
        auto storage_id = mp_id_converter->serialize(*p_meta, id);
        if (id.is_empty() || storage_id.is_empty())
            throw MissingIdentifier(p_meta->name());

        // the identifier may have been reassigned since scheduling
        auto hash = mp_id_handler->hash(id);
        if (hash != insert.hash) {
            auto p_other = m_identity_map.get(p_meta->name(), hash);
            if (p_other != nullptr && p_other != insert.p_entity)
                throw DuplicateIdentifier(p_meta->name(), id.to_str());
        }

        auto data = take_snapshot(m_factory, *p_meta, &entity);

        DEBUG("insert {} {} {}", p_meta->storage_name(), storage_id.to_str(), Value{data}.to_json());
        m_storage.insert(p_meta->storage_name(), storage_id, data);

        if (hash != insert.hash)
            m_identity_map.remove(p_meta->name(), insert.hash);

        m_original_data[handle] = std::move(data);
        m_identifiers[handle] = IdEntry{std::move(id), std::move(storage_id), hash};
        m_identity_map.add(p_meta->name(), hash, insert.p_entity);
        m_insertions.erase(handle);
    }
}

inline
void UnitOfWork::process_deletions() {
    std::vector<std::pair<Handle, std::shared_ptr<Entity>>> pending(m_deletions.begin(), m_deletions.end());

    for (auto& [handle, p_entity] : pending) {
        auto id_it = m_identifiers.find(handle);
        ASSERT(id_it != m_identifiers.end());
        auto entry = id_it->second;

        auto p_meta = get_class_metadata(p_entity->class_name());
        DEBUG("remove {} {}", p_meta->storage_name(), entry.storage_id.to_str());
        m_storage.remove(p_meta->storage_name(), entry.storage_id);

        m_identifiers.erase(handle);
        m_original_data.erase(handle);
        m_identity_map.remove(p_meta->name(), entry.hash);
        m_deletions.erase(handle);
        detach(*p_entity);
    }
}

inline
void UnitOfWork::commit() {
    process_identity_map();
    process_insertions();
    process_deletions();

    m_insertions.clear();
    m_deletions.clear();
}

inline
void UnitOfWork::clear() {
    m_identity_map.for_each([this] (const String&, const String&, const std::shared_ptr<Entity>& p_entity) {
        detach(*p_entity);
    });
    for (auto& [handle, insert] : m_insertions)
        detach(*insert.p_entity);
    for (auto& [handle, p_entity] : m_deletions)
        detach(*p_entity);

    m_insertions.clear();
    m_deletions.clear();
    m_identifiers.clear();
    m_original_data.clear();
    m_identity_map.clear();
}

inline
bool UnitOfWork::is_managed(const Entity& entity) const {
    auto handle = handle_of(entity);
    return handle != 0 && m_identifiers.count(handle) > 0;
}

inline
bool UnitOfWork::is_scheduled_for_insert(const Entity& entity) const {
    auto handle = handle_of(entity);
    return handle != 0 && m_insertions.count(handle) > 0;
}

inline
bool UnitOfWork::is_scheduled_for_delete(const Entity& entity) const {
    auto handle = handle_of(entity);
    return handle != 0 && m_deletions.count(handle) > 0;
}

} // namespace kvorm
