/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <memory>

#include <kvorm/UnitOfWork.h>
#include <kvorm/Configuration.h>
#include <kvorm/storage/Storage.h>
#include <kvorm/mapping/ClassMetadataFactory.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Application facade over a UnitOfWork.
/// - `find` returns nullptr when the storage has no record for the key.
/// - Changes to managed instances, and scheduled insertions and deletions,
///   are written by `flush`.
/////////////////////////////////////////////////////////////////////////////
class EntityManager
{
  public:
    EntityManager(std::shared_ptr<Storage> p_storage,
                  std::shared_ptr<ClassMetadataFactory> p_factory,
                  const Configuration& config = {});

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator = (const EntityManager&) = delete;

    std::shared_ptr<Entity> find(const String& class_name, const Value& key);

    template <typename T>
    std::shared_ptr<T> find(const String& class_name, const Value& key) {
        return std::dynamic_pointer_cast<T>(find(class_name, key));
    }

    /// Create a blank, unmanaged instance of a class.
    std::shared_ptr<Entity> create(const String& class_name);

    template <typename T>
    std::shared_ptr<T> create(const String& class_name) {
        return std::dynamic_pointer_cast<T>(create(class_name));
    }

    void persist(const std::shared_ptr<Entity>& p_entity) { m_uow.schedule_for_insert(p_entity); }
    void remove(const std::shared_ptr<Entity>& p_entity)  { m_uow.schedule_for_delete(p_entity); }
    void flush()                                          { m_uow.commit(); }
    void clear()                                          { m_uow.clear(); }

    UnitOfWork& unit_of_work()                 { return m_uow; }
    ClassMetadataFactory& metadata_factory()   { return *mp_factory; }
    Storage& unwrap()                          { return *mp_storage; }

    std::shared_ptr<const ClassMetadata> get_class_metadata(const String& class_name) {
        return mp_factory->get_metadata_for(class_name);
    }

  private:
    std::shared_ptr<Storage> mp_storage;
    std::shared_ptr<ClassMetadataFactory> mp_factory;
    UnitOfWork m_uow;
};


inline
EntityManager::EntityManager(std::shared_ptr<Storage> p_storage,
                             std::shared_ptr<ClassMetadataFactory> p_factory,
                             const Configuration& config)
  : mp_storage{std::move(p_storage)}
  , mp_factory{p_factory? std::move(p_factory): config.new_metadata_factory()}
  , m_uow{*mp_factory, *mp_storage, config}
{}

inline
std::shared_ptr<Entity> EntityManager::find(const String& class_name, const Value& key) {
    try {
        return m_uow.reconstitute(class_name, key);
    } catch (const NotFound&) {
        return nullptr;
    }
}

inline
std::shared_ptr<Entity> EntityManager::create(const String& class_name) {
    return get_class_metadata(class_name)->new_instance();
}

} // namespace kvorm
