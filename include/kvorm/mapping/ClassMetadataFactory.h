/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <memory>
#include <vector>
#include <tsl/ordered_map.h>

#include <kvorm/mapping/ClassMetadata.h>
#include <kvorm/mapping/MappingDriver.h>
#include <kvorm/support/logging.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Cache of class metadata.
/// - Metadata is loaded through the MappingDriver on first use, or registered
///   programmatically with `set_metadata_for`.
/// - A class that is not embeddable must declare at least one identifier.
/////////////////////////////////////////////////////////////////////////////
class ClassMetadataFactory
{
  public:
    ClassMetadataFactory() = default;
    explicit ClassMetadataFactory(std::shared_ptr<const MappingDriver> p_driver) : mp_driver{std::move(p_driver)} {}

    ClassMetadataFactory(const ClassMetadataFactory&) = delete;
    ClassMetadataFactory& operator = (const ClassMetadataFactory&) = delete;

    /// @throws MappingError if the class cannot be loaded.
    std::shared_ptr<const ClassMetadata> get_metadata_for(const String& class_name);

    bool has_metadata_for(const String& class_name) const { return m_cache.find(class_name) != m_cache.end(); }

    void set_metadata_for(std::shared_ptr<ClassMetadata> p_meta);

    /// Register a factory for instances of a class.
    void set_instantiator(const String& class_name, ClassMetadata::Instantiator instantiator);

    /// Load every class known to the mapping driver.
    std::vector<std::shared_ptr<const ClassMetadata>> get_all_metadata();

    const MappingDriver* driver() const { return mp_driver.get(); }

  private:
    std::shared_ptr<ClassMetadata> load(const String& class_name);
    static void validate(const ClassMetadata& meta);

  private:
    std::shared_ptr<const MappingDriver> mp_driver;
    tsl::ordered_map<String, std::shared_ptr<ClassMetadata>> m_cache;
};


inline
void ClassMetadataFactory::validate(const ClassMetadata& meta) {
    if (!meta.is_embeddable() && meta.identifier().empty())
        throw MappingError(fmt::format("{} does not declare an identifier field", meta.name()));
}

inline
std::shared_ptr<ClassMetadata> ClassMetadataFactory::load(const String& class_name) {
    auto it = m_cache.find(class_name);
    if (it != m_cache.end()) return it->second;

    if (!mp_driver)
        throw MappingError(fmt::format("{} is not registered and no mapping driver is configured", class_name));

    auto p_meta = std::make_shared<ClassMetadata>(class_name);
    mp_driver->load_metadata_for_class(class_name, *p_meta);
    validate(*p_meta);
    DEBUG("loaded metadata for {} (storage={})", class_name, p_meta->storage_name());
    m_cache.insert({class_name, p_meta});
    return p_meta;
}

inline
std::shared_ptr<const ClassMetadata> ClassMetadataFactory::get_metadata_for(const String& class_name) {
    return load(class_name);
}

inline
void ClassMetadataFactory::set_metadata_for(std::shared_ptr<ClassMetadata> p_meta) {
    ASSERT(p_meta != nullptr);
    validate(*p_meta);
    m_cache[p_meta->name()] = std::move(p_meta);
}

inline
void ClassMetadataFactory::set_instantiator(const String& class_name, ClassMetadata::Instantiator instantiator) {
    load(class_name)->set_instantiator(std::move(instantiator));
}

inline
std::vector<std::shared_ptr<const ClassMetadata>> ClassMetadataFactory::get_all_metadata() {
    std::vector<std::shared_ptr<const ClassMetadata>> result;
    if (mp_driver) {
        for (auto& name : mp_driver->all_class_names())
            load(name);
    }
    for (auto& [name, p_meta] : m_cache)
        result.push_back(p_meta);
    return result;
}

} // namespace kvorm
