/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <memory>

#include <kvorm/id/IdConverter.h>
#include <kvorm/mapping/MappingDriver.h>
#include <kvorm/mapping/ClassMetadataFactory.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Configuration of an EntityManager.
/// - The identifier converter defaults to NullIdConverter.
/// - The mapping driver is used by `new_metadata_factory`, and may be unset
///   when all metadata is registered programmatically.
/////////////////////////////////////////////////////////////////////////////
class Configuration
{
  public:
    Configuration() : mp_id_converter{std::make_shared<NullIdConverter>()} {}

    const std::shared_ptr<const IdConverter>& id_converter() const { return mp_id_converter; }
    void set_id_converter(std::shared_ptr<const IdConverter> p_converter) {
        ASSERT(p_converter != nullptr);
        mp_id_converter = std::move(p_converter);
    }

    const std::shared_ptr<const MappingDriver>& mapping_driver() const  { return mp_mapping_driver; }
    void set_mapping_driver(std::shared_ptr<const MappingDriver> p_driver) { mp_mapping_driver = std::move(p_driver); }

    std::shared_ptr<ClassMetadataFactory> new_metadata_factory() const {
        return std::make_shared<ClassMetadataFactory>(mp_mapping_driver);
    }

  private:
    std::shared_ptr<const IdConverter> mp_id_converter;
    std::shared_ptr<const MappingDriver> mp_mapping_driver;
};

} // namespace kvorm
