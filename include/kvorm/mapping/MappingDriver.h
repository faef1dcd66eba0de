/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <vector>
#include <kvorm/mapping/ClassMetadata.h>
#include <kvorm/parser/json.h>
#include <kvorm/core/errors.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Source of class mapping descriptions.
/////////////////////////////////////////////////////////////////////////////
class MappingDriver
{
  public:
    virtual ~MappingDriver() = default;

    /// Populate the metadata of a class.
    /// @throws MappingError if the class is unknown or not a valid entity or embeddable.
    virtual void load_metadata_for_class(const String& class_name, ClassMetadata& meta) const = 0;

    virtual std::vector<String> all_class_names() const = 0;
};

/////////////////////////////////////////////////////////////////////////////
/// Mapping driver reading a JSON document of the form:
/// @code
/// {
///   "User":    {"storage": "users",
///               "fields": {"id": {"id": true},
///                          "name": {},
///                          "address": {"embedded": "Address"},
///                          "cache": {"transient": true}}},
///   "Address": {"embeddable": true,
///               "fields": {"street": {}, "city": {}}}
/// }
/// @endcode
/// - `storage` defaults to the class name.
/// - Fields are mapped in document order, which is the order of composite
///   identifiers.
/////////////////////////////////////////////////////////////////////////////
class JsonMappingDriver : public MappingDriver
{
  public:
    explicit JsonMappingDriver(const Value& document);

    static JsonMappingDriver from_json(const StringView& json) { return JsonMappingDriver{json::parse(json)}; }
    static JsonMappingDriver from_file(const String& file_name) { return JsonMappingDriver{json::parse_file(file_name)}; }

    void load_metadata_for_class(const String& class_name, ClassMetadata& meta) const override;
    std::vector<String> all_class_names() const override;

  private:
    static bool flag(const Value& options, const String& name);

  private:
    Record m_classes;
};


inline
JsonMappingDriver::JsonMappingDriver(const Value& document) {
    if (!document.is_map())
        throw MappingError(fmt::format("Mapping document must be an object, got {}", document.type_name()));
    m_classes = document.as_map();
}

inline
bool JsonMappingDriver::flag(const Value& options, const String& name) {
    auto value = options.get(name);
    return value.type() == Value::BOOL && value.as_bool();
}

inline
void JsonMappingDriver::load_metadata_for_class(const String& class_name, ClassMetadata& meta) const {
    auto it = m_classes.find(class_name);
    if (it == m_classes.end())
        throw MappingError(fmt::format("{} is not a mapped class", class_name));

    auto& desc = it->second;
    if (!desc.is_map())
        throw MappingError(fmt::format("{} mapping must be an object", class_name));

    bool embeddable = flag(desc, "embeddable");
    if (!embeddable && !desc.contains("storage") && !desc.contains("fields"))
        throw MappingError(fmt::format("{} is not a valid key-value-store entity", class_name));

    meta.set_embeddable(embeddable);

    if (!embeddable) {
        auto storage = desc.get("storage");
        if (storage.is_str()) {
            meta.set_storage_name(storage.as_str());
        } else if (!storage.is_nil()) {
            throw MappingError(fmt::format("{} storage name must be a string", class_name));
        }
    }

    auto fields = desc.get("fields");
    if (fields.is_nil()) return;
    if (!fields.is_map())
        throw MappingError(fmt::format("{} fields must be an object", class_name));

    for (auto& [field, options] : fields.as_map()) {
        if (!options.is_map())
            throw MappingError(fmt::format("{}::{} field options must be an object", class_name, field));

        if (flag(options, "id")) {
            meta.map_identifier(field);
        } else if (flag(options, "transient")) {
            meta.skip_transient_field(field);
        } else if (options.contains("embedded")) {
            auto target = options.get("embedded");
            if (!target.is_str())
                throw MappingError(fmt::format("{}::{} embedded target must be a class name", class_name, field));
            meta.map_embedded(field, target.as_str());
        } else {
            meta.map_field(field);
        }
    }
}

inline
std::vector<String> JsonMappingDriver::all_class_names() const {
    std::vector<String> names;
    for (auto& [name, desc] : m_classes)
        names.push_back(name);
    return names;
}

} // namespace kvorm
