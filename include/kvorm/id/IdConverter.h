/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/core/Identifier.h>
#include <kvorm/core/serialize.h>
#include <kvorm/core/errors.h>
#include <kvorm/mapping/ClassMetadata.h>

#include <fmt/format.h>
#include <vector>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Conversion between in-memory identifiers and the storage representation.
/// - `serialize` produces the identifier passed to Storage calls.
/// - `unserialize` cleans a raw storage record before hydration, and never
///   modifies its argument.
/////////////////////////////////////////////////////////////////////////////
class IdConverter
{
  public:
    virtual ~IdConverter() = default;
    virtual Identifier serialize(const ClassMetadata& meta, const Identifier& id) const = 0;
    virtual Record unserialize(const ClassMetadata& meta, const Record& data) const = 0;
};

class NullIdConverter : public IdConverter
{
  public:
    Identifier serialize(const ClassMetadata&, const Identifier& id) const override { return id; }
    Record unserialize(const ClassMetadata&, const Record& data) const override   { return data; }
};

/////////////////////////////////////////////////////////////////////////////
/// Encodes any identifier as a single string key.
/// - Each part is type-tagged (see kvorm::serialize), with ':' and '\' escaped.
/// - A composite is prefixed with '#' and its parts are joined with ':'.
/// - A record may carry the encoded key in the reserved `$key` attribute. It
///   is removed by `unserialize`, and decoded into any identifier fields the
///   record lacks.
/////////////////////////////////////////////////////////////////////////////
class EncodedIdConverter : public IdConverter
{
  public:
    static constexpr auto key_attribute = "$key";

    Identifier serialize(const ClassMetadata& meta, const Identifier& id) const override;
    Record unserialize(const ClassMetadata& meta, const Record& data) const override;

    Identifier decode(const ClassMetadata& meta, const StringView& encoded) const;

  private:
    static String escape(const String& part);
    static std::vector<String> split(const StringView& encoded);
    static Value decode_part(const ClassMetadata& meta, const String& part);
};


inline
String EncodedIdConverter::escape(const String& part) {
    String result;
    result.reserve(part.size());
    for (auto c : part) {
        if (c == ':' || c == '\\') result.push_back('\\');
        result.push_back(c);
    }
    return result;
}

inline
std::vector<String> EncodedIdConverter::split(const StringView& encoded) {
    std::vector<String> parts;
    String part;
    bool escape = false;
    for (auto c : encoded) {
        if (escape) {
            part.push_back(c);
            escape = false;
        } else if (c == '\\') {
            escape = true;
        } else if (c == ':') {
            parts.push_back(std::move(part));
            part.clear();
        } else {
            part.push_back(c);
        }
    }
    parts.push_back(std::move(part));
    return parts;
}

inline
Value EncodedIdConverter::decode_part(const ClassMetadata& meta, const String& part) {
    Value value;
    if (!deserialize(part, value))
        throw InvalidIdentifier(fmt::format("{} identifier has an invalid encoding: '{}'", meta.name(), part));
    return value;
}

inline
Identifier EncodedIdConverter::serialize(const ClassMetadata& meta, const Identifier& id) const {
    if (id.is_empty()) return id;
    if (!id.is_composite()) return Identifier{Value{escape(kvorm::serialize(id.value()))}};

    String result = "#";
    bool first = true;
    for (auto& [field, value] : id.fields()) {
        if (!first) result.push_back(':');
        first = false;
        result += escape(kvorm::serialize(value));
    }
    return Identifier{Value{std::move(result)}};
}

inline
Identifier EncodedIdConverter::decode(const ClassMetadata& meta, const StringView& encoded) const {
    if (encoded.empty())
        throw InvalidIdentifier(fmt::format("{} identifier is empty", meta.name()));

    if (encoded[0] != '#') {
        auto parts = split(encoded);
        if (parts.size() != 1)
            throw InvalidIdentifier(fmt::format("{} identifier has an invalid encoding: '{}'", meta.name(), encoded));
        return Identifier{decode_part(meta, parts.front())};
    }

    auto parts = split(encoded.substr(1));
    auto& fields = meta.identifier();
    if (parts.size() != fields.size())
        throw InvalidIdentifier(fmt::format("{} identifier has {} parts, expected {}", meta.name(), parts.size(), fields.size()));

    Record id;
    for (size_t i = 0; i < parts.size(); ++i)
        id.insert({fields[i], decode_part(meta, parts[i])});
    return Identifier{std::move(id)};
}

inline
Record EncodedIdConverter::unserialize(const ClassMetadata& meta, const Record& data) const {
    Record result = data;
    auto it = result.find(key_attribute);
    if (it == result.end()) return result;

    auto encoded = it->second;
    result.erase(key_attribute);
    if (!encoded.is_str()) return result;

    auto id = decode(meta, encoded.as_str());
    auto& fields = meta.identifier();
    if (id.is_composite()) {
        for (auto& [field, value] : id.fields()) {
            if (result.find(field) == result.end())
                result.insert({field, value});
        }
    } else if (!fields.empty() && result.find(fields.front()) == result.end()) {
        result.insert({fields.front(), id.value()});
    }
    return result;
}

} // namespace kvorm
