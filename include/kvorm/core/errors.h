/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <fmt/format.h>
#include <kvorm/support/types.h>
#include <kvorm/support/exception.h>

namespace kvorm {

struct NotFound : public KvormException
{
    NotFound(const String& class_name, const String& id)
      : KvormException(fmt::format("{} with id {} not found in storage", class_name, id)) {}
};

struct MissingIdentifier : public KvormException
{
    MissingIdentifier(const String& class_name)
      : KvormException(fmt::format("Trying to persist {} entity that has no id", class_name)) {}
};

struct DuplicateIdentifier : public KvormException
{
    DuplicateIdentifier(const String& class_name, const String& id)
      : KvormException(fmt::format("{} with id {} already exists", class_name, id)) {}
};

struct NotManaged : public KvormException
{
    NotManaged(const String& class_name)
      : KvormException(fmt::format("{} entity scheduled for deletion is not managed. "
                                   "Only managed entities can be deleted.", class_name)) {}
};

struct InvalidIdentifier : public KvormException
{
    InvalidIdentifier(String&& error) : KvormException(std::forward<String>(error)) {}
};

struct MappingError : public KvormException
{
    MappingError(String&& error) : KvormException(std::forward<String>(error)) {}
};

struct StorageError : public KvormException
{
    StorageError(String&& error) : KvormException(std::forward<String>(error)) {}
};

} // namespace kvorm
