/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/core/Value.h>
#include <kvorm/core/Identifier.h>

namespace kvorm {

/////////////////////////////////////////////////////////////////////////////
/// Storage driver contract.
/// - Identifiers passed to a driver are in serialized form (see IdConverter).
/// - `find` returns an empty Record when no record exists.
/// - Failures are raised as exceptions, and propagate through the UnitOfWork
///   unchanged.
/////////////////////////////////////////////////////////////////////////////
class Storage
{
  public:
    virtual ~Storage() = default;

    /// True if `update` accepts only the changed fields of a record.
    virtual bool supports_partial_updates() const = 0;

    /// True if identifiers may be composite records.
    virtual bool supports_composite_primary_keys() const = 0;

    /// True if identifiers must be composite records.
    virtual bool requires_composite_primary_keys() const = 0;

    virtual void insert(const String& storage_name, const Identifier& id, const Record& data) = 0;
    virtual void update(const String& storage_name, const Identifier& id, const Record& data) = 0;
    virtual void remove(const String& storage_name, const Identifier& id) = 0;
    virtual Record find(const String& storage_name, const Identifier& id) = 0;

    virtual String name() const = 0;
};

} // namespace kvorm
