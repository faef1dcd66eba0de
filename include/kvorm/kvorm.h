/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/core/Value.h>
#include <kvorm/core/Identifier.h>
#include <kvorm/core/Entity.h>
#include <kvorm/parser/json.h>
#include <kvorm/mapping/ClassMetadata.h>
#include <kvorm/mapping/MappingDriver.h>
#include <kvorm/mapping/ClassMetadataFactory.h>
#include <kvorm/storage/Storage.h>
#include <kvorm/storage/ArrayStorage.h>
#include <kvorm/Configuration.h>
#include <kvorm/UnitOfWork.h>
#include <kvorm/EntityManager.h>
#include <kvorm/support/logging.h>
#include <kvorm/fmt_support.h>
