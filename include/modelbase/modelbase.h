#ifndef MODELBASE_H
#define MODELBASE_H

// Utility functions
#include "utils/utils.h"
#include "utils/uuidv7.h"

// Core components
#include "core/config.h"
#include "core/database_connector.h"
#include "core/exceptions.h"
#include "core/logger.h"
#include "core/types.h"

// Fields and validation
#include "validation/validation_rule.h"
#include "validation/validation_rule_factory.h"
#include "fields/field_base.h"
#include "fields/fields.h"
#include "fields/field_factory.h"
#include "catalog/validation_rule_catalog.h"
#include "catalog/field_type_catalog.h"

// Metadata
#include "metadata/field_descriptor.h"
#include "metadata/model_hierarchy.h"
#include "metadata/core_fields.h"
#include "metadata/options_registry.h"
#include "metadata/entity_metadata.h"
#include "metadata/relationship_metadata.h"
#include "metadata/relationship_resolver.h"
#include "metadata/metadata_engine.h"

// Runtime models
#include "model/model_context.h"
#include "model/relationship.h"
#include "model/model.h"

// Command line application
#include "app.h"

// For convenience to using json,
// lets include it here
#include <nlohmann/json.hpp>

#endif // MODELBASE_H
