#pragma once

#include <string>

#include <arrow/type.h>

namespace qfab {
namespace storage {
namespace parquet {

// Canonical "name:type:nullable;" rendering of the field list
std::string CanonicalSchemaString(const arrow::Schema& schema);

/**
 * @brief Content fingerprint of a schema
 *
 * SHA-256 of the canonical field list, hex encoded, first 16 characters.
 * Field metadata and schema metadata do not take part.
 */
std::string SchemaKey(const arrow::Schema& schema);

} // namespace parquet
} // namespace storage
} // namespace qfab
