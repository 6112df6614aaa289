#include "qfab/storage/parquet/schema_key.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace qfab {
namespace storage {
namespace parquet {

namespace {
constexpr size_t kSchemaKeyLength = 16;
} // namespace

std::string CanonicalSchemaString(const arrow::Schema& schema) {
    std::string out;
    for (const auto& field : schema.fields()) {
        out += field->name();
        out += ':';
        out += field->type()->ToString();
        out += ':';
        out += field->nullable() ? "true" : "false";
        out += ';';
    }
    return out;
}

std::string SchemaKey(const arrow::Schema& schema) {
    std::string canonical = CanonicalSchemaString(schema);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(canonical.c_str()), canonical.length(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str().substr(0, kSchemaKeyLength);
}

} // namespace parquet
} // namespace storage
} // namespace qfab
