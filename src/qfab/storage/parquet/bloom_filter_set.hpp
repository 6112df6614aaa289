#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <arrow/api.h>
#include <parquet/bloom_filter.h>

#include "qfab/core/result.h"

namespace qfab {
namespace storage {
namespace parquet {

/**
 * @brief One split-block bloom filter per column, stored as a sidecar
 *
 * Sidecar layout: magic "QFBF", u32 version, u32 filter count, then for each
 * filter u32 name length, name bytes, u32 filter length and the filter as
 * written by BlockSplitBloomFilter::WriteTo. Integers are little endian.
 *
 * Integer, timestamp and string/binary columns are supported. Integers hash as
 * int64 so a filter built over int32 answers int64 probes.
 */
class BloomFilterSet {
public:
    static constexpr uint32_t kDefaultNdv = 100000;
    static constexpr double kDefaultFpp = 0.01;

    BloomFilterSet() = default;
    BloomFilterSet(BloomFilterSet&&) = default;
    BloomFilterSet& operator=(BloomFilterSet&&) = default;

    static bool IsSupportedType(const arrow::DataType& type);

    // Sidecar object location for a segment file
    static std::string SidecarPath(const std::string& location) { return location + ".bloom"; }

    void CreateFilter(const std::string& field, uint32_t estimated_entries = kDefaultNdv,
                      double fpp = kDefaultFpp);
    bool HasFilter(const std::string& field) const { return filters_.count(field) > 0; }

    void InsertInt(const std::string& field, int64_t value);
    void InsertBytes(const std::string& field, std::string_view value);

    // Adds every non-null value of the array to the field's filter
    core::Result<void> InsertArray(const std::string& field, const arrow::Array& values);

    // True when the value may be present. Fields without a filter and
    // unsupported probe types always answer true.
    bool MightContain(const std::string& field, const arrow::Scalar& value) const;

    std::vector<std::string> fields() const;
    size_t size() const { return filters_.size(); }
    bool empty() const { return filters_.empty(); }

    core::Result<std::shared_ptr<arrow::Buffer>> Serialize() const;
    static core::Result<BloomFilterSet> Deserialize(const std::shared_ptr<arrow::Buffer>& data);

private:
    ::parquet::BlockSplitBloomFilter* Find(const std::string& field) const;

    std::map<std::string, std::unique_ptr<::parquet::BlockSplitBloomFilter>> filters_;
};

} // namespace parquet
} // namespace storage
} // namespace qfab
