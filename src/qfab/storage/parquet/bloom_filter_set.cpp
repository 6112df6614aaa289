#include "qfab/storage/parquet/bloom_filter_set.hpp"

#include <cstring>

#include <arrow/io/memory.h>
#include <parquet/properties.h>
#include <parquet/types.h>

#include "qfab/common/logger.h"

namespace qfab {
namespace storage {
namespace parquet {

namespace {

constexpr char kMagic[4] = {'Q', 'F', 'B', 'F'};
constexpr uint32_t kVersion = 1;

void PutU32(std::string* out, uint32_t v) {
    char bytes[4];
    for (int i = 0; i < 4; ++i) bytes[i] = static_cast<char>((v >> (8 * i)) & 0xFF);
    out->append(bytes, 4);
}

bool GetU32(const uint8_t* data, int64_t size, int64_t* pos, uint32_t* v) {
    if (*pos + 4 > size) return false;
    uint32_t out = 0;
    for (int i = 0; i < 4; ++i) out |= static_cast<uint32_t>(data[*pos + i]) << (8 * i);
    *pos += 4;
    *v = out;
    return true;
}

template <typename ArrayType>
void InsertIntegers(::parquet::BlockSplitBloomFilter* filter, const arrow::Array& values) {
    const auto& typed = static_cast<const ArrayType&>(values);
    for (int64_t i = 0; i < typed.length(); ++i) {
        if (typed.IsNull(i)) continue;
        filter->InsertHash(filter->Hash(static_cast<int64_t>(typed.Value(i))));
    }
}

template <typename ArrayType>
void InsertBinary(::parquet::BlockSplitBloomFilter* filter, const arrow::Array& values) {
    const auto& typed = static_cast<const ArrayType&>(values);
    for (int64_t i = 0; i < typed.length(); ++i) {
        if (typed.IsNull(i)) continue;
        auto view = typed.GetView(i);
        ::parquet::ByteArray ba(static_cast<uint32_t>(view.size()),
                                reinterpret_cast<const uint8_t*>(view.data()));
        filter->InsertHash(filter->Hash(&ba));
    }
}

} // namespace

bool BloomFilterSet::IsSupportedType(const arrow::DataType& type) {
    switch (type.id()) {
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
        case arrow::Type::INT64:
        case arrow::Type::UINT8:
        case arrow::Type::UINT16:
        case arrow::Type::UINT32:
        case arrow::Type::UINT64:
        case arrow::Type::TIMESTAMP:
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY:
            return true;
        default:
            return false;
    }
}

void BloomFilterSet::CreateFilter(const std::string& field, uint32_t estimated_entries, double fpp) {
    if (estimated_entries == 0) estimated_entries = kDefaultNdv;
    uint32_t num_bytes = ::parquet::BlockSplitBloomFilter::OptimalNumOfBytes(estimated_entries, fpp);
    auto filter = std::make_unique<::parquet::BlockSplitBloomFilter>();
    filter->Init(num_bytes);
    filters_[field] = std::move(filter);
    QFAB_DEBUG("[BloomFilter] Created filter for {}: {} bytes for {} entries, FPP={}",
               field, num_bytes, estimated_entries, fpp);
}

::parquet::BlockSplitBloomFilter* BloomFilterSet::Find(const std::string& field) const {
    auto it = filters_.find(field);
    return it == filters_.end() ? nullptr : it->second.get();
}

void BloomFilterSet::InsertInt(const std::string& field, int64_t value) {
    if (auto* filter = Find(field)) {
        filter->InsertHash(filter->Hash(value));
    }
}

void BloomFilterSet::InsertBytes(const std::string& field, std::string_view value) {
    if (auto* filter = Find(field)) {
        ::parquet::ByteArray ba(static_cast<uint32_t>(value.size()),
                                reinterpret_cast<const uint8_t*>(value.data()));
        filter->InsertHash(filter->Hash(&ba));
    }
}

core::Result<void> BloomFilterSet::InsertArray(const std::string& field, const arrow::Array& values) {
    auto* filter = Find(field);
    if (!filter) {
        return core::Result<void>::error("No bloom filter for field " + field, core::Error::Code::NOT_FOUND);
    }
    switch (values.type_id()) {
        case arrow::Type::INT8: InsertIntegers<arrow::Int8Array>(filter, values); break;
        case arrow::Type::INT16: InsertIntegers<arrow::Int16Array>(filter, values); break;
        case arrow::Type::INT32: InsertIntegers<arrow::Int32Array>(filter, values); break;
        case arrow::Type::INT64: InsertIntegers<arrow::Int64Array>(filter, values); break;
        case arrow::Type::UINT8: InsertIntegers<arrow::UInt8Array>(filter, values); break;
        case arrow::Type::UINT16: InsertIntegers<arrow::UInt16Array>(filter, values); break;
        case arrow::Type::UINT32: InsertIntegers<arrow::UInt32Array>(filter, values); break;
        case arrow::Type::UINT64: InsertIntegers<arrow::UInt64Array>(filter, values); break;
        case arrow::Type::TIMESTAMP: InsertIntegers<arrow::TimestampArray>(filter, values); break;
        case arrow::Type::STRING: InsertBinary<arrow::StringArray>(filter, values); break;
        case arrow::Type::LARGE_STRING: InsertBinary<arrow::LargeStringArray>(filter, values); break;
        case arrow::Type::BINARY: InsertBinary<arrow::BinaryArray>(filter, values); break;
        case arrow::Type::LARGE_BINARY: InsertBinary<arrow::LargeBinaryArray>(filter, values); break;
        default:
            return core::Result<void>::error("Bloom filters do not support type " + values.type()->ToString(),
                                             core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

bool BloomFilterSet::MightContain(const std::string& field, const arrow::Scalar& value) const {
    auto* filter = Find(field);
    if (!filter || !value.is_valid) {
        return true;
    }
    switch (value.type->id()) {
        case arrow::Type::INT8:
            return filter->FindHash(filter->Hash(static_cast<int64_t>(static_cast<const arrow::Int8Scalar&>(value).value)));
        case arrow::Type::INT16:
            return filter->FindHash(filter->Hash(static_cast<int64_t>(static_cast<const arrow::Int16Scalar&>(value).value)));
        case arrow::Type::INT32:
            return filter->FindHash(filter->Hash(static_cast<int64_t>(static_cast<const arrow::Int32Scalar&>(value).value)));
        case arrow::Type::INT64:
            return filter->FindHash(filter->Hash(static_cast<const arrow::Int64Scalar&>(value).value));
        case arrow::Type::UINT8:
            return filter->FindHash(filter->Hash(static_cast<int64_t>(static_cast<const arrow::UInt8Scalar&>(value).value)));
        case arrow::Type::UINT16:
            return filter->FindHash(filter->Hash(static_cast<int64_t>(static_cast<const arrow::UInt16Scalar&>(value).value)));
        case arrow::Type::UINT32:
            return filter->FindHash(filter->Hash(static_cast<int64_t>(static_cast<const arrow::UInt32Scalar&>(value).value)));
        case arrow::Type::UINT64:
            return filter->FindHash(filter->Hash(static_cast<int64_t>(static_cast<const arrow::UInt64Scalar&>(value).value)));
        case arrow::Type::TIMESTAMP:
            return filter->FindHash(filter->Hash(static_cast<const arrow::TimestampScalar&>(value).value));
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
        case arrow::Type::BINARY:
        case arrow::Type::LARGE_BINARY: {
            const auto& bin = static_cast<const arrow::BaseBinaryScalar&>(value);
            ::parquet::ByteArray ba(static_cast<uint32_t>(bin.value->size()), bin.value->data());
            return filter->FindHash(filter->Hash(&ba));
        }
        default:
            return true;
    }
}

std::vector<std::string> BloomFilterSet::fields() const {
    std::vector<std::string> out;
    out.reserve(filters_.size());
    for (const auto& [name, filter] : filters_) out.push_back(name);
    return out;
}

core::Result<std::shared_ptr<arrow::Buffer>> BloomFilterSet::Serialize() const {
    using BufferResult = core::Result<std::shared_ptr<arrow::Buffer>>;
    std::string out(kMagic, sizeof(kMagic));
    PutU32(&out, kVersion);
    PutU32(&out, static_cast<uint32_t>(filters_.size()));
    for (const auto& [name, filter] : filters_) {
        auto sink = arrow::io::BufferOutputStream::Create();
        if (!sink.ok()) {
            return BufferResult::error("Failed to allocate bloom filter buffer: " + sink.status().ToString(),
                                       core::Error::Code::INTERNAL);
        }
        filter->WriteTo(sink->get());
        auto bytes = (*sink)->Finish();
        if (!bytes.ok()) {
            return BufferResult::error("Failed to serialize bloom filter " + name + ": " + bytes.status().ToString(),
                                       core::Error::Code::INTERNAL);
        }
        PutU32(&out, static_cast<uint32_t>(name.size()));
        out += name;
        PutU32(&out, static_cast<uint32_t>((*bytes)->size()));
        out.append(reinterpret_cast<const char*>((*bytes)->data()), static_cast<size_t>((*bytes)->size()));
    }
    return BufferResult(arrow::Buffer::FromString(std::move(out)));
}

core::Result<BloomFilterSet> BloomFilterSet::Deserialize(const std::shared_ptr<arrow::Buffer>& data) {
    using SetResult = core::Result<BloomFilterSet>;
    if (!data || data->size() < 12 || std::memcmp(data->data(), kMagic, sizeof(kMagic)) != 0) {
        return SetResult::error("Not a bloom filter sidecar", core::Error::Code::INVALID_ARGUMENT);
    }
    const uint8_t* bytes = data->data();
    int64_t size = data->size();
    int64_t pos = 4;
    uint32_t version = 0;
    uint32_t count = 0;
    if (!GetU32(bytes, size, &pos, &version) || version != kVersion || !GetU32(bytes, size, &pos, &count)) {
        return SetResult::error("Unsupported bloom filter sidecar version", core::Error::Code::INVALID_ARGUMENT);
    }

    BloomFilterSet set;
    ::parquet::ReaderProperties reader_props;
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t name_len = 0;
        if (!GetU32(bytes, size, &pos, &name_len) || pos + name_len > size) {
            return SetResult::error("Truncated bloom filter sidecar", core::Error::Code::INVALID_ARGUMENT);
        }
        std::string name(reinterpret_cast<const char*>(bytes + pos), name_len);
        pos += name_len;
        uint32_t filter_len = 0;
        if (!GetU32(bytes, size, &pos, &filter_len) || pos + filter_len > size) {
            return SetResult::error("Truncated bloom filter sidecar", core::Error::Code::INVALID_ARGUMENT);
        }
        arrow::io::BufferReader reader(arrow::SliceBuffer(data, pos, filter_len));
        try {
            auto loaded = ::parquet::BlockSplitBloomFilter::Deserialize(reader_props, &reader, filter_len);
            set.filters_[name] = std::make_unique<::parquet::BlockSplitBloomFilter>(std::move(loaded));
        } catch (const std::exception& e) {
            return SetResult::error("Failed to deserialize bloom filter " + name + ": " + e.what(),
                                    core::Error::Code::INVALID_ARGUMENT);
        }
        pos += filter_len;
    }
    return SetResult(std::move(set));
}

} // namespace parquet
} // namespace storage
} // namespace qfab
