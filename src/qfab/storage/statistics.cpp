#include "qfab/storage/statistics.h"

#include <arrow/type_traits.h>

namespace qfab {
namespace storage {

namespace {

bool IsIntegral(arrow::Type::type id) {
    switch (id) {
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
        case arrow::Type::INT64:
        case arrow::Type::UINT8:
        case arrow::Type::UINT16:
        case arrow::Type::UINT32:
        case arrow::Type::UINT64:
        case arrow::Type::TIMESTAMP:
        case arrow::Type::DATE32:
        case arrow::Type::DATE64:
            return true;
        default:
            return false;
    }
}

bool IsFloating(arrow::Type::type id) {
    return id == arrow::Type::FLOAT || id == arrow::Type::DOUBLE || id == arrow::Type::HALF_FLOAT;
}

bool IsStringLike(arrow::Type::type id) {
    return id == arrow::Type::STRING || id == arrow::Type::LARGE_STRING ||
           id == arrow::Type::BINARY || id == arrow::Type::LARGE_BINARY;
}

std::optional<int64_t> AsInt64(const arrow::Scalar& s) {
    switch (s.type->id()) {
        case arrow::Type::INT8: return static_cast<const arrow::Int8Scalar&>(s).value;
        case arrow::Type::INT16: return static_cast<const arrow::Int16Scalar&>(s).value;
        case arrow::Type::INT32: return static_cast<const arrow::Int32Scalar&>(s).value;
        case arrow::Type::INT64: return static_cast<const arrow::Int64Scalar&>(s).value;
        case arrow::Type::UINT8: return static_cast<const arrow::UInt8Scalar&>(s).value;
        case arrow::Type::UINT16: return static_cast<const arrow::UInt16Scalar&>(s).value;
        case arrow::Type::UINT32: return static_cast<const arrow::UInt32Scalar&>(s).value;
        case arrow::Type::UINT64:
            return static_cast<int64_t>(static_cast<const arrow::UInt64Scalar&>(s).value);
        case arrow::Type::TIMESTAMP: return static_cast<const arrow::TimestampScalar&>(s).value;
        case arrow::Type::DATE32: return static_cast<const arrow::Date32Scalar&>(s).value;
        case arrow::Type::DATE64: return static_cast<const arrow::Date64Scalar&>(s).value;
        default: return std::nullopt;
    }
}

std::optional<double> AsDouble(const arrow::Scalar& s) {
    if (s.type->id() == arrow::Type::FLOAT) return static_cast<const arrow::FloatScalar&>(s).value;
    if (s.type->id() == arrow::Type::DOUBLE) return static_cast<const arrow::DoubleScalar&>(s).value;
    auto i = AsInt64(s);
    if (i) return static_cast<double>(*i);
    return std::nullopt;
}

std::string_view AsView(const arrow::Scalar& s) {
    const auto& base = static_cast<const arrow::BaseBinaryScalar&>(s);
    if (!base.value) return std::string_view();
    return std::string_view(reinterpret_cast<const char*>(base.value->data()),
                            static_cast<size_t>(base.value->size()));
}

template <typename T>
int Cmp(const T& a, const T& b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

} // namespace

std::optional<int> CompareScalars(const arrow::Scalar& a, const arrow::Scalar& b) {
    if (!a.is_valid || !b.is_valid) return std::nullopt;
    auto ia = a.type->id();
    auto ib = b.type->id();
    if (IsIntegral(ia) && IsIntegral(ib)) {
        return Cmp(*AsInt64(a), *AsInt64(b));
    }
    if ((IsIntegral(ia) || IsFloating(ia)) && (IsIntegral(ib) || IsFloating(ib))) {
        return Cmp(*AsDouble(a), *AsDouble(b));
    }
    if (IsStringLike(ia) && IsStringLike(ib)) {
        return Cmp(AsView(a), AsView(b));
    }
    if (ia == arrow::Type::BOOL && ib == arrow::Type::BOOL) {
        return Cmp(static_cast<const arrow::BooleanScalar&>(a).value,
                   static_cast<const arrow::BooleanScalar&>(b).value);
    }
    return std::nullopt;
}

void MergeColumnStatistics(ColumnStatistics* into, const ColumnStatistics& other) {
    into->null_count += other.null_count;
    if (!other.has_min_max()) {
        // Unknown bounds in any part make the whole unknown
        into->min.reset();
        into->max.reset();
        return;
    }
    if (!into->has_min_max()) return;
    auto lo = CompareScalars(*other.min, *into->min);
    auto hi = CompareScalars(*other.max, *into->max);
    if (!lo || !hi) {
        into->min.reset();
        into->max.reset();
        return;
    }
    if (*lo < 0) into->min = other.min;
    if (*hi > 0) into->max = other.max;
}

} // namespace storage
} // namespace qfab
