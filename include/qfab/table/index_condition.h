#ifndef QFAB_TABLE_INDEX_CONDITION_H_
#define QFAB_TABLE_INDEX_CONDITION_H_

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include <roaring/roaring64map.hh>

namespace qfab {
namespace table {

/**
 * @brief Inverted-index result handed to a listing table
 *
 * Files are identified by their segment key. When candidate_files is set, any
 * other file is skipped. A row filter keeps only the listed row ids (counted
 * from the start of the file).
 */
struct IndexCondition {
    std::optional<std::set<std::string>> candidate_files;
    std::map<std::string, roaring::Roaring64Map> row_filters;

    bool AllowsFile(const std::string& file_key) const {
        return !candidate_files || candidate_files->count(file_key) > 0;
    }

    const roaring::Roaring64Map* RowFilter(const std::string& file_key) const {
        auto it = row_filters.find(file_key);
        return it == row_filters.end() ? nullptr : &it->second;
    }
};

} // namespace table
} // namespace qfab

#endif // QFAB_TABLE_INDEX_CONDITION_H_
