#include "core/types.hpp"
#include "core/error.hpp"

#include <format>

namespace dbaccess {

void validate_page(int64_t offset, int64_t limit) {
    if (offset < 0) {
        throw InvalidArgumentError(std::format("offset must be non-negative (got {})", offset));
    }
    if (limit < 0) {
        throw InvalidArgumentError(std::format("limit must be non-negative (got {})", limit));
    }
}

void check_row_alignment(const DbQueryResult& result) {
    const size_t width = result.columns.size();
    for (size_t i = 0; i < result.rows.size(); ++i) {
        if (result.rows[i].size() != width) {
            throw DriverError(std::format(
                "Row {} has {} values but the result has {} columns",
                i, result.rows[i].size(), width));
        }
    }
}

} // namespace dbaccess
