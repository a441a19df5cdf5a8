#include <csvutil/core/row.hpp>

#include <fmt/format.h>

namespace csvutil {

auto field_at(const Row& row, FieldIndex index, std::size_t row_number)
    -> Result<const std::string*> {
    if (index >= row.size()) {
        return fail(ErrorKind::FieldIndexOutOfRange,
                    fmt::format("field {} requested but row {} has {} field(s)", index,
                                row_number, row.size()));
    }
    return &row[index];
}

}  // namespace csvutil
