#include <csvutil/io/row_writer.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace csvutil::io {

auto join_row(const Row& row, std::string_view delimiter) -> std::string {
    return fmt::format("{}", fmt::join(row, delimiter));
}

void write_row(std::ostream& out, const Row& row, std::string_view delimiter) {
    out << join_row(row, delimiter) << '\n';
}

}  // namespace csvutil::io
