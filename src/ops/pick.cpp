#include <csvutil/io/row_reader.hpp>
#include <csvutil/ops/pick.hpp>

#include <fmt/format.h>

#include <charconv>

namespace csvutil::ops {

auto parse_field_list(std::string_view text) -> Result<std::vector<FieldIndex>> {
    std::vector<FieldIndex> fields;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t comma = text.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        auto token = io::trim(text.substr(pos, comma - pos));
        FieldIndex field = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), field);
        if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
            return fail(ErrorKind::MalformedSpec,
                        fmt::format("unable to interpret field '{}' in '{}'", token, text));
        }
        fields.push_back(field);
        pos = comma + 1;
    }
    return fields;
}

auto pick(const Row& row, const std::vector<FieldIndex>& fields, std::size_t row_number)
    -> Result<Row> {
    Row out;
    out.reserve(fields.size());
    for (FieldIndex field : fields) {
        auto value = field_at(row, field, row_number);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        out.push_back(**value);
    }
    return out;
}

}  // namespace csvutil::ops
