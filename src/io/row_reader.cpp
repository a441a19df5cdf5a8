#include <csvutil/io/row_reader.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <system_error>

namespace csvutil::io {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";
constexpr char kQuote = '"';

// Parses one record starting at `line`. While a quoted field is still open
// at the end of a line, `next_line` is asked for the continuation; the line
// break becomes part of the field.
template <typename NextLine>
auto parse_record(std::string line, std::string_view delimiter, NextLine&& next_line) -> Row {
    Row row;
    std::string field;
    bool at_field_start = true;
    bool quoted = false;
    std::size_t pos = 0;
    for (;;) {
        if (pos >= line.size()) {
            if (quoted && next_line(line)) {
                field.push_back('\n');
                pos = 0;
                continue;
            }
            break;
        }
        const char ch = line[pos];
        if (quoted) {
            if (ch == kQuote) {
                if (pos + 1 < line.size() && line[pos + 1] == kQuote) {
                    field.push_back(kQuote);
                    pos += 2;
                } else {
                    quoted = false;
                    ++pos;
                }
                continue;
            }
            field.push_back(ch);
            ++pos;
            continue;
        }
        if (line.compare(pos, delimiter.size(), delimiter) == 0) {
            row.emplace_back(trim(field));
            field.clear();
            at_field_start = true;
            pos += delimiter.size();
            continue;
        }
        if (at_field_start && ch == kQuote) {
            quoted = true;
            at_field_start = false;
            ++pos;
            continue;
        }
        at_field_start = false;
        field.push_back(ch);
        ++pos;
    }
    row.emplace_back(trim(field));
    return row;
}

auto strip_cr(std::string& line) -> void {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(kWhitespace);
    return text.substr(begin, end - begin + 1);
}

auto split_line(std::string_view line, std::string_view delimiter) -> Row {
    if (line.empty()) {
        return {};
    }
    return parse_record(std::string(line), delimiter, [](std::string&) { return false; });
}

auto RowReader::next() -> std::optional<Row> {
    std::string line;
    if (!std::getline(*input_, line)) {
        return std::nullopt;
    }
    ++rows_read_;
    strip_cr(line);
    if (line.empty()) {
        return Row{};
    }
    return parse_record(std::move(line), delimiter_, [this](std::string& continuation) {
        if (!std::getline(*input_, continuation)) {
            return false;
        }
        strip_cr(continuation);
        return true;
    });
}

auto InputSource::open(const std::string& path) -> Result<InputSource> {
    InputSource source;
    if (path.empty()) {
        source.stream_ = &std::cin;
        source.name_ = "<stdin>";
        return source;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return fail(ErrorKind::SourceUnavailable, "'" + path + "' is a directory");
    }
    source.file_ = std::make_unique<std::ifstream>(path);
    if (!*source.file_) {
        return fail(ErrorKind::SourceUnavailable, "cannot open '" + path + "'");
    }
    source.stream_ = source.file_.get();
    source.name_ = path;
    spdlog::debug("reading rows from {}", path);
    return source;
}

}  // namespace csvutil::io
