#pragma once

#include <csvutil/core/error.hpp>
#include <csvutil/core/row.hpp>

#include <cstddef>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace csvutil::io {

/// Streaming reader for delimiter-separated text.
///
/// Yields one Row per record. Fields are trimmed of surrounding whitespace.
/// A field that opens with a double quote runs to its closing quote and may
/// contain the delimiter, line breaks and doubled ("") quotes. An empty line
/// yields a row with no fields.
class RowReader {
   public:
    /// `delimiter` must be non-empty.
    RowReader(std::istream& input, std::string delimiter)
        : input_(&input), delimiter_(std::move(delimiter)) {}

    /// Next row, or std::nullopt at end of input.
    [[nodiscard]] auto next() -> std::optional<Row>;

    /// Rows returned so far.
    [[nodiscard]] auto rows_read() const noexcept -> std::size_t { return rows_read_; }

    [[nodiscard]] auto delimiter() const noexcept -> const std::string& { return delimiter_; }

   private:
    std::istream* input_;
    std::string delimiter_;
    std::size_t rows_read_ = 0;
};

/// Split a single line (no embedded line breaks) into trimmed fields.
[[nodiscard]] auto split_line(std::string_view line, std::string_view delimiter) -> Row;

/// Trim spaces, tabs, CR, LF, VT and FF from both ends.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/// File or standard input, selected by path. An empty path means stdin.
class InputSource {
   public:
    [[nodiscard]] static auto open(const std::string& path) -> Result<InputSource>;

    [[nodiscard]] auto stream() noexcept -> std::istream& { return *stream_; }

    /// "<stdin>" or the file path.
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

   private:
    InputSource() = default;

    std::unique_ptr<std::ifstream> file_;
    std::istream* stream_ = nullptr;
    std::string name_;
};

}  // namespace csvutil::io
