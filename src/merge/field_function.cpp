#include <csvutil/merge/field_function.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>

namespace csvutil::merge {

namespace {

auto is_digit(char ch) -> bool {
    return ch >= '0' && ch <= '9';
}

auto is_lower(char ch) -> bool {
    return ch >= 'a' && ch <= 'z';
}

auto malformed(std::string_view spec) -> std::unexpected<Error> {
    return fail(ErrorKind::MalformedSpec,
                fmt::format("unable to interpret field:function '{}'", spec));
}

}  // namespace

auto parse_field_function(std::string_view spec) -> Result<FieldFunction> {
    const auto colon = spec.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == spec.size()) {
        return malformed(spec);
    }
    const auto field_text = spec.substr(0, colon);
    const auto name = spec.substr(colon + 1);
    for (char ch : field_text) {
        if (!is_digit(ch)) {
            return malformed(spec);
        }
    }
    for (char ch : name) {
        if (!is_lower(ch)) {
            return malformed(spec);
        }
    }

    FieldIndex field = 0;
    auto [ptr, ec] = std::from_chars(field_text.data(), field_text.data() + field_text.size(), field);
    if (ec == std::errc::result_out_of_range) {
        return fail(ErrorKind::FieldIndexOutOfRange,
                    fmt::format("field index {} in '{}' is too large", field_text, spec));
    }
    if (ec != std::errc{} || ptr != field_text.data() + field_text.size()) {
        return malformed(spec);
    }

    auto reduction = resolve_reduction(name);
    if (!reduction) {
        return std::unexpected(std::move(reduction.error()));
    }
    return FieldFunction{.field = field, .reduction = *reduction};
}

auto parse_field_functions(const std::vector<std::string>& specs)
    -> Result<std::vector<FieldFunction>> {
    std::vector<FieldFunction> bindings;
    bindings.reserve(specs.size());
    for (const auto& spec : specs) {
        auto binding = parse_field_function(spec);
        if (!binding) {
            return std::unexpected(std::move(binding.error()));
        }
        spdlog::debug("merge: field {} bound to {}", binding->field,
                      reduction_name(binding->reduction));
        bindings.push_back(*binding);
    }
    return bindings;
}

}  // namespace csvutil::merge
