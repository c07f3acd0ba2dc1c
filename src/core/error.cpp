/// @file error.cpp
/// @brief Error reports for spatial_core

#include <spatial/core/error.hpp>
#include <spdlog/fmt/fmt.h>

#include <iterator>

namespace spatial_core {

namespace {

using Buffer = fmt::memory_buffer;

void append_field(Buffer& out, bool& first, const char* key, const std::string& value) {
    if (value.empty()) {
        return;
    }
    fmt::format_to(std::back_inserter(out), "{}{}={}", first ? " {" : ", ", key, value);
    first = false;
}

void close_fields(Buffer& out, bool first) {
    if (!first) {
        out.push_back('}');
    }
}

void append_domain(Buffer& out, const ShapeError& err) {
    fmt::format_to(std::back_inserter(out), "ShapeError: {}", err.message);
    bool first = true;
    append_field(out, first, "shape", err.shape);
    append_field(out, first, "value", err.value);
    close_fields(out, first);
}

void append_domain(Buffer& out, const SerializationError& err) {
    fmt::format_to(std::back_inserter(out), "SerializationError: {}", err.message);
    bool first = true;
    append_field(out, first, "field", err.field);
    close_fields(out, first);
}

void append_domain(Buffer& out, const ConversionError& err) {
    fmt::format_to(std::back_inserter(out), "ConversionError: {}", err.message);
    bool first = true;
    append_field(out, first, "from", err.source_type);
    append_field(out, first, "to", err.target_type);
    close_fields(out, first);
}

void append_domain(Buffer& out, const MatrixError& err) {
    fmt::format_to(std::back_inserter(out), "MatrixError: {}", err.message);
}

void append_domain(Buffer& out, const std::string& message) {
    fmt::format_to(std::back_inserter(out), "{}", message);
}

} // anonymous namespace

std::string error_report(const Error& error) {
    Buffer out;
    fmt::format_to(std::back_inserter(out), "[{}] ", error_code_name(error.code()));
    std::visit([&out](const auto& err) { append_domain(out, err); }, error.variant());

    for (const auto& [key, value] : error.context()) {
        fmt::format_to(std::back_inserter(out), " {}={}", key, value);
    }
    return fmt::to_string(out);
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;

} // namespace spatial_core
