// codec.cpp - implementation of the dataset state checks

#include "dset/codec.hpp"
#include <stdexcept>

namespace dset {

auto to_string(archive_format format) -> const char* {
    switch (format) {
        case archive_format::binary: return "binary";
        case archive_format::ascii: return "ascii";
    }
    return "unknown";
}

auto from_string(std::type_identity<archive_format>, const std::string& s) -> archive_format {
    if (s == "binary") return archive_format::binary;
    if (s == "ascii") return archive_format::ascii;
    throw std::runtime_error("unknown archive_format: " + s);
}

void check_state(
    const std::string& dtype,
    const char* expected_dtype,
    const shape_t& shape,
    std::size_t data_size,
    const std::vector<axis_state_t>& axes)
{
    if (dtype != expected_dtype) {
        throw config_error(fmt::format(
            "decode: the archive holds {} data, not {}", dtype.empty() ? "untyped" : dtype, expected_dtype));
    }
    if (data_size != num_elements(shape)) {
        throw config_error(fmt::format(
            "decode: {} values cannot fill the shape {}", data_size, shape_string(shape)));
    }
    if (axes.size() != shape.size()) {
        throw config_error(fmt::format(
            "decode: {} axis records for an array with {} dimensions", axes.size(), shape.size()));
    }
    for (std::size_t d = 0; d < axes.size(); ++d) {
        const auto& range = axes[d].range;
        if (range && range->size() != shape[d]) {
            throw config_error(fmt::format(
                "decode: dimension {}: range length: {}; target length: {}", d, range->size(), shape[d]));
        }
    }
}

} // namespace dset
