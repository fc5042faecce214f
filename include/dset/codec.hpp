#pragma once

#include <cstdint>
#include <exception>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include "ascii_reader.hpp"
#include "ascii_writer.hpp"
#include "axis_meta.hpp"
#include "binary_reader.hpp"
#include "binary_writer.hpp"
#include "core.hpp"
#include "dataset.hpp"
#include "serialize.hpp"

namespace dset {

// =============================================================================
// Archive format
// =============================================================================

enum class archive_format {
    binary,
    ascii
};

auto to_string(archive_format format) -> const char*;
auto from_string(std::type_identity<archive_format>, const std::string& s) -> archive_format;

// =============================================================================
// Serialized state of a dataset
// =============================================================================
//
// The archive record "dataset" holds:
//
//   dtype        element type name, checked on decode
//   shape        extents
//   data         elements in row-major order
//   data_unit
//   data_label
//   axes         one {label, unit, range} group per dimension; an absent
//                range is an optional group with has_value = 0
//   metadata     list of {key, value} groups; values are variant groups
//                {index, value}, index 0 (None) carrying an empty group
//
// =============================================================================

struct axis_state_t {
    std::string label;
    std::string unit;
    range_t range;

    auto fields() const {
        return std::make_tuple(
            field("label", label),
            field("unit", unit),
            field("range", range)
        );
    }

    auto fields() {
        return std::make_tuple(
            field("label", label),
            field("unit", unit),
            field("range", range)
        );
    }
};

template<Arithmetic T>
struct dataset_state_t {
    std::string dtype;
    shape_t shape;
    std::vector<T> data;
    std::string data_unit;
    std::string data_label;
    std::vector<axis_state_t> axes;
    metadata_t metadata;

    auto fields() const {
        return std::make_tuple(
            field("dtype", dtype),
            field("shape", shape),
            field("data", data),
            field("data_unit", data_unit),
            field("data_label", data_label),
            field("axes", axes),
            field("metadata", metadata)
        );
    }

    auto fields() {
        return std::make_tuple(
            field("dtype", dtype),
            field("shape", shape),
            field("data", data),
            field("data_unit", data_unit),
            field("data_label", data_label),
            field("axes", axes),
            field("metadata", metadata)
        );
    }
};

template<Arithmetic T>
constexpr auto dtype_name() -> const char* {
    if constexpr (std::is_same_v<T, float>) return "float32";
    else if constexpr (std::is_same_v<T, double>) return "float64";
    else if constexpr (std::is_floating_point_v<T>) return "longdouble";
    else if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return "int8";
        else if constexpr (sizeof(T) == 2) return "int16";
        else if constexpr (sizeof(T) == 4) return "int32";
        else return "int64";
    } else {
        if constexpr (sizeof(T) == 1) return "uint8";
        else if constexpr (sizeof(T) == 2) return "uint16";
        else if constexpr (sizeof(T) == 4) return "uint32";
        else return "uint64";
    }
}

// Throws config_error unless the decoded state describes a consistent array
// of the expected element type
void check_state(
    const std::string& dtype,
    const char* expected_dtype,
    const shape_t& shape,
    std::size_t data_size,
    const std::vector<axis_state_t>& axes);

template<Arithmetic T>
auto to_state(const dataset_t<T>& ds) -> dataset_state_t<T> {
    auto meta = ds.property_meta();
    auto state = dataset_state_t<T>{};
    state.dtype = dtype_name<T>();
    state.shape = ds.shape();
    state.data = ds.to_vector();
    state.data_unit = meta.data_unit;
    state.data_label = meta.data_label;
    state.metadata = meta.metadata;
    for (std::size_t d = 0; d < ds.ndim(); ++d) {
        state.axes.push_back({meta.labels.at(d), meta.units.at(d), meta.ranges.at(d)});
    }
    return state;
}

template<Arithmetic T>
auto from_state(dataset_state_t<T> state) -> dataset_t<T> {
    check_state(state.dtype, dtype_name<T>(), state.shape, state.data.size(), state.axes);

    auto labels = std::vector<std::string>{};
    auto units = std::vector<std::string>{};
    auto ranges = std::vector<range_t>{};
    for (auto& axis : state.axes) {
        labels.push_back(std::move(axis.label));
        units.push_back(std::move(axis.unit));
        ranges.push_back(std::move(axis.range));
    }
    auto options = dataset_options_t{};
    options.axis_labels = std::move(labels);
    options.axis_units = std::move(units);
    options.axis_ranges = std::move(ranges);
    options.data_unit = std::move(state.data_unit);
    options.data_label = std::move(state.data_label);
    options.metadata = std::move(state.metadata);
    return dataset_t<T>(std::move(state.data), std::move(state.shape), options);
}

// =============================================================================
// encode / decode
// =============================================================================

template<Arithmetic T>
auto encode(const dataset_t<T>& ds, archive_format format = archive_format::binary) -> std::string {
    auto state = to_state(ds);
    auto os = std::ostringstream{};
    if (format == archive_format::binary) {
        auto writer = binary_writer(os);
        serialize(writer, "dataset", state);
    } else {
        auto writer = ascii_writer(os);
        serialize(writer, "dataset", state);
    }
    return os.str();
}

// The format is detected from the binary header. Malformed or foreign
// archives raise config_error.
template<Arithmetic T>
auto decode(const std::string& blob) -> dataset_t<T> {
    auto state = dataset_state_t<T>{};
    auto found = false;
    try {
        auto is = std::istringstream(blob);
        if (binary_format::has_magic(blob)) {
            auto reader = binary_reader(is);
            found = deserialize(reader, "dataset", state);
        } else {
            auto reader = ascii_reader(is);
            found = deserialize(reader, "dataset", state);
        }
    } catch (const config_error&) {
        throw;
    } catch (const std::exception& e) {
        throw config_error(fmt::format("decode: {}", e.what()));
    }
    if (!found) {
        throw config_error("decode: the archive has no dataset record");
    }
    return from_state(std::move(state));
}

} // namespace dset
