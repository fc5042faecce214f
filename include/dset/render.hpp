#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
#include <fmt/format.h>
#include "axis_meta.hpp"
#include "core.hpp"
#include "dataset.hpp"
#include "serialize.hpp"

namespace dset {

// =============================================================================
// Render options
// =============================================================================

struct render_options_t {
    std::size_t threshold = 20;   // summarize arrays with more elements
    std::size_t edge_items = 0;   // 0: 2 for n-d arrays, 3 for 1-d
    int precision = 6;            // significant digits of floating values

    auto fields() const {
        return std::make_tuple(
            field("threshold", threshold),
            field("edge_items", edge_items),
            field("precision", precision)
        );
    }

    auto fields() {
        return std::make_tuple(
            field("threshold", threshold),
            field("edge_items", edge_items),
            field("precision", precision)
        );
    }
};

// =============================================================================
// Building blocks
// =============================================================================

template<Arithmetic T>
auto format_value(T value, int precision) -> std::string {
    if constexpr (std::is_floating_point_v<T>) {
        return fmt::format("{:.{}g}", value, precision);
    } else {
        return fmt::format("{}", value);
    }
}

// Nested-bracket text "array([...])" of an array of the given shape whose
// i-th row-major element is cell(i); large arrays show only edge items
auto render_array(
    const shape_t& shape,
    const std::function<std::string(std::size_t)>& cell,
    const render_options_t& options) -> std::string;

auto render_metadata_value(const metadata_value_t& value, int precision) -> std::string;

// Everything but the array body: "dataset(\naxis_labels: {...},\n...,\n<body>\n)"
auto render_dataset(const axis_meta_t& meta, const std::string& body, const render_options_t& options) -> std::string;

// =============================================================================
// render
// =============================================================================
//
// Deterministic text for debugging: axis maps in dimension order, metadata
// in key order, then the (possibly summarized) elements. Output depends on
// the array state and options only.
//
// =============================================================================

template<Arithmetic T>
auto render(const dataset_t<T>& ds, const render_options_t& options = {}) -> std::string {
    auto values = ds.to_vector();
    auto body = render_array(ds.shape(), [&](std::size_t i) {
        return format_value(values[i], options.precision);
    }, options);
    return render_dataset(ds.property_meta(), body, options);
}

} // namespace dset
