// transform.cpp - implementation of the metadata side of structural transforms

#include "dset/transform.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include "dset/log.hpp"

namespace dset {

namespace {

auto carry_scalars(const axis_meta_t& meta) -> axis_meta_t {
    auto result = axis_meta_t{};
    result.data_unit = meta.data_unit;
    result.data_label = meta.data_label;
    result.metadata = meta.metadata;
    return result;
}

void copy_axis(axis_meta_t& dst, std::size_t to, const axis_meta_t& src, std::size_t from) {
    dst.labels[to] = src.labels.at(from);
    dst.units[to] = src.units.at(from);
    dst.ranges[to] = src.ranges.at(from);
}

} // anonymous namespace

auto wrap_axis(long axis, std::size_t ndim, const char* operation) -> std::size_t {
    auto n = static_cast<long>(ndim);
    auto a = axis < 0 ? axis + n : axis;
    if (a < 0 || a >= n) {
        throw std::out_of_range(fmt::format(
            "{}: axis {} is out of range for an array with {} dimensions", operation, axis, ndim));
    }
    return static_cast<std::size_t>(a);
}

// =============================================================================
// Flattening
// =============================================================================

auto flattened_meta(const axis_meta_t& meta, std::size_t size) -> axis_meta_t {
    auto result = carry_scalars(meta);
    result.labels[0] = flattened_label;
    result.units[0] = "";
    result.ranges[0] = arange(size);
    return result;
}

auto check_flatten_dims(const std::vector<long>& dims, std::size_t ndim) -> std::vector<std::size_t> {
    auto result = std::vector<std::size_t>{};
    for (auto d : dims) {
        result.push_back(wrap_axis(d, ndim, "flatten_dims"));
    }
    for (std::size_t i = 1; i < result.size(); ++i) {
        if (result[i] != result[i - 1] + 1) {
            throw config_error(fmt::format(
                "flatten_dims: the dimensions [{}] are not adjacent and ascending",
                fmt::join(dims, ", ")));
        }
    }
    return result;
}

auto flatten_dims_meta(
    const axis_meta_t& meta,
    const std::vector<std::size_t>& dims,
    const shape_t& new_shape,
    const std::string& label,
    const std::string& unit,
    const range_t& range) -> axis_meta_t
{
    auto result = carry_scalars(meta);
    auto first = dims.front();
    auto last = dims.back();
    auto old_ndim = meta.labels.size();

    for (std::size_t d = 0; d < first; ++d) {
        copy_axis(result, d, meta, d);
    }
    result.labels[first] = label;
    result.units[first] = unit;
    result.ranges[first] = range;

    if (range && range->size() != new_shape[first]) {
        logger::warn(
            "flatten_dims: dimension {}: given range length: {}; target length: {}; range dropped",
            first, range->size(), new_shape[first]);
        result.ranges[first] = std::nullopt;
    }
    for (std::size_t d = last + 1; d < old_ndim; ++d) {
        copy_axis(result, d - (last - first), meta, d);
    }
    return result;
}

// =============================================================================
// Transpose and squeeze
// =============================================================================

auto check_permutation(const std::vector<long>& axes, std::size_t ndim) -> std::vector<std::size_t> {
    auto perm = std::vector<std::size_t>{};

    if (axes.empty()) {
        for (std::size_t d = ndim; d > 0; --d) {
            perm.push_back(d - 1);
        }
        return perm;
    }
    if (axes.size() != ndim) {
        throw config_error(fmt::format(
            "transpose: got {} axes for an array with {} dimensions", axes.size(), ndim));
    }
    for (auto a : axes) {
        perm.push_back(wrap_axis(a, ndim, "transpose"));
    }
    auto sorted = perm;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        throw config_error(fmt::format("transpose: repeated axis in [{}]", fmt::join(axes, ", ")));
    }
    return perm;
}

auto transposed_meta(const axis_meta_t& meta, const std::vector<std::size_t>& perm) -> axis_meta_t {
    auto result = carry_scalars(meta);
    for (std::size_t d = 0; d < perm.size(); ++d) {
        copy_axis(result, d, meta, perm[d]);
    }
    return result;
}

auto squeezed_meta(const axis_meta_t& meta, const std::vector<std::size_t>& removed) -> axis_meta_t {
    auto result = carry_scalars(meta);
    auto next = std::size_t{0};
    for (std::size_t d = 0; d < meta.labels.size(); ++d) {
        if (std::find(removed.begin(), removed.end(), d) != removed.end()) continue;
        copy_axis(result, next++, meta, d);
    }
    return result;
}

// =============================================================================
// Rebinning
// =============================================================================

auto rebin_crop(std::size_t extent, std::size_t binning, std::size_t dim) -> std::pair<std::size_t, std::size_t> {
    if (binning == 0) {
        throw config_error("get_rebinned_copy: the binning factor must be at least 1");
    }
    auto bins = extent / binning;
    if (bins == 0) {
        throw config_error(fmt::format(
            "get_rebinned_copy: binning factor {} exceeds the size {} of dimension {}",
            binning, extent, dim));
    }
    return {(extent - bins * binning) / 2, bins};
}

auto rebinned_meta(const axis_meta_t& meta, const shape_t& old_shape, std::size_t binning) -> axis_meta_t {
    auto result = meta;
    for (auto& [dim, range] : result.ranges) {
        if (!range) continue;
        auto [start, bins] = rebin_crop(old_shape[dim], binning, dim);
        auto binned = std::vector<double>(bins);
        for (std::size_t b = 0; b < bins; ++b) {
            auto total = 0.0;
            for (std::size_t k = 0; k < binning; ++k) {
                total += (*range)[start + b * binning + k];
            }
            binned[b] = total / static_cast<double>(binning);
        }
        range = std::move(binned);
    }
    return result;
}

// =============================================================================
// Reshape
// =============================================================================

auto corresponding_dims(const shape_t& old_shape, const shape_t& new_shape) -> std::map<std::size_t, std::size_t> {
    // Product of the extents before each axis
    auto leading = [](const shape_t& shape) {
        auto result = std::vector<std::size_t>(shape.size());
        auto p = std::size_t{1};
        for (std::size_t d = 0; d < shape.size(); ++d) {
            result[d] = p;
            p *= shape[d];
        }
        return result;
    };
    auto old_leading = leading(old_shape);
    auto new_leading = leading(new_shape);

    auto result = std::map<std::size_t, std::size_t>{};
    auto used = std::vector<bool>(old_shape.size(), false);

    for (std::size_t n = 0; n < new_shape.size(); ++n) {
        for (std::size_t o = 0; o < old_shape.size(); ++o) {
            if (!used[o] && old_shape[o] == new_shape[n] && old_leading[o] == new_leading[n]) {
                result[n] = o;
                used[o] = true;
                break;
            }
        }
    }
    return result;
}

auto infer_shape(const std::vector<long>& shape, std::size_t size) -> shape_t {
    auto result = shape_t(shape.size());
    auto inferred = shape.size();
    auto known = std::size_t{1};

    for (std::size_t d = 0; d < shape.size(); ++d) {
        if (shape[d] == -1) {
            if (inferred != shape.size()) {
                throw config_error("reshape: only one dimension can be -1");
            }
            inferred = d;
        } else if (shape[d] < 0) {
            throw config_error(fmt::format("reshape: invalid extent {} for dimension {}", shape[d], d));
        } else {
            result[d] = static_cast<std::size_t>(shape[d]);
            known *= result[d];
        }
    }
    if (inferred != shape.size()) {
        if (known == 0 || size % known != 0) {
            throw config_error(fmt::format(
                "reshape: cannot reshape {} elements into [{}]", size, fmt::join(shape, ", ")));
        }
        result[inferred] = size / known;
        known *= result[inferred];
    }
    if (known != size) {
        throw config_error(fmt::format(
            "reshape: cannot reshape {} elements into [{}]", size, fmt::join(shape, ", ")));
    }
    return result;
}

auto reshaped_meta(const axis_meta_t& meta, const shape_t& old_shape, const shape_t& new_shape) -> axis_meta_t {
    auto matches = corresponding_dims(old_shape, new_shape);
    auto result = carry_scalars(meta);

    for (std::size_t d = 0; d < new_shape.size(); ++d) {
        auto match = matches.find(d);
        if (match != matches.end()) {
            copy_axis(result, d, meta, match->second);
        } else {
            result.labels[d] = "";
            result.units[d] = "";
            result.ranges[d] = arange(new_shape[d]);
        }
    }
    return result;
}

// =============================================================================
// Repeat and sort
// =============================================================================

auto repeat_positions(std::size_t extent, std::size_t repeats) -> std::vector<long> {
    auto positions = std::vector<long>{};
    positions.reserve(extent * repeats);
    for (std::size_t i = 0; i < extent; ++i) {
        positions.insert(positions.end(), repeats, static_cast<long>(i));
    }
    return positions;
}

auto repeated_meta(const axis_meta_t& meta, std::size_t axis, std::size_t repeats) -> axis_meta_t {
    auto result = meta;
    if (auto& range = result.ranges.at(axis)) {
        auto values = std::vector<double>{};
        values.reserve(range->size() * repeats);
        for (auto v : *range) {
            values.insert(values.end(), repeats, v);
        }
        range = std::move(values);
    }
    return result;
}

auto reordered_meta(const axis_meta_t& meta, std::size_t axis, const std::vector<std::size_t>& order) -> axis_meta_t {
    auto result = meta;
    if (auto& range = result.ranges.at(axis)) {
        auto values = std::vector<double>{};
        values.reserve(order.size());
        for (auto i : order) {
            values.push_back(range->at(i));
        }
        range = std::move(values);
    }
    return result;
}

// =============================================================================
// Reductions
// =============================================================================

auto reduced_label(const std::string& data_label, std::string_view op_name) -> std::string {
    auto op = std::string(op_name);
    if (!op.empty()) {
        op[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(op[0])));
    }
    return op + " of " + data_label;
}

auto reduced_meta(const axis_meta_t& meta, std::size_t axis, std::string_view op_name) -> axis_meta_t {
    auto result = squeezed_meta(meta, {axis});
    result.data_label = reduced_label(meta.data_label, op_name);
    return result;
}

} // namespace dset
