// index.cpp - implementation of index resolution and metadata propagation

#include "dset/index.hpp"
#include <algorithm>
#include <string>
#include <fmt/format.h>
#include "dset/transform.hpp"

namespace dset {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

auto axes_consumed(const selector_t& sel) -> std::size_t {
    return std::visit(overloaded{
        [](const bool_mask_t& m) -> std::size_t { return m.rank(); },
        [](const new_axis_t&) -> std::size_t { return 0; },
        [](const auto&) -> std::size_t { return 1; }
    }, sel);
}

auto slice_axis(const slice_t& s, std::size_t extent, std::size_t dim) -> resolved_axis_t {
    if (s.step == 0) {
        throw config_error(fmt::format("slice step cannot be zero (axis {})", dim));
    }
    auto n = static_cast<long>(extent);
    auto wrap = [n](long v) { return v < 0 ? v + n : v; };
    long start, stop;

    if (s.step > 0) {
        start = std::clamp(s.start ? wrap(*s.start) : 0L, 0L, n);
        stop = std::clamp(s.stop ? wrap(*s.stop) : n, 0L, n);
    } else {
        start = std::clamp(s.start ? wrap(*s.start) : n - 1, -1L, n - 1);
        stop = std::clamp(s.stop ? wrap(*s.stop) : -1L, -1L, n - 1);
    }

    // Count first; stepping past stop could overflow for huge steps
    auto span = s.step > 0 ? stop - start : start - stop;
    auto magnitude = s.step > 0
        ? static_cast<unsigned long>(s.step)
        : 0UL - static_cast<unsigned long>(s.step);
    auto count = span > 0 ? (static_cast<unsigned long>(span) - 1) / magnitude + 1 : 0UL;

    auto axis = resolved_axis_t{};
    axis.source_dims = {dim};
    axis.from_slice = true;
    for (unsigned long k = 0; k < count; ++k) {
        auto offset = static_cast<long>(k * magnitude);
        axis.positions.push_back(static_cast<std::size_t>(s.step > 0 ? start + offset : start - offset));
    }
    axis.extent = axis.positions.size();
    return axis;
}

auto array_axis(const index_array_t& a, std::size_t extent, std::size_t dim) -> resolved_axis_t {
    auto axis = resolved_axis_t{};
    axis.source_dims = {dim};
    for (auto i : a.indices) {
        axis.positions.push_back(wrap_index(i, extent, dim));
    }
    axis.extent = axis.positions.size();
    return axis;
}

auto mask_axis(const bool_mask_t& m, const shape_t& shape, std::size_t dim) -> resolved_axis_t {
    auto mask_shape = m.shape.empty() ? shape_t{m.mask.size()} : m.shape;
    auto target = shape_t(shape.begin() + dim, shape.begin() + dim + mask_shape.size());

    if (mask_shape != target || m.mask.size() != num_elements(mask_shape)) {
        throw std::out_of_range(fmt::format(
            "boolean mask of shape {} does not match the shape {} of axes {}..{}",
            shape_string(mask_shape), shape_string(target), dim, dim + target.size() - 1));
    }

    auto axis = resolved_axis_t{};
    for (std::size_t k = 0; k < mask_shape.size(); ++k) {
        axis.source_dims.push_back(dim + k);
    }
    for (std::size_t flat = 0; flat < m.mask.size(); ++flat) {
        if (!m.mask[flat]) continue;
        auto idx = ndindex(mask_shape, flat);
        axis.positions.insert(axis.positions.end(), idx.begin(), idx.end());
        axis.extent++;
    }
    return axis;
}

auto provenance_key(const metadata_t& metadata, std::size_t dim) -> std::string {
    auto base = fmt::format("sliced_axis_{}", dim);
    if (!metadata.count(base)) return base;
    for (std::size_t n = 1;; ++n) {
        auto key = fmt::format("{}_{}", base, n);
        if (!metadata.count(key)) return key;
    }
}

} // anonymous namespace

// =============================================================================
// resolved_index_t
// =============================================================================

auto resolved_index_t::is_basic() const -> bool {
    return std::all_of(axes.begin(), axes.end(), [](const auto& a) {
        return a.from_slice || a.source_dims.empty();
    });
}

auto resolved_index_t::has_multi_axis_mask() const -> bool {
    return std::any_of(axes.begin(), axes.end(), [](const auto& a) {
        return a.source_dims.size() > 1;
    });
}

auto resolved_index_t::shape() const -> shape_t {
    auto result = shape_t{};
    for (const auto& a : axes) {
        result.push_back(a.extent);
    }
    return result;
}

// =============================================================================
// resolve
// =============================================================================

auto resolve(const index_t& key, const shape_t& shape) -> resolved_index_t {
    auto consumed = std::size_t{0};
    for (const auto& sel : key) {
        consumed += axes_consumed(sel);
    }
    if (consumed > shape.size()) {
        throw config_error(fmt::format(
            "too many indices: the expression addresses {} axes but the array has {}",
            consumed, shape.size()));
    }

    auto result = resolved_index_t{};
    auto dim = std::size_t{0};

    for (const auto& sel : key) {
        std::visit(overloaded{
            [&](long i) {
                result.fixed.emplace_back(dim, wrap_index(i, shape[dim], dim));
                dim += 1;
            },
            [&](const slice_t& s) {
                result.axes.push_back(slice_axis(s, shape[dim], dim));
                dim += 1;
            },
            [&](const index_array_t& a) {
                result.axes.push_back(array_axis(a, shape[dim], dim));
                dim += 1;
            },
            [&](const bool_mask_t& m) {
                result.axes.push_back(mask_axis(m, shape, dim));
                dim += m.rank();
            },
            [&](const new_axis_t&) {
                auto axis = resolved_axis_t{};
                axis.extent = 1;
                result.axes.push_back(axis);
            }
        }, sel);
    }
    for (; dim < shape.size(); ++dim) {
        result.axes.push_back(slice_axis(all, shape[dim], dim));
    }
    return result;
}

// =============================================================================
// propagate
// =============================================================================

auto propagate(const axis_meta_t& old, const resolved_index_t& index) -> axis_meta_t {
    auto meta = axis_meta_t{};
    meta.data_unit = old.data_unit;
    meta.data_label = old.data_label;
    meta.metadata = old.metadata;

    for (const auto& [dim, pos] : index.fixed) {
        auto record = sliced_axis_t{old.labels.at(dim), old.units.at(dim), std::nullopt};
        if (const auto& range = old.ranges.at(dim)) {
            record.value = (*range)[pos];
        }
        meta.metadata[provenance_key(meta.metadata, dim)] = record;
    }

    auto new_shape = index.shape();

    if (index.has_multi_axis_mask()) {
        // No per-axis correspondence survives a mask over several axes
        meta.labels = old.labels;
        meta.units = old.units;
        meta.ranges = old.ranges;
    } else {
        for (std::size_t a = 0; a < index.axes.size(); ++a) {
            const auto& axis = index.axes[a];
            if (axis.source_dims.empty()) {
                meta.labels[a] = "";
                meta.units[a] = "";
                meta.ranges[a] = std::nullopt;
                continue;
            }
            auto dim = axis.source_dims.front();
            meta.labels[a] = old.labels.at(dim);
            meta.units[a] = old.units.at(dim);
            if (const auto& range = old.ranges.at(dim)) {
                auto values = std::vector<double>{};
                values.reserve(axis.positions.size());
                for (auto p : axis.positions) {
                    values.push_back((*range)[p]);
                }
                meta.ranges[a] = std::move(values);
            } else {
                meta.ranges[a] = std::nullopt;
            }
        }
    }

    if (new_shape.size() == 1 && meta.labels.size() > 1) {
        return flattened_meta(meta, new_shape[0]);
    }
    return enforce_consistency(std::move(meta), new_shape, "indexing");
}

auto propagate(const axis_meta_t& old, const index_t& key, const shape_t& old_shape, const shape_t& new_shape) -> axis_meta_t {
    auto index = resolve(key, old_shape);
    if (index.shape() != new_shape) {
        throw config_error(fmt::format(
            "indexing an array of shape {} gives shape {}, not {}",
            shape_string(old_shape), shape_string(index.shape()), shape_string(new_shape)));
    }
    return propagate(old, index);
}

} // namespace dset
