// axis_meta.cpp - implementation of the per-axis metadata defaults and checks

#include "dset/axis_meta.hpp"

namespace dset {

auto default_labels(std::size_t ndim) -> label_map_t {
    auto labels = label_map_t{};
    for (std::size_t d = 0; d < ndim; ++d) {
        labels[d] = "";
    }
    return labels;
}

auto default_ranges(const shape_t& shape) -> range_map_t {
    auto ranges = range_map_t{};
    for (std::size_t d = 0; d < shape.size(); ++d) {
        ranges[d] = arange(shape[d]);
    }
    return ranges;
}

auto default_axis_meta(const shape_t& shape) -> axis_meta_t {
    auto meta = axis_meta_t{};
    meta.labels = default_labels(shape.size());
    meta.units = default_labels(shape.size());
    meta.ranges = default_ranges(shape);
    return meta;
}

auto normalize_labels(const axis_spec_t<std::string>& spec, std::size_t ndim, std::string_view axis_name) -> label_map_t {
    return normalize(spec, ndim, axis_name, [](std::size_t) { return std::string{}; });
}

auto normalize_ranges(const axis_spec_t<range_t>& spec, const shape_t& shape) -> range_map_t {
    auto ranges = normalize(spec, shape.size(), "axis_ranges", [&shape](std::size_t d) {
        return range_t{arange(shape[d])};
    });

    for (const auto& [dim, range] : ranges) {
        if (range && range->size() != shape[dim]) {
            logger::warn(
                "axis_ranges: dimension {}: given range length: {}; target length: {}; "
                "using default values",
                dim, range->size(), shape[dim]);
            return default_ranges(shape);
        }
    }
    return ranges;
}

namespace {

template<typename Map>
auto has_dense_keys(const Map& map, std::size_t ndim) -> bool {
    if (map.size() != ndim) return false;
    auto expected = std::size_t{0};
    for (const auto& [key, value] : map) {
        if (key != expected++) return false;
    }
    return true;
}

} // anonymous namespace

auto is_consistent(const axis_meta_t& meta, const shape_t& shape) -> bool {
    auto ndim = shape.size();
    if (!has_dense_keys(meta.labels, ndim) ||
        !has_dense_keys(meta.units, ndim) ||
        !has_dense_keys(meta.ranges, ndim)) {
        return false;
    }
    for (const auto& [dim, range] : meta.ranges) {
        if (range && range->size() != shape[dim]) return false;
    }
    return true;
}

auto enforce_consistency(axis_meta_t meta, const shape_t& shape, std::string_view context) -> axis_meta_t {
    auto ndim = shape.size();

    if (!has_dense_keys(meta.labels, ndim)) {
        logger::warn("{}: {} axis labels for {} dimensions; using default values", context, meta.labels.size(), ndim);
        meta.labels = default_labels(ndim);
    }
    if (!has_dense_keys(meta.units, ndim)) {
        logger::warn("{}: {} axis units for {} dimensions; using default values", context, meta.units.size(), ndim);
        meta.units = default_labels(ndim);
    }

    auto ranges_ok = has_dense_keys(meta.ranges, ndim);
    if (ranges_ok) {
        for (const auto& [dim, range] : meta.ranges) {
            if (range && range->size() != shape[dim]) ranges_ok = false;
        }
    }
    if (!ranges_ok) {
        logger::warn("{}: axis ranges do not match the shape {}; using default values", context, shape_string(shape));
        meta.ranges = default_ranges(shape);
    }
    return meta;
}

} // namespace dset
