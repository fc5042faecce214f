#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>
#include <fmt/ranges.h>
#include "core.hpp"
#include "log.hpp"
#include "serialize.hpp"

namespace dset {

// =============================================================================
// Metadata value types
// =============================================================================

using range_t = std::optional<std::vector<double>>;
using label_map_t = std::map<std::size_t, std::string>;
using range_map_t = std::map<std::size_t, range_t>;

// Provenance of an axis removed by integer indexing
struct sliced_axis_t {
    std::string label;
    std::string unit;
    std::optional<double> value;

    auto operator==(const sliced_axis_t&) const -> bool = default;

    auto fields() const {
        return std::make_tuple(
            field("label", label),
            field("unit", unit),
            field("value", value)
        );
    }

    auto fields() {
        return std::make_tuple(
            field("label", label),
            field("unit", unit),
            field("value", value)
        );
    }
};

// std::monostate stands for "no value"
using metadata_value_t = std::variant<
    std::monostate,
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<double>,
    sliced_axis_t>;

using metadata_t = std::map<std::string, metadata_value_t>;

// =============================================================================
// axis_meta_t: per-axis labels, units and ranges plus whole-array metadata
// =============================================================================
//
// Invariant (maintained by every producer in this library): the key sets of
// labels, units and ranges are exactly {0, ..., ndim - 1}, and every present
// range has the extent of its dimension.
//
// =============================================================================

struct axis_meta_t {
    label_map_t labels;
    label_map_t units;
    range_map_t ranges;
    std::string data_unit;
    std::string data_label;
    metadata_t metadata;

    auto operator==(const axis_meta_t&) const -> bool = default;
};

// =============================================================================
// axis_spec_t: user-supplied per-axis values, ordered or keyed
// =============================================================================

template<typename V>
class axis_spec_t {
public:
    enum class kind_t { unset, ordered, keyed, single };

    axis_spec_t() = default;
    axis_spec_t(std::initializer_list<V> values) : value_(std::in_place_index<1>, values) {}
    axis_spec_t(std::vector<V> values) : value_(std::in_place_index<1>, std::move(values)) {}
    axis_spec_t(std::map<long, V> values) : value_(std::in_place_index<2>, std::move(values)) {}

    // A lone value where one per axis is expected; rejected by normalize()
    axis_spec_t(V value) : value_(std::in_place_index<3>, std::move(value)) {}

    auto kind() const -> kind_t { return static_cast<kind_t>(value_.index()); }
    auto ordered() const -> const std::vector<V>& { return std::get<1>(value_); }
    auto keyed() const -> const std::map<long, V>& { return std::get<2>(value_); }

private:
    std::variant<std::monostate, std::vector<V>, std::map<long, V>, V> value_;
};

// =============================================================================
// Normalization
// =============================================================================
//
// normalize() turns a spec into a canonical map keyed 0..ndim-1. An unset
// spec, a keyed spec with any other key set, or an ordered spec of the wrong
// length all yield the defaults (the latter two with a warning). A single
// value cannot be read as per-axis data and raises config_error.
//
// =============================================================================

template<typename V, typename DefaultFn>
auto normalize(const axis_spec_t<V>& spec, std::size_t ndim, std::string_view axis_name, DefaultFn make_default)
    -> std::map<std::size_t, V>
{
    using kind_t = typename axis_spec_t<V>::kind_t;

    auto defaults = [&] {
        auto result = std::map<std::size_t, V>{};
        for (std::size_t d = 0; d < ndim; ++d) {
            result[d] = make_default(d);
        }
        return result;
    };

    switch (spec.kind()) {
        case kind_t::unset:
            return defaults();

        case kind_t::single:
            throw config_error(
                std::string(axis_name) + ": expected one entry per axis (a sequence or a "
                "mapping from axis index), got a single value");

        case kind_t::ordered: {
            const auto& values = spec.ordered();
            if (values.size() != ndim) {
                logger::warn(
                    "{}: got {} entries for {} dimensions; using default values",
                    axis_name, values.size(), ndim);
                return defaults();
            }
            auto result = std::map<std::size_t, V>{};
            for (std::size_t d = 0; d < ndim; ++d) {
                result[d] = values[d];
            }
            return result;
        }

        case kind_t::keyed: {
            const auto& values = spec.keyed();
            auto valid = values.size() == ndim;
            for (const auto& [key, value] : values) {
                if (key < 0 || static_cast<std::size_t>(key) >= ndim) valid = false;
            }
            if (!valid) {
                auto keys = std::vector<long>{};
                for (const auto& [key, value] : values) keys.push_back(key);
                logger::warn(
                    "{}: keys [{}] do not match the dimensions 0..{}; using default values",
                    axis_name, fmt::join(keys, ", "), static_cast<long>(ndim) - 1);
                return defaults();
            }
            auto result = std::map<std::size_t, V>{};
            for (const auto& [key, value] : values) {
                result[static_cast<std::size_t>(key)] = value;
            }
            return result;
        }
    }
    return defaults();
}

auto default_labels(std::size_t ndim) -> label_map_t;
auto default_ranges(const shape_t& shape) -> range_map_t;
auto default_axis_meta(const shape_t& shape) -> axis_meta_t;

auto normalize_labels(const axis_spec_t<std::string>& spec, std::size_t ndim, std::string_view axis_name) -> label_map_t;

// Also resets the whole map (with a warning) if a present range does not
// match the extent of its dimension
auto normalize_ranges(const axis_spec_t<range_t>& spec, const shape_t& shape) -> range_map_t;

// Whether the three axis maps are keyed 0..ndim-1 and ranges match the shape
auto is_consistent(const axis_meta_t& meta, const shape_t& shape) -> bool;

// Restore the invariants after a transform that could not track an axis,
// resetting (with a warning) whichever maps violate them
auto enforce_consistency(axis_meta_t meta, const shape_t& shape, std::string_view context) -> axis_meta_t;

} // namespace dset
