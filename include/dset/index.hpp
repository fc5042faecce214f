#pragma once

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>
#include "axis_meta.hpp"
#include "core.hpp"

namespace dset {

// =============================================================================
// Selectors
// =============================================================================

struct slice_t {
    std::optional<long> start;
    std::optional<long> stop;
    long step = 1;
};

// Inserts a unit-length axis
struct new_axis_t {};

// Integer positions along one axis (negative values wrap)
struct index_array_t {
    std::vector<long> indices;
};

// Boolean mask over one or more consecutive axes; an empty shape means a
// one-dimensional mask of mask.size() entries
struct bool_mask_t {
    std::vector<bool> mask;
    shape_t shape;

    auto rank() const -> std::size_t { return shape.empty() ? 1 : shape.size(); }
};

using selector_t = std::variant<long, slice_t, index_array_t, bool_mask_t, new_axis_t>;
using index_t = std::vector<selector_t>;

inline constexpr slice_t all{};
inline constexpr new_axis_t new_axis{};

// =============================================================================
// Resolved index: an index expression evaluated against a shape
// =============================================================================
//
// Selectors consume input axes left to right; axes not addressed are taken
// whole. Index arrays act independently per axis (outer indexing), so each
// array or one-dimensional mask contributes one output axis.
//
// =============================================================================

struct resolved_axis_t {
    std::vector<std::size_t> source_dims;   // empty for an inserted axis
    std::vector<std::size_t> positions;     // one tuple of source coordinates per output entry
    std::size_t extent = 0;
    bool from_slice = false;
};

struct resolved_index_t {
    std::vector<std::pair<std::size_t, std::size_t>> fixed;  // (input dim, position) of integer selectors
    std::vector<resolved_axis_t> axes;

    // Only integers, slices and new axes: the result can alias the input
    auto is_basic() const -> bool;
    auto has_multi_axis_mask() const -> bool;
    auto shape() const -> shape_t;
};

// Throws std::out_of_range for out-of-bounds integers or index array entries
// or a mask of the wrong shape, and config_error when the expression
// addresses more axes than there are or uses a zero slice step.
auto resolve(const index_t& key, const shape_t& shape) -> resolved_index_t;

// Axis metadata of the result of indexing an array of shape old_shape
// (and metadata old) with key, whose result has shape new_shape
auto propagate(const axis_meta_t& old, const index_t& key, const shape_t& old_shape, const shape_t& new_shape) -> axis_meta_t;

// Same, for an expression already resolved against the old shape
auto propagate(const axis_meta_t& old, const resolved_index_t& index) -> axis_meta_t;

} // namespace dset
