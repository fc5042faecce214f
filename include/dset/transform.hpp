#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "axis_meta.hpp"
#include "core.hpp"

namespace dset {

// =============================================================================
// Metadata transforms
// =============================================================================
//
// Each function maps the metadata of an input array to the metadata of the
// transformed array. The whole-array fields (data unit and label, free-form
// metadata) are carried over unchanged unless noted.
//
// =============================================================================

inline constexpr const char* flattened_label = "Flattened";

// Single axis "Flattened" with unit "" and range 0..size-1
auto flattened_meta(const axis_meta_t& meta, std::size_t size) -> axis_meta_t;

// Validate the dimensions for flatten_dims: negative values count from the
// end; the result must be strictly consecutive and ascending.
auto check_flatten_dims(const std::vector<long>& dims, std::size_t ndim) -> std::vector<std::size_t>;

// Wrap a possibly negative axis number; throws std::out_of_range
auto wrap_axis(long axis, std::size_t ndim, const char* operation) -> std::size_t;

// The span dims[0]..dims.back() becomes one axis with the given label, unit
// and range; a range of the wrong length is dropped with a warning
auto flatten_dims_meta(
    const axis_meta_t& meta,
    const std::vector<std::size_t>& dims,
    const shape_t& new_shape,
    const std::string& label,
    const std::string& unit,
    const range_t& range) -> axis_meta_t;

// An empty axes list means reverse order
auto check_permutation(const std::vector<long>& axes, std::size_t ndim) -> std::vector<std::size_t>;
auto transposed_meta(const axis_meta_t& meta, const std::vector<std::size_t>& perm) -> axis_meta_t;

// Drop the listed axes (sorted) and renumber the rest
auto squeezed_meta(const axis_meta_t& meta, const std::vector<std::size_t>& removed) -> axis_meta_t;

// First kept index and number of bins for a centre crop of extent to a
// multiple of binning; throws config_error if no bin fits
auto rebin_crop(std::size_t extent, std::size_t binning, std::size_t dim) -> std::pair<std::size_t, std::size_t>;
auto rebinned_meta(const axis_meta_t& meta, const shape_t& old_shape, std::size_t binning) -> axis_meta_t;

// Map from new axis to old axis for axes that keep their extent and their
// position in row-major order across a reshape
auto corresponding_dims(const shape_t& old_shape, const shape_t& new_shape) -> std::map<std::size_t, std::size_t>;

// Resolve a single -1 entry and check that the element count is unchanged
auto infer_shape(const std::vector<long>& shape, std::size_t size) -> shape_t;
auto reshaped_meta(const axis_meta_t& meta, const shape_t& old_shape, const shape_t& new_shape) -> axis_meta_t;

// Each position 0..extent-1 repeated `repeats` times in turn: 0, 0, 1, 1, ...
auto repeat_positions(std::size_t extent, std::size_t repeats) -> std::vector<long>;

// Range along axis repeated element-wise; an absent range stays absent
auto repeated_meta(const axis_meta_t& meta, std::size_t axis, std::size_t repeats) -> axis_meta_t;

// Range along axis reordered by order (a permutation of its positions)
auto reordered_meta(const axis_meta_t& meta, std::size_t axis, const std::vector<std::size_t>& order) -> axis_meta_t;

// Drop the reduced axis; the data label becomes "<Op> of <label>"
auto reduced_meta(const axis_meta_t& meta, std::size_t axis, std::string_view op_name) -> axis_meta_t;
auto reduced_label(const std::string& data_label, std::string_view op_name) -> std::string;

} // namespace dset
