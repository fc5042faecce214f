#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include "axis_meta.hpp"
#include "core.hpp"
#include "index.hpp"
#include "transform.hpp"

namespace dset {

// =============================================================================
// dataset_options_t: construction-time metadata
// =============================================================================

struct dataset_options_t {
    axis_spec_t<std::string> axis_labels;
    axis_spec_t<std::string> axis_units;
    axis_spec_t<range_t> axis_ranges;
    std::string data_unit;
    std::string data_label;
    metadata_t metadata;
};

// =============================================================================
// dataset_t: dense n-d array with per-axis labels, units and ranges
// =============================================================================
//
// Storage is a shared buffer addressed through an element offset and signed
// strides. Operations that only re-address elements return views that share
// the buffer with their source:
//
//   operator[] with integers, slices and new axes
//   transpose, squeeze, reshape of a contiguous array
//
// Everything else returns an array with its own buffer: operator[] with index
// arrays or masks, flatten, flatten_dims, get_rebinned_copy, reductions,
// arithmetic, copy and astype. Writes through one view are visible in every
// array sharing its buffer; no synchronization is provided.
//
// Metadata is never shared: every result carries its own axis_meta_t.
//
// =============================================================================

template<Arithmetic T>
class dataset_t {
public:
    using value_type = T;

    dataset_t() : dataset_t(shape_t{0}) {}

    // Zero-filled
    explicit dataset_t(const shape_t& shape, const dataset_options_t& options = {})
        : dataset_t(std::vector<T>(num_elements(shape)), shape, options) {}

    dataset_t(std::vector<T> data, shape_t shape, const dataset_options_t& options = {}) {
        if (data.size() != num_elements(shape)) {
            throw config_error(fmt::format(
                "dataset: {} values cannot fill the shape {}", data.size(), shape_string(shape)));
        }
        buffer_ = std::make_shared<std::vector<T>>(std::move(data));
        strides_ = contiguous_strides(shape);
        shape_ = std::move(shape);
        meta_.labels = normalize_labels(options.axis_labels, shape_.size(), "axis_labels");
        meta_.units = normalize_labels(options.axis_units, shape_.size(), "axis_units");
        meta_.ranges = normalize_ranges(options.axis_ranges, shape_);
        meta_.data_unit = options.data_unit;
        meta_.data_label = options.data_label;
        meta_.metadata = options.metadata;
    }

    // =========================================================================
    // Shape and storage
    // =========================================================================

    auto shape() const -> const shape_t& { return shape_; }
    auto strides() const -> const strides_t& { return strides_; }
    auto ndim() const -> std::size_t { return shape_.size(); }
    auto size() const -> std::size_t { return num_elements(shape_); }

    auto is_contiguous() const -> bool {
        auto expected = contiguous_strides(shape_);
        for (std::size_t d = 0; d < shape_.size(); ++d) {
            if (shape_[d] > 1 && strides_[d] != expected[d]) return false;
        }
        return true;
    }

    auto shares_buffer(const dataset_t& other) const -> bool {
        return buffer_ == other.buffer_;
    }

    // Elements in row-major order of this array's own shape
    auto to_vector() const -> std::vector<T> {
        auto values = std::vector<T>{};
        values.reserve(size());
        for_each_offset([&](std::ptrdiff_t off) { values.push_back(element(off)); });
        return values;
    }

    // =========================================================================
    // Element access
    // =========================================================================

    auto at(const std::vector<long>& index) -> T& {
        return element(element_offset(index));
    }

    auto at(const std::vector<long>& index) const -> const T& {
        return element(element_offset(index));
    }

    // The only element of a one-element (typically 0-d) array
    auto item() const -> T {
        if (size() != 1) {
            throw config_error(fmt::format("item: array of shape {} has {} elements", shape_string(shape_), size()));
        }
        return element(offset_);
    }

    void fill(T value) {
        for_each_offset([&](std::ptrdiff_t off) { element(off) = value; });
    }

    // =========================================================================
    // Metadata
    // =========================================================================

    auto axis_labels() const -> label_map_t { return meta_.labels; }
    auto axis_units() const -> label_map_t { return meta_.units; }
    auto axis_ranges() const -> range_map_t { return meta_.ranges; }
    auto axis_range(std::size_t dim) const -> range_t { return meta_.ranges.at(dim); }
    auto data_unit() const -> const std::string& { return meta_.data_unit; }
    auto data_label() const -> const std::string& { return meta_.data_label; }
    auto metadata() const -> const metadata_t& { return meta_.metadata; }
    auto property_meta() const -> axis_meta_t { return meta_; }

    void set_axis_labels(const axis_spec_t<std::string>& labels) {
        meta_.labels = normalize_labels(labels, ndim(), "axis_labels");
    }

    void set_axis_units(const axis_spec_t<std::string>& units) {
        meta_.units = normalize_labels(units, ndim(), "axis_units");
    }

    void set_axis_ranges(const axis_spec_t<range_t>& ranges) {
        meta_.ranges = normalize_ranges(ranges, shape_);
    }

    void set_data_unit(std::string unit) { meta_.data_unit = std::move(unit); }
    void set_data_label(std::string label) { meta_.data_label = std::move(label); }
    void set_metadata(metadata_t metadata) { meta_.metadata = std::move(metadata); }

    // "label / unit", or just the label when there is no unit
    auto axis_description(std::size_t dim) const -> std::string {
        const auto& label = meta_.labels.at(dim);
        const auto& unit = meta_.units.at(dim);
        return unit.empty() ? label : label + " / " + unit;
    }

    auto data_description() const -> std::string {
        return meta_.data_unit.empty() ? meta_.data_label : meta_.data_label + " / " + meta_.data_unit;
    }

    // "label: value unit" per axis joined by "; "; axes given as nullopt are
    // skipped, and axes without a range report the index itself
    auto description_of_point(const std::vector<std::optional<long>>& indices) const -> std::string {
        if (indices.size() != ndim()) {
            throw config_error(fmt::format(
                "description_of_point: {} indices for an array with {} dimensions", indices.size(), ndim()));
        }
        auto result = std::string{};
        for (std::size_t d = 0; d < indices.size(); ++d) {
            if (!indices[d]) continue;
            auto i = wrap_index(*indices[d], shape_[d], d);
            const auto& range = meta_.ranges.at(d);
            auto value = range ? (*range)[i] : static_cast<double>(i);
            auto entry = fmt::format("{}: {:.4f} {}", meta_.labels.at(d), value, meta_.units.at(d));
            result += result.empty() ? entry : "; " + entry;
        }
        return result;
    }

    // Whether the spacing of the finite range values varies by more than
    // threshold relative to its mean
    auto is_axis_nonlinear(std::size_t dim, double threshold = 1e-4) const -> bool {
        const auto& range = meta_.ranges.at(dim);
        if (!range) {
            throw config_error(fmt::format("is_axis_nonlinear: axis {} has no range", dim));
        }
        auto finite = std::vector<double>{};
        for (auto v : *range) {
            if (std::isfinite(v)) finite.push_back(v);
        }
        if (finite.size() < 2) return false;

        auto diffs = std::vector<double>{};
        for (std::size_t i = 1; i < finite.size(); ++i) {
            diffs.push_back(finite[i] - finite[i - 1]);
        }
        auto mean = 0.0;
        for (auto d : diffs) mean += d;
        mean /= static_cast<double>(diffs.size());
        auto var = 0.0;
        for (auto d : diffs) var += (d - mean) * (d - mean);
        auto stddev = std::sqrt(var / static_cast<double>(diffs.size()));

        // nan (no spacing at all) compares false
        return std::abs(stddev / mean) > threshold;
    }

    // =========================================================================
    // Indexing
    // =========================================================================

    auto operator[](const index_t& key) const -> dataset_t {
        auto index = resolve(key, shape_);
        auto meta = propagate(meta_, index);
        auto base = offset_;
        for (const auto& [dim, pos] : index.fixed) {
            base += static_cast<std::ptrdiff_t>(pos) * strides_[dim];
        }

        if (index.is_basic()) {
            auto shape = shape_t{};
            auto strides = strides_t{};
            for (const auto& axis : index.axes) {
                shape.push_back(axis.extent);
                if (axis.source_dims.empty()) {
                    strides.push_back(0);
                    continue;
                }
                auto stride = strides_[axis.source_dims.front()];
                if (axis.extent > 0) {
                    base += static_cast<std::ptrdiff_t>(axis.positions[0]) * stride;
                }
                if (axis.extent > 1) {
                    stride *= static_cast<std::ptrdiff_t>(axis.positions[1]) - static_cast<std::ptrdiff_t>(axis.positions[0]);
                }
                strides.push_back(stride);
            }
            return dataset_t(buffer_, base, std::move(shape), std::move(strides), std::move(meta));
        }

        // Gather: offset contributed by each output axis at each of its entries
        auto tables = std::vector<std::vector<std::ptrdiff_t>>{};
        for (const auto& axis : index.axes) {
            auto table = std::vector<std::ptrdiff_t>(axis.extent, 0);
            auto k = axis.source_dims.size();
            for (std::size_t o = 0; o < axis.extent && k > 0; ++o) {
                for (std::size_t j = 0; j < k; ++j) {
                    table[o] += static_cast<std::ptrdiff_t>(axis.positions[o * k + j]) * strides_[axis.source_dims[j]];
                }
            }
            tables.push_back(std::move(table));
        }

        auto shape = index.shape();
        auto values = std::vector<T>{};
        values.reserve(num_elements(shape));
        if (num_elements(shape) > 0) {
            auto idx = multi_index_t(shape.size(), 0);
            do {
                auto off = base;
                for (std::size_t a = 0; a < idx.size(); ++a) {
                    off += tables[a][idx[a]];
                }
                values.push_back(element(off));
            } while (increment(idx, shape));
        }
        return from_values(std::move(values), std::move(shape), std::move(meta));
    }

    // Entries at the given positions along one axis (a copy)
    auto take(const std::vector<long>& indices, long axis) const -> dataset_t {
        auto a = wrap_axis(axis, ndim(), "take");
        auto key = index_t(a, selector_t{all});
        key.push_back(index_array_t{indices});
        return (*this)[key];
    }

    // =========================================================================
    // Structural transforms
    // =========================================================================

    auto copy() const -> dataset_t {
        return from_values(to_vector(), shape_, meta_);
    }

    template<Arithmetic U>
    auto astype() const -> dataset_t<U> {
        auto values = std::vector<U>{};
        values.reserve(size());
        for_each_offset([&](std::ptrdiff_t off) { values.push_back(static_cast<U>(element(off))); });
        return dataset_t<U>::from_values(std::move(values), shape_, meta_);
    }

    auto flatten() const -> dataset_t {
        return from_values(to_vector(), shape_t{size()}, flattened_meta(meta_, size()));
    }

    // Merge adjacent dimensions into one; fewer than two dims returns a copy
    auto flatten_dims(
        const std::vector<long>& dims,
        const std::string& label = flattened_label,
        const std::string& unit = "",
        const range_t& range = std::nullopt) const -> dataset_t
    {
        if (dims.size() < 2) {
            return copy();
        }
        auto checked = check_flatten_dims(dims, ndim());
        auto first = checked.front();
        auto last = checked.back();

        auto new_shape = shape_t(shape_.begin(), shape_.begin() + first);
        auto merged = std::size_t{1};
        for (auto d = first; d <= last; ++d) merged *= shape_[d];
        new_shape.push_back(merged);
        new_shape.insert(new_shape.end(), shape_.begin() + last + 1, shape_.end());

        auto meta = flatten_dims_meta(meta_, checked, new_shape, label, unit, range);
        return from_values(to_vector(), std::move(new_shape), std::move(meta));
    }

    // Permuted view; no axes means reverse order
    auto transpose(const std::vector<long>& axes = {}) const -> dataset_t {
        auto perm = check_permutation(axes, ndim());
        auto shape = shape_t{};
        auto strides = strides_t{};
        for (auto p : perm) {
            shape.push_back(shape_[p]);
            strides.push_back(strides_[p]);
        }
        return dataset_t(buffer_, offset_, std::move(shape), std::move(strides), transposed_meta(meta_, perm));
    }

    // View without unit-length axes, or without the given one
    auto squeeze(std::optional<long> axis = std::nullopt) const -> dataset_t {
        auto removed = std::vector<std::size_t>{};
        if (axis) {
            auto a = wrap_axis(*axis, ndim(), "squeeze");
            if (shape_[a] != 1) {
                throw config_error(fmt::format(
                    "squeeze: dimension {} has size {}; only unit-length dimensions can be removed", a, shape_[a]));
            }
            removed.push_back(a);
        } else {
            for (std::size_t d = 0; d < ndim(); ++d) {
                if (shape_[d] == 1) removed.push_back(d);
            }
        }
        auto shape = shape_t{};
        auto strides = strides_t{};
        for (std::size_t d = 0; d < ndim(); ++d) {
            if (std::find(removed.begin(), removed.end(), d) != removed.end()) continue;
            shape.push_back(shape_[d]);
            strides.push_back(strides_[d]);
        }
        return dataset_t(buffer_, offset_, std::move(shape), std::move(strides), squeezed_meta(meta_, removed));
    }

    // Centre-crop every dimension to a multiple of binning and average each
    // block of binning^ndim elements
    auto get_rebinned_copy(std::size_t binning) const -> dataset_t<mean_type_t<T>> {
        using R = mean_type_t<T>;
        using acc_t = std::common_type_t<R, double>;

        if (binning == 1) {
            return astype<R>();
        }
        auto starts = shape_t{};
        auto bins = shape_t{};
        for (std::size_t d = 0; d < ndim(); ++d) {
            auto [start, count] = rebin_crop(shape_[d], binning, d);
            starts.push_back(start);
            bins.push_back(count);
        }

        auto block = shape_t(ndim(), binning);
        auto block_size = num_elements(block);
        auto values = std::vector<R>{};
        values.reserve(num_elements(bins));

        auto out = multi_index_t(ndim(), 0);
        auto src = std::vector<long>(ndim());
        do {
            auto total = acc_t{0};
            auto k = multi_index_t(ndim(), 0);
            do {
                for (std::size_t d = 0; d < ndim(); ++d) {
                    src[d] = static_cast<long>(starts[d] + out[d] * binning + k[d]);
                }
                total += static_cast<acc_t>(at(src));
            } while (increment(k, block));
            values.push_back(static_cast<R>(total / static_cast<acc_t>(block_size)));
        } while (increment(out, bins));

        return dataset_t<R>::from_values(std::move(values), std::move(bins), rebinned_meta(meta_, shape_, binning));
    }

    // A single -1 extent is inferred; contiguous arrays give a view
    auto reshape(const std::vector<long>& shape) const -> dataset_t {
        auto new_shape = infer_shape(shape, size());
        auto meta = reshaped_meta(meta_, shape_, new_shape);
        if (is_contiguous()) {
            auto strides = contiguous_strides(new_shape);
            return dataset_t(buffer_, offset_, std::move(new_shape), std::move(strides), std::move(meta));
        }
        return from_values(to_vector(), std::move(new_shape), std::move(meta));
    }

    // Copy with every entry repeated; without an axis the array is flattened
    // first and the result carries "Flattened" metadata
    auto repeat(std::size_t repeats, std::optional<long> axis = std::nullopt) const -> dataset_t {
        if (!axis) {
            auto values = std::vector<T>{};
            values.reserve(size() * repeats);
            for (auto v : to_vector()) {
                values.insert(values.end(), repeats, v);
            }
            auto n = values.size();
            return from_values(std::move(values), shape_t{n}, flattened_meta(meta_, n));
        }
        auto a = wrap_axis(*axis, ndim(), "repeat");
        auto result = take(repeat_positions(shape_[a], repeats), static_cast<long>(a));
        result.meta_ = repeated_meta(meta_, a, repeats);
        return result;
    }

    // Sort in place, ascending with nan last (stable). A 1-D array reorders
    // its range together with the values. Without an axis an n-d array is
    // replaced by its sorted flattened copy. An axis on an n-d array throws
    // config_error: the per-axis metadata cannot follow the elements.
    void sort(std::optional<long> axis = -1) {
        if (axis && ndim() > 1) {
            throw config_error(fmt::format(
                "sort: sorting along axis {} of a {}-dimensional array would destroy its axis metadata; "
                "flatten it first", *axis, ndim()));
        }
        if (ndim() == 0) {
            if (axis) {
                throw std::out_of_range("sort: a 0-dimensional array has no axis to sort along");
            }
            return;
        }
        if (axis) {
            wrap_axis(*axis, ndim(), "sort");
        }
        auto values = to_vector();
        auto order = lane_order(values);

        if (ndim() > 1) {
            auto sorted = std::vector<T>{};
            sorted.reserve(values.size());
            for (auto i : order) sorted.push_back(values[i]);
            auto n = sorted.size();
            *this = from_values(std::move(sorted), shape_t{n}, flattened_meta(meta_, n));
            return;
        }
        meta_ = reordered_meta(meta_, 0, order);
        auto k = std::size_t{0};
        for_each_offset([&](std::ptrdiff_t off) { element(off) = values[order[k++]]; });
    }

    // Positions that would sort each lane along axis (ascending, nan last,
    // stable); without an axis, positions into the flattened array. The
    // result has default axis metadata.
    auto argsort(std::optional<long> axis = -1) const -> dataset_t<std::int64_t> {
        if (!axis) {
            auto order = lane_order(to_vector());
            auto n = order.size();
            return dataset_t<std::int64_t>(std::vector<std::int64_t>(order.begin(), order.end()), shape_t{n});
        }
        auto a = wrap_axis(*axis, ndim(), "argsort");
        auto values = std::vector<std::int64_t>(size());
        auto contiguous = contiguous_strides(shape_);
        for_each_lane(a, [&](multi_index_t full, const std::vector<T>& lane) {
            auto order = lane_order(lane);
            for (std::size_t k = 0; k < order.size(); ++k) {
                full[a] = k;
                values[static_cast<std::size_t>(ndoffset(contiguous, full))] = static_cast<std::int64_t>(order[k]);
            }
        });
        return dataset_t<std::int64_t>(std::move(values), shape_);
    }

    // =========================================================================
    // Reductions
    // =========================================================================

    auto sum() const -> T { return sum_of(to_vector()); }
    auto mean() const -> mean_type_t<T> { return mean_of(to_vector()); }
    auto min() const -> T { return min_of(to_vector()); }
    auto max() const -> T { return max_of(to_vector()); }

    auto sum(long axis) const -> dataset_t { return reduce_axis<T>(axis, "sum", &sum_of); }
    auto mean(long axis) const -> dataset_t<mean_type_t<T>> { return reduce_axis<mean_type_t<T>>(axis, "mean", &mean_of); }
    auto min(long axis) const -> dataset_t { return reduce_axis<T>(axis, "min", &min_of); }
    auto max(long axis) const -> dataset_t { return reduce_axis<T>(axis, "max", &max_of); }

    // =========================================================================
    // Elementwise operations (results keep the left operand's metadata;
    // integer division by zero throws config_error)
    // =========================================================================

    template<typename F>
        requires Arithmetic<std::invoke_result_t<F, T>>
    auto map(F&& f) const -> dataset_t<std::invoke_result_t<F, T>> {
        using R = std::invoke_result_t<F, T>;
        auto values = std::vector<R>{};
        values.reserve(size());
        for_each_offset([&](std::ptrdiff_t off) { values.push_back(f(element(off))); });
        return dataset_t<R>::from_values(std::move(values), shape_, meta_);
    }

    friend auto operator+(const dataset_t& a, const dataset_t& b) -> dataset_t { return a.zip(b, "+", std::plus<>{}); }
    friend auto operator-(const dataset_t& a, const dataset_t& b) -> dataset_t { return a.zip(b, "-", std::minus<>{}); }
    friend auto operator*(const dataset_t& a, const dataset_t& b) -> dataset_t { return a.zip(b, "*", std::multiplies<>{}); }
    friend auto operator/(const dataset_t& a, const dataset_t& b) -> dataset_t {
        return a.zip(b, "/", [](T x, T y) { check_divisor(y); return x / y; });
    }

    friend auto operator+(const dataset_t& a, T b) -> dataset_t { return a.map([b](T x) { return static_cast<T>(x + b); }); }
    friend auto operator-(const dataset_t& a, T b) -> dataset_t { return a.map([b](T x) { return static_cast<T>(x - b); }); }
    friend auto operator*(const dataset_t& a, T b) -> dataset_t { return a.map([b](T x) { return static_cast<T>(x * b); }); }
    friend auto operator/(const dataset_t& a, T b) -> dataset_t {
        check_divisor(b);
        return a.map([b](T x) { return static_cast<T>(x / b); });
    }

    friend auto operator+(T a, const dataset_t& b) -> dataset_t { return b.map([a](T x) { return static_cast<T>(a + x); }); }
    friend auto operator-(T a, const dataset_t& b) -> dataset_t { return b.map([a](T x) { return static_cast<T>(a - x); }); }
    friend auto operator*(T a, const dataset_t& b) -> dataset_t { return b.map([a](T x) { return static_cast<T>(a * x); }); }
    friend auto operator/(T a, const dataset_t& b) -> dataset_t {
        b.for_each_offset([&b](std::ptrdiff_t off) { check_divisor(b.element(off)); });
        return b.map([a](T x) { return static_cast<T>(a / x); });
    }

    // In place, through views
    auto operator+=(T b) -> dataset_t& { for_each_offset([&](std::ptrdiff_t off) { element(off) += b; }); return *this; }
    auto operator-=(T b) -> dataset_t& { for_each_offset([&](std::ptrdiff_t off) { element(off) -= b; }); return *this; }
    auto operator*=(T b) -> dataset_t& { for_each_offset([&](std::ptrdiff_t off) { element(off) *= b; }); return *this; }
    auto operator/=(T b) -> dataset_t& { check_divisor(b); for_each_offset([&](std::ptrdiff_t off) { element(off) /= b; }); return *this; }

    // Buffer contents (in logical order) and all metadata
    friend auto operator==(const dataset_t& a, const dataset_t& b) -> bool {
        return a.shape_ == b.shape_ && a.meta_ == b.meta_ && a.to_vector() == b.to_vector();
    }

private:
    template<Arithmetic U> friend class dataset_t;

    std::shared_ptr<std::vector<T>> buffer_;
    std::ptrdiff_t offset_ = 0;
    shape_t shape_;
    strides_t strides_;
    axis_meta_t meta_;

    dataset_t(std::shared_ptr<std::vector<T>> buffer, std::ptrdiff_t offset, shape_t shape, strides_t strides, axis_meta_t meta)
        : buffer_(std::move(buffer))
        , offset_(offset)
        , shape_(std::move(shape))
        , strides_(std::move(strides))
        , meta_(std::move(meta)) {}

    static auto from_values(std::vector<T> values, shape_t shape, axis_meta_t meta) -> dataset_t {
        auto strides = contiguous_strides(shape);
        return dataset_t(std::make_shared<std::vector<T>>(std::move(values)), 0, std::move(shape), std::move(strides), std::move(meta));
    }

    auto element(std::ptrdiff_t off) -> T& { return (*buffer_)[static_cast<std::size_t>(off)]; }
    auto element(std::ptrdiff_t off) const -> const T& { return (*buffer_)[static_cast<std::size_t>(off)]; }

    auto element_offset(const std::vector<long>& index) const -> std::ptrdiff_t {
        if (index.size() != ndim()) {
            throw std::out_of_range(fmt::format(
                "at: {} indices for an array with {} dimensions", index.size(), ndim()));
        }
        auto off = offset_;
        for (std::size_t d = 0; d < index.size(); ++d) {
            off += static_cast<std::ptrdiff_t>(wrap_index(index[d], shape_[d], d)) * strides_[d];
        }
        return off;
    }

    template<typename F>
    void for_each_offset(F&& f) const {
        if (size() == 0) return;
        auto idx = multi_index_t(ndim(), 0);
        do {
            f(offset_ + ndoffset(strides_, idx));
        } while (increment(idx, shape_));
    }

    template<typename Op>
    auto zip(const dataset_t& other, const char* name, Op op) const -> dataset_t {
        if (shape_ != other.shape_) {
            throw config_error(fmt::format(
                "operator{}: shapes {} and {} differ", name, shape_string(shape_), shape_string(other.shape_)));
        }
        auto a = to_vector();
        auto b = other.to_vector();
        for (std::size_t i = 0; i < a.size(); ++i) {
            a[i] = static_cast<T>(op(a[i], b[i]));
        }
        return from_values(std::move(a), shape_, meta_);
    }

    // Calls f(index, lane) for every lane along axis a in row-major order of
    // the other axes; index addresses the lane's first element
    template<typename F>
    void for_each_lane(std::size_t a, F&& f) const {
        auto out_shape = shape_;
        out_shape.erase(out_shape.begin() + static_cast<std::ptrdiff_t>(a));
        if (num_elements(out_shape) == 0) return;

        auto lane = std::vector<T>(shape_[a]);
        auto out = multi_index_t(out_shape.size(), 0);
        auto full = multi_index_t(ndim(), 0);
        do {
            for (std::size_t d = 0, o = 0; d < ndim(); ++d) {
                if (d != a) full[d] = out[o++];
            }
            for (std::size_t k = 0; k < shape_[a]; ++k) {
                full[a] = k;
                lane[k] = element(offset_ + ndoffset(strides_, full));
            }
            full[a] = 0;
            f(full, lane);
        } while (increment(out, out_shape));
    }

    template<Arithmetic R>
    auto reduce_axis(long axis, const char* name, R (*reduce)(const std::vector<T>&)) const -> dataset_t<R> {
        auto a = wrap_axis(axis, ndim(), name);
        auto out_shape = shape_;
        out_shape.erase(out_shape.begin() + static_cast<std::ptrdiff_t>(a));

        auto values = std::vector<R>{};
        values.reserve(num_elements(out_shape));
        for_each_lane(a, [&](const multi_index_t&, const std::vector<T>& lane) {
            values.push_back(reduce(lane));
        });
        return dataset_t<R>::from_values(std::move(values), std::move(out_shape), reduced_meta(meta_, a, name));
    }

    static void check_divisor(T divisor) {
        if constexpr (std::is_integral_v<T>) {
            if (divisor == T{0}) {
                throw config_error("operator/: integer division by zero");
            }
        }
    }

    // Ascending, nan after every number
    static auto sorts_before(T a, T b) -> bool {
        if constexpr (std::is_floating_point_v<T>) {
            if (std::isnan(a)) return false;
            if (std::isnan(b)) return true;
        }
        return a < b;
    }

    static auto lane_order(const std::vector<T>& lane) -> std::vector<std::size_t> {
        auto order = std::vector<std::size_t>(lane.size());
        for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
        std::stable_sort(order.begin(), order.end(), [&lane](std::size_t i, std::size_t j) {
            return sorts_before(lane[i], lane[j]);
        });
        return order;
    }

    static auto sum_of(const std::vector<T>& values) -> T {
        auto total = T{0};
        for (auto v : values) total += v;
        return total;
    }

    static auto mean_of(const std::vector<T>& values) -> mean_type_t<T> {
        using R = mean_type_t<T>;
        if (values.empty()) return std::numeric_limits<R>::quiet_NaN();
        auto total = std::common_type_t<R, double>{0};
        for (auto v : values) total += v;
        return static_cast<R>(total / static_cast<double>(values.size()));
    }

    static auto min_of(const std::vector<T>& values) -> T {
        if (values.empty()) {
            throw std::runtime_error("min: empty array");
        }
        auto result = values.front();
        for (auto v : values) result = v < result ? v : result;
        return result;
    }

    static auto max_of(const std::vector<T>& values) -> T {
        if (values.empty()) {
            throw std::runtime_error("max: empty array");
        }
        auto result = values.front();
        for (auto v : values) result = v > result ? v : result;
        return result;
    }
};

} // namespace dset
