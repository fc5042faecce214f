#pragma once

#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace dset {

// =============================================================================
// Concepts
// =============================================================================

template<typename T>
concept Arithmetic = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

// Element type of averages: integers average to double
template<Arithmetic T>
using mean_type_t = std::conditional_t<std::is_floating_point_v<T>, T, double>;

// =============================================================================
// Errors
// =============================================================================

// Raised for requests that cannot be interpreted at all: a per-axis spec of
// the wrong kind, non-adjacent dimensions to merge, a non-unit axis to
// squeeze, a binning factor that leaves no bins, or a malformed archive.
struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Shapes and strides (row-major, runtime rank)
// =============================================================================

using shape_t = std::vector<std::size_t>;
using strides_t = std::vector<std::ptrdiff_t>;
using multi_index_t = std::vector<std::size_t>;

inline auto num_elements(const shape_t& shape) -> std::size_t {
    auto n = std::size_t{1};
    for (auto s : shape) n *= s;
    return n;
}

inline auto contiguous_strides(const shape_t& shape) -> strides_t {
    auto strides = strides_t(shape.size());
    auto str = std::ptrdiff_t{1};
    for (std::size_t i = shape.size(); i > 0; --i) {
        strides[i - 1] = str;
        str *= static_cast<std::ptrdiff_t>(shape[i - 1]);
    }
    return strides;
}

inline auto ndoffset(const strides_t& strides, const multi_index_t& idx) -> std::ptrdiff_t {
    auto off = std::ptrdiff_t{0};
    for (std::size_t i = 0; i < idx.size(); ++i) {
        off += static_cast<std::ptrdiff_t>(idx[i]) * strides[i];
    }
    return off;
}

inline auto ndindex(const shape_t& shape, std::size_t off) -> multi_index_t {
    auto idx = multi_index_t(shape.size());
    for (std::size_t i = shape.size(); i > 0; --i) {
        idx[i - 1] = off % shape[i - 1];
        off /= shape[i - 1];
    }
    return idx;
}

// Advance a row-major multi-index by one; returns false after the last element
inline auto increment(multi_index_t& idx, const shape_t& shape) -> bool {
    for (std::size_t i = shape.size(); i > 0; --i) {
        if (++idx[i - 1] < shape[i - 1]) return true;
        idx[i - 1] = 0;
    }
    return false;
}

// Wrap a possibly negative index into [0, extent)
inline auto wrap_index(long i, std::size_t extent, std::size_t dim) -> std::size_t {
    auto n = static_cast<long>(extent);
    auto j = i < 0 ? i + n : i;
    if (j < 0 || j >= n) {
        throw std::out_of_range(
            "index " + std::to_string(i) + " is out of bounds for axis " +
            std::to_string(dim) + " with size " + std::to_string(extent));
    }
    return static_cast<std::size_t>(j);
}

inline auto arange(std::size_t n) -> std::vector<double> {
    auto r = std::vector<double>(n);
    for (std::size_t i = 0; i < n; ++i) r[i] = static_cast<double>(i);
    return r;
}

inline auto shape_string(const shape_t& shape) -> std::string {
    auto s = std::string("(");
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(shape[i]);
    }
    if (shape.size() == 1) s += ",";
    return s + ")";
}

} // namespace dset
