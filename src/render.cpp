// render.cpp - implementation of the diagnostic text rendering

#include "dset/render.hpp"
#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <variant>
#include <vector>

namespace dset {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Positions shown along one axis; nullopt marks the elided middle
auto visible_positions(std::size_t extent, std::size_t edge, bool summarize) -> std::vector<std::optional<std::size_t>> {
    auto result = std::vector<std::optional<std::size_t>>{};
    if (summarize && extent > 2 * edge) {
        for (std::size_t i = 0; i < edge; ++i) result.emplace_back(i);
        result.emplace_back(std::nullopt);
        for (std::size_t i = extent - edge; i < extent; ++i) result.emplace_back(i);
    } else {
        for (std::size_t i = 0; i < extent; ++i) result.emplace_back(i);
    }
    return result;
}

class array_printer {
public:
    array_printer(const shape_t& shape, const std::function<std::string(std::size_t)>& cell, const render_options_t& options)
        : shape_(shape)
        , strides_(contiguous_strides(shape))
    {
        auto edge = options.edge_items ? options.edge_items : (shape.size() > 1 ? 2 : 3);
        auto summarize = num_elements(shape) > options.threshold;
        for (auto extent : shape) {
            visible_.push_back(visible_positions(extent, edge, summarize));
        }
        collect(0, 0, cell);
    }

    auto print(std::size_t dim, std::size_t base, const std::string& indent) const -> std::string {
        auto out = std::string("[");
        auto last = dim + 1 == shape_.size();
        auto separator = last
            ? std::string(", ")
            : "," + std::string(shape_.size() - dim - 1, '\n') + indent + " ";

        for (std::size_t k = 0; k < visible_[dim].size(); ++k) {
            if (k > 0) out += separator;
            const auto& pos = visible_[dim][k];
            if (!pos) {
                out += "...";
            } else if (last) {
                const auto& text = cells_.at(base + *pos);
                out += std::string(width_ - text.size(), ' ') + text;
            } else {
                out += print(dim + 1, base + *pos * static_cast<std::size_t>(strides_[dim]), indent + " ");
            }
        }
        return out + "]";
    }

    auto scalar() const -> const std::string& { return cells_.at(0); }

private:
    void collect(std::size_t dim, std::size_t base, const std::function<std::string(std::size_t)>& cell) {
        if (dim == shape_.size()) {
            auto text = cell(base);
            width_ = std::max(width_, text.size());
            cells_.emplace(base, std::move(text));
            return;
        }
        for (const auto& pos : visible_[dim]) {
            if (pos) collect(dim + 1, base + *pos * static_cast<std::size_t>(strides_[dim]), cell);
        }
    }

    shape_t shape_;
    strides_t strides_;
    std::vector<std::vector<std::optional<std::size_t>>> visible_;
    std::map<std::size_t, std::string> cells_;
    std::size_t width_ = 0;
};

auto quoted(const std::string& s) -> std::string {
    return "'" + s + "'";
}

auto render_doubles(const std::vector<double>& values, int precision) -> std::string {
    auto out = std::string("[");
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += format_value(values[i], precision);
    }
    return out + "]";
}

// "name: {\n    0: a\n    1: b}"
template<typename Map, typename F>
auto render_axis_map(const char* name, const Map& map, F&& item) -> std::string {
    auto out = fmt::format("{}: {{", name);
    for (const auto& [dim, value] : map) {
        out += fmt::format("\n    {}: {}", dim, item(value));
    }
    return out + "}";
}

} // anonymous namespace

auto render_array(
    const shape_t& shape,
    const std::function<std::string(std::size_t)>& cell,
    const render_options_t& options) -> std::string
{
    if (num_elements(shape) == 0) {
        return shape.size() == 1
            ? std::string("array([])")
            : fmt::format("array([], shape={})", shape_string(shape));
    }
    auto printer = array_printer(shape, cell, options);
    if (shape.empty()) {
        return "array(" + printer.scalar() + ")";
    }
    return "array(" + printer.print(0, 0, std::string(6, ' ')) + ")";
}

auto render_metadata_value(const metadata_value_t& value, int precision) -> std::string {
    return std::visit(overloaded{
        [](std::monostate) -> std::string { return "None"; },
        [](bool b) -> std::string { return b ? "True" : "False"; },
        [](std::int64_t i) -> std::string { return fmt::format("{}", i); },
        [precision](double d) -> std::string { return format_value(d, precision); },
        [](const std::string& s) -> std::string { return quoted(s); },
        [precision](const std::vector<double>& v) -> std::string { return render_doubles(v, precision); },
        [precision](const sliced_axis_t& s) -> std::string {
            return fmt::format("{{'label': {}, 'unit': {}, 'value': {}}}",
                quoted(s.label), quoted(s.unit),
                s.value ? format_value(*s.value, precision) : std::string("None"));
        }
    }, value);
}

auto render_dataset(const axis_meta_t& meta, const std::string& body, const render_options_t& options) -> std::string {
    auto labels = render_axis_map("axis_labels", meta.labels, quoted);
    auto units = render_axis_map("axis_units", meta.units, quoted);
    auto ranges = render_axis_map("axis_ranges", meta.ranges, [&](const range_t& range) {
        if (!range) return std::string("None");
        return render_array(shape_t{range->size()}, [&](std::size_t i) {
            return format_value((*range)[i], options.precision);
        }, options);
    });

    auto metadata = std::string("metadata: {");
    auto first = true;
    for (const auto& [key, value] : meta.metadata) {
        metadata += fmt::format("{}{}: {}", first ? "" : ", ", quoted(key), render_metadata_value(value, options.precision));
        first = false;
    }
    metadata += "}";

    return fmt::format(
        "dataset(\n{},\n{},\n{},\n{},\ndata_unit: {},\ndata_label: {},\n{}\n)",
        labels, ranges, units, metadata, meta.data_unit, meta.data_label, body);
}

} // namespace dset
