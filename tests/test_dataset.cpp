#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "dset/dataset.hpp"
#include "dset/log.hpp"

using namespace dset;

// =============================================================================
// Helpers
// =============================================================================

auto iota_values(std::size_t n) -> std::vector<double> {
    auto values = std::vector<double>(n);
    for (std::size_t i = 0; i < n; ++i) values[i] = static_cast<double>(i);
    return values;
}

// Labels "label0".. and ranges 100 * d + i on every axis
auto make_labelled(const shape_t& shape) -> dataset_t<double> {
    auto labels = std::vector<std::string>{};
    auto units = std::vector<std::string>{};
    auto ranges = std::vector<range_t>{};
    for (std::size_t d = 0; d < shape.size(); ++d) {
        labels.push_back("label" + std::to_string(d));
        units.push_back("unit" + std::to_string(d));
        auto range = std::vector<double>(shape[d]);
        for (std::size_t i = 0; i < shape[d]; ++i) range[i] = 100.0 * static_cast<double>(d) + static_cast<double>(i);
        ranges.push_back(range);
    }
    auto options = dataset_options_t{};
    options.axis_labels = labels;
    options.axis_units = units;
    options.axis_ranges = ranges;
    options.data_unit = "counts";
    options.data_label = "intensity";
    return dataset_t<double>(iota_values(num_elements(shape)), shape, options);
}

auto approx_equal(double a, double b, double tol = 1e-12) -> bool {
    return std::abs(a - b) <= tol * std::max(1.0, std::abs(b));
}

template<typename F>
auto throws_config_error(F&& f) -> bool {
    try {
        f();
    } catch (const config_error&) {
        return true;
    }
    return false;
}

template<typename F>
auto throws_out_of_range(F&& f) -> bool {
    try {
        f();
    } catch (const std::out_of_range&) {
        return true;
    }
    return false;
}

// =============================================================================
// Construction and metadata store
// =============================================================================

void test_construction_defaults() {
    std::cout << "Testing construction defaults... ";

    auto ds = dataset_t<double>(shape_t{2, 3});
    assert(ds.ndim() == 2);
    assert(ds.size() == 6);
    assert(ds.axis_labels().at(1).empty());
    assert(*ds.axis_range(0) == arange(2));
    assert(*ds.axis_range(1) == arange(3));
    assert(ds.data_unit().empty());
    assert(ds.metadata().empty());
    assert(ds.sum() == 0.0);
    assert(is_consistent(ds.property_meta(), ds.shape()));

    auto empty = dataset_t<int>{};
    assert((empty.shape() == shape_t{0}));
    assert(empty.size() == 0);

    std::cout << "PASSED\n";
}

void test_construction_size_mismatch() {
    std::cout << "Testing construction size mismatch... ";

    assert(throws_config_error([] { dataset_t<double>(std::vector<double>(5), shape_t{2, 3}); }));

    std::cout << "PASSED\n";
}

void test_setters_normalize() {
    std::cout << "Testing setters normalize their input... ";

    auto warnings = 0;
    logger::set_sink([&](log_level, std::string_view) { ++warnings; });

    auto ds = dataset_t<float>(shape_t{2, 3});
    ds.set_axis_labels({"row", "column"});
    ds.set_axis_units(std::map<long, std::string>{{0, "mm"}, {1, "deg"}});
    ds.set_axis_ranges({std::vector<double>{0.1, 0.2}, std::nullopt});
    assert(ds.axis_labels().at(1) == "column");
    assert(ds.axis_units().at(0) == "mm");
    assert(!ds.axis_range(1).has_value());
    assert(warnings == 0);

    ds.set_axis_labels({"only_one"});
    assert(ds.axis_labels().at(0).empty());
    assert(warnings == 1);

    ds.set_axis_ranges({arange(2), arange(2)});
    assert(*ds.axis_range(1) == arange(3));
    assert(warnings == 2);

    logger::reset_sink();

    assert(throws_config_error([&] { ds.set_axis_labels(std::string("row")); }));

    std::cout << "PASSED\n";
}

void test_returned_maps_are_copies() {
    std::cout << "Testing returned maps are copies... ";

    auto ds = make_labelled({2, 2});
    auto labels = ds.axis_labels();
    labels[0] = "changed";
    labels[5] = "extra";
    assert(ds.axis_labels().at(0) == "label0");
    assert(ds.axis_labels().size() == 2);

    std::cout << "PASSED\n";
}

void test_descriptions() {
    std::cout << "Testing descriptions... ";

    auto ds = make_labelled({3, 4});
    assert(ds.axis_description(1) == "label1 / unit1");
    assert(ds.data_description() == "intensity / counts");
    assert(ds.description_of_point({1, 2}) == "label0: 1.0000 unit0; label1: 102.0000 unit1");
    assert(ds.description_of_point({std::nullopt, -1}) == "label1: 103.0000 unit1");
    assert(throws_config_error([&] { ds.description_of_point({1}); }));

    ds.set_axis_units({"", ""});
    assert(ds.axis_description(0) == "label0");

    std::cout << "PASSED\n";
}

void test_is_axis_nonlinear() {
    std::cout << "Testing is_axis_nonlinear... ";

    auto ds = dataset_t<double>(shape_t{5, 4});
    ds.set_axis_ranges({std::vector<double>{0.0, 1.0, 2.0, 3.0, 4.0}, std::vector<double>{1.0, 2.0, 4.0, 8.0}});
    assert(!ds.is_axis_nonlinear(0));
    assert(ds.is_axis_nonlinear(1));

    ds.set_axis_ranges({arange(5), std::nullopt});
    assert(throws_config_error([&] { ds.is_axis_nonlinear(1); }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Element access and views
// =============================================================================

void test_at_and_fill() {
    std::cout << "Testing element access... ";

    auto ds = make_labelled({3, 4});
    assert(ds.at({1, 2}) == 6.0);
    assert(ds.at({-1, -1}) == 11.0);
    ds.at({0, 0}) = 42.0;
    assert(ds.to_vector()[0] == 42.0);
    assert(throws_out_of_range([&] { ds.at({3, 0}); }));
    assert(throws_out_of_range([&] { ds.at({0}); }));

    std::cout << "PASSED\n";
}

void test_basic_indexing_is_a_view() {
    std::cout << "Testing basic indexing is a view... ";

    auto ds = make_labelled({4, 5});
    auto row = ds[{1}];
    assert((row.shape() == shape_t{5}));
    assert(row.shares_buffer(ds));
    assert(row.axis_labels().at(0) == "label1");

    row.fill(-1.0);
    assert(ds.at({1, 3}) == -1.0);
    assert(ds.at({2, 3}) == 13.0);

    auto strided = ds[{slice_t{std::nullopt, std::nullopt, -2}, slice_t{1, 4, 2}}];
    assert((strided.shape() == shape_t{2, 2}));
    assert((strided.to_vector() == std::vector<double>{16.0, 18.0, -1.0, -1.0}));
    assert(strided.at({0, 0}) == 16.0);
    assert(strided.at({1, 1}) == -1.0);
    assert((*strided.axis_range(0) == std::vector<double>{3.0, 1.0}));
    assert((*strided.axis_range(1) == std::vector<double>{101.0, 103.0}));

    std::cout << "PASSED\n";
}

void test_advanced_indexing_is_a_copy() {
    std::cout << "Testing advanced indexing is a copy... ";

    auto ds = make_labelled({3, 4});
    auto picked = ds[{index_array_t{{2, 0}}, bool_mask_t{{true, false, false, true}, {}}}];
    assert((picked.shape() == shape_t{2, 2}));
    assert(!picked.shares_buffer(ds));
    assert((picked.to_vector() == std::vector<double>{8.0, 11.0, 0.0, 3.0}));
    assert((*picked.axis_range(0) == std::vector<double>{2.0, 0.0}));
    assert((*picked.axis_range(1) == std::vector<double>{100.0, 103.0}));

    auto taken = ds.take({3, 1}, -1);
    assert((taken.to_vector() == std::vector<double>{3.0, 1.0, 7.0, 5.0, 11.0, 9.0}));
    assert(taken.axis_labels().at(1) == "label1");

    std::cout << "PASSED\n";
}

void test_full_mask_flattens() {
    std::cout << "Testing a full mask gives a flattened axis... ";

    auto ds = make_labelled({2, 3});
    auto mask = std::vector<bool>{};
    for (auto v : ds.to_vector()) mask.push_back(v > 2.0);
    auto selected = ds[{bool_mask_t{mask, ds.shape()}}];

    assert((selected.to_vector() == std::vector<double>{3.0, 4.0, 5.0}));
    assert(selected.axis_labels().at(0) == "Flattened");
    assert(*selected.axis_range(0) == arange(3));
    assert(selected.data_label() == "intensity");

    std::cout << "PASSED\n";
}

// Indexing [:, 7, 6] of a (10, 12, 14, 16) array
void test_scenario_integer_indexing() {
    std::cout << "Testing integer indexing of a 4-d array... ";

    auto ds = make_labelled({10, 12, 14, 16});
    auto sub = ds[{all, 7, 6}];

    assert((sub.shape() == shape_t{10, 16}));
    assert(sub.axis_labels().at(0) == "label0");
    assert(sub.axis_labels().at(1) == "label3");
    assert(sub.axis_units().at(1) == "unit3");
    assert(*sub.axis_range(1) == ds.axis_range(3));
    for (long i = 0; i < 10; ++i) {
        for (long l = 0; l < 16; l += 5) {
            assert(sub.at({i, l}) == ds.at({i, 7, 6, l}));
        }
    }
    auto record = std::get<sliced_axis_t>(sub.metadata().at("sliced_axis_1"));
    assert(record.label == "label1" && record.value == 107.0);

    std::cout << "PASSED\n";
}

void test_too_many_indices() {
    std::cout << "Testing too many indices... ";

    auto ds = make_labelled({2, 2});
    assert(throws_config_error([&] { ds[{0, 0, 0}]; }));
    assert(throws_out_of_range([&] { ds[{2}]; }));

    std::cout << "PASSED\n";
}

// =============================================================================
// Structural transforms
// =============================================================================

// transpose() of a (6, 7, 8, 9) array
void test_scenario_transpose() {
    std::cout << "Testing default transpose of a 4-d array... ";

    auto r1 = arange(7);
    for (auto& v : r1) v = 20.0 - v;
    auto r2 = arange(8);
    for (auto& v : r2) v = 3.0 * v;
    auto r3 = arange(9);
    for (auto& v : r3) v = -v;

    auto options = dataset_options_t{};
    options.axis_labels = {"a", "b", "c", "d"};
    options.axis_ranges = {arange(6), r1, r2, r3};
    auto ds = dataset_t<double>(iota_values(6 * 7 * 8 * 9), {6, 7, 8, 9}, options);

    auto t = ds.transpose();
    assert((t.shape() == shape_t{9, 8, 7, 6}));
    assert(t.axis_labels().at(0) == "d");
    assert(*t.axis_range(0) == r3);
    assert(t.axis_labels().at(3) == "a");
    assert(t.shares_buffer(ds));
    assert(t.at({2, 3, 4, 5}) == ds.at({5, 4, 3, 2}));

    std::cout << "PASSED\n";
}

void test_transpose_involution() {
    std::cout << "Testing transpose involution... ";

    auto ds = make_labelled({3, 5});
    auto t = ds.transpose();
    assert(t.axis_labels().at(0) == "label1");
    assert(t.axis_units().at(1) == "unit0");
    assert(t.transpose() == ds);

    auto p = make_labelled({2, 3, 4}).transpose({1, 2, 0});
    assert((p.shape() == shape_t{3, 4, 2}));
    assert(throws_config_error([&] { ds.transpose({0, 0}); }));

    std::cout << "PASSED\n";
}

void test_flatten() {
    std::cout << "Testing flatten... ";

    auto ds = make_labelled({3, 4});
    auto flat = ds.transpose().flatten();
    assert((flat.shape() == shape_t{12}));
    assert(flat.to_vector()[1] == 4.0);
    assert(flat.axis_labels().at(0) == "Flattened");
    assert(*flat.axis_range(0) == arange(12));
    assert(flat.data_unit() == "counts");
    assert(!flat.shares_buffer(ds));

    std::cout << "PASSED\n";
}

// flatten_dims(1, 2) of a (10, 12, 14, 16) array
void test_scenario_flatten_dims() {
    std::cout << "Testing flatten_dims of a 4-d array... ";

    auto ds = make_labelled({10, 12, 14, 16});
    auto merged = ds.flatten_dims({1, 2});
    assert((merged.shape() == shape_t{10, 168, 16}));
    assert(merged.axis_labels().at(1) == "Flattened");
    assert(!merged.axis_range(1).has_value());
    assert(merged.axis_labels().at(2) == "label3");
    assert(merged.at({3, 14 * 5 + 2, 9}) == ds.at({3, 5, 2, 9}));

    auto ranged = ds.flatten_dims({1, 2}, "pixel", "px", arange(168));
    assert(ranged.axis_labels().at(1) == "pixel");
    assert(*ranged.axis_range(1) == arange(168));

    assert(throws_config_error([&] { ds.flatten_dims({0, 2}); }));
    assert(ds.flatten_dims({2}) == ds);

    std::cout << "PASSED\n";
}

void test_squeeze() {
    std::cout << "Testing squeeze... ";

    auto ds = make_labelled({1, 3, 1});
    auto all_squeezed = ds.squeeze();
    assert((all_squeezed.shape() == shape_t{3}));
    assert(all_squeezed.axis_labels().at(0) == "label1");
    assert(all_squeezed.shares_buffer(ds));

    auto one = ds.squeeze(-1);
    assert((one.shape() == shape_t{1, 3}));
    assert(one.axis_labels().at(1) == "label1");

    assert(throws_config_error([&] { ds.squeeze(1); }));

    std::cout << "PASSED\n";
}

void test_squeeze_undoes_new_axis() {
    std::cout << "Testing squeeze undoes a new axis... ";

    auto ds = make_labelled({3, 4});
    auto expanded = ds[{all, new_axis}];
    assert((expanded.shape() == shape_t{3, 1, 4}));
    assert(expanded.axis_labels().at(1).empty());
    assert(!expanded.axis_range(1).has_value());

    auto restored = expanded.squeeze(1);
    assert(restored == ds);

    std::cout << "PASSED\n";
}

// get_rebinned_copy(2) of a constant (10, 10) array
void test_scenario_rebin_constant() {
    std::cout << "Testing rebinning a constant array... ";

    auto ds = dataset_t<double>(std::vector<double>(100, 2.5), {10, 10});
    auto binned = ds.get_rebinned_copy(2);
    assert((binned.shape() == shape_t{5, 5}));
    for (auto v : binned.to_vector()) {
        assert(v == 2.5);
    }

    auto odd = dataset_t<double>(std::vector<double>(100, 3.7), {10, 10}).get_rebinned_copy(3);
    assert((odd.shape() == shape_t{3, 3}));
    for (auto v : odd.to_vector()) {
        assert(approx_equal(v, 3.7));
    }

    std::cout << "PASSED\n";
}

void test_rebin_identity_and_division() {
    std::cout << "Testing rebin identity and exact division... ";

    auto ds = make_labelled({4, 6});
    assert(ds.get_rebinned_copy(1) == ds);
    assert(!ds.get_rebinned_copy(1).shares_buffer(ds));

    auto binned = ds.get_rebinned_copy(2);
    assert((binned.shape() == shape_t{2, 3}));
    assert((*binned.axis_range(0) == std::vector<double>{0.5, 2.5}));
    assert((*binned.axis_range(1) == std::vector<double>{100.5, 102.5, 104.5}));
    // Block (0, 0) holds 0, 1, 6, 7
    assert(binned.at({0, 0}) == 3.5);
    assert(binned.axis_labels().at(1) == "label1");

    assert(throws_config_error([&] { ds.get_rebinned_copy(5); }));
    assert(throws_config_error([&] { ds.get_rebinned_copy(0); }));

    std::cout << "PASSED\n";
}

void test_rebin_integer_data() {
    std::cout << "Testing rebinning integer data... ";

    auto ds = dataset_t<std::int32_t>(std::vector<std::int32_t>{1, 2, 3, 4}, {4});
    auto binned = ds.get_rebinned_copy(2);
    static_assert(std::is_same_v<decltype(binned), dataset_t<double>>);
    assert((binned.to_vector() == std::vector<double>{1.5, 3.5}));

    std::cout << "PASSED\n";
}

void test_reshape() {
    std::cout << "Testing reshape... ";

    auto ds = make_labelled({4, 3, 2});
    auto r = ds.reshape({4, -1});
    assert((r.shape() == shape_t{4, 6}));
    assert(r.shares_buffer(ds));
    assert(r.axis_labels().at(0) == "label0");
    assert(r.axis_labels().at(1).empty());

    auto from_view = ds.transpose().reshape({-1});
    assert(!from_view.shares_buffer(ds));
    assert(from_view.to_vector()[1] == 6.0);

    assert(throws_config_error([&] { ds.reshape({5, -1}); }));

    std::cout << "PASSED\n";
}

void test_repeat() {
    std::cout << "Testing repeat... ";

    auto ds = make_labelled({2, 3});
    auto rows = ds.repeat(2, 0);
    assert((rows.shape() == shape_t{4, 3}));
    assert((rows.to_vector() == std::vector<double>{0, 1, 2, 0, 1, 2, 3, 4, 5, 3, 4, 5}));
    assert((*rows.axis_range(0) == std::vector<double>{0.0, 0.0, 1.0, 1.0}));
    assert(rows.axis_labels().at(0) == "label0");
    assert(rows.axis_labels().at(1) == "label1");
    assert(!rows.shares_buffer(ds));

    auto cols = ds.repeat(2, -1);
    assert((cols.shape() == shape_t{2, 6}));
    assert((cols[{0}].to_vector() == std::vector<double>{0, 0, 1, 1, 2, 2}));
    assert((*cols.axis_range(1) == std::vector<double>{100, 100, 101, 101, 102, 102}));

    auto flat = ds.repeat(2);
    assert((flat.shape() == shape_t{12}));
    assert(flat.to_vector()[3] == 1.0);
    assert(flat.axis_labels().at(0) == "Flattened");
    assert(*flat.axis_range(0) == arange(12));
    assert(flat.data_label() == "intensity");

    assert((ds.repeat(0, 1).shape() == shape_t{2, 0}));
    assert(throws_out_of_range([&] { ds.repeat(2, 2); }));

    std::cout << "PASSED\n";
}

void test_sort_one_dimensional() {
    std::cout << "Testing sort of a 1-D array... ";

    auto options = dataset_options_t{};
    options.axis_labels = {"energy"};
    options.axis_ranges = {std::vector<double>{10.0, 20.0, 30.0, 40.0, 50.0}};
    auto ds = dataset_t<double>(std::vector<double>{3.0, NAN, 1.0, 2.0, 1.0}, {5}, options);

    auto shared = ds[{all}];
    ds.sort();
    auto values = ds.to_vector();
    assert(values[0] == 1.0 && values[1] == 1.0 && values[2] == 2.0 && values[3] == 3.0);
    assert(std::isnan(values[4]));
    assert((*ds.axis_range(0) == std::vector<double>{30.0, 50.0, 40.0, 10.0, 20.0}));
    assert(ds.axis_labels().at(0) == "energy");
    assert(shared.at({0}) == 1.0);
    assert(ds.shares_buffer(shared));

    // Sorting a strided view writes through to its source
    auto base = dataset_t<int>(std::vector<int>{5, 0, 3, 0, 1, 0}, {6});
    auto every_other = base[{slice_t{std::nullopt, std::nullopt, 2}}];
    every_other.sort(0);
    assert((base.to_vector() == std::vector<int>{1, 0, 3, 0, 5, 0}));

    std::cout << "PASSED\n";
}

void test_sort_multi_dimensional() {
    std::cout << "Testing sort of an n-d array... ";

    auto ds = make_labelled({2, 3}) * -1.0;
    assert(throws_config_error([&] { ds.sort(); }));
    assert(throws_config_error([&] { ds.sort(0); }));
    assert(ds.ndim() == 2);

    ds.sort(std::nullopt);
    assert((ds.shape() == shape_t{6}));
    assert((ds.to_vector() == std::vector<double>{-5, -4, -3, -2, -1, 0}));
    assert(ds.axis_labels().at(0) == "Flattened");
    assert(*ds.axis_range(0) == arange(6));
    assert(is_consistent(ds.property_meta(), ds.shape()));

    std::cout << "PASSED\n";
}

void test_argsort() {
    std::cout << "Testing argsort... ";

    auto ds = dataset_t<double>(std::vector<double>{3, 1, 2, 0, 5, 4}, {2, 3});
    ds.set_axis_labels({"row", "col"});

    auto last = ds.argsort();
    static_assert(std::is_same_v<decltype(last), dataset_t<std::int64_t>>);
    assert((last.shape() == shape_t{2, 3}));
    assert((last.to_vector() == std::vector<std::int64_t>{1, 2, 0, 0, 2, 1}));
    assert(last.axis_labels().at(0).empty());

    auto first = ds.argsort(0);
    assert((first.to_vector() == std::vector<std::int64_t>{1, 0, 0, 0, 1, 1}));

    auto flat = ds.argsort(std::nullopt);
    assert((flat.shape() == shape_t{6}));
    assert((flat.to_vector() == std::vector<std::int64_t>{3, 1, 2, 0, 5, 4}));

    // Ties keep their order and nan goes last
    auto ties = dataset_t<double>(std::vector<double>{NAN, 2.0, 1.0, 2.0}, {4});
    assert((ties.argsort().to_vector() == std::vector<std::int64_t>{2, 1, 3, 0}));
    assert(ties.to_vector()[1] == 2.0);

    assert(throws_out_of_range([&] { ds.argsort(2); }));

    std::cout << "PASSED\n";
}

void test_huge_slice_step() {
    std::cout << "Testing slices with huge steps... ";

    auto ds = make_labelled({10});
    auto forward = ds[{slice_t{5, std::nullopt, std::numeric_limits<long>::max()}}];
    assert((forward.shape() == shape_t{1}));
    assert(forward.at({0}) == 5.0);
    assert((*forward.axis_range(0) == std::vector<double>{5.0}));

    auto backward = ds[{slice_t{std::nullopt, std::nullopt, std::numeric_limits<long>::min()}}];
    assert((backward.to_vector() == std::vector<double>{9.0}));

    std::cout << "PASSED\n";
}

// =============================================================================
// Reductions and arithmetic
// =============================================================================

void test_reductions() {
    std::cout << "Testing reductions... ";

    auto ds = make_labelled({2, 3});
    assert(ds.sum() == 15.0);
    assert(ds.mean() == 2.5);
    assert(ds.min() == 0.0);
    assert(ds.max() == 5.0);

    auto col = ds.sum(0);
    assert((col.to_vector() == std::vector<double>{3.0, 5.0, 7.0}));
    assert(col.axis_labels().at(0) == "label1");
    assert(col.data_label() == "Sum of intensity");

    auto row = ds.mean(-1);
    assert((row.to_vector() == std::vector<double>{1.0, 4.0}));
    assert(row.data_label() == "Mean of intensity");
    assert(ds.max(1).to_vector()[1] == 5.0);
    assert(ds.min(0).to_vector()[2] == 2.0);

    auto threw = false;
    try {
        dataset_t<double>{}.min();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_arithmetic() {
    std::cout << "Testing arithmetic... ";

    auto a = make_labelled({2, 2});
    auto b = dataset_t<double>(std::vector<double>{1.0, 1.0, 2.0, 2.0}, {2, 2});

    auto c = a * b + 1.0;
    assert((c.to_vector() == std::vector<double>{1.0, 2.0, 5.0, 7.0}));
    assert(c.axis_labels().at(0) == "label0");
    assert(c.data_unit() == "counts");

    auto d = 10.0 - a;
    assert((d.to_vector() == std::vector<double>{10.0, 9.0, 8.0, 7.0}));

    auto view = a[{1}];
    view *= 2.0;
    assert(a.at({1, 1}) == 6.0);

    auto squared = a.map([](double x) { return static_cast<float>(x * x); });
    static_assert(std::is_same_v<decltype(squared), dataset_t<float>>);
    assert(squared.at({1, 0}) == 16.0f);

    assert(throws_config_error([&] { a + make_labelled({2, 3}); }));

    std::cout << "PASSED\n";
}

void test_integer_division_by_zero() {
    std::cout << "Testing integer division by zero... ";

    auto ints = dataset_t<int>(std::vector<int>{4, 6, 8}, {3});
    auto zeros = dataset_t<int>(std::vector<int>{2, 0, 1}, {3});

    assert(throws_config_error([&] { ints / 0; }));
    assert(throws_config_error([&] { 12 / zeros; }));
    assert(throws_config_error([&] { ints / zeros; }));
    assert(throws_config_error([&] { ints /= 0; }));
    assert((ints.to_vector() == std::vector<int>{4, 6, 8}));

    assert(((ints / 2).to_vector() == std::vector<int>{2, 3, 4}));
    assert(((24 / ints).to_vector() == std::vector<int>{6, 4, 3}));

    // Floating-point division follows IEEE
    auto doubles = dataset_t<double>(std::vector<double>{1.0, -1.0}, {2});
    auto inf = doubles / 0.0;
    assert(std::isinf(inf.at({0})) && inf.at({0}) > 0.0);
    assert(inf.at({1}) < 0.0);

    std::cout << "PASSED\n";
}

void test_astype_and_copy() {
    std::cout << "Testing astype and copy... ";

    auto ds = make_labelled({2, 2}) / 2.0;
    auto ints = ds.astype<int>();
    assert((ints.to_vector() == std::vector<int>{0, 0, 1, 1}));
    assert(ints.axis_labels().at(1) == "label1");

    auto copied = ds.copy();
    copied.fill(0.0);
    assert(ds.at({1, 1}) == 1.5);
    assert(!(copied == ds));

    std::cout << "PASSED\n";
}

// =============================================================================
// Invariants
// =============================================================================

void test_invariants_after_operations() {
    std::cout << "Testing invariants after operations... ";

    auto ds = make_labelled({4, 1, 6});
    auto results = std::vector<dataset_t<double>>{
        ds[{slice_t{1, 3}}],
        ds[{-1, 0}],
        ds[{new_axis, all, 0, index_array_t{{5, 0}}}],
        ds.flatten(),
        ds.flatten_dims({0, 1}),
        ds.transpose({2, 0, 1}),
        ds.squeeze(),
        ds.get_rebinned_copy(1),
        ds.reshape({24}),
        ds.sum(2),
        ds.take({0, 0, 1}, 2),
        ds.repeat(3, 0),
        ds.repeat(2)
    };
    for (const auto& r : results) {
        assert(is_consistent(r.property_meta(), r.shape()));
    }

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Construction and Metadata ===\n\n";

    test_construction_defaults();
    test_construction_size_mismatch();
    test_setters_normalize();
    test_returned_maps_are_copies();
    test_descriptions();
    test_is_axis_nonlinear();

    std::cout << "\n=== Indexing ===\n\n";

    test_at_and_fill();
    test_basic_indexing_is_a_view();
    test_advanced_indexing_is_a_copy();
    test_full_mask_flattens();
    test_scenario_integer_indexing();
    test_too_many_indices();

    std::cout << "\n=== Structural Transforms ===\n\n";

    test_scenario_transpose();
    test_transpose_involution();
    test_flatten();
    test_scenario_flatten_dims();
    test_squeeze();
    test_squeeze_undoes_new_axis();
    test_scenario_rebin_constant();
    test_rebin_identity_and_division();
    test_rebin_integer_data();
    test_reshape();
    test_repeat();
    test_sort_one_dimensional();
    test_sort_multi_dimensional();
    test_argsort();
    test_huge_slice_step();

    std::cout << "\n=== Reductions and Arithmetic ===\n\n";

    test_reductions();
    test_arithmetic();
    test_integer_division_by_zero();
    test_astype_and_copy();

    std::cout << "\n=== Invariants ===\n\n";

    test_invariants_after_operations();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
