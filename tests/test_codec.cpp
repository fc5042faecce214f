#include <cassert>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include "dset/codec.hpp"
#include "dset/dataset.hpp"

using namespace dset;

// =============================================================================
// Helpers
// =============================================================================

auto make_sample() -> dataset_t<double> {
    auto values = std::vector<double>(24);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = 0.1 * static_cast<double>(i) - 1.0;
    }
    auto options = dataset_options_t{};
    options.axis_labels = {"energy", "angle", "frame"};
    options.axis_units = {"keV", "deg", ""};
    options.axis_ranges = {std::vector<double>{8.0, 9.5}, std::nullopt, std::vector<double>{0.0, 0.25, 0.5, 1e-9}};
    options.data_unit = "counts / s";
    options.data_label = "detector \"A\" {main}";
    options.metadata["temperature"] = 293.15;
    options.metadata["sample"] = std::string("LaB6");
    options.metadata["frames"] = std::int64_t{4};
    options.metadata["calibrated"] = true;
    options.metadata["note"] = std::monostate{};
    options.metadata["mask"] = std::vector<double>{1.0, 0.0};
    return dataset_t<double>(values, {2, 3, 4}, options);
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

// =============================================================================
// Round trips
// =============================================================================

void test_round_trip(archive_format format) {
    std::cout << "Testing " << to_string(format) << " round trip... ";

    auto original = make_sample();
    auto decoded = decode<double>(encode(original, format));
    assert(decoded == original);
    assert(!decoded.axis_range(1).has_value());
    assert(std::holds_alternative<std::monostate>(decoded.metadata().at("note")));
    assert(std::get<bool>(decoded.metadata().at("calibrated")));
    assert(std::get<std::int64_t>(decoded.metadata().at("frames")) == 4);

    std::cout << "PASSED\n";
}

void test_round_trip_after_indexing() {
    std::cout << "Testing round trip of a sliced view... ";

    auto original = make_sample()[{slice_t{std::nullopt, std::nullopt, -1}, 1}];
    assert(original.metadata().count("sliced_axis_1"));

    for (auto format : {archive_format::binary, archive_format::ascii}) {
        auto decoded = decode<double>(encode(original, format));
        assert(decoded == original);
        auto record = std::get<sliced_axis_t>(decoded.metadata().at("sliced_axis_1"));
        assert(record.label == "angle");
        assert(!record.value.has_value());
    }

    std::cout << "PASSED\n";
}

void test_round_trip_integer_types() {
    std::cout << "Testing integer element types... ";

    auto bytes = dataset_t<std::uint8_t>(std::vector<std::uint8_t>{0, 127, 255}, {3});
    assert(decode<std::uint8_t>(encode(bytes)) == bytes);
    assert(decode<std::uint8_t>(encode(bytes, archive_format::ascii)) == bytes);

    auto big = dataset_t<std::int64_t>(std::vector<std::int64_t>{std::numeric_limits<std::int64_t>::min(), 0, 1}, {1, 3});
    assert(decode<std::int64_t>(encode(big)) == big);
    assert(decode<std::int64_t>(encode(big, archive_format::ascii)) == big);

    std::cout << "PASSED\n";
}

void test_round_trip_special_values() {
    std::cout << "Testing special values... ";

    auto ds = dataset_t<double>(std::vector<double>{
        std::numeric_limits<double>::infinity(),
        -0.0,
        std::numeric_limits<double>::denorm_min()
    }, {3});
    ds.set_axis_ranges({std::vector<double>{-std::numeric_limits<double>::infinity(), 0.0, 1.0}});

    for (auto format : {archive_format::binary, archive_format::ascii}) {
        auto decoded = decode<double>(encode(ds, format));
        assert(decoded == ds);
    }

    // nan never compares equal; check it separately
    auto with_nan = dataset_t<float>(std::vector<float>{std::numeric_limits<float>::quiet_NaN(), 1.5f}, {2});
    for (auto format : {archive_format::binary, archive_format::ascii}) {
        auto decoded = decode<float>(encode(with_nan, format));
        assert(std::isnan(decoded.at({0})));
        assert(decoded.at({1}) == 1.5f);
    }

    std::cout << "PASSED\n";
}

void test_round_trip_long_double() {
    std::cout << "Testing long double elements... ";

    auto ds = dataset_t<long double>(std::vector<long double>{1.0L / 3.0L, 0.1L, -2.5L}, {3});
    ds.set_axis_labels({"step"});
    for (auto format : {archive_format::binary, archive_format::ascii}) {
        auto decoded = decode<long double>(encode(ds, format));
        assert(decoded == ds);
        assert(decoded.at({0}) == 1.0L / 3.0L);
    }
    assert(throws_config_error([&] { decode<double>(encode(ds)); }));

    std::cout << "PASSED\n";
}

void test_binary_magic_bytes() {
    std::cout << "Testing binary magic bytes... ";

    auto blob = encode(make_sample());
    assert(blob.substr(0, 4) == "DSET");
    assert(binary_format::has_magic(blob));

    std::cout << "PASSED\n";
}

void test_round_trip_zero_dimensional() {
    std::cout << "Testing zero-dimensional and empty arrays... ";

    auto scalar = make_sample()[{1, 2, 3}];
    assert(scalar.ndim() == 0);
    assert(decode<double>(encode(scalar)) == scalar);
    assert(decode<double>(encode(scalar, archive_format::ascii)) == scalar);

    auto empty = dataset_t<double>(shape_t{0, 3});
    assert(decode<double>(encode(empty)) == empty);
    assert(decode<double>(encode(empty, archive_format::ascii)) == empty);

    std::cout << "PASSED\n";
}

// =============================================================================
// Failures
// =============================================================================

void test_dtype_mismatch() {
    std::cout << "Testing dtype mismatch... ";

    auto blob = encode(make_sample());
    assert(throws_config_error([&] { decode<float>(blob); }));
    assert(throws_config_error([&] { decode<int>(blob); }));

    std::cout << "PASSED\n";
}

void test_malformed_archives() {
    std::cout << "Testing malformed archives... ";

    assert(throws_config_error([] { decode<double>(""); }));
    assert(throws_config_error([] { decode<double>("something = 1\n"); }));

    auto blob = encode(make_sample());
    assert(throws_config_error([&] { decode<double>(blob.substr(0, blob.size() / 2)); }));

    auto text = encode(make_sample(), archive_format::ascii);
    auto pos = text.find("shape = [2, 3, 4]");
    assert(pos != std::string::npos);
    text.replace(pos, 17, "shape = [2, 3, 5]");
    assert(throws_config_error([&] { decode<double>(text); }));

    std::cout << "PASSED\n";
}

void test_format_names() {
    std::cout << "Testing archive format names... ";

    assert(from_string(std::type_identity<archive_format>{}, "ascii") == archive_format::ascii);
    assert(from_string(std::type_identity<archive_format>{}, "binary") == archive_format::binary);
    assert(std::string(dtype_name<double>()) == "float64");
    assert(std::string(dtype_name<std::uint16_t>()) == "uint16");

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Round Trips ===\n\n";

    test_round_trip(archive_format::binary);
    test_round_trip(archive_format::ascii);
    test_round_trip_after_indexing();
    test_round_trip_integer_types();
    test_round_trip_special_values();
    test_round_trip_zero_dimensional();
    test_round_trip_long_double();
    test_binary_magic_bytes();

    std::cout << "\n=== Failures ===\n\n";

    test_dtype_mismatch();
    test_malformed_archives();
    test_format_names();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
