#include <cmath>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <utility>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "dset/dset.hpp"

using namespace dset;

// =============================================================================
// A synthetic detector image stack: frames x rows x columns
// =============================================================================

static auto make_stack() -> dataset_t<double> {
    auto shape = shape_t{4, 6, 8};
    auto values = std::vector<double>(num_elements(shape));
    auto idx = multi_index_t(shape.size(), 0);
    auto n = std::size_t{0};
    do {
        auto r = static_cast<double>(idx[1]) - 2.5;
        auto c = static_cast<double>(idx[2]) - 3.5;
        values[n++] = (1.0 + 0.1 * static_cast<double>(idx[0])) * std::exp(-(r * r + c * c) / 8.0);
    } while (increment(idx, shape));

    auto options = dataset_options_t{};
    options.axis_labels = {"time", "y", "x"};
    options.axis_units = {"s", "mm", "mm"};
    options.axis_ranges = {
        std::vector<double>{0.0, 0.5, 1.0, 1.5},
        std::vector<double>{-1.25, -0.75, -0.25, 0.25, 0.75, 1.25},
        std::nullopt
    };
    options.data_unit = "counts";
    options.data_label = "intensity";
    options.metadata["detector"] = std::string("synthetic");
    options.metadata["exposure"] = 0.5;
    return dataset_t<double>(std::move(values), std::move(shape), options);
}

static void section(const char* title) {
    fmt::print("\n========================================\n{}\n========================================\n\n", title);
}

// Usage: dataset-tour [key=value ...] [--save <file>] [--ascii]
//
// key=value pairs set render options (threshold, edge_items, precision).
int main(int argc, char* argv[]) {
    auto render_options = render_options_t{};
    auto save_path = std::string{};
    auto format = archive_format::binary;

    try {
        for (int i = 1; i < argc; ++i) {
            auto arg = std::string(argv[i]);
            if (arg == "--save" && i + 1 < argc) {
                save_path = argv[++i];
            } else if (arg == "--ascii") {
                format = archive_format::ascii;
            } else if (auto eq = arg.find('='); eq != std::string::npos) {
                set(render_options, arg.substr(0, eq), arg.substr(eq + 1));
            } else {
                fmt::print(stderr, "Usage: {} [key=value ...] [--save <file>] [--ascii]\n", argv[0]);
                return 1;
            }
        }

        logger::set_level(log_level::info);

        auto stack = make_stack();
        section("Image stack");
        fmt::print("{}\n", render(stack, render_options));

        section("Frame 2 (integer index records provenance)");
        auto frame = stack[{2}];
        fmt::print("{}\n", render(frame, render_options));
        fmt::print("centre pixel: {}\n", frame.description_of_point({3, 4}));

        section("Column profile, reversed rows");
        auto profile = stack[{all, slice_t{std::nullopt, std::nullopt, -1}, 4}];
        fmt::print("{}\n", render(profile.transpose(), render_options));

        section("Frames merged with rows");
        fmt::print("{}\n", render(stack.flatten_dims({0, 1}, "time, y"), render_options));

        section("Rebinned by 2");
        auto binned = stack.get_rebinned_copy(2);
        fmt::print("{}\n", render(binned, render_options));

        section("Mean over time");
        fmt::print("{}\n", render(stack.mean(0), render_options));

        // A wrong-length spec degrades to defaults with a warning
        section("Recoverable metadata mismatch");
        auto relabelled = stack.copy();
        relabelled.set_axis_labels({"only", "two"});
        fmt::print("labels after bad spec: [{}, {}, {}]\n",
            relabelled.axis_labels().at(0), relabelled.axis_labels().at(1), relabelled.axis_labels().at(2));

        auto blob = encode(stack, format);
        auto restored = decode<double>(blob);
        section("Archive");
        fmt::print("{} archive: {} bytes, round trip {}\n",
            to_string(format), blob.size(), restored == stack ? "exact" : "MISMATCH");

        if (!save_path.empty()) {
            auto file = std::ofstream(save_path, std::ios::binary);
            if (!file) {
                fmt::print(stderr, "Error: cannot open file '{}'\n", save_path);
                return 1;
            }
            file << blob;
            fmt::print("saved to {}\n", save_path);
        }
        return restored == stack ? 0 : 1;

    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
