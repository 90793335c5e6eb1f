#include "cli_commands.hpp"
#include "roi_mask/io/fits_io.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace roi_mask;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

// 2x2 frames, 3 samples each, stored as a 4x3 pixel matrix
fs::path write_pixel_file(const std::string& name) {
    PixelMatrix px(4, 3);
    px << 1.0f, 1.0f, 1.0f,
          1.0f, 9.0f, 1.0f,
          1.0f, 1.0f, 1.0f,
          1.0f, 1.0f, 1.0f;
    io::FitsHeader header;
    header.set("NROWS", 2);
    header.set("NCOLS", 2);

    fs::path path = fs::temp_directory_path() / name;
    io::write_fits_float(path, px, header);
    return path;
}

std::vector<json> parse_events(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::vector<json> events;
    while (std::getline(in, line)) {
        events.push_back(json::parse(line));
    }
    return events;
}

} // namespace

TEST_CASE("run_resolution_reports_unexpected_exceptions_as_error_events") {
    fs::path data = write_pixel_file("roi_mask_test_cli_throw.fits");

    cli::ResolveRequest request;
    request.command = "threshold";
    request.data_path = data.string();
    request.method = "explode";

    auto make_registry = [](const config::ThresholdConfig&) {
        threshold::ThresholdRegistry registry;
        registry.add("explode", [](const FrameStack&) -> MaskMatrix {
            throw std::runtime_error("threshold backend failed");
        });
        return registry;
    };

    std::ostringstream out;
    int rc = cli::run_resolution(request, out, make_registry);
    fs::remove(data);

    REQUIRE(rc == 1);
    std::vector<json> events = parse_events(out.str());
    REQUIRE(events.size() == 3);
    REQUIRE(events[0]["type"] == "run_start");
    REQUIRE(events[1]["type"] == "error");
    REQUIRE(events[1]["message"] == "threshold backend failed");
    REQUIRE(events[2]["type"] == "run_end");
    REQUIRE(events[2]["success"] == false);
    REQUIRE(events[2]["status"] == "error");
}

TEST_CASE("run_resolution_threshold_command_computes_mask") {
    fs::path data = write_pixel_file("roi_mask_test_cli_sigma.fits");

    cli::ResolveRequest request;
    request.command = "threshold";
    request.data_path = data.string();
    request.method = "sigma";

    std::ostringstream out;
    int rc = cli::run_resolution(request, out);
    fs::remove(data);

    REQUIRE(rc == 0);
    std::vector<json> events = parse_events(out.str());
    REQUIRE(events.back()["type"] == "run_end");
    REQUIRE(events.back()["success"] == true);

    bool resolved = false;
    for (const auto& e : events) {
        if (e["type"] == "mask_resolved") {
            resolved = true;
            REQUIRE(e["computed_mask"] == true);
            REQUIRE(e["n_rows"] == 2);
            REQUIRE(e["n_cols"] == 2);
        }
    }
    REQUIRE(resolved);
}

TEST_CASE("run_resolution_fails_for_unrecognized_requested_method") {
    fs::path data = write_pixel_file("roi_mask_test_cli_unknown.fits");

    cli::ResolveRequest request;
    request.command = "threshold";
    request.data_path = data.string();
    request.method = "median";

    std::ostringstream out;
    int rc = cli::run_resolution(request, out);
    fs::remove(data);

    REQUIRE(rc == 1);
    std::vector<json> events = parse_events(out.str());
    REQUIRE(events[1]["type"] == "warning");
    REQUIRE(events.back()["success"] == false);
    REQUIRE(events.back()["status"] == "unrecognized_method");
}
