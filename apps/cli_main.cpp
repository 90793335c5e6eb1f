#include "cli_commands.hpp"

#include "roi_mask/config/configuration.hpp"
#include "roi_mask/core/errors.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <exception>
#include <iostream>
#include <string>

using json = nlohmann::json;

using namespace roi_mask;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

static int cmd_validate_config(const std::string& path) {
    json result;
    result["path"] = path;
    result["errors"] = json::array();

    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const RoiMaskError& e) {
        result["valid"] = false;
        result["errors"].push_back(e.what());
    } catch (const YAML::Exception& e) {
        result["valid"] = false;
        result["errors"].push_back(e.what());
    } catch (const std::exception& e) {
        result["valid"] = false;
        result["errors"].push_back(e.what());
    }

    print_json(result);
    return result["valid"].get<bool>() ? 0 : 1;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: roi_mask_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  resolve --config C --data D [--mask-out M] [--data-out O] [--apply]\n"
              << "                                  Resolve the configured mask against a FITS stack\n"
              << "  threshold <method> --data D [--config C] [--mask-out M] [--data-out O] [--apply]\n"
              << "                                  Compute a mask with sigma|adaptive|otsu|triangle\n"
              << "  validate-config --path P        Validate config\n"
              << "  get-schema                      Print JSON schema for config\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (std::strcmp(argv[i], "--apply") != 0 && i + 1 < argc &&
                       argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        if (path.empty()) {
            std::cerr << "validate-config requires --path\n";
            return 1;
        }
        return cmd_validate_config(path);
    }

    if (command == "resolve") {
        std::string config_path = get_arg("--config");
        std::string data_path = get_arg("--data");
        if (config_path.empty() || data_path.empty()) {
            std::cerr << "resolve requires --config and --data\n";
            return 1;
        }
        cli::ResolveRequest request;
        request.command = command;
        request.config_path = config_path;
        request.data_path = data_path;
        request.mask_out = get_arg("--mask-out");
        request.data_out = get_arg("--data-out");
        request.apply = has_flag("--apply");
        return cli::run_resolution(request, std::cout);
    }

    if (command == "threshold") {
        std::string method = get_positional(0);
        std::string data_path = get_arg("--data");
        if (method.empty() || data_path.empty()) {
            std::cerr << "threshold requires a method and --data\n";
            return 1;
        }
        cli::ResolveRequest request;
        request.command = command;
        request.config_path = get_arg("--config");
        request.data_path = data_path;
        request.method = method;
        request.mask_out = get_arg("--mask-out");
        request.data_out = get_arg("--data-out");
        request.apply = has_flag("--apply");
        return cli::run_resolution(request, std::cout);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
