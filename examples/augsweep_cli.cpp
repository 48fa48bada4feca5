// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// augsweep: remove Augment extension state from VSCode-family editors.
//
// Usage:
//   augsweep list
//   augsweep scan --editor cursor
//   augsweep clean --dry-run
//   augsweep clean --editor vscode --preserve "*.code-snippets"
//   augsweep telemetry --editor windsurf
//   augsweep verify --json
//
// Exit codes: 0 success, 1 partial failure or residue, 2 usage or fatal error.

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <augsweep/config.h>
#include <augsweep/console.h>
#include <augsweep/errors.h>
#include <augsweep/locator.h>
#include <augsweep/operation_registry.h>
#include <augsweep/operations.h>
#include <augsweep/types.h>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_PARTIAL = 1;
constexpr int EXIT_USAGE = 2;

namespace color {
    constexpr const char* RESET  = "\033[0m";
    constexpr const char* BOLD   = "\033[1m";
    constexpr const char* GRAY   = "\033[90m";
    constexpr const char* RED    = "\033[91m";
    constexpr const char* GREEN  = "\033[92m";
    constexpr const char* YELLOW = "\033[93m";
    constexpr const char* CYAN   = "\033[96m";
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

struct CommandLine {
    std::string command;
    augsweep::json args = augsweep::json::object();
    std::string configPath;
    bool jsonOutput = false;
    bool quiet = false;
    bool verbose = false;
    bool help = false;
};

void printUsage(const augsweep::OperationRegistry& registry) {
    std::cout << "Usage: augsweep <command> [options]\n\n"
              << "Commands:\n"
              << registry.formatHelp() << "\n"
              << "Options:\n"
              << "  --editor <name>     vscode, cursor, windsurf, vscodium, code-oss, generic-oss, all\n"
              << "  --os <name>         linux, macos, windows (default: this machine)\n"
              << "  --path <dir>        operate on one explicit directory\n"
              << "  --kind <kind>       root kind for --path (default: augmentHome)\n"
              << "  --augment-only      only the ~/.augment directory\n"
              << "  --dry-run           report what would change\n"
              << "  --preserve <glob>   keep matching entries (repeatable)\n"
              << "  --no-telemetry      do not regenerate telemetry ids\n"
              << "  --no-store          do not remove keys from state.vscdb\n"
              << "  --config <file>     JSON or JSONC configuration file\n"
              << "  --json              print the result as JSON\n"
              << "  --quiet             no progress output\n"
              << "  --verbose           print every item\n"
              << "  -h, --help          show this help\n";
}

/// @throws std::invalid_argument on an unknown option or a missing value
CommandLine parseCommandLine(int argc, char** argv) {
    CommandLine cl;
    augsweep::json preserve = augsweep::json::array();

    auto value = [&](int& i, const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + option);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            cl.help = true;
        } else if (arg == "--editor") {
            cl.args["editor"] = value(i, arg);
        } else if (arg == "--os") {
            cl.args["os"] = value(i, arg);
        } else if (arg == "--path") {
            cl.args["path"] = value(i, arg);
        } else if (arg == "--kind") {
            cl.args["kind"] = value(i, arg);
        } else if (arg == "--preserve") {
            preserve.push_back(value(i, arg));
        } else if (arg == "--config") {
            cl.configPath = value(i, arg);
        } else if (arg == "--augment-only") {
            cl.args["augmentOnly"] = true;
        } else if (arg == "--dry-run") {
            cl.args["dryRun"] = true;
        } else if (arg == "--no-telemetry") {
            cl.args["noTelemetry"] = true;
        } else if (arg == "--no-store") {
            cl.args["noStore"] = true;
        } else if (arg == "--json") {
            cl.jsonOutput = true;
        } else if (arg == "--quiet" || arg == "-q") {
            cl.quiet = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cl.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (!preserve.empty()) {
        cl.args["preserve"] = preserve;
    }
    return cl;
}

// ---------------------------------------------------------------------------
// Human-readable output (the executor's console already reports clean runs)
// ---------------------------------------------------------------------------

void printRoots(const augsweep::json& roots) {
    if (roots.empty()) {
        std::cout << color::GRAY << "  (none found)" << color::RESET << std::endl;
        return;
    }
    for (const auto& root : roots) {
        std::cout << "  " << color::CYAN << root.value("label", std::string("?")) << color::RESET
                  << "  " << root.value("kind", std::string()) << "  "
                  << root.value("path", std::string()) << std::endl;
    }
}

void printHuman(const std::string& command, const augsweep::json& result) {
    if (command == "list") {
        std::cout << color::BOLD << "Roots (" << result.value("os", std::string()) << "):"
                  << color::RESET << std::endl;
        printRoots(result["roots"]);
    } else if (command == "discover") {
        std::cout << color::BOLD << "Other editors:" << color::RESET << std::endl;
        printRoots(result["editors"]);
    } else if (command == "env") {
        std::cout << color::BOLD << "Augment home: " << color::RESET
                  << result.value("augmentHome", std::string());
        if (!result.value("exists", false)) {
            std::cout << color::GRAY << " (not present)" << color::RESET << std::endl;
            return;
        }
        std::cout << std::endl;
        for (const auto& item : result["items"]) {
            std::cout << "  " << item.value("name", std::string())
                      << (item.value("isDirectory", false) ? "/" : "") << color::GRAY << "  "
                      << item.value("items", 0) << " item(s)" << color::RESET << std::endl;
        }
    } else if (command == "scan") {
        for (const auto& root : result["roots"]) {
            std::cout << color::CYAN << root["root"].value("path", std::string()) << color::RESET
                      << "  removable: " << root.value("removable", 0)
                      << "  preserved: " << root.value("preserved", 0)
                      << "  bytes: " << root.value("removableBytes", 0) << std::endl;
        }
    } else if (command == "telemetry" || command == "store") {
        for (const auto& op : result["operations"]) {
            std::cout << "  " << op.value("outcome", std::string()) << "  "
                      << op.value("target", std::string());
            if (op.contains("error") && op["error"].is_string()) {
                std::cout << color::RED << "  " << op["error"].get<std::string>() << color::RESET;
            }
            std::cout << std::endl;
        }
    } else if (command == "verify") {
        for (const auto& root : result["roots"]) {
            bool clean = root.value("clean", false);
            std::cout << (clean ? color::GREEN : color::YELLOW) << (clean ? "  clean    " : "  residue  ")
                      << color::RESET << root["root"].value("path", std::string()) << std::endl;
            for (const auto& file : root["files"]) {
                std::cout << color::GRAY << "      " << file.get<std::string>() << color::RESET
                          << std::endl;
            }
        }
    } else if (command == "clean") {
        std::cout << color::BOLD
                  << (result.value("dryRun", false) ? "Would remove " : "Removed ")
                  << result.value("totalRemoved", 0) << " item(s), "
                  << result.value("bytesFreed", 0) << " bytes" << color::RESET << std::endl;
    }
}

int exitCodeFor(const augsweep::json& result) {
    std::string status = result.value("status", std::string("error"));
    if (status == "ok") return EXIT_OK;
    if (status == "partial") return EXIT_PARTIAL;
    return EXIT_USAGE;
}

} // namespace

int main(int argc, char** argv) {
    auto context = std::make_shared<augsweep::OperationContext>();
    augsweep::OperationRegistry registry;
    augsweep::registerBuiltinOperations(registry, context);
    augsweep::TerminalConsole console;

    CommandLine cl;
    try {
        cl = parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        console.printError(e.what());
        printUsage(registry);
        return EXIT_USAGE;
    }

    if (cl.help || cl.command.empty()) {
        printUsage(registry);
        return cl.help ? EXIT_OK : EXIT_USAGE;
    }

    std::string command = registry.resolveName(cl.command);
    if (command.empty()) {
        console.printError("Unknown command: " + cl.command);
        printUsage(registry);
        return EXIT_USAGE;
    }

    try {
        if (!cl.configPath.empty()) {
            context->config = augsweep::loadConfig(cl.configPath);
        }
        context->os = augsweep::currentOsFamily();
        context->host = augsweep::HostEnvironment::fromProcess(context->os);
    } catch (const augsweep::CleanerError& e) {
        console.printError(e.what());
        return EXIT_USAGE;
    }

    context->silentMode = cl.jsonOutput || cl.quiet;
    context->verbose = cl.verbose;

    augsweep::json result = registry.executeOperation(command, cl.args);

    if (cl.jsonOutput) {
        console.prettyPrintJson(result);
        return exitCodeFor(result);
    }

    if (result.value("status", std::string()) == "error") {
        console.printError(result.value("error", std::string("unknown error")));
        return EXIT_USAGE;
    }

    if (!cl.quiet) {
        printHuman(command, result);
        if (result.value("dryRun", false)) {
            console.printInfo("Dry run: nothing was changed");
        }
    }
    if (result.value("status", std::string()) == "partial") {
        console.printWarning(command == "verify" ? "Augment state remains"
                                                 : "Completed with failures");
    }
    return exitCodeFor(result);
}
