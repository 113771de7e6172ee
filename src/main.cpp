#include "sturdypatch/application/patcher_app.hpp"
#include "sturdypatch/io/file_system.hpp"
#include "sturdypatch/parsers/patch_parser.hpp"
#include "sturdypatch/ui/ftxui_terminal.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

auto print_usage() -> void {
    std::cout << "Usage: sturdypatch -f <file> [options]\n";
    std::cout << "  -f, --file <path>         Document to patch\n";
    std::cout << "  -p, --patch <path>        Read the JSON patch from file (default: stdin)\n";
    std::cout << "  -o, --output <path>       Write the result here ('-' for stdout)\n";
    std::cout << "      --version-suffix <s>  Use this suffix for the output file name\n";
    std::cout << "      --in-place            Overwrite the target file\n";
    std::cout << "      --dry-run             Report outcomes without writing anything\n";
    std::cout << "      --non-interactive     Apply every matching hunk without review\n";
    std::cout << "      --log-dir <dir>       Save the patch log in this directory\n";
    std::cout << "      --verbose             Print the patch log\n";
    std::cout << "      --schema              Print the patch payload schema\n";
    std::cout << "  -h, --help                Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  sturdypatch -f main.py -p fix.json               # Review, save main_v0.0.py\n";
    std::cout << "  cat fix.json | sturdypatch -f main.py --in-place # Piped patch\n";
    std::cout << "  sturdypatch -f main.py -p fix.json --non-interactive -o - # To stdout\n";
}

auto require_value(int i, int argc, const std::string& arg) -> void {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        std::exit(sturdypatch::exit_error);
    }
}

auto parse_args(int argc, char* argv[]) -> sturdypatch::Config {
    sturdypatch::Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-f" || arg == "--file") {
            require_value(i, argc, arg);
            config.target_file = argv[++i];
        } else if (arg == "-p" || arg == "--patch") {
            require_value(i, argc, arg);
            config.patch_file = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            require_value(i, argc, arg);
            config.output_file = argv[++i];
        } else if (arg == "--version-suffix") {
            require_value(i, argc, arg);
            config.version_suffix = argv[++i];
        } else if (arg == "--log-dir") {
            require_value(i, argc, arg);
            config.log_dir = argv[++i];
        } else if (arg == "--in-place") {
            config.in_place = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--non-interactive") {
            config.interactive = false;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--schema") {
            std::cout << sturdypatch::patch_schema() << '\n';
            std::exit(sturdypatch::exit_success);
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(sturdypatch::exit_success);
        } else {
            std::cerr << "Error: Unknown option " << arg << '\n';
            print_usage();
            std::exit(sturdypatch::exit_error);
        }
    }

    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = parse_args(argc, argv);

    if (config.target_file.empty()) {
        std::cerr << "Error: No target file given (use -f <file>)\n";
        return sturdypatch::exit_error;
    }

    // The review UI shares stdout with the patched text otherwise
    if (config.output_file == "-") {
        config.interactive = false;
    }

    sturdypatch::PatcherApp app(std::make_unique<sturdypatch::FTXUITerminal>(),
                                std::make_unique<sturdypatch::FileSystem>(),
                                std::make_unique<sturdypatch::PatchParser>());

    return app.run(config);
}
