#include "brstitch/brstitch.hpp"
#include "brstitch/cli_colors.hpp"
#include "brstitch/confirm.hpp"
#include "brstitch/constants.hpp"
#include "brstitch/env.hpp"
#include "brstitch/interrupt.hpp"
#include "brstitch/log.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CliArgs {
    std::vector<std::filesystem::path> files;
    bool split = false;
    bool quiet = false;
    bool keep_sections = false;
    bool replace = false;
    bool nest = false;
    bool compress = true;
    bool help = false;
    std::optional<bool> color;
    brstitch::confirm::ConfirmPolicy policy = brstitch::confirm::ConfirmPolicy::Ask;
    std::size_t size = brstitch::constants::DefaultSectionSize();
    std::filesystem::path out_dir;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  brstitch [PATH...] [-k] [-o <dir>]                 stitch section files (default: current directory)\n";
    std::cout << "  brstitch -s PATH... [-x <size>] [-n] [-r] [-o <dir>] [--no-compress]\n";
    std::cout << "\n";
    std::cout << "Section files (which can be stitched back together) must have the extension '"
              << brstitch::constants::kSectionExt << "'.\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -s, --split            split each of the given files into sections\n";
    std::cout << "  -y, --yes              always say yes\n";
    std::cout << "      --no               always say no\n";
    std::cout << "  -q, --quiet            don't print progress to the console\n";
    std::cout << "  -k, --keep-sections    [stitch] keep the section files after stitching\n";
    std::cout << "  -r, --replace          [split] delete the original file after splitting\n";
    std::cout << "  -n, --nest             [split] place the sections of each file into a separate directory\n";
    std::cout << "  -x, --size <size>      [split] maximum size of the sections, e.g. 512kb, 8mb (default 8mb)\n";
    std::cout << "      --no-compress      [split] store section payloads uncompressed\n";
    std::cout << "  -o, --out <dir>        directory for sections or stitched files\n";
    std::cout << "      --no-color         disable colored output\n";
    std::cout << "  -h, --help             show this help\n";
}

CliArgs ParseArgs(int argc, char** argv) {
    CliArgs args;
    if (brstitch::env::IsEnabled("BRSTITCH_ASSUME_YES")) {
        args.policy = brstitch::confirm::ConfirmPolicy::AssumeYes;
    }
    bool only_paths = false;
    int idx = 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (only_paths || flag.empty() || flag[0] != '-' || flag == "-") {
            args.files.emplace_back(flag);
            idx += 1;
        } else if (flag == "--") {
            only_paths = true;
            idx += 1;
        } else if (flag == "-s" || flag == "--split") {
            args.split = true;
            idx += 1;
        } else if (flag == "-y" || flag == "--yes") {
            args.policy = brstitch::confirm::ConfirmPolicy::AssumeYes;
            idx += 1;
        } else if (flag == "--no") {
            args.policy = brstitch::confirm::ConfirmPolicy::AssumeNo;
            idx += 1;
        } else if (flag == "-q" || flag == "--quiet") {
            args.quiet = true;
            idx += 1;
        } else if (flag == "-k" || flag == "--keep-sections") {
            args.keep_sections = true;
            idx += 1;
        } else if (flag == "-r" || flag == "--replace") {
            args.replace = true;
            idx += 1;
        } else if (flag == "-n" || flag == "--nest") {
            args.nest = true;
            idx += 1;
        } else if (flag == "--no-compress") {
            args.compress = false;
            idx += 1;
        } else if (flag == "-x" || flag == "--size") {
            if (idx + 1 >= argc) {
                throw std::invalid_argument("Missing size value");
            }
            args.size = brstitch::ParseSize(argv[idx + 1]);
            idx += 2;
        } else if (flag == "-o" || flag == "--out") {
            if (idx + 1 >= argc) {
                throw std::invalid_argument("Missing output directory");
            }
            args.out_dir = argv[idx + 1];
            idx += 2;
        } else if (flag == "--no-color") {
            args.color = false;
            idx += 1;
        } else if (flag == "-h" || flag == "--help") {
            args.help = true;
            idx += 1;
        } else {
            throw std::invalid_argument("Unknown flag: " + flag);
        }
    }
    if (args.files.empty() && !args.split) {
        args.files.emplace_back(".");
    }
    if (args.size <= brstitch::constants::kHeaderSize) {
        throw std::invalid_argument("cannot encode any data without at least "
                                    + std::to_string(brstitch::constants::kHeaderSize + 1)
                                    + " byte sections");
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    CliArgs args;
    try {
        args = ParseArgs(argc, argv);
    } catch (const std::invalid_argument& exc) {
        brstitch::log::Error(exc.what());
        PrintUsage();
        return 2;
    }
    if (args.help) {
        PrintUsage();
        return 0;
    }
    if (args.color) {
        brstitch::cli::SetColorsEnabled(*args.color);
    }
    brstitch::log::SetQuiet(args.quiet);
    brstitch::confirm::Confirmer confirmer(args.policy);

    try {
        brstitch::interrupt::InstallHandlers();
        if (args.split) {
            if (args.files.empty()) {
                brstitch::log::Error("Missing input path");
                PrintUsage();
                return 2;
            }
            brstitch::SplitOptions options;
            options.section_size = args.size;
            options.compress = args.compress;
            options.nest = args.nest;
            options.delete_original = args.replace;
            options.output_dir = args.out_dir;
            for (const auto& path : args.files) {
                brstitch::SplitFile(path, options, confirmer);
            }
            return 0;
        }

        brstitch::StitchOptions options;
        options.keep_sections = args.keep_sections;
        options.output_dir = args.out_dir;
        brstitch::StitchSummary summary = brstitch::StitchFiles(args.files, options, confirmer);
        if (summary.outputs.empty() && summary.skipped.empty() && summary.failed.empty()) {
            brstitch::log::Info("No section files found.");
        }
        if (!summary.outputs.empty()) {
            brstitch::log::Info(brstitch::cli::Green("Stitched " + std::to_string(summary.outputs.size())
                                                     + " file(s)."));
        }
        for (const auto& name : summary.skipped) {
            brstitch::log::Info(brstitch::cli::Yellow("Skipped " + brstitch::log::Quote(name)));
        }
        if (!summary.failed.empty()) {
            for (const auto& [name, reason] : summary.failed) {
                brstitch::log::Error("failed to stitch " + brstitch::log::Quote(name) + ": " + reason);
            }
            return 1;
        }
        return 0;
    } catch (const std::exception& exc) {
        brstitch::log::Error(exc.what());
        return 1;
    }
}
