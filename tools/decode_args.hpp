#pragma once

#include "wxrx/debug.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

// Option parsing for wxrx_decode. Throws std::runtime_error on bad input.

namespace wxrx::tools {

struct ParsedArgs {
    std::filesystem::path input;
    std::string protocol = "elv";
    int sample_rate_hz = 160000;
    int noise_level = 500;
    int jitter = 20;
    bool auto_noise = false;
    bool help = false;
    bool have_log = false;
    wxrx::debug::Level log_level = wxrx::debug::Level::Warn;
};

inline void print_usage(const char *prog) {
    std::cout << "Usage: " << prog << " [options] <file|->\n"
              << "Options:\n"
              << "  --protocol <elv|mebus>  Sensor protocol (default elv)\n"
              << "  --log <level>           DEBUG|INFO|WARN|ERROR|OFF (default WARN or $WXRX_LOG)\n"
              << "  --rate <int>            Sample rate in Hz, ELV only (default 160000)\n"
              << "  --noise <int>           Mebus signal level separating noise from carrier (default 500)\n"
              << "  --auto-noise            Mebus: derive the noise level from each sync block\n"
              << "  --jitter <int>          Mebus pulse timing tolerance in samples (default 20)\n"
              << "Input: raw signed 16-bit samples in host byte order, '-' reads stdin.\n";
}

inline ParsedArgs parse_args(int argc, char **argv) {
    ParsedArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string cur = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::runtime_error("Missing value for " + cur);
            return argv[++i];
        };
        if (cur == "--protocol") {
            args.protocol = value();
        } else if (cur == "--log") {
            std::string level = value();
            if (!wxrx::debug::parse_level(level, args.log_level))
                throw std::runtime_error("Invalid log level: " + level);
            args.have_log = true;
        } else if (cur == "--rate") {
            args.sample_rate_hz = std::stoi(value());
        } else if (cur == "--noise") {
            args.noise_level = std::stoi(value());
        } else if (cur == "--auto-noise") {
            args.auto_noise = true;
        } else if (cur == "--jitter") {
            args.jitter = std::stoi(value());
        } else if (cur == "--help" || cur == "-h") {
            args.help = true;
            return args;
        } else if (cur.rfind("--", 0) == 0) {
            throw std::runtime_error("Unrecognized option: " + cur);
        } else if (args.input.empty()) {
            args.input = cur;
        } else {
            throw std::runtime_error("More than one input file given");
        }
    }
    if (args.input.empty()) {
        throw std::runtime_error("Missing input file");
    }
    if (args.protocol != "elv" && args.protocol != "mebus") {
        throw std::runtime_error("Unknown protocol: " + args.protocol);
    }
    return args;
}

} // namespace wxrx::tools
