/// @file converter.cpp
/// @brief ypbank-converter: translate a record file between csv, txt and bin

#include "ToolSupport.hpp"

#include "ypbank/io/FileIo.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <getopt.h>

#include <string>

using namespace YpBank;

namespace {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_DATA = 1,  ///< parse or validation error
    EXIT_USAGE = 2, ///< bad arguments or unknown format
    EXIT_IO = 3,
};

struct Options {
    std::string input;
    std::string inputFormat;
    std::string outputFormat;
    std::string output = "-";
};

void usage(const FormatRegistry& registry) {
    fmt::print("Usage: ypbank-converter --input <path|-> --input-format <fmt> "
               "--output-format <fmt> [--output <path>] [--verbose]\n"
               "\n"
               "Convert a bank operation record file from one format to another.\n"
               "\n"
               "  -i, --input PATH          input file, '-' for standard input\n"
               "  -f, --input-format FMT    format of the input\n"
               "  -t, --output-format FMT   format to write\n"
               "  -o, --output PATH         output file (default: standard output)\n"
               "  -v, --verbose             progress messages on standard error\n"
               "  -h, --help                show this help\n"
               "  -V, --version             show version\n"
               "\n"
               "Formats: {}\n",
               fmt::join(registry.names(), ", "));
}

int exitCodeFor(const Error& err) {
    if (tools::isIoError(err))
        return EXIT_IO;
    if (err.code == errc::unknown_format)
        return EXIT_USAGE;
    return EXIT_DATA;
}

} // namespace

int main(int argc, char** argv) {
    tools::ToolContext ctx;
    ctx.name = "ypbank-converter";

    const FormatRegistry registry = FormatRegistry::builtin();
    Options opt;

    static struct option long_options[] = {
        {"input", required_argument, nullptr, 'i'},
        {"input-format", required_argument, nullptr, 'f'},
        {"output-format", required_argument, nullptr, 't'},
        {"output", required_argument, nullptr, 'o'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0},
    };

    int c;
    while ((c = getopt_long(argc, argv, "i:f:t:o:vhV", long_options, nullptr)) != -1) {
        switch (c) {
        case 'i': opt.input = optarg; break;
        case 'f': opt.inputFormat = optarg; break;
        case 't': opt.outputFormat = optarg; break;
        case 'o': opt.output = optarg; break;
        case 'v': ctx.verbose = true; break;
        case 'h': usage(registry); return EXIT_OK;
        case 'V': tools::printVersion(ctx); return EXIT_OK;
        default: tools::printUsageError(ctx, "invalid arguments"); return EXIT_USAGE;
        }
    }

    if (optind < argc) {
        tools::printUsageError(ctx, fmt::format("unexpected argument '{}'", argv[optind]));
        return EXIT_USAGE;
    }
    if (opt.input.empty() || opt.inputFormat.empty() || opt.outputFormat.empty()) {
        tools::printUsageError(ctx, "--input, --input-format and --output-format are required");
        return EXIT_USAGE;
    }

    // 입력을 읽기 전에 포맷 이름부터 확인한다.
    Error err;
    if (!registry.lookup(opt.inputFormat, err) || !registry.lookup(opt.outputFormat, err)) {
        tools::printError(ctx, {}, err);
        return EXIT_USAGE;
    }

    std::string data;
    if (!tools::readInput(opt.input, data, err)) {
        tools::printError(ctx, opt.input, err);
        return EXIT_IO;
    }

    const Converter converter(registry);
    std::string encoded;
    if (!converter.convert(data, opt.inputFormat, opt.outputFormat, encoded, err)) {
        tools::printError(ctx, opt.input, err);
        return exitCodeFor(err);
    }

    std::error_code ec;
    if (!io::writeFile(opt.output, encoded, ec)) {
        failIo(err, ec, "cannot write output");
        tools::printError(ctx, opt.output, err);
        return EXIT_IO;
    }

    if (ctx.verbose) {
        fmt::print(stderr, "{}: converted {} to {} ({} -> {}, {} bytes)\n", ctx.name, opt.input,
                   opt.output, opt.inputFormat, opt.outputFormat, encoded.size());
    }
    return EXIT_OK;
}
