/// @file comparer.cpp
/// @brief ypbank-comparer: report differences between two record files

#include "ToolSupport.hpp"

#include "ypbank/compare/ReportFormat.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <getopt.h>

#include <string>

using namespace YpBank;

namespace {

enum ExitCode : int {
    EXIT_IDENTICAL = 0,
    EXIT_DIFFERENT = 1,
    EXIT_ERROR = 2, ///< usage, parse, validation or duplicate-key error
    EXIT_IO = 3,
};

struct Options {
    std::string file1;
    std::string format1;
    std::string file2;
    std::string format2;
};

void usage(const FormatRegistry& registry) {
    fmt::print("Usage: ypbank-comparer --file1 <path> --format1 <fmt> "
               "--file2 <path> --format2 <fmt> [--verbose]\n"
               "\n"
               "Compare two bank operation record files, matching records by id.\n"
               "\n"
               "  -a, --file1 PATH      left file, '-' for standard input\n"
               "  -A, --format1 FMT     format of the left file\n"
               "  -b, --file2 PATH      right file\n"
               "  -B, --format2 FMT     format of the right file\n"
               "  -v, --verbose         progress messages on standard error\n"
               "  -h, --help            show this help\n"
               "  -V, --version         show version\n"
               "\n"
               "Formats: {}\n"
               "Exit status: 0 identical, 1 differences found, 2 invalid input, 3 I/O error\n",
               fmt::join(registry.names(), ", "));
}

} // namespace

int main(int argc, char** argv) {
    tools::ToolContext ctx;
    ctx.name = "ypbank-comparer";

    const FormatRegistry registry = FormatRegistry::builtin();
    Options opt;

    static struct option long_options[] = {
        {"file1", required_argument, nullptr, 'a'},
        {"format1", required_argument, nullptr, 'A'},
        {"file2", required_argument, nullptr, 'b'},
        {"format2", required_argument, nullptr, 'B'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0},
    };

    int c;
    while ((c = getopt_long(argc, argv, "a:A:b:B:vhV", long_options, nullptr)) != -1) {
        switch (c) {
        case 'a': opt.file1 = optarg; break;
        case 'A': opt.format1 = optarg; break;
        case 'b': opt.file2 = optarg; break;
        case 'B': opt.format2 = optarg; break;
        case 'v': ctx.verbose = true; break;
        case 'h': usage(registry); return EXIT_IDENTICAL;
        case 'V': tools::printVersion(ctx); return EXIT_IDENTICAL;
        default: tools::printUsageError(ctx, "invalid arguments"); return EXIT_ERROR;
        }
    }

    if (optind < argc) {
        tools::printUsageError(ctx, fmt::format("unexpected argument '{}'", argv[optind]));
        return EXIT_ERROR;
    }
    if (opt.file1.empty() || opt.format1.empty() || opt.file2.empty() || opt.format2.empty()) {
        tools::printUsageError(ctx, "--file1, --format1, --file2 and --format2 are required");
        return EXIT_ERROR;
    }
    if (opt.file1 == "-" && opt.file2 == "-") {
        tools::printUsageError(ctx, "standard input can be used for one file only");
        return EXIT_ERROR;
    }

    Error err;
    if (!registry.lookup(opt.format1, err) || !registry.lookup(opt.format2, err)) {
        tools::printError(ctx, {}, err);
        return EXIT_ERROR;
    }

    Converter converter(registry);
    RecordSequence left;
    RecordSequence right;
    if (!tools::loadRecords(ctx, converter, opt.file1, opt.format1, left, err)) {
        tools::printError(ctx, opt.file1, err);
        return tools::isIoError(err) ? EXIT_IO : EXIT_ERROR;
    }
    if (!tools::loadRecords(ctx, converter, opt.file2, opt.format2, right, err)) {
        tools::printError(ctx, opt.file2, err);
        return tools::isIoError(err) ? EXIT_IO : EXIT_ERROR;
    }

    DiffReport report;
    if (!compare(left, right, report, err)) {
        tools::printError(ctx, {}, err);
        return EXIT_ERROR;
    }

    fmt::print("{}", formatDiffReport(report, ReportLabels{opt.file1, opt.file2}));
    return report.identical() ? EXIT_IDENTICAL : EXIT_DIFFERENT;
}
