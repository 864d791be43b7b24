#include "ToolSupport.hpp"

#include "ypbank/io/FileIo.hpp"
#include "ypbank/ypbank.hpp"

#include <fmt/core.h>

namespace YpBank::tools {

void printError(const ToolContext& ctx, std::string_view subject, const Error& err) {
    if (subject.empty())
        fmt::print(stderr, "{}: {}\n", ctx.name, err.message());
    else
        fmt::print(stderr, "{}: {}: {}\n", ctx.name, subject, err.message());
}

void printUsageError(const ToolContext& ctx, std::string_view message) {
    fmt::print(stderr, "{}: {}\nTry '{} --help' for more information.\n", ctx.name, message,
               ctx.name);
}

void printVersion(const ToolContext& ctx) { fmt::print("{} {}\n", ctx.name, VERSION_STRING); }

bool isIoError(const Error& err) {
    return err && err.code.category() != ypbank_category();
}

bool readInput(const std::string& path, std::string& data, Error& err) {
    std::error_code ec;
    if (!io::readFile(path, data, ec))
        return failIo(err, ec, "cannot read input");
    return true;
}

bool loadRecords(const ToolContext& ctx, const Converter& converter, const std::string& path,
                 std::string_view format, RecordSequence& out, Error& err) {
    std::string data;
    if (!readInput(path, data, err))
        return false;

    if (!converter.decode(data, format, out, err))
        return false;

    if (ctx.verbose) {
        fmt::print(stderr, "{}: decoded {} records from {} ({})\n", ctx.name, out.size(), path,
                   format);
    }
    return true;
}

} // namespace YpBank::tools
