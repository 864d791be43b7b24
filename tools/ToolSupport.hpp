#pragma once
/// @file ToolSupport.hpp
/// @brief Diagnostics and input helpers shared by the command-line tools

#include "ypbank/convert/Converter.hpp"

#include <string>
#include <string_view>

namespace YpBank::tools {

/// @brief Per-invocation settings common to both tools
struct ToolContext {
    const char* name = "";
    bool verbose = false;
};

/// @brief "<tool>: <subject>: <message>" on stderr
void printError(const ToolContext& ctx, std::string_view subject, const Error& err);

/// @brief "<tool>: <message>" on stderr, usage problems
void printUsageError(const ToolContext& ctx, std::string_view message);

/// @brief "<tool> <version>" on stdout
void printVersion(const ToolContext& ctx);

/// @brief True for errno-based errors produced by the io layer
bool isIoError(const Error& err);

/// @brief Read path ("-" for stdin) whole
bool readInput(const std::string& path, std::string& data, Error& err);

/// @brief Read path ("-" for stdin) and decode it with the named format
/// @details Prints a progress line when ctx.verbose is set. Errors are returned, not printed.
bool loadRecords(const ToolContext& ctx, const Converter& converter, const std::string& path,
                 std::string_view format, RecordSequence& out, Error& err);

} // namespace YpBank::tools
