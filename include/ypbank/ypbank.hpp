#pragma once

/**
 * @file ypbank.hpp
 * @brief Main convenience header for the YPBank record library
 *
 * Include this single header to access all library functionality.
 *
 * @example Basic Usage
 * @code
 * #include <ypbank/ypbank.hpp>
 *
 * int main() {
 *     auto registry = YpBank::FormatRegistry::builtin();
 *     YpBank::Converter converter(registry);
 *
 *     std::string out;
 *     YpBank::Error err;
 *     if (!converter.convert(csvText, "csv", "bin", out, err))
 *         fmt::print(stderr, "{}\n", err.message());
 * }
 * @endcode
 */

// =============================================================================
// Record Model
// =============================================================================
#include "error/Error.hpp"
#include "record/Currency.hpp"
#include "record/FieldText.hpp"
#include "record/OccurredAt.hpp"
#include "record/OperationType.hpp"
#include "record/Record.hpp"
#include "record/RecordSequence.hpp"

// =============================================================================
// Codecs
// =============================================================================
#include "codec/BinCodec.hpp"
#include "codec/CsvCodec.hpp"
#include "codec/FormatRegistry.hpp"
#include "codec/RecordCodec.hpp"
#include "codec/TxtCodec.hpp"

// =============================================================================
// Comparison / Conversion
// =============================================================================
#include "compare/Comparer.hpp"
#include "compare/ReportFormat.hpp"
#include "convert/Converter.hpp"

// =============================================================================
// Utilities
// =============================================================================
#include "io/FileIo.hpp"

/**
 * @namespace YpBank
 * @brief Root namespace of the YPBank record library
 *
 * Key components:
 * - Record model: Record, RecordFields, OccurredAt, OperationType
 * - Codecs: CsvCodec, TxtCodec, BinCodec behind RecordCodec, looked up via FormatRegistry
 * - Tools support: compare(), formatDiffReport(), Converter, io::readFile / io::writeFile
 */
namespace YpBank {

// Version information
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace YpBank
