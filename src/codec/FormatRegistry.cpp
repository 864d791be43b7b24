#include "ypbank/codec/FormatRegistry.hpp"
#include "ypbank/codec/BinCodec.hpp"
#include "ypbank/codec/CsvCodec.hpp"
#include "ypbank/codec/TxtCodec.hpp"
#include "ypbank/util/textFormatUtil.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace YpBank {

FormatRegistry FormatRegistry::builtin() {
    FormatRegistry reg;
    reg.add(std::make_unique<CsvCodec>());
    reg.add(std::make_unique<TxtCodec>());
    reg.add(std::make_unique<BinCodec>());
    reg.addAlias("text", "txt");
    reg.addAlias("binary", "bin");
    return reg;
}

bool FormatRegistry::add(std::unique_ptr<RecordCodec> codec) {
    if (!codec || codec->name() == nullptr || *codec->name() == '\0')
        return false;

    // 먼저 등록된 codec 이 우선한다.
    std::string key = util::toLowerAscii(codec->name());
    if (byName_.count(key))
        return false;

    byName_.emplace(std::move(key), codec.get());
    codecs_.push_back(std::move(codec));
    return true;
}

bool FormatRegistry::addAlias(std::string_view alias, std::string_view target) {
    const RecordCodec* codec = find(target);
    if (!codec || alias.empty())
        return false;
    return byName_.emplace(util::toLowerAscii(alias), codec).second;
}

const RecordCodec* FormatRegistry::find(std::string_view name) const {
    auto it = byName_.find(util::toLowerAscii(name));
    return it == byName_.end() ? nullptr : it->second;
}

const RecordCodec* FormatRegistry::lookup(std::string_view name, Error& err) const {
    const RecordCodec* codec = find(name);
    if (!codec) {
        fail(err, errc::unknown_format, LocationKind::None, 0,
             fmt::format("unknown format '{}' (known: {})", name, fmt::join(names(), ", ")));
    }
    return codec;
}

std::vector<std::string> FormatRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(codecs_.size());
    for (const auto& c : codecs_)
        out.emplace_back(c->name());
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace YpBank
