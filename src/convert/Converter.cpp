#include "ypbank/convert/Converter.hpp"

namespace YpBank {

bool Converter::convert(std::string_view input, std::string_view sourceFormat,
                        std::string_view targetFormat, std::string& output, Error& err) const {
    output.clear();
    err.clear();

    const RecordCodec* src = registry_.lookup(sourceFormat, err);
    if (!src)
        return false;
    const RecordCodec* dst = registry_.lookup(targetFormat, err);
    if (!dst)
        return false;

    RecordSequence records;
    if (!src->decode(input, records, err))
        return false;

    output = dst->encode(records);
    return true;
}

bool Converter::decode(std::string_view input, std::string_view format, RecordSequence& out,
                       Error& err) const {
    out.clear();
    err.clear();

    const RecordCodec* codec = registry_.lookup(format, err);
    if (!codec)
        return false;
    return codec->decode(input, out, err);
}

} // namespace YpBank
