//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "wasm/BinaryReader.hpp"

#include "wasm/Leb128.hpp"

namespace funtab::wasm
{
namespace
{

support::Diag unexpectedEnd(size_t offset, size_t wanted)
{
    return support::makeError(support::ErrorKind::HostFailure,
                              "unexpected end of module at offset " + std::to_string(offset) +
                                  " (wanted " + std::to_string(wanted) + " byte(s))");
}

} // namespace

support::Expected<uint8_t> BinaryReader::readByte()
{
    if (atEnd())
        return unexpectedEnd(pos_, 1);
    return bytes_[pos_++];
}

support::Expected<uint32_t> BinaryReader::readVarU32()
{
    return uleb128Decode(bytes_, pos_);
}

support::Expected<std::span<const uint8_t>> BinaryReader::readBytes(size_t count)
{
    if (count > remaining())
        return unexpectedEnd(pos_, count);
    auto slice = bytes_.subspan(pos_, count);
    pos_ += count;
    return slice;
}

support::Expected<std::string> BinaryReader::readName()
{
    const size_t start = pos_;
    auto length = readVarU32();
    if (!length)
        return length.error();
    auto raw = readBytes(length.value());
    if (!raw)
    {
        pos_ = start;
        return raw.error();
    }
    return std::string(raw.value().begin(), raw.value().end());
}

} // namespace funtab::wasm
