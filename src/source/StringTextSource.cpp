// SPDX-License-Identifier: Apache-2.0
#include "StringTextSource.hpp"

#include <algorithm>

namespace speakstream
{

StringTextSource::StringTextSource(std::string text, std::size_t blockSize, std::string id):
    _text(std::move(text)), _blockSize(std::max<std::size_t>(blockSize, 1)), _id(std::move(id))
{
}

auto StringTextSource::read(std::stop_token token) -> Result<std::optional<std::string>>
{
    if (token.stop_requested())
        return makeError(ErrorCode::Cancelled, "Read cancelled");

    if (_offset >= _text.size())
        return std::optional<std::string> {};

    auto const length = std::min(_blockSize, _text.size() - _offset);
    auto piece = _text.substr(_offset, length);
    _offset += length;
    return std::optional<std::string> { std::move(piece) };
}

auto StringTextSource::sourceId() const -> std::string
{
    return _id;
}

auto StringTextSource::sizeHint() const -> std::optional<std::size_t>
{
    return _text.size();
}

} // namespace speakstream
