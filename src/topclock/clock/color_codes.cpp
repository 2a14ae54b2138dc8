#include "color_codes.hpp"
#include <algorithm>
#include <array>

namespace topclock::clock {

namespace {

constexpr std::array<char, 3> ALLOWED_CODES = { '0', '1', '2' };

} // namespace

ColorCodeIterator::ColorCodeIterator(std::string_view buffer)
    : buffer_(buffer)
{
}

bool ColorCodeIterator::code_at(size_t pos) const
{
    return buffer_[pos] == '|' && pos + 1 < buffer_.size()
        && std::ranges::find(ALLOWED_CODES, buffer_[pos + 1]) != ALLOWED_CODES.end();
}

std::optional<Segment> ColorCodeIterator::next()
{
    if (index_ >= buffer_.size())
        return std::nullopt;

    std::optional<uint8_t> color;
    if (code_at(index_))
    {
        color = static_cast<uint8_t>(buffer_[index_ + 1] - '0');
        index_ += 2;
    }

    size_t start = index_;
    while (index_ < buffer_.size() && !code_at(index_))
        ++index_;

    if (index_ > start || color)
        return Segment{ buffer_.substr(start, index_ - start), color };

    return std::nullopt;
}

std::vector<Segment> split_segments(std::string_view markup)
{
    std::vector<Segment> segments;
    ColorCodeIterator it(markup);
    while (auto segment = it.next())
        segments.push_back(*segment);
    return segments;
}

} // namespace topclock::clock
