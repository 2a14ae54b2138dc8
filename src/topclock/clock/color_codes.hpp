#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace topclock::clock {

/// A run of text sharing one colour. `color` is empty for text before any code.
struct Segment
{
    std::string_view text;
    std::optional<uint8_t> color;

    bool operator==(Segment const&) const = default;
};

/**
 * @brief Splits "|0text|1more" markup into coloured segments.
 *
 * A '|' followed by an allowed code digit (0, 1 or 2) starts a new segment in
 * that colour; any other '|' is literal text. A code with no text after it
 * still yields an (empty) segment so a trailing colour switch is visible.
 * Segments view into the buffer, which must outlive the iterator.
 */
class ColorCodeIterator
{
public:
    explicit ColorCodeIterator(std::string_view buffer);

    std::optional<Segment> next();

private:
    std::string_view buffer_;
    size_t index_ = 0;

    bool code_at(size_t pos) const;
};

std::vector<Segment> split_segments(std::string_view markup);

} // namespace topclock::clock
