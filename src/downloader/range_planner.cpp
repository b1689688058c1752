/*
 * rangefetch/src/downloader/range_planner.cpp
 *
 * Range window planning.
 * - Windows are contiguous, ascending, non-overlapping and cover [0, total).
 * - The last window carries the remainder (or a full chunk on an exact multiple).
 * - Wire translation: the server reads "bytes=a-b" as [a, b), so the upper
 *   bound sent is start + length rather than RFC 9110's start + length - 1.
 */

#include <rangefetch/downloader/downloader.hpp>

#include <algorithm>
#include <string>

namespace rangefetch::downloader {

RangePlanner::RangePlanner(std::uint64_t totalLength, std::uint32_t chunkSize)
    : _total(totalLength), _chunk(chunkSize) {}

std::optional<Window> RangePlanner::next() {
    if (_chunk == 0 || _cursor >= _total)
        return std::nullopt;

    const auto remaining = _total - _cursor;
    Window w;
    w.startOffset = _cursor;
    w.length = static_cast<std::uint32_t>(std::min<std::uint64_t>(remaining, _chunk));
    _cursor += w.length;
    return w;
}

std::uint64_t RangePlanner::windowCount() const noexcept {
    if (_chunk == 0)
        return 0;
    return _total / _chunk + (_total % _chunk != 0 ? 1 : 0);
}

Expected<RangePlanner> makeRangePlanner(std::uint64_t totalLength, std::uint32_t chunkSize) {
    if (chunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk size must be greater than zero"};
    }
    return RangePlanner{totalLength, chunkSize};
}

Expected<std::vector<Window>> planWindows(std::uint64_t totalLength, std::uint32_t chunkSize) {
    auto pr = makeRangePlanner(totalLength, chunkSize);
    if (!pr.ok())
        return pr.error();

    auto& planner = pr.value();
    std::vector<Window> out;
    out.reserve(static_cast<std::size_t>(planner.windowCount()));
    while (auto w = planner.next()) {
        out.push_back(*w);
    }
    return out;
}

std::string formatRangeHeader(const Window& w) {
    const auto wire = toWireRange(w);
    return "bytes=" + std::to_string(wire.first) + "-" + std::to_string(wire.last);
}

std::string describeWindow(const Window& w) {
    return "[" + std::to_string(w.startOffset) + ", " + std::to_string(w.endOffset()) + ")";
}

} // namespace rangefetch::downloader
