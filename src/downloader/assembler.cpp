/*
 * rangefetch/src/downloader/assembler.cpp
 *
 * Single pre-sized buffer filled strictly in window order.
 * A write is validated in full before any byte is copied, so a rejected
 * window leaves the buffer and fill cursor untouched.
 */

#include <rangefetch/downloader/downloader.hpp>

#include <cstring>
#include <string>

namespace rangefetch::downloader {

Assembler::Assembler(std::uint64_t expectedLength)
    : _expected(expectedLength), _buffer(static_cast<std::size_t>(expectedLength)) {}

Expected<void> Assembler::write(const Window& window, ByteSpan chunk) {
    if (chunk.size() != window.length) {
        Error err{ErrorCode::LengthMismatch,
                  "window " + describeWindow(window) + " expected " +
                      std::to_string(window.length) + " bytes, got " +
                      std::to_string(chunk.size())};
        err.window = window;
        return err;
    }
    if (window.startOffset > _expected || window.length > _expected - window.startOffset) {
        Error err{ErrorCode::InvalidWindow, "window " + describeWindow(window) +
                                                " exceeds expected length " +
                                                std::to_string(_expected)};
        err.window = window;
        return err;
    }
    if (window.startOffset != _filled) {
        Error err{ErrorCode::InvalidWindow,
                  "window " + describeWindow(window) + " does not start at fill offset " +
                      std::to_string(_filled)};
        err.window = window;
        return err;
    }

    if (!chunk.empty()) {
        std::memcpy(_buffer.data() + window.startOffset, chunk.data(), chunk.size());
    }
    _filled += window.length;
    return {};
}

Expected<AssembledBuffer> Assembler::intoBuffer() && {
    if (!isComplete()) {
        return Error{ErrorCode::IncompleteAssembly,
                     "assembled " + std::to_string(_filled) + " of " + std::to_string(_expected) +
                         " bytes"};
    }
    _expected = 0;
    _filled = 0;
    return AssembledBuffer{std::move(_buffer)};
}

} // namespace rangefetch::downloader
