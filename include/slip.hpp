#pragma once

/**
 * @file slip.hpp
 * @brief SLIP framing for viamesh frames on a serial byte stream.
 *
 * @details
 * A serial modem delivers a stream of bytes, not frames. SLIP puts each
 * viamesh stamp between END bytes and escapes END/ESC inside it, so the
 * receiving side can cut the stream back into stamps even after line noise
 * or a device reset.
 *
 * | Byte      | Value | Role                                    |
 * |-----------|-------|-----------------------------------------|
 * | `END`     | 0xC0  | frame boundary                          |
 * | `ESC`     | 0xDB  | next byte is an escape code             |
 * | `ESC_END` | 0xDC  | escaped literal 0xC0                    |
 * | `ESC_ESC` | 0xDD  | escaped literal 0xDB                    |
 *
 * The encoder writes END, the escaped payload, END. The decoder ignores bytes
 * until the first END; after that every END closes the current frame and opens
 * the next, so frames may share a boundary byte. A frame is dropped on a bad
 * escape or when it grows past `limit` bytes. Empty frames (END END) are
 * separators.
 *
 * @code
 *   std::vector<uint8_t> wire;
 *   viamesh::slip::encode(stamp.data(), stamp.size(), wire);
 *
 *   viamesh::slip::decoder dec;
 *   std::vector<uint8_t> frame;
 *   for (uint8_t b : wire) {
 *     if (dec.feed(b, frame)) handle(frame);
 *   }
 * @endcode
 */

#include <vector>
#include <cstddef>
#include <cstdint>

namespace viamesh {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// Encode @p n bytes at @p in as one SLIP frame into @p out (cleared first).
inline void encode(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(n * 2 + 2);
    out.push_back(END);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = in[i];
        if (b == END)      { out.push_back(ESC); out.push_back(ESC_END); }
        else if (b == ESC) { out.push_back(ESC); out.push_back(ESC_ESC); }
        else               { out.push_back(b); }
    }
    out.push_back(END);
}

/**
 * @brief Byte-at-a-time SLIP decoder. Keeps partial frames across calls.
 */
struct decoder {
    std::vector<uint8_t> buf;       ///< payload collected so far
    size_t limit = 0;               ///< max payload bytes, 0 = unlimited
    bool esc = false;               ///< previous byte was ESC
    bool in_frame = false;          ///< an opening END was seen
    size_t dropped = 0;             ///< frames discarded (bad escape, oversize)

    decoder() = default;
    explicit decoder(size_t max_payload) : limit(max_payload) {}

    /// Forget any partial frame and wait for the next END.
    void reset() {
        buf.clear();
        esc = false;
        in_frame = false;
    }

    /**
     * @brief Feed one byte.
     * @return true when @p frame now holds one complete payload
     */
    bool feed(uint8_t b, std::vector<uint8_t>& frame) {
        if (b == END) {
            const bool complete = in_frame && !buf.empty();
            if (complete) frame.swap(buf);
            buf.clear();
            esc = false;
            in_frame = true;        // every END also opens the next frame
            return complete;
        }
        if (!in_frame) return false;

        if (esc) {
            esc = false;
            if      (b == ESC_END) b = END;
            else if (b == ESC_ESC) b = ESC;
            else { ++dropped; reset(); return false; }
        } else if (b == ESC) {
            esc = true;
            return false;
        }

        if (limit != 0 && buf.size() >= limit) { ++dropped; reset(); return false; }
        buf.push_back(b);
        return false;
    }
};

} // namespace slip
} // namespace viamesh
