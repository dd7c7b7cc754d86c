#include "byte_cursor.h"

#include <algorithm>

#include "../utilities.hpp"

namespace replay {

std::span<const std::byte> ByteCursor::take(size_t n) {
    if (!canRead(n)) {
        m_underrun = true;
        return {};
    }
    auto view = m_data.subspan(m_pos, n);
    m_pos += n;
    return view;
}

std::optional<uint8_t> ByteCursor::readU8() {
    if (!canRead(1)) {
        m_underrun = true;
        return std::nullopt;
    }
    return read_scalar_le<uint8_t>(take(1));
}

std::optional<uint16_t> ByteCursor::readU16LE() {
    if (!canRead(2)) {
        m_underrun = true;
        return std::nullopt;
    }
    return read_scalar_le<uint16_t>(take(2));
}

std::optional<uint32_t> ByteCursor::readU32LE() {
    if (!canRead(4)) {
        m_underrun = true;
        return std::nullopt;
    }
    return read_scalar_le<uint32_t>(take(4));
}

std::optional<std::vector<uint8_t>> ByteCursor::readBytes(size_t n) {
    if (!canRead(n)) {
        m_underrun = true;
        return std::nullopt;
    }
    auto view = take(n);
    std::vector<uint8_t> out(n);
    std::transform(view.begin(), view.end(), out.begin(),
                   [](std::byte b) { return std::to_integer<uint8_t>(b); });
    return out;
}

std::optional<std::string> ByteCursor::readFixedString(size_t n) {
    if (!canRead(n)) {
        m_underrun = true;
        return std::nullopt;
    }
    return decode_text(take(n));
}

std::optional<uint8_t> ByteCursor::peekU8() const {
    if (!canRead(1)) {
        return std::nullopt;
    }
    return std::to_integer<uint8_t>(m_data[m_pos]);
}

void ByteCursor::seek(size_t pos) {
    m_pos = std::min(pos, m_data.size());
}

bool ByteCursor::skip(size_t n) {
    if (!canRead(n)) {
        m_pos = m_data.size();
        m_underrun = true;
        return false;
    }
    m_pos += n;
    return true;
}

std::string decode_text(std::span<const std::byte> bytes) {
    auto zero = std::find(bytes.begin(), bytes.end(), std::byte{0});
    auto field = bytes.first(static_cast<size_t>(zero - bytes.begin()));

    std::string out;
    out.reserve(field.size());
    if (is_valid_utf8(field)) {
        for (std::byte b : field) {
            const auto c = std::to_integer<uint8_t>(b);
            if (c < 0x20 || c == 0x7F) {
                continue;
            }
            out.push_back(static_cast<char>(c));
        }
        return out;
    }
    for (std::byte b : field) {
        const auto c = std::to_integer<uint8_t>(b);
        if (c >= 0x20 && c <= 0x7E) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

} // namespace replay
