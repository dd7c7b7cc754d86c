#include "payload_expander.h"

#include <algorithm>
#include <array>
#include <climits>

#include <zlib.h>

namespace replay {

namespace {

constexpr std::array<InflateAttempt, 5> kAttempts{{
    {0, 15, "zlib/15"},
    {0, 0, "zlib/en-tete"},
    {0, 15 + 32, "zlib-gzip/auto"},
    {2, -15, "deflate-brut/+2"},
    {0, -15, "deflate-brut/0"},
}};

constexpr size_t kInflateChunk = 64 * 1024;

} // namespace

std::span<const InflateAttempt> inflate_attempts() {
    return kAttempts;
}

bool is_zlib_header(uint8_t cmf, uint8_t flg) {
    if ((cmf & 0x0F) != 8 || (cmf >> 4) > 7) {
        return false;
    }
    return ((static_cast<unsigned>(cmf) << 8) | flg) % 31 == 0;
}

bool looks_like_game_data(std::span<const std::byte> data) {
    if (data.size() < kMinPayloadSize) {
        return false;
    }
    size_t zeros = 0;
    size_t printable = 0;
    for (std::byte b : data) {
        const auto c = std::to_integer<uint8_t>(b);
        if (c == 0) {
            ++zeros;
        } else if (c >= 0x20 && c <= 0x7E) {
            ++printable;
        }
    }
    const double total = static_cast<double>(data.size());
    const double zeroRatio = static_cast<double>(zeros) / total;
    const double printableRatio = static_cast<double>(printable) / total;
    return zeroRatio >= kMinZeroRatio && zeroRatio <= kMaxZeroRatio &&
           printableRatio >= kMinPrintableRatio && printableRatio <= kMaxPrintableRatio;
}

std::optional<std::vector<std::byte>> inflate_stream(std::span<const std::byte> input,
                                                     int windowBits, size_t cap,
                                                     bool &truncated) {
    truncated = false;
    z_stream zs{};
    zs.zalloc = Z_NULL;
    zs.zfree = Z_NULL;
    zs.opaque = Z_NULL;
    const size_t inSize = std::min<size_t>(input.size(), UINT_MAX);
    zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(input.data()));
    zs.avail_in = static_cast<uInt>(inSize);

    if (inflateInit2(&zs, windowBits) != Z_OK) {
        return std::nullopt;
    }

    std::vector<std::byte> out;
    int rc = Z_OK;
    while (true) {
        if (out.size() >= cap) {
            truncated = true;
            break;
        }
        const size_t chunk = std::min(kInflateChunk, cap - out.size());
        const size_t before = out.size();
        out.resize(before + chunk);
        zs.next_out = reinterpret_cast<Bytef *>(out.data() + before);
        zs.avail_out = static_cast<uInt>(chunk);
        rc = inflate(&zs, Z_NO_FLUSH);
        out.resize(before + (chunk - zs.avail_out));
        if (rc == Z_STREAM_END) {
            break;
        }
        if (rc == Z_BUF_ERROR || (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0)) {
            // Entrée épuisée avant la fin du flux
            truncated = true;
            break;
        }
        if (rc != Z_OK) {
            inflateEnd(&zs);
            return std::nullopt;
        }
    }
    inflateEnd(&zs);
    return out;
}

PayloadExpansion expand_payload(std::span<const std::byte> file,
                                FormatRevision revision,
                                const DecoderOptions &opt) {
    PayloadExpansion result;
    const size_t start = std::min(kPrologSize, file.size());
    auto raw = file.subspan(start);

    if (revision != FormatRevision::Remastered) {
        result.body.assign(raw.begin(), raw.end());
        result.mode = PayloadMode::Uncompressed;
        return result;
    }

    const size_t scanEnd = std::min(file.size(), start + kCompressionScanWindow);
    bool headerSeen = false;
    for (size_t pos = start; pos + 1 < scanEnd; ++pos) {
        const auto cmf = std::to_integer<uint8_t>(file[pos]);
        const auto flg = std::to_integer<uint8_t>(file[pos + 1]);
        if (!is_zlib_header(cmf, flg)) {
            continue;
        }
        headerSeen = true;
        for (const auto &attempt : kAttempts) {
            if (pos + attempt.skip >= file.size()) {
                continue;
            }
            bool truncated = false;
            auto inflated = inflate_stream(file.subspan(pos + attempt.skip),
                                           attempt.window_bits, kMaxInflatedSize,
                                           truncated);
            if (!inflated) {
                continue;
            }
            if (!looks_like_game_data(*inflated)) {
                log_warn("payload", "sortie rejetée par la validation (" +
                                        std::string(attempt.label) + ", " +
                                        std::to_string(inflated->size()) + " octets)",
                         opt);
                continue;
            }
            result.body = std::move(*inflated);
            result.mode = PayloadMode::Inflated;
            result.stream_offset = pos;
            result.attempt = attempt.label;
            result.truncated_stream = truncated;
            if (truncated) {
                result.issues.push_back("payload: compressed stream truncated, partial output kept (" +
                                        std::to_string(result.body.size()) + " bytes)");
                log_warn("payload", "flux compressé tronqué, sortie partielle conservée", opt);
            }
            if (attempt.skip != 0 || attempt.window_bits != 15) {
                result.issues.push_back(std::string("payload: inflated with alternate parameters ") +
                                        attempt.label);
            }
            return result;
        }
    }

    result.body.assign(raw.begin(), raw.end());
    if (headerSeen) {
        result.mode = PayloadMode::RawFallback;
        result.issues.push_back("payload: every decompression attempt failed, using raw bytes");
        log_warn("payload", "échec de toutes les tentatives de décompression, octets bruts utilisés",
                 opt);
    } else {
        result.mode = PayloadMode::Uncompressed;
        result.issues.push_back("payload: no compressed stream header in prolog, body read as-is");
    }
    return result;
}

} // namespace replay
