// Implémentation des utilitaires (I/O, journalisation, texte, temps de jeu)
#include "utilities.hpp"

#include <cmath>
#include <cstdio>
#include <iostream>
#include <limits>
#include <mutex>

namespace replay {

std::streamsize checked_streamsize(size_t size) {
    if (size > static_cast<size_t>(std::numeric_limits<std::streamsize>::max())) {
        throw std::runtime_error("Taille dépasse la limite de streamsize");
    }
    return static_cast<std::streamsize>(size);
}

void read_exact(std::ifstream &f, void *data, size_t size) {
    std::streamsize ss = checked_streamsize(size);
    auto old = f.exceptions();
    f.exceptions(std::ios::goodbit);
    auto start = f.tellg();
    f.read(static_cast<char *>(data), ss);
    std::streamsize got = f.gcount();
    f.clear();
    if (got != ss) {
        f.seekg(start);
    }
    f.exceptions(old);
    if (got != ss) {
        throw std::runtime_error("Lecture incomplète (" +
                                 std::to_string(got) + "/" +
                                 std::to_string(size) + " octets)");
    }
}

std::vector<std::byte> read_file_bytes(const std::string &path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) {
        throw std::runtime_error("Impossible d'ouvrir " + path);
    }
    const auto end = f.tellg();
    if (end < 0) {
        throw std::runtime_error("Taille illisible pour " + path);
    }
    f.seekg(0, std::ios::beg);
    std::vector<std::byte> bytes(static_cast<size_t>(end));
    if (!bytes.empty()) {
        read_exact(f, bytes.data(), bytes.size());
    }
    return bytes;
}

namespace {

std::mutex g_logMutex;

void log(std::string_view source, const std::string &msg,
         const char *prefix, const DecoderOptions &opt) {
    if (opt.quiet) return;
    std::lock_guard lock(g_logMutex);
    std::cerr << prefix << source << ": " << msg << '\n';
}

} // namespace

void log_info(std::string_view source, const std::string &msg,
              const DecoderOptions &opt) {
    log(source, msg, "", opt);
}

void log_warn(std::string_view source, const std::string &msg,
              const DecoderOptions &opt) {
    log(source, msg, "AVERTISSEMENT: ", opt);
}

void log_error(std::string_view source, const std::string &msg,
               const DecoderOptions &opt) {
    log(source, msg, "ERREUR: ", opt);
}

bool is_valid_utf8(std::span<const std::byte> bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = std::to_integer<uint8_t>(bytes[i]);
        size_t extra = 0;
        uint32_t codepoint = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codepoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codepoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codepoint = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = std::to_integer<uint8_t>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            codepoint = (codepoint << 6) | (cont & 0x3F);
        }
        // Formes trop longues et substituts UTF-16 interdits
        if ((extra == 1 && codepoint < 0x80) ||
            (extra == 2 && codepoint < 0x800) ||
            (extra == 3 && (codepoint < 0x10000 || codepoint > 0x10FFFF)) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

size_t utf8_length(std::string_view text) {
    size_t count = 0;
    for (char c : text) {
        if ((static_cast<uint8_t>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string frames_to_time(uint32_t frames, double framesPerSecond) {
    if (framesPerSecond <= 0.0) {
        return "0:00";
    }
    const auto totalSeconds =
        static_cast<uint64_t>(std::floor(static_cast<double>(frames) / framesPerSecond));
    const uint64_t minutes = totalSeconds / 60;
    const uint64_t seconds = totalSeconds % 60;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%llu:%02llu",
                  static_cast<unsigned long long>(minutes),
                  static_cast<unsigned long long>(seconds));
    return buffer;
}

std::string hex_byte(uint8_t value) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "0x%02x", value);
    return buffer;
}

} // namespace replay
