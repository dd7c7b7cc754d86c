#include "command_stream.h"

#include <algorithm>
#include <limits>

#include "byte_cursor.h"

namespace replay {

namespace {

uint32_t advance_frame(uint32_t frame, uint64_t delta) {
    const uint64_t next = static_cast<uint64_t>(frame) + delta;
    return next > std::numeric_limits<uint32_t>::max()
               ? std::numeric_limits<uint32_t>::max()
               : static_cast<uint32_t>(next);
}

template <Integral T>
T param_at(std::span<const uint8_t> raw, size_t off) {
    return read_scalar_le<T>(std::as_bytes(raw.subspan(off, sizeof(T))));
}

} // namespace

CommandParams CommandStreamDecoder::decode_params(const OpcodeDescriptor &desc,
                                                  std::span<const uint8_t> raw) {
    switch (desc.layout) {
    case ParamLayout::Select:
        if (raw.size() >= 3) {
            return SelectParams{raw[0], param_at<uint16_t>(raw, 1)};
        }
        break;
    case ParamLayout::Build:
        if (raw.size() >= 6) {
            return BuildParams{param_at<uint16_t>(raw, 0), param_at<uint16_t>(raw, 2),
                               param_at<uint16_t>(raw, 4)};
        }
        break;
    case ParamLayout::Entity16:
        if (raw.size() >= 2) {
            return EntityParams{param_at<uint16_t>(raw, 0)};
        }
        break;
    case ParamLayout::Entity8:
        if (raw.size() >= 1) {
            return EntityParams{raw[0]};
        }
        break;
    case ParamLayout::Position:
        if (raw.size() >= 4) {
            return PositionParams{param_at<uint16_t>(raw, 0), param_at<uint16_t>(raw, 2),
                                  std::nullopt};
        }
        break;
    case ParamLayout::PositionTarget:
        if (raw.size() >= 6) {
            return PositionParams{param_at<uint16_t>(raw, 0), param_at<uint16_t>(raw, 2),
                                  param_at<uint16_t>(raw, 4)};
        }
        break;
    case ParamLayout::Hotkey:
        if (raw.size() >= 2) {
            return HotkeyParams{raw[0], raw[1]};
        }
        break;
    case ParamLayout::Chat:
        return ChatParams{decode_text(std::as_bytes(raw))};
    case ParamLayout::Raw:
        break;
    }
    return std::monostate{};
}

std::optional<std::vector<uint8_t>> CommandStreamDecoder::read_variable(ByteCursor &cursor) const {
    const size_t cap = m_options.max_variable_length;
    switch (m_options.variable_length_rule) {
    case VariableLengthRule::NullTerminated: {
        std::vector<uint8_t> text;
        while (text.size() < cap) {
            auto b = cursor.readU8();
            if (!b) {
                return std::nullopt;
            }
            if (*b == 0) {
                return text;
            }
            text.push_back(*b);
        }
        // Plafond atteint : le terminateur éventuel qui suit est consommé
        if (cursor.peekU8() == uint8_t{0}) {
            cursor.skip(1);
        }
        return text;
    }
    case VariableLengthRule::LengthPrefixed: {
        auto length = cursor.readU8();
        if (!length) {
            return std::nullopt;
        }
        auto data = cursor.readBytes(*length);
        if (!data) {
            return std::nullopt;
        }
        if (data->size() > cap) {
            data->resize(cap);
        }
        return data;
    }
    case VariableLengthRule::FixedCap:
        return cursor.readBytes(cap);
    }
    return std::nullopt;
}

CommandStreamResult CommandStreamDecoder::decode(std::span<const std::byte> section) const {
    CommandStreamResult result;
    ByteCursor cursor(section);
    uint32_t frame = 0;

    auto underrun = [&](const char *what) {
        result.ended_by_underrun = true;
        result.issues.push_back(std::string("commands: stream ended inside ") + what +
                                " at offset " + std::to_string(cursor.position()));
        log_warn("commandes", std::string("fin de flux au milieu d'un ") + what, m_options);
    };

    while (!cursor.atEnd()) {
        if (result.iterations >= m_options.max_iterations) {
            result.hit_iteration_cap = true;
            result.issues.push_back("commands: iteration cap of " +
                                    std::to_string(m_options.max_iterations) + " reached");
            log_warn("commandes", "plafond d'itérations atteint", m_options);
            break;
        }
        ++result.iterations;

        const size_t recordStart = cursor.position();
        const uint8_t byte = *cursor.readU8();

        if (byte == kFrameStep) {
            frame = advance_frame(frame, 1);
            continue;
        }
        if (byte == kFrameSkip8) {
            auto n = cursor.readU8();
            if (!n) {
                underrun("frame marker");
                break;
            }
            frame = advance_frame(frame, *n);
            continue;
        }
        if (byte == kFrameSkip16) {
            auto n = cursor.readU16LE();
            if (!n) {
                underrun("frame marker");
                break;
            }
            frame = advance_frame(frame, *n);
            continue;
        }
        if (byte == kFrameSkip32) {
            auto n = cursor.readU32LE();
            if (!n) {
                underrun("frame marker");
                break;
            }
            frame = advance_frame(frame, *n);
            continue;
        }

        auto desc = lookup_opcode(byte);
        if (!desc) {
            ++result.unknown_opcodes;
            ++result.resyncs;
            // L'octet suivant est pris pour un joueur s'il ne peut être autre chose
            auto next = cursor.peekU8();
            if (next && *next < kMaxPlayerSlots && !is_frame_marker(*next) &&
                !lookup_opcode(*next)) {
                cursor.skip(1);
            }
            if (result.unknown_opcodes <= 8) {
                log_warn("commandes", "opcode inconnu " + hex_byte(byte) + " à l'offset " +
                                          std::to_string(recordStart),
                         m_options);
            }
            continue;
        }

        auto player = cursor.readU8();
        if (!player) {
            underrun("record");
            break;
        }
        std::optional<std::vector<uint8_t>> raw;
        if (desc->parameter_length) {
            raw = cursor.readBytes(*desc->parameter_length);
        } else {
            raw = read_variable(cursor);
        }
        if (!raw) {
            underrun("record");
            break;
        }
        if (*player >= kMaxPlayerSlots) {
            ++result.dropped;
            continue;
        }

        Command cmd;
        cmd.frame = frame;
        cmd.player = *player;
        cmd.opcode = byte;
        cmd.params = decode_params(*desc, *raw);
        cmd.raw = std::move(*raw);
        cmd.effective = desc->effective;
        result.commands.push_back(std::move(cmd));
    }

    if (result.unknown_opcodes > 0) {
        result.issues.push_back("commands: " + std::to_string(result.unknown_opcodes) +
                                " unknown opcode(s), stream resynchronized");
    }
    if (result.dropped > 0) {
        result.issues.push_back("commands: " + std::to_string(result.dropped) +
                                " record(s) with out-of-range player dropped");
    }
    result.final_frame = frame;
    return result;
}

} // namespace replay
