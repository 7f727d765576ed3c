// ==============================================================================
// WAV I/O for the Hearth tools
// ==============================================================================
// Minimal RIFF/WAVE support: writes 16-bit PCM mono, reads 16-bit PCM
// (first channel only). Only the fmt and data chunks are interpreted; other
// chunks are skipped.
// ==============================================================================

#pragma once

#include <hearth/dsp/core/audio_buffer.h>
#include <hearth/dsp/core/pcm_utils.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace HearthTools {

// Simple little-endian byte writer for RIFF headers
class BinaryWriter {
public:
    std::vector<uint8_t> data;

    void writeTag(const char* tag) {
        data.insert(data.end(), tag, tag + 4);
    }

    void writeUInt16(uint16_t val) {
        data.push_back(static_cast<uint8_t>(val & 0xFF));
        data.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    }

    void writeUInt32(uint32_t val) {
        for (int shift = 0; shift < 32; shift += 8) {
            data.push_back(static_cast<uint8_t>((val >> shift) & 0xFF));
        }
    }

    void writeInt16(int16_t val) {
        writeUInt16(static_cast<uint16_t>(val));
    }
};

inline uint16_t readUInt16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t readUInt32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

/// Write signed 16-bit mono PCM as a RIFF/WAVE file.
/// @throws std::runtime_error if the file cannot be written
inline void writeWav16(const std::filesystem::path& path, std::span<const int16_t> pcm,
                       uint32_t sampleRate) {
    constexpr uint16_t kChannels = 1;
    constexpr uint16_t kBitsPerSample = 16;
    constexpr uint16_t kBlockAlign = kChannels * kBitsPerSample / 8;
    const auto dataBytes = static_cast<uint32_t>(pcm.size() * kBlockAlign);

    BinaryWriter w;
    w.writeTag("RIFF");
    w.writeUInt32(36 + dataBytes);
    w.writeTag("WAVE");

    w.writeTag("fmt ");
    w.writeUInt32(16);                       // fmt chunk size
    w.writeUInt16(1);                        // PCM
    w.writeUInt16(kChannels);
    w.writeUInt32(sampleRate);
    w.writeUInt32(sampleRate * kBlockAlign);  // byte rate
    w.writeUInt16(kBlockAlign);
    w.writeUInt16(kBitsPerSample);

    w.writeTag("data");
    w.writeUInt32(dataBytes);
    w.data.reserve(w.data.size() + dataBytes);
    for (int16_t s : pcm) {
        w.writeInt16(s);
    }

    std::ofstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("failed to create " + path.string());
    }
    f.write(reinterpret_cast<const char*>(w.data.data()),
            static_cast<std::streamsize>(w.data.size()));
    if (!f) {
        throw std::runtime_error("failed to write " + path.string());
    }
}

/// Read a 16-bit PCM WAV file into a float buffer (s / 32767). Multichannel
/// files contribute their first channel.
/// @throws std::runtime_error on I/O errors or unsupported formats
inline Hearth::DSP::AudioBuffer readWav16(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("failed to open " + path.string());
    }
    const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                                     std::istreambuf_iterator<char>());

    const auto fail = [&path](const std::string& why) {
        return std::runtime_error(path.string() + ": " + why);
    };

    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0
        || std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw fail("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
    const uint8_t* dataChunk = nullptr;
    uint32_t dataSize = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        const uint32_t chunkSize = readUInt32(chunk + 4);
        const size_t bodyStart = pos + 8;
        const size_t available = bytes.size() - bodyStart;

        if (std::memcmp(chunk, "fmt ", 4) == 0 && chunkSize >= 16 && available >= 16) {
            format = readUInt16(chunk + 8);
            channels = readUInt16(chunk + 10);
            sampleRate = readUInt32(chunk + 12);
            bitsPerSample = readUInt16(chunk + 22);
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            dataChunk = chunk + 8;
            dataSize = static_cast<uint32_t>(std::min<size_t>(chunkSize, available));
        }
        // Chunks are word-aligned
        pos = bodyStart + chunkSize + (chunkSize & 1u);
    }

    if (format != 1 || bitsPerSample != 16) {
        throw fail("only 16-bit PCM is supported");
    }
    if (channels == 0 || sampleRate == 0 || dataChunk == nullptr) {
        throw fail("missing fmt or data chunk");
    }

    const size_t frameBytes = static_cast<size_t>(channels) * 2;
    const size_t frames = dataSize / frameBytes;
    std::vector<int16_t> pcm(frames);
    for (size_t i = 0; i < frames; ++i) {
        pcm[i] = static_cast<int16_t>(readUInt16(dataChunk + i * frameBytes));
    }
    return Hearth::DSP::fromPcm16(pcm, static_cast<double>(sampleRate));
}

} // namespace HearthTools
