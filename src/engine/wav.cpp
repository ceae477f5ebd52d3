#include "uvm/engine/wav.hpp"

#include "uvm/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>

namespace uvm::engine {

namespace {

constexpr std::uint16_t kFormatPcm = 1;
constexpr std::uint16_t kFormatFloat = 3;
constexpr std::uint16_t kFormatExtensible = 0xFFFE;

struct WavHeader {
    std::uint16_t format = 0;
    std::uint16_t channels = 0;
    std::uint32_t sampleRate = 0;
    std::uint16_t bitsPerSample = 0;
    std::uint32_t dataSize = 0;
    std::streamoff dataOffset = 0;
};

std::uint16_t read_u16(const unsigned char* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_u32(const unsigned char* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

void writeU32(std::ofstream& out, std::uint32_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

void writeU16(std::ofstream& out, std::uint16_t value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

WavHeader read_header(std::ifstream& in, const std::string& name) {
    unsigned char riff[12];
    if (!in.read(reinterpret_cast<char*>(riff), sizeof(riff)) || std::memcmp(riff, "RIFF", 4) != 0 ||
        std::memcmp(riff + 8, "WAVE", 4) != 0) {
        throw AudioError("not a RIFF/WAVE file: " + name);
    }

    WavHeader header;
    bool haveFmt = false;
    unsigned char chunk[8];
    while (in.read(reinterpret_cast<char*>(chunk), sizeof(chunk))) {
        const std::uint32_t size = read_u32(chunk + 4);
        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (size < 16) {
                throw AudioError("truncated fmt chunk: " + name);
            }
            std::vector<unsigned char> fmt(size);
            if (!in.read(reinterpret_cast<char*>(fmt.data()), size)) {
                throw AudioError("truncated fmt chunk: " + name);
            }
            header.format = read_u16(fmt.data());
            header.channels = read_u16(fmt.data() + 2);
            header.sampleRate = read_u32(fmt.data() + 4);
            header.bitsPerSample = read_u16(fmt.data() + 14);
            // WAVE_FORMAT_EXTENSIBLE carries the real format in the sub-format GUID.
            if (header.format == kFormatExtensible && size >= 26) {
                header.format = read_u16(fmt.data() + 24);
            }
            haveFmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            header.dataSize = size;
            header.dataOffset = in.tellg();
            break;
        } else {
            in.seekg(size, std::ios::cur);
        }
        if (size % 2 != 0) {
            in.seekg(1, std::ios::cur);
        }
    }

    if (!haveFmt) {
        throw AudioError("missing fmt chunk: " + name);
    }
    if (header.dataOffset == 0) {
        throw AudioError("missing data chunk: " + name);
    }
    if (header.channels == 0 || header.sampleRate == 0) {
        throw AudioError("invalid channel count or sample rate: " + name);
    }

    const bool pcm = header.format == kFormatPcm &&
                     (header.bitsPerSample == 8 || header.bitsPerSample == 16 || header.bitsPerSample == 24 ||
                      header.bitsPerSample == 32);
    const bool ieee = header.format == kFormatFloat && (header.bitsPerSample == 32 || header.bitsPerSample == 64);
    if (!pcm && !ieee) {
        throw AudioError("unsupported wav format " + std::to_string(header.format) + "/" +
                         std::to_string(header.bitsPerSample) + "-bit: " + name);
    }
    return header;
}

float decode_sample(const unsigned char* p, const WavHeader& header) {
    if (header.format == kFormatFloat) {
        if (header.bitsPerSample == 32) {
            float value;
            std::memcpy(&value, p, sizeof(value));
            return value;
        }
        double value;
        std::memcpy(&value, p, sizeof(value));
        return static_cast<float>(value);
    }

    switch (header.bitsPerSample) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<std::int16_t>(read_u16(p))) / 32768.0f;
        case 24: {
            std::int32_t value = p[0] | (p[1] << 8) | (p[2] << 16);
            if (value & 0x800000) {
                value |= ~0xFFFFFF;
            }
            return static_cast<float>(value) / 8388608.0f;
        }
        default:
            return static_cast<float>(static_cast<std::int32_t>(read_u32(p)) / 2147483648.0);
    }
}

}  // namespace

WavData read_wav(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw AudioError("failed to open wav: " + path.string());
    }

    const auto header = read_header(in, path.string());
    const std::size_t bytesPerSample = header.bitsPerSample / 8;
    const std::size_t frameBytes = bytesPerSample * header.channels;

    std::vector<unsigned char> raw(header.dataSize);
    in.seekg(header.dataOffset);
    in.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    // Tolerate a data chunk that claims more bytes than the file holds.
    raw.resize(static_cast<std::size_t>(in.gcount()));

    const std::size_t frames = raw.size() / frameBytes;
    WavData data;
    data.sampleRate = static_cast<int>(header.sampleRate);
    data.channels = header.channels;
    data.interleaved.resize(frames * header.channels);
    for (std::size_t i = 0; i < data.interleaved.size(); ++i) {
        data.interleaved[i] = decode_sample(raw.data() + i * bytesPerSample, header);
    }
    return data;
}

double wav_duration_ms(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw AudioError("failed to open wav: " + path.string());
    }

    const auto header = read_header(in, path.string());
    in.seekg(0, std::ios::end);
    const auto available = static_cast<std::uint64_t>(in.tellg() - header.dataOffset);
    const auto dataSize = std::min<std::uint64_t>(header.dataSize, available);
    const std::uint64_t frameBytes = static_cast<std::uint64_t>(header.bitsPerSample / 8) * header.channels;
    return static_cast<double>(dataSize / frameBytes) * 1000.0 / header.sampleRate;
}

void write_wav(const AudioBuffer& buffer, const std::filesystem::path& path) {
    if (buffer.sampleRate <= 0) {
        throw AudioError("invalid sample rate for " + path.string());
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw AudioError("failed to write wav: " + path.string());
    }

    const std::uint16_t channels = 1;
    const std::uint16_t bitsPerSample = 16;
    const std::uint32_t byteRate = static_cast<std::uint32_t>(buffer.sampleRate) * channels * bitsPerSample / 8;
    const std::uint16_t blockAlign = channels * bitsPerSample / 8;
    const std::uint32_t dataSize = static_cast<std::uint32_t>(buffer.samples.size() * sizeof(std::int16_t));

    out.write("RIFF", 4);
    writeU32(out, 36 + dataSize);
    out.write("WAVE", 4);

    out.write("fmt ", 4);
    writeU32(out, 16);
    writeU16(out, kFormatPcm);
    writeU16(out, channels);
    writeU32(out, static_cast<std::uint32_t>(buffer.sampleRate));
    writeU32(out, byteRate);
    writeU16(out, blockAlign);
    writeU16(out, bitsPerSample);

    out.write("data", 4);
    writeU32(out, dataSize);

    for (const float sample : buffer.samples) {
        const float clamped = std::clamp(sample, -1.0f, 1.0f);
        const auto pcm = static_cast<std::int16_t>(clamped * 32767.0f);
        out.write(reinterpret_cast<const char*>(&pcm), sizeof(pcm));
    }

    if (!out) {
        throw AudioError("failed to write wav: " + path.string());
    }
}

}  // namespace uvm::engine
