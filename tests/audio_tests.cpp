#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include "uvm/engine/audio.hpp"
#include "uvm/engine/wav.hpp"
#include "uvm/errors.hpp"

#include <cstdint>
#include <fstream>

using Catch::Approx;
using uvm::engine::AudioBuffer;

namespace {

void put_u16(std::string& out, std::uint16_t value) {
    out += static_cast<char>(value & 0xFF);
    out += static_cast<char>((value >> 8) & 0xFF);
}

void put_u32(std::string& out, std::uint32_t value) {
    put_u16(out, static_cast<std::uint16_t>(value & 0xFFFF));
    put_u16(out, static_cast<std::uint16_t>(value >> 16));
}

// Hand-assembled RIFF file, optionally with an odd-sized chunk before "fmt ".
std::string build_wav(std::uint16_t format, std::uint16_t channels, std::uint32_t rate, std::uint16_t bits,
                      const std::string& data, bool extraChunk = false) {
    std::string body = "WAVE";
    if (extraChunk) {
        body += "LIST";
        put_u32(body, 3);
        body += "abc";
        body += '\0';
    }
    body += "fmt ";
    put_u32(body, 16);
    put_u16(body, format);
    put_u16(body, channels);
    put_u32(body, rate);
    put_u32(body, rate * channels * bits / 8);
    put_u16(body, static_cast<std::uint16_t>(channels * bits / 8));
    put_u16(body, bits);
    body += "data";
    put_u32(body, static_cast<std::uint32_t>(data.size()));
    body += data;

    std::string out = "RIFF";
    put_u32(out, static_cast<std::uint32_t>(body.size()));
    return out + body;
}

void write_file(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

AudioBuffer constant(std::size_t count, float value, int rate = 44100) {
    AudioBuffer buffer;
    buffer.sampleRate = rate;
    buffer.samples.assign(count, value);
    return buffer;
}

}  // namespace

TEST_CASE("Stereo frames are averaged to mono", "[audio]") {
    uvm::engine::WavData wav;
    wav.sampleRate = 22050;
    wav.channels = 2;
    wav.interleaved = {0.2f, 0.6f, -1.0f, 1.0f};

    const auto mono = uvm::engine::to_mono(wav);
    REQUIRE(mono.sampleRate == 22050);
    REQUIRE(mono.samples.size() == 2);
    REQUIRE(mono.samples[0] == Approx(0.4f));
    REQUIRE(mono.samples[1] == Approx(0.0f));
}

TEST_CASE("Linear resampling changes the sample count by the rate ratio", "[audio]") {
    AudioBuffer buffer;
    buffer.sampleRate = 22050;
    for (int i = 0; i < 100; ++i) {
        buffer.samples.push_back(static_cast<float>(i) / 100.0f);
    }

    const auto up = uvm::engine::resample_linear(buffer, 44100);
    REQUIRE(up.sampleRate == 44100);
    REQUIRE(up.samples.size() == 200);
    REQUIRE(up.samples[1] == Approx(0.005f));
    REQUIRE(up.duration_ms() == Approx(buffer.duration_ms()));

    const auto same = uvm::engine::resample_linear(buffer, 22050);
    REQUIRE(same.samples == buffer.samples);
}

TEST_CASE("Peak normalization", "[audio]") {
    auto buffer = constant(10, 0.25f);
    buffer.samples[3] = -0.5f;
    uvm::engine::peak_normalize(buffer);
    REQUIRE(buffer.samples[3] == Approx(-0.95f));
    REQUIRE(buffer.samples[0] == Approx(0.475f));

    auto silent = constant(10, 0.0f);
    uvm::engine::peak_normalize(silent);
    REQUIRE(silent.samples == constant(10, 0.0f).samples);
}

TEST_CASE("Fades silence both ends", "[audio]") {
    auto buffer = constant(1000, 1.0f);
    uvm::engine::apply_fade(buffer, 5.0);

    REQUIRE(buffer.samples.front() == 0.0f);
    REQUIRE(buffer.samples.back() == 0.0f);
    REQUIRE(buffer.samples[500] == 1.0f);
    REQUIRE(buffer.samples[1] < buffer.samples[100]);

    auto tiny = constant(4, 1.0f);
    uvm::engine::apply_fade(tiny, 5.0);
    REQUIRE(tiny.samples == constant(4, 1.0f).samples);
}

TEST_CASE("Slicing clamps to the buffer", "[audio]") {
    AudioBuffer buffer = constant(1000, 0.1f, 1000);

    REQUIRE(uvm::engine::slice_ms(buffer, 100.0, 200.0).samples.size() == 100);
    REQUIRE(uvm::engine::slice_ms(buffer, -50.0, 20.0).samples.size() == 20);
    REQUIRE(uvm::engine::slice_ms(buffer, 900.0, 5000.0).samples.size() == 100);
    REQUIRE(uvm::engine::slice_ms(buffer, 300.0, 200.0).samples.empty());
}

TEST_CASE("16-bit mono wav round trip", "[audio]") {
    uvm::test::TempDir dir;
    const auto path = dir.path() / "tone.wav";
    const auto tone = uvm::test::make_tone(100.0, 44100);
    uvm::test::write_tone(path, 100.0, 44100);

    const auto wav = uvm::engine::read_wav(path);
    REQUIRE(wav.sampleRate == 44100);
    REQUIRE(wav.channels == 1);
    REQUIRE(wav.frames() == tone.frames());
    REQUIRE(wav.duration_ms() == Approx(100.0));
    for (std::size_t i = 0; i < wav.interleaved.size(); i += 97) {
        REQUIRE(wav.interleaved[i] == Approx(tone.interleaved[i]).margin(1e-3));
    }
    REQUIRE(uvm::engine::wav_duration_ms(path) == Approx(100.0));
}

TEST_CASE("24-bit stereo wav with an odd-sized extra chunk", "[audio]") {
    uvm::test::TempDir dir;
    const auto path = dir.path() / "deep.wav";

    // Two frames: (+0.5, -0.5) and (0, max).
    const std::string data("\x00\x00\x40" "\x00\x00\xC0" "\x00\x00\x00" "\xFF\xFF\x7F", 12);
    write_file(path, build_wav(1, 2, 48000, 24, data, true));

    const auto wav = uvm::engine::read_wav(path);
    REQUIRE(wav.sampleRate == 48000);
    REQUIRE(wav.channels == 2);
    REQUIRE(wav.frames() == 2);
    REQUIRE(wav.interleaved[0] == Approx(0.5f));
    REQUIRE(wav.interleaved[1] == Approx(-0.5f));
    REQUIRE(wav.interleaved[2] == 0.0f);
    REQUIRE(wav.interleaved[3] == Approx(1.0f).margin(1e-6));
}

TEST_CASE("32-bit float wav", "[audio]") {
    uvm::test::TempDir dir;
    const auto path = dir.path() / "float.wav";

    const float samples[] = {0.25f, -0.75f};
    const std::string data(reinterpret_cast<const char*>(samples), sizeof(samples));
    write_file(path, build_wav(3, 1, 44100, 32, data));

    const auto wav = uvm::engine::read_wav(path);
    REQUIRE(wav.interleaved == std::vector<float>{0.25f, -0.75f});
}

TEST_CASE("Unreadable audio raises AudioError", "[audio]") {
    uvm::test::TempDir dir;

    const auto text = dir.path() / "text.wav";
    write_file(text, "this is not audio at all");
    REQUIRE_THROWS_AS(uvm::engine::read_wav(text), uvm::AudioError);
    REQUIRE_THROWS_AS(uvm::engine::wav_duration_ms(text), uvm::AudioError);

    const auto adpcm = dir.path() / "adpcm.wav";
    write_file(adpcm, build_wav(2, 1, 44100, 4, std::string(16, '\0')));
    REQUIRE_THROWS_AS(uvm::engine::read_wav(adpcm), uvm::AudioError);

    REQUIRE_THROWS_AS(uvm::engine::read_wav(dir.path() / "missing.wav"), uvm::AudioError);

    AudioBuffer bad;
    bad.sampleRate = 0;
    REQUIRE_THROWS_AS(uvm::engine::write_wav(bad, dir.path() / "bad.wav"), uvm::AudioError);
}
