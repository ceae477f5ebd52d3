#include "uvm/engine/oto.hpp"

#include "uvm/engine/encoding.hpp"
#include "uvm/errors.hpp"

#include <QSaveFile>
#include <QString>

#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace uvm::engine {

namespace {

std::optional<double> to_double(const std::string& value) {
    const auto t = trim(value);
    if (t.empty() || t.find_first_not_of("-0123456789.") != std::string::npos) {
        return std::nullopt;
    }
    try {
        std::size_t idx = 0;
        const double out = std::stod(t, &idx);
        if (idx != t.size()) {
            return std::nullopt;
        }
        return out;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool has_wav_extension(const std::string& filename) {
    return filename.size() > 4 && to_lower_ascii(filename.substr(filename.size() - 4)) == ".wav";
}

}  // namespace

std::optional<OtoEntry> parse_oto_line(const std::string& raw) {
    const auto line = trim(raw);
    if (line.empty() || line.starts_with("#") || line.starts_with(";") || line.starts_with("//")) {
        return std::nullopt;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }

    OtoEntry entry;
    entry.wavFile = line.substr(0, eq);
    if (!has_wav_extension(entry.wavFile)) {
        return std::nullopt;
    }

    std::stringstream ss(line.substr(eq + 1));
    std::string token;
    std::vector<std::string> fields;
    while (std::getline(ss, token, ',')) {
        fields.push_back(token);
    }
    if (fields.size() != 6) {
        return std::nullopt;
    }

    const auto offset = to_double(fields[1]);
    const auto consonant = to_double(fields[2]);
    const auto cutoff = to_double(fields[3]);
    const auto preutter = to_double(fields[4]);
    const auto overlap = to_double(fields[5]);
    if (!offset || !consonant || !cutoff || !preutter || !overlap) {
        return std::nullopt;
    }
    if (*offset < 0.0 || *consonant < 0.0 || *preutter < 0.0) {
        return std::nullopt;
    }

    entry.alias = fields[0];
    if (entry.alias.empty()) {
        entry.alias = entry.wavFile.substr(0, entry.wavFile.rfind('.'));
    }
    entry.params = {*offset, *consonant, *cutoff, *preutter, *overlap};
    return entry;
}

std::vector<OtoEntry> parse_oto(const std::string& text) {
    std::vector<OtoEntry> entries;
    std::istringstream in(normalize_text(text));
    std::string line;
    while (std::getline(in, line)) {
        if (auto entry = parse_oto_line(line)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

std::string format_number(double value) {
    if (std::isfinite(value) && value == std::trunc(value) && std::abs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    // Shortest round-trip digits, never exponent notation.
    char buffer[512];
    const auto result =
        std::to_chars(std::begin(buffer), std::end(buffer), value, std::chars_format::fixed);
    if (result.ec != std::errc{}) {
        throw std::invalid_argument("oto value cannot be written as a decimal");
    }
    return std::string(buffer, result.ptr);
}

std::string to_oto_line(const OtoEntry& entry) {
    const auto& p = entry.params;
    return entry.wavFile + "=" + entry.alias + "," + format_number(p.offsetMs) + "," +
           format_number(p.consonantMs) + "," + format_number(p.cutoffMs) + "," +
           format_number(p.preutterMs) + "," + format_number(p.overlapMs);
}

bool is_representable(const OtoEntry& entry) {
    if ((entry.wavFile + entry.alias).find_first_of("\r\n") != std::string::npos) {
        return false;
    }
    const auto reparsed = parse_oto_line(to_oto_line(entry));
    return reparsed && reparsed->wavFile == entry.wavFile && reparsed->alias == entry.alias;
}

std::string serialize_oto(const std::vector<OtoEntry>& entries) {
    std::string out;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += to_oto_line(entries[i]);
    }
    return out;
}

std::vector<OtoEntry> read_oto_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StoreError("failed to open oto.ini: " + path.string());
    }
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse_oto(content);
}

void write_oto_file(const std::filesystem::path& path, const std::vector<OtoEntry>& entries) {
    const auto content = serialize_oto(entries) + "\n";

    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        throw StoreError("failed to write oto.ini: " + path.string() + ": " + file.errorString().toStdString());
    }
    if (file.write(content.data(), static_cast<qint64>(content.size())) != static_cast<qint64>(content.size())) {
        file.cancelWriting();
        throw StoreError("short write to oto.ini: " + path.string());
    }
    if (!file.commit()) {
        throw StoreError("failed to commit oto.ini: " + path.string() + ": " + file.errorString().toStdString());
    }
}

}  // namespace uvm::engine
