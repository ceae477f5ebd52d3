#include "uvm/store/config.hpp"

#include "uvm/errors.hpp"
#include "uvm/logging.hpp"

#include <QSettings>
#include <QString>
#include <QVariant>

#include <optional>
#include <stdexcept>

namespace uvm::store {

namespace {

QString q(const char* key) {
    return QString::fromLatin1(key);
}

int read_int(const QSettings& settings, const char* key, int fallback) {
    if (!settings.contains(q(key))) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(q(key)).toInt(&ok);
    if (!ok) {
        throw ConfigError(std::string("expected an integer for ") + key);
    }
    return value;
}

double read_double(const QSettings& settings, const char* key, double fallback) {
    if (!settings.contains(q(key))) {
        return fallback;
    }
    bool ok = false;
    const double value = settings.value(q(key)).toDouble(&ok);
    if (!ok) {
        throw ConfigError(std::string("expected a number for ") + key);
    }
    return value;
}

bool read_bool(const QSettings& settings, const char* key, bool fallback) {
    if (!settings.contains(q(key))) {
        return fallback;
    }
    const auto value = settings.value(q(key)).toString().trimmed().toLower();
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    throw ConfigError(std::string("expected a boolean for ") + key);
}

}  // namespace

ManagerConfig load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ConfigError("config file not found: " + path.string());
    }

    QSettings settings(QString::fromStdString(path.string()), QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        throw ConfigError("cannot parse config file: " + path.string());
    }

    ManagerConfig config;

    if (settings.contains(q("storage/root"))) {
        std::filesystem::path root = settings.value(q("storage/root")).toString().toStdString();
        config.dataRoot = root.is_relative() ? path.parent_path() / root : root;
    } else {
        config.dataRoot = path.parent_path() / config.dataRoot;
    }
    const int lockCapacity = read_int(settings, "storage/lock_capacity", static_cast<int>(config.lockCapacity));
    if (lockCapacity < 1) {
        throw ConfigError("storage/lock_capacity must be at least 1");
    }
    config.lockCapacity = static_cast<std::size_t>(lockCapacity);

    config.slicer.targetSampleRate = read_int(settings, "audio/target_sample_rate", config.slicer.targetSampleRate);
    if (config.slicer.targetSampleRate < 8000 || config.slicer.targetSampleRate > 192000) {
        throw ConfigError("audio/target_sample_rate out of range");
    }
    config.slicer.fadeMs = read_double(settings, "audio/fade_ms", config.slicer.fadeMs);
    config.slicer.minSampleMs = read_double(settings, "audio/min_sample_ms", config.slicer.minSampleMs);
    const int maxName = read_int(settings, "audio/max_name_length", static_cast<int>(config.slicer.maxNameLength));
    if (maxName < 1) {
        throw ConfigError("audio/max_name_length must be at least 1");
    }
    config.slicer.maxNameLength = static_cast<std::size_t>(maxName);

    if (settings.contains(q("estimation/tightness"))) {
        std::optional<engine::RecordingStyle> style;
        if (settings.contains(q("estimation/style"))) {
            const auto name = settings.value(q("estimation/style")).toString().toStdString();
            try {
                style = engine::parse_recording_style(name);
            } catch (const std::invalid_argument& e) {
                throw ConfigError(std::string("estimation/style: ") + e.what());
            }
        }
        config.estimation =
            engine::EstimationParams::from_tightness(read_double(settings, "estimation/tightness", 0.5), style);
    }
    config.estimation.consonantAwareOverlap =
        read_bool(settings, "estimation/consonant_aware_overlap", config.estimation.consonantAwareOverlap);

    config.writeCharacterTxt = read_bool(settings, "generation/character_txt", config.writeCharacterTxt);
    config.language = settings.value(q("generation/language"), QString::fromStdString(config.language))
                          .toString()
                          .toStdString();

    qCDebug(lcUvmStore).noquote() << "loaded config" << QString::fromStdString(path.string()) << "data root"
                                  << QString::fromStdString(config.dataRoot.string());
    return config;
}

}  // namespace uvm::store
