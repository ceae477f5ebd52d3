#include "uvm/engine/aligner.hpp"
#include "uvm/engine/estimation.hpp"
#include "uvm/engine/oto.hpp"
#include "uvm/engine/oto_validation.hpp"
#include "uvm/engine/slicer.hpp"
#include "uvm/errors.hpp"
#include "uvm/logging.hpp"
#include "uvm/store/batch_oto.hpp"
#include "uvm/store/config.hpp"
#include "uvm/store/generator.hpp"
#include "uvm/store/oto_repository.hpp"
#include "uvm/store/session.hpp"
#include "uvm/store/store.hpp"

#include <QCoreApplication>
#include <QLoggingCategory>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <string>

namespace {

// Exit codes per failure stage.
constexpr int kExitArgs = 1;
constexpr int kExitConfig = 2;
constexpr int kExitCommand = 3;
constexpr int kExitInvalid = 4;

struct CliArgs {
    std::string command;
    std::filesystem::path config;
    std::filesystem::path wav;
    std::filesystem::path lab;
    std::filesystem::path oto;
    std::filesystem::path samples;
    std::filesystem::path out;
    std::optional<std::string> alias;
    std::string session;
    std::string name;
    std::string voicebank;
    std::string language;
    bool overwrite = false;
    bool verbose = false;
    bool help = false;
};

const std::set<std::string> kCommands = {"suggest", "generate", "batch-oto", "validate"};
const std::set<std::string> kValueFlags = {"--config", "--wav",  "--lab",       "--oto",     "--samples",
                                           "--out",    "--alias", "--session",  "--name",    "--voicebank",
                                           "--language"};

std::optional<CliArgs> parse_args(int argc, char** argv, std::string& error) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string k = argv[i];
        if (k == "--help" || k == "-h") {
            args.help = true;
            return args;
        }
        if (k == "--overwrite") {
            args.overwrite = true;
            continue;
        }
        if (k == "--verbose" || k == "-v") {
            args.verbose = true;
            continue;
        }
        if (kCommands.contains(k) && args.command.empty()) {
            args.command = k;
            continue;
        }
        if (!kValueFlags.contains(k)) {
            error = "Unknown argument: " + k;
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            error = "Missing value for argument: " + k;
            return std::nullopt;
        }

        const std::string v = argv[++i];
        if (k == "--config") {
            args.config = v;
        } else if (k == "--wav") {
            args.wav = v;
        } else if (k == "--lab") {
            args.lab = v;
        } else if (k == "--oto") {
            args.oto = v;
        } else if (k == "--samples") {
            args.samples = v;
        } else if (k == "--out") {
            args.out = v;
        } else if (k == "--alias") {
            args.alias = v;
        } else if (k == "--session") {
            args.session = v;
        } else if (k == "--name") {
            args.name = v;
        } else if (k == "--voicebank") {
            args.voicebank = v;
        } else {
            args.language = v;
        }
    }

    if (args.command.empty()) {
        error = "A command is required.";
        return std::nullopt;
    }
    if (args.command == "suggest" && args.wav.empty()) {
        error = "suggest requires --wav.";
        return std::nullopt;
    }
    if (args.command == "generate" && (args.session.empty() || args.name.empty())) {
        error = "generate requires --session and --name.";
        return std::nullopt;
    }
    if (args.command == "batch-oto" && (args.voicebank.empty() || args.samples.empty())) {
        error = "batch-oto requires --voicebank and --samples.";
        return std::nullopt;
    }
    if (args.command == "validate" && args.oto.empty()) {
        error = "validate requires --oto.";
        return std::nullopt;
    }
    return args;
}

void print_usage() {
    std::cout << "Usage: uvm [--config manager.ini] [--verbose] <command> [options]\n"
              << "  suggest   --wav sample.wav [--lab sample.lab] [--alias a] [--language ja]\n"
              << "  generate  --session <id> --name <voicebank> [--out dir]\n"
              << "  batch-oto --voicebank <id> --samples <dir> [--overwrite] [--language ja]\n"
              << "  validate  --oto oto.ini\n";
}

void print_failures(const std::vector<uvm::store::FailedItem>& failures) {
    for (const auto& failure : failures) {
        std::cout << "  " << failure.file << ": " << failure.reason << "\n";
    }
}

int run_suggest(const CliArgs& args, const uvm::store::ManagerConfig& config) {
    auto aligner = args.lab.empty() ? uvm::engine::LabFileAligner() : uvm::engine::LabFileAligner(args.lab);
    const uvm::engine::OtoEstimator estimator(config.estimation);
    const auto language = args.language.empty() ? config.language : args.language;

    const auto suggestion = estimator.suggest(aligner, args.wav, args.alias, language);
    std::cout << uvm::engine::to_oto_line(suggestion.to_entry()) << "\n"
              << "confidence " << std::fixed << std::setprecision(3) << suggestion.confidence << "\n";
    for (const auto& warning : suggestion.validationWarnings) {
        std::cout << "warning: " << warning << "\n";
    }
    return 0;
}

int run_generate(const CliArgs& args, const uvm::store::ManagerConfig& config) {
    uvm::store::FileStore store(config.dataRoot);
    uvm::store::SessionService sessions(store, config.lockCapacity);
    uvm::engine::LabFileAligner aligner;
    const uvm::engine::OtoEstimator estimator(config.estimation);
    uvm::store::VoicebankGenerator generator(sessions, aligner, estimator, config.slicer, config.writeCharacterTxt);

    const auto out = args.out.empty()
                         ? config.dataRoot / "generated" / uvm::engine::sanitize_name(args.name)
                         : args.out;
    const auto report = generator.generate(args.session, args.name, out);

    std::cout << "Generated " << report.sampleCount << " samples (" << report.otoEntryCount << " oto entries) in "
              << report.path.string() << "\n"
              << "takes: " << report.processedTakes << " processed, " << report.skippedTakes << " skipped, "
              << report.failedTakes << " failed\n"
              << "average confidence " << std::fixed << std::setprecision(3) << report.averageConfidence << ", "
              << std::setprecision(2) << report.elapsedSeconds << " s\n";
    print_failures(report.reasons);
    return report.sampleCount > 0 ? 0 : kExitCommand;
}

int run_batch_oto(const CliArgs& args, const uvm::store::ManagerConfig& config) {
    uvm::store::FileStore store(config.dataRoot);
    uvm::store::OtoRepository repository(store, config.lockCapacity);
    uvm::engine::LabFileAligner aligner;
    const uvm::engine::OtoEstimator estimator(config.estimation);
    uvm::store::BatchOtoService service(repository, aligner, estimator);

    const auto language = args.language.empty() ? config.language : args.language;
    const auto result = service.run(args.voicebank, args.samples, args.overwrite, language);

    std::cout << result.totalSamples << " samples: " << result.processed << " processed, " << result.skipped
              << " skipped, " << result.failed << " failed\n"
              << "average confidence " << std::fixed << std::setprecision(3) << result.averageConfidence << "\n";
    print_failures(result.failures);
    return 0;
}

int run_validate(const CliArgs& args) {
    const auto entries = uvm::engine::read_oto_file(args.oto);
    std::size_t invalid = 0;
    for (const auto& entry : entries) {
        try {
            uvm::engine::validate_strict(entry.params);
        } catch (const uvm::InvalidTimingError& e) {
            ++invalid;
            std::cout << "invalid " << entry.wavFile << "=" << entry.alias << ": " << e.what() << "\n";
            continue;
        }
        for (const auto& warning : uvm::engine::check_soft_warnings(entry.params)) {
            std::cout << "warning " << entry.wavFile << "=" << entry.alias << ": " << warning << "\n";
        }
    }
    std::cout << entries.size() << " entries, " << invalid << " invalid\n";
    return invalid == 0 ? 0 : kExitInvalid;
}

}  // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("uvm"));

    std::string error;
    const auto args = parse_args(argc, argv, error);
    if (!args.has_value()) {
        if (!error.empty()) {
            std::cerr << "[args] " << error << "\n";
        }
        print_usage();
        return kExitArgs;
    }

    if (args->help) {
        print_usage();
        return 0;
    }
    if (args->verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("uvm.*.debug=true"));
    }

    uvm::store::ManagerConfig config;
    if (!args->config.empty()) {
        try {
            config = uvm::store::load_config(args->config);
        } catch (const uvm::ConfigError& e) {
            std::cerr << "[config] " << e.what() << "\n";
            return kExitConfig;
        }
    }

    try {
        if (args->command == "suggest") {
            return run_suggest(*args, config);
        }
        if (args->command == "generate") {
            return run_generate(*args, config);
        }
        if (args->command == "batch-oto") {
            return run_batch_oto(*args, config);
        }
        return run_validate(*args);
    } catch (const uvm::Error& e) {
        qCWarning(lcUvmCli).noquote() << args->command.c_str() << "failed:" << e.what();
        std::cerr << "[" << args->command << "] " << e.what() << "\n";
        return kExitCommand;
    }
}
