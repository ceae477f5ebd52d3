#include "uvm/store/oto_repository.hpp"

#include "uvm/engine/oto.hpp"
#include "uvm/engine/oto_validation.hpp"
#include "uvm/errors.hpp"
#include "uvm/logging.hpp"

#include <QString>

#include <algorithm>

namespace uvm::store {

using engine::OtoEntry;

namespace {

void check_id(const std::string& voicebankId) {
    if (voicebankId.empty() || voicebankId == "." || voicebankId == ".." ||
        voicebankId.find_first_of("/\\") != std::string::npos) {
        throw StoreError("invalid voicebank id: '" + voicebankId + "'");
    }
}

std::string voicebank_dir(const std::string& voicebankId) {
    return "voicebanks/" + voicebankId;
}

bool same_key(const OtoEntry& entry, const std::string& wavFile, const std::string& alias) {
    return entry.wavFile == wavFile && entry.alias == alias;
}

std::string describe(const std::string& wavFile, const std::string& alias) {
    return wavFile + "=" + alias;
}

void check_representable(const OtoEntry& entry) {
    if (!engine::is_representable(entry)) {
        throw OtoValidationError("entry is not representable in oto.ini: " + describe(entry.wavFile, entry.alias));
    }
}

void check_representable(const std::vector<OtoEntry>& entries) {
    for (const auto& entry : entries) {
        check_representable(entry);
    }
}

// Strict timing rules plus a check that the entry survives a write/read cycle.
void check_entry(const OtoEntry& entry) {
    engine::validate_strict(entry.params);
    check_representable(entry);
}

}  // namespace

OtoRepository::OtoRepository(DurableStore& store, std::size_t lockCapacity) : store_(store), locks_(lockCapacity) {}

std::string OtoRepository::oto_key(const std::string& voicebankId) {
    check_id(voicebankId);
    return voicebank_dir(voicebankId) + "/oto.ini";
}

bool OtoRepository::voicebank_exists(const std::string& voicebankId) const {
    check_id(voicebankId);
    return store_.exists(voicebank_dir(voicebankId));
}

std::vector<OtoEntry> OtoRepository::entries(const std::string& voicebankId) const {
    const auto text = store_.read(oto_key(voicebankId));
    if (!text) {
        return {};
    }
    return engine::parse_oto(*text);
}

std::optional<OtoEntry> OtoRepository::entry(const std::string& voicebankId,
                                             const std::string& wavFile,
                                             const std::string& alias) const {
    for (auto& e : entries(voicebankId)) {
        if (same_key(e, wavFile, alias)) {
            return e;
        }
    }
    return std::nullopt;
}

std::vector<OtoEntry> OtoRepository::entries_for_file(const std::string& voicebankId,
                                                      const std::string& wavFile) const {
    auto all = entries(voicebankId);
    std::erase_if(all, [&](const OtoEntry& e) { return e.wavFile != wavFile; });
    return all;
}

void OtoRepository::write_entries(const std::string& voicebankId, const std::vector<OtoEntry>& entries) {
    auto text = engine::serialize_oto(entries);
    if (!text.empty()) {
        text += '\n';
    }
    store_.write(oto_key(voicebankId), text);
}

OtoEntry OtoRepository::create_entry(const std::string& voicebankId, const OtoEntry& entry) {
    check_entry(entry);

    const auto mutex = locks_.get(voicebankId);
    std::lock_guard guard(*mutex);

    auto current = entries(voicebankId);
    const bool duplicate = std::any_of(current.begin(), current.end(), [&](const OtoEntry& e) {
        return same_key(e, entry.wavFile, entry.alias);
    });
    if (duplicate) {
        throw OtoEntryExistsError("entry already exists: " + describe(entry.wavFile, entry.alias));
    }

    current.push_back(entry);
    write_entries(voicebankId, current);
    qCDebug(lcUvmStore).noquote() << "created" << QString::fromStdString(describe(entry.wavFile, entry.alias))
                                  << "in" << QString::fromStdString(voicebankId);
    return entry;
}

OtoEntry OtoRepository::update_entry(const std::string& voicebankId,
                                     const std::string& wavFile,
                                     const std::string& alias,
                                     const OtoPatch& patch) {
    const auto mutex = locks_.get(voicebankId);
    std::lock_guard guard(*mutex);

    auto current = entries(voicebankId);
    const auto it = std::find_if(current.begin(), current.end(),
                                 [&](const OtoEntry& e) { return same_key(e, wavFile, alias); });
    if (it == current.end()) {
        throw OtoNotFoundError("entry not found: " + describe(wavFile, alias));
    }

    OtoEntry updated = *it;
    updated.wavFile = patch.wavFile.value_or(updated.wavFile);
    updated.alias = patch.alias.value_or(updated.alias);
    updated.params.offsetMs = patch.offsetMs.value_or(updated.params.offsetMs);
    updated.params.consonantMs = patch.consonantMs.value_or(updated.params.consonantMs);
    updated.params.cutoffMs = patch.cutoffMs.value_or(updated.params.cutoffMs);
    updated.params.preutterMs = patch.preutterMs.value_or(updated.params.preutterMs);
    updated.params.overlapMs = patch.overlapMs.value_or(updated.params.overlapMs);
    check_entry(updated);

    if (!same_key(updated, wavFile, alias)) {
        const bool collides = std::any_of(current.begin(), current.end(), [&](const OtoEntry& e) {
            return &e != &*it && same_key(e, updated.wavFile, updated.alias);
        });
        if (collides) {
            throw OtoEntryExistsError("entry already exists: " + describe(updated.wavFile, updated.alias));
        }
    }

    *it = updated;
    write_entries(voicebankId, current);
    return updated;
}

bool OtoRepository::delete_entry(const std::string& voicebankId, const std::string& wavFile, const std::string& alias) {
    const auto mutex = locks_.get(voicebankId);
    std::lock_guard guard(*mutex);

    auto current = entries(voicebankId);
    const auto removed = std::erase_if(current, [&](const OtoEntry& e) { return same_key(e, wavFile, alias); });
    if (removed == 0) {
        return false;
    }
    write_entries(voicebankId, current);
    return true;
}

void OtoRepository::save_entries(const std::string& voicebankId, const std::vector<OtoEntry>& entries) {
    check_representable(entries);

    const auto mutex = locks_.get(voicebankId);
    std::lock_guard guard(*mutex);
    write_entries(voicebankId, entries);
}

std::vector<OtoEntry> OtoRepository::merge_entries(const std::string& voicebankId,
                                                   const std::vector<OtoEntry>& newEntries,
                                                   bool overwrite) {
    check_representable(newEntries);

    const auto mutex = locks_.get(voicebankId);
    std::lock_guard guard(*mutex);

    auto merged = entries(voicebankId);
    if (overwrite) {
        std::erase_if(merged, [&](const OtoEntry& e) {
            return std::any_of(newEntries.begin(), newEntries.end(),
                               [&](const OtoEntry& n) { return n.wavFile == e.wavFile; });
        });
    }
    merged.insert(merged.end(), newEntries.begin(), newEntries.end());
    std::stable_sort(merged.begin(), merged.end(),
                     [](const OtoEntry& a, const OtoEntry& b) { return a.wavFile < b.wavFile; });

    write_entries(voicebankId, merged);
    return merged;
}

bool OtoRepository::delete_voicebank(const std::string& voicebankId) {
    check_id(voicebankId);
    std::size_t removed = 0;
    {
        const auto mutex = locks_.get(voicebankId);
        std::lock_guard guard(*mutex);
        removed = store_.remove_prefix(voicebank_dir(voicebankId));
    }
    locks_.discard(voicebankId);
    qCInfo(lcUvmStore).noquote() << "deleted voicebank" << QString::fromStdString(voicebankId) << "(" << removed
                                 << "keys)";
    return removed > 0;
}

}  // namespace uvm::store
