#pragma once

#include "uvm/engine/types.hpp"
#include "uvm/store/lock_map.hpp"
#include "uvm/store/store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace uvm::store {

// Partial update of an entry; unset fields keep their stored value.
struct OtoPatch {
    std::optional<std::string> wavFile;
    std::optional<std::string> alias;
    std::optional<double> offsetMs;
    std::optional<double> consonantMs;
    std::optional<double> cutoffMs;
    std::optional<double> preutterMs;
    std::optional<double> overlapMs;
};

// oto.ini collections, one per voicebank. Every mutation rewrites the whole
// collection while holding that voicebank's lock; reads take no lock.
class OtoRepository {
public:
    explicit OtoRepository(DurableStore& store, std::size_t lockCapacity = BoundedLockMap::kDefaultMaxSize);

    static std::string oto_key(const std::string& voicebankId);

    [[nodiscard]] bool voicebank_exists(const std::string& voicebankId) const;

    [[nodiscard]] std::vector<engine::OtoEntry> entries(const std::string& voicebankId) const;
    [[nodiscard]] std::optional<engine::OtoEntry> entry(const std::string& voicebankId,
                                                        const std::string& wavFile,
                                                        const std::string& alias) const;
    [[nodiscard]] std::vector<engine::OtoEntry> entries_for_file(const std::string& voicebankId,
                                                                 const std::string& wavFile) const;

    // Throws InvalidTimingError, OtoValidationError, or OtoEntryExistsError for a duplicate (file, alias).
    engine::OtoEntry create_entry(const std::string& voicebankId, const engine::OtoEntry& entry);

    // Throws OtoNotFoundError, InvalidTimingError, or OtoEntryExistsError when a
    // rename collides with another entry.
    engine::OtoEntry update_entry(const std::string& voicebankId,
                                  const std::string& wavFile,
                                  const std::string& alias,
                                  const OtoPatch& patch);

    // Returns false if there was no such entry.
    bool delete_entry(const std::string& voicebankId, const std::string& wavFile, const std::string& alias);

    // Replaces the whole collection. Throws OtoValidationError, writing nothing,
    // if any entry cannot be written as an oto line.
    void save_entries(const std::string& voicebankId, const std::vector<engine::OtoEntry>& entries);

    // Throws OtoValidationError, writing nothing, if any new entry cannot be
    // written as an oto line. With overwrite, new entries replace every stored entry of the same file;
    // otherwise they are appended. The result is ordered by file name.
    std::vector<engine::OtoEntry> merge_entries(const std::string& voicebankId,
                                                const std::vector<engine::OtoEntry>& newEntries,
                                                bool overwrite);

    // Removes all stored data of the voicebank, then its lock.
    bool delete_voicebank(const std::string& voicebankId);

    [[nodiscard]] const BoundedLockMap& locks() const { return locks_; }

private:
    void write_entries(const std::string& voicebankId, const std::vector<engine::OtoEntry>& entries);

    DurableStore& store_;
    BoundedLockMap locks_;
};

}  // namespace uvm::store
