#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uvm::store {

// Byte storage addressed by '/'-separated keys. write() replaces the value
// atomically: a concurrent read sees the old or the new bytes, never a mix.
class DurableStore {
public:
    virtual ~DurableStore() = default;

    virtual std::optional<std::string> read(const std::string& key) const = 0;
    virtual void write(const std::string& key, const std::string& bytes) = 0;
    [[nodiscard]] virtual bool exists(const std::string& key) const = 0;

    // Removes every key under prefix. Returns the number of keys removed.
    virtual std::size_t remove_prefix(const std::string& prefix) = 0;

    // Keys directly below prefix, without the prefix.
    [[nodiscard]] virtual std::vector<std::string> list(const std::string& prefix) const = 0;

    // Filesystem location of key for stores backed by files.
    [[nodiscard]] virtual std::optional<std::filesystem::path> local_path(const std::string& /*key*/) const {
        return std::nullopt;
    }
};

class FileStore : public DurableStore {
public:
    explicit FileStore(std::filesystem::path root);

    std::optional<std::string> read(const std::string& key) const override;
    void write(const std::string& key, const std::string& bytes) override;
    [[nodiscard]] bool exists(const std::string& key) const override;
    std::size_t remove_prefix(const std::string& prefix) override;
    [[nodiscard]] std::vector<std::string> list(const std::string& prefix) const override;
    [[nodiscard]] std::optional<std::filesystem::path> local_path(const std::string& key) const override {
        return path_for(key);
    }

    // Filesystem location of key. Throws StoreError for keys escaping the root.
    [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;
    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

class MemoryStore : public DurableStore {
public:
    std::optional<std::string> read(const std::string& key) const override;
    void write(const std::string& key, const std::string& bytes) override;
    [[nodiscard]] bool exists(const std::string& key) const override;
    std::size_t remove_prefix(const std::string& prefix) override;
    [[nodiscard]] std::vector<std::string> list(const std::string& prefix) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> data_;
};

}  // namespace uvm::store
