#include "uvm/store/store.hpp"

#include "uvm/errors.hpp"
#include "uvm/logging.hpp"

#include <QSaveFile>
#include <QString>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <system_error>

namespace uvm::store {

namespace {

std::string with_trailing_slash(const std::string& prefix) {
    if (prefix.empty() || prefix.back() == '/') {
        return prefix;
    }
    return prefix + "/";
}

}  // namespace

FileStore::FileStore(std::filesystem::path root) : root_(std::filesystem::absolute(std::move(root)).lexically_normal()) {}

std::filesystem::path FileStore::path_for(const std::string& key) const {
    const std::filesystem::path relative(key);
    if (key.empty() || relative.is_absolute()) {
        throw StoreError("invalid store key: '" + key + "'");
    }

    const auto path = (root_ / relative).lexically_normal();
    const auto rel = path.lexically_relative(root_);
    if (rel.empty() || *rel.begin() == "..") {
        throw StoreError("store key escapes the data root: " + key);
    }
    return path;
}

std::optional<std::string> FileStore::read(const std::string& key) const {
    std::ifstream in(path_for(key), std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void FileStore::write(const std::string& key, const std::string& bytes) {
    const auto path = path_for(key);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StoreError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        throw StoreError("cannot write " + path.string() + ": " + file.errorString().toStdString());
    }
    if (file.write(bytes.data(), static_cast<qint64>(bytes.size())) != static_cast<qint64>(bytes.size())) {
        file.cancelWriting();
        throw StoreError("short write to " + path.string());
    }
    if (!file.commit()) {
        throw StoreError("cannot commit " + path.string() + ": " + file.errorString().toStdString());
    }
}

bool FileStore::exists(const std::string& key) const {
    return std::filesystem::exists(path_for(key));
}

std::size_t FileStore::remove_prefix(const std::string& prefix) {
    const auto path = path_for(prefix);
    std::error_code ec;
    const auto removed = std::filesystem::remove_all(path, ec);
    if (ec) {
        throw StoreError("cannot remove " + path.string() + ": " + ec.message());
    }
    qCInfo(lcUvmStore).noquote() << "removed" << QString::fromStdString(path.string());
    return static_cast<std::size_t>(removed);
}

std::vector<std::string> FileStore::list(const std::string& prefix) const {
    const auto dir = prefix.empty() ? root_ : path_for(prefix);
    std::vector<std::string> out;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return out;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        out.push_back(entry.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<std::string> MemoryStore::read(const std::string& key) const {
    std::lock_guard guard(mutex_);
    const auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStore::write(const std::string& key, const std::string& bytes) {
    std::lock_guard guard(mutex_);
    data_[key] = bytes;
}

bool MemoryStore::exists(const std::string& key) const {
    std::lock_guard guard(mutex_);
    if (data_.contains(key)) {
        return true;
    }
    const auto dir = with_trailing_slash(key);
    const auto it = data_.lower_bound(dir);
    return it != data_.end() && it->first.starts_with(dir);
}

std::size_t MemoryStore::remove_prefix(const std::string& prefix) {
    std::lock_guard guard(mutex_);
    const auto dir = with_trailing_slash(prefix);
    std::size_t removed = data_.erase(prefix);
    for (auto it = data_.lower_bound(dir); it != data_.end() && it->first.starts_with(dir);) {
        it = data_.erase(it);
        ++removed;
    }
    return removed;
}

std::vector<std::string> MemoryStore::list(const std::string& prefix) const {
    std::lock_guard guard(mutex_);
    const auto dir = with_trailing_slash(prefix);
    std::set<std::string> names;
    for (auto it = data_.lower_bound(dir); it != data_.end() && it->first.starts_with(dir); ++it) {
        const auto rest = it->first.substr(dir.size());
        names.insert(rest.substr(0, rest.find('/')));
    }
    return {names.begin(), names.end()};
}

}  // namespace uvm::store
