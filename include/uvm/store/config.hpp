#pragma once

#include "uvm/engine/estimation.hpp"
#include "uvm/engine/slicer.hpp"
#include "uvm/store/lock_map.hpp"

#include <filesystem>
#include <string>

namespace uvm::store {

struct ManagerConfig {
    std::filesystem::path dataRoot = "data";
    std::size_t lockCapacity = BoundedLockMap::kDefaultMaxSize;
    engine::SlicerConfig slicer;
    engine::EstimationParams estimation;
    bool writeCharacterTxt = true;
    std::string language = "ja";
};

// INI file with [storage], [audio], [estimation] and [generation] groups.
// Missing keys keep their defaults; a relative data root is resolved against
// the directory of the file. Throws ConfigError.
ManagerConfig load_config(const std::filesystem::path& path);

}  // namespace uvm::store
