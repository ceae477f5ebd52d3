#include "uvm/engine/encoding.hpp"

#include <algorithm>
#include <cctype>

namespace uvm::engine {

std::string normalize_text(std::string raw) {
    if (raw.starts_with("\xEF\xBB\xBF")) {
        raw.erase(0, 3);
    }
    raw.erase(std::remove(raw.begin(), raw.end(), '\r'), raw.end());
    return raw;
}

std::string to_lower_ascii(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace uvm::engine
