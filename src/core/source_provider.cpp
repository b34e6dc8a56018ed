#include <gem/core/source_provider.h>

namespace gem::core {

void MemorySourceProvider::add(const std::string& path, std::string contents) {
    files_[path] = std::move(contents);
}

bool MemorySourceProvider::exists(const std::string& path) const {
    return files_.count(path) > 0;
}

std::optional<std::string> MemorySourceProvider::read(const std::string& path) const {
    auto it = files_.find(path);
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

} // namespace gem::core
