#pragma once
#include <map>
#include <optional>
#include <string>

namespace gem::core {

// Storage collaborator. Paths are passed through exactly as written in the
// document; resolving them against an assets directory is the provider's job.
class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    virtual bool exists(const std::string& path) const = 0;
    virtual std::optional<std::string> read(const std::string& path) const = 0;
};

class MemorySourceProvider : public SourceProvider {
public:
    void add(const std::string& path, std::string contents);

    bool exists(const std::string& path) const override;
    std::optional<std::string> read(const std::string& path) const override;

private:
    std::map<std::string, std::string> files_;
};

} // namespace gem::core
