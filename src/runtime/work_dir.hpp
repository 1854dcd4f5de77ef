#pragma once
#include <string>
#include <filesystem>

namespace execore::runtime {

// Uniquely named scratch directory, removed with everything in it on destruction
class WorkDir {
public:
    WorkDir() = default;
    ~WorkDir();

    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;
    WorkDir(WorkDir&& other) noexcept;
    WorkDir& operator=(WorkDir&& other) noexcept;

    // Create <root>/<prefix>XXXXXX; false (with error()) on failure
    bool create(const std::filesystem::path& root, const std::string& prefix);

    // Remove now; safe to call more than once
    bool remove();

    bool valid() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::filesystem::path path_;
    std::string error_;
};

} // namespace execore::runtime
