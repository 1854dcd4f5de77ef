#include "runtime/work_dir.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace fs = std::filesystem;

namespace execore::runtime {

WorkDir::~WorkDir() {
    remove();
}

WorkDir::WorkDir(WorkDir&& other) noexcept
    : path_(std::move(other.path_))
    , error_(std::move(other.error_)) {
    other.path_.clear();
}

WorkDir& WorkDir::operator=(WorkDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        error_ = std::move(other.error_);
        other.path_.clear();
    }
    return *this;
}

bool WorkDir::create(const fs::path& root, const std::string& prefix) {
    remove();

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        error_ = "cannot create " + root.string() + ": " + ec.message();
        spdlog::error("WorkDir: {}", error_);
        return false;
    }

    std::string tmpl = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        error_ = "mkdtemp failed in " + root.string() + ": " + strerror(errno);
        spdlog::error("WorkDir: {}", error_);
        return false;
    }

    path_ = fs::path(buffer.data());
    spdlog::debug("Created work dir {}", path_.string());
    return true;
}

bool WorkDir::remove() {
    if (path_.empty()) {
        return true;
    }

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove work dir {}: {}", path_.string(), ec.message());
        path_.clear();
        return false;
    }

    spdlog::debug("Removed work dir {}", path_.string());
    path_.clear();
    return true;
}

} // namespace execore::runtime
