#include "execution/snapshot.hpp"

#include <fstream>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::execution {
namespace {

namespace fs = std::filesystem;

constexpr fs::perms kReadOnlyFile = fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kReadOnlyDir = kReadOnlyFile | fs::perms::owner_exec | fs::perms::group_exec |
                                   fs::perms::others_exec;

void MakeReadOnly(const fs::path& root) {
    std::vector<fs::path> directories;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_directory(ec)) {
            directories.push_back(it->path());
        } else {
            fs::permissions(it->path(), kReadOnlyFile, fs::perm_options::replace, ec);
        }
        if (ec) {
            break;
        }
    }
    if (ec) {
        throw ExecutionError("Failed to seal snapshot " + root.string() + ": " + ec.message());
    }
    // Deepest first, the root last.
    for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
        fs::permissions(*it, kReadOnlyDir, fs::perm_options::replace, ec);
        if (ec) {
            throw ExecutionError("Failed to seal snapshot " + it->string() + ": " + ec.message());
        }
    }
    fs::permissions(root, kReadOnlyDir, fs::perm_options::replace, ec);
    if (ec) {
        throw ExecutionError("Failed to seal snapshot " + root.string() + ": " + ec.message());
    }
}

}  // namespace

ScratchDir::ScratchDir(fs::path path)
    : path_(std::move(path)) {
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        const auto failed = path_;
        path_.clear();
        throw ExecutionError("Failed to create scratch directory " + failed.string() + ": " + ec.message());
    }
}

ScratchDir::~ScratchDir() {
    Reset();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        Reset();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScratchDir::Reset() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    RemoveTree(path_, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "engine", "failed to remove scratch directory", {
            {"path", path_.string()},
            {"error", ec.message()}
        });
    }
    path_.clear();
}

fs::path ValidateRelativePath(const std::string& path) {
    if (utils::Trim(path).empty()) {
        throw SecurityError("Empty file path");
    }
    const fs::path candidate(path);
    if (candidate.is_absolute() || candidate.has_root_path()) {
        throw SecurityError("Absolute file path not allowed: " + path);
    }
    for (const auto& part : candidate) {
        if (part == "..") {
            throw SecurityError("Parent directory reference not allowed: " + path);
        }
    }
    auto normalized = candidate.lexically_normal();
    if (normalized.empty() || normalized == ".") {
        throw SecurityError("File path names no file: " + path);
    }
    return normalized;
}

void MaterializeSnapshot(const std::vector<storage::File>& files, const fs::path& code_dir) {
    std::error_code ec;
    fs::create_directories(code_dir, ec);
    if (ec) {
        throw ExecutionError("Failed to create snapshot directory " + code_dir.string() + ": " + ec.message());
    }
    const auto base = code_dir.lexically_normal();
    for (const auto& file : files) {
        const auto relative = ValidateRelativePath(file.path);
        const auto target = (base / relative).lexically_normal();
        const auto check = target.lexically_relative(base);
        if (check.empty() || *check.begin() == "..") {
            throw SecurityError("File path escapes the snapshot: " + file.path);
        }

        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ExecutionError("Failed to create " + target.parent_path().string() + ": " + ec.message());
        }
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw ExecutionError("Failed to write snapshot file " + file.path);
        }
        output << file.content;
        output.close();
        if (!output) {
            throw ExecutionError("Failed to write snapshot file " + file.path);
        }
    }
    MakeReadOnly(code_dir);
}

void RemoveTree(const fs::path& root, std::error_code& ec) {
    ec.clear();
    if (!fs::exists(root, ec)) {
        return;
    }
    std::error_code perm_ec;
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, perm_ec);
    for (auto it = fs::recursive_directory_iterator(root, perm_ec);
         !perm_ec && it != fs::recursive_directory_iterator(); it.increment(perm_ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && !it->is_symlink(entry_ec)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, entry_ec);
        }
    }
    fs::remove_all(root, ec);
}

}  // namespace codebox::execution
