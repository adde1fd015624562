#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "storage/storage_types.hpp"

namespace codebox::execution {

// Owns one execution's scratch directory and removes it on destruction
// unless released.
class ScratchDir {
public:
    ScratchDir() = default;
    // Creates `path` (and parents). Throws ExecutionError on failure.
    explicit ScratchDir(std::filesystem::path path);
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;

    const std::filesystem::path& Path() const { return path_; }
    bool Empty() const { return path_.empty(); }

    // Removes the directory now. Errors are logged.
    void Reset();

private:
    std::filesystem::path path_;
};

// Normalized form of a project-relative path. Throws SecurityError for
// blank or absolute paths and for any ".." component.
std::filesystem::path ValidateRelativePath(const std::string& path);

// Writes the files under code_dir and makes the tree read-only (files 0444,
// directories 0555). Throws SecurityError for paths that would escape
// code_dir, ExecutionError for I/O failures.
void MaterializeSnapshot(const std::vector<storage::File>& files, const std::filesystem::path& code_dir);

// Restores owner write permission below `root`, then removes it.
void RemoveTree(const std::filesystem::path& root, std::error_code& ec);

}  // namespace codebox::execution
