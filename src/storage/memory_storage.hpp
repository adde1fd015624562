#pragma once

#include <mutex>
#include <unordered_map>

#include "storage/storage.hpp"

namespace codebox::storage {

class MemoryProjectStorage : public ProjectStorage {
public:
    Project CreateProject(const Project& project) override;
    Project GetProject(const std::string& project_id) override;
    std::vector<Project> ListProjects(const std::string& owner_id) override;
    void DeleteProject(const std::string& project_id) override;

private:
    std::unordered_map<std::string, Project> projects_;
    std::mutex mutex_;
};

class MemoryFileStorage : public FileStorage {
public:
    File SaveFile(const File& file) override;
    File GetFile(const std::string& file_id) override;
    std::vector<File> ListFiles(const std::string& project_id) override;
    void DeleteFile(const std::string& file_id) override;

private:
    std::unordered_map<std::string, File> files_;
    std::mutex mutex_;
};

}  // namespace codebox::storage
