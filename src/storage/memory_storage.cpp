#include "storage/memory_storage.hpp"

#include <algorithm>
#include <stdexcept>

#include "core/errors.hpp"

namespace codebox::storage {

Project MemoryProjectStorage::CreateProject(const Project& project) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (projects_.count(project.id) > 0) {
        throw DuplicateError("Project " + project.id + " already exists");
    }
    for (const auto& [id, existing] : projects_) {
        if (existing.owner_id == project.owner_id && existing.name == project.name) {
            throw DuplicateError("Project name " + project.name + " already used by " + project.owner_id);
        }
    }
    projects_.emplace(project.id, project);
    return project;
}

Project MemoryProjectStorage::GetProject(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        throw NotFoundError("Project " + project_id + " not found");
    }
    return it->second;
}

std::vector<Project> MemoryProjectStorage::ListProjects(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Project> projects;
    for (const auto& [id, project] : projects_) {
        if (project.owner_id == owner_id) {
            projects.push_back(project);
        }
    }
    std::sort(projects.begin(), projects.end(), [](const Project& a, const Project& b) {
        return a.created_at < b.created_at;
    });
    return projects;
}

void MemoryProjectStorage::DeleteProject(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (projects_.erase(project_id) == 0) {
        throw NotFoundError("Project " + project_id + " not found");
    }
}

File MemoryFileStorage::SaveFile(const File& file) {
    if (utils::Trim(file.path).empty()) {
        throw std::invalid_argument("Path cannot be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, existing] : files_) {
        if (id != file.id && existing.project_id == file.project_id && existing.path == file.path) {
            throw DuplicateError("File " + file.path + " already exists in project " + file.project_id);
        }
    }
    files_.insert_or_assign(file.id, file);
    return file;
}

File MemoryFileStorage::GetFile(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        throw NotFoundError("File " + file_id + " not found");
    }
    return it->second;
}

std::vector<File> MemoryFileStorage::ListFiles(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<File> files;
    for (const auto& [id, file] : files_) {
        if (file.project_id == project_id) {
            files.push_back(file);
        }
    }
    std::sort(files.begin(), files.end(), [](const File& a, const File& b) {
        return a.path < b.path;
    });
    return files;
}

void MemoryFileStorage::DeleteFile(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (files_.erase(file_id) == 0) {
        throw NotFoundError("File " + file_id + " not found");
    }
}

}  // namespace codebox::storage
