#pragma once

#include <string>
#include <vector>

#include "storage/storage_types.hpp"

namespace codebox::storage {

// Project persistence. Implementations are thread safe.
//   GetProject/DeleteProject on an unknown id throw NotFoundError.
//   CreateProject on a colliding id, or a colliding (owner_id, name), throws DuplicateError.
//   Backend failures throw StorageError.
class ProjectStorage {
public:
    virtual ~ProjectStorage() = default;
    virtual Project CreateProject(const Project& project) = 0;
    virtual Project GetProject(const std::string& project_id) = 0;
    virtual std::vector<Project> ListProjects(const std::string& owner_id) = 0;
    virtual void DeleteProject(const std::string& project_id) = 0;
};

// File persistence, same error contract as ProjectStorage. SaveFile creates
// the file, or replaces the content of the file with the same id. A second
// file id at an existing (project_id, path) throws DuplicateError; a blank
// path throws std::invalid_argument.
class FileStorage {
public:
    virtual ~FileStorage() = default;
    virtual File SaveFile(const File& file) = 0;
    virtual File GetFile(const std::string& file_id) = 0;
    virtual std::vector<File> ListFiles(const std::string& project_id) = 0;
    virtual void DeleteFile(const std::string& file_id) = 0;
};

}  // namespace codebox::storage
