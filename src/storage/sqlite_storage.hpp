#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include "storage/storage.hpp"
#include "sqlite3.h"

namespace codebox::storage {

// One SQLite connection shared by the project and file storages. Files are
// deleted with their project (ON DELETE CASCADE).
class SqliteDatabase {
public:
    // Opens (creating if needed) the database and its schema. Throws StorageError.
    explicit SqliteDatabase(std::filesystem::path db_path);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    sqlite3* Handle() { return db_; }
    std::mutex& Mutex() { return mutex_; }
    const std::filesystem::path& Path() const { return db_path_; }

private:
    void EnsureSchema();

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

class SqliteProjectStorage : public ProjectStorage {
public:
    explicit SqliteProjectStorage(std::shared_ptr<SqliteDatabase> database);

    Project CreateProject(const Project& project) override;
    Project GetProject(const std::string& project_id) override;
    std::vector<Project> ListProjects(const std::string& owner_id) override;
    void DeleteProject(const std::string& project_id) override;

private:
    std::shared_ptr<SqliteDatabase> database_;
};

// SaveFile on a project id the database does not know throws NotFoundError.
class SqliteFileStorage : public FileStorage {
public:
    explicit SqliteFileStorage(std::shared_ptr<SqliteDatabase> database);

    File SaveFile(const File& file) override;
    File GetFile(const std::string& file_id) override;
    std::vector<File> ListFiles(const std::string& project_id) override;
    void DeleteFile(const std::string& file_id) override;

private:
    std::shared_ptr<SqliteDatabase> database_;
};

}  // namespace codebox::storage
