#include "storage/sqlite_storage.hpp"

#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "core/errors.hpp"
#include "utils/logging.hpp"

namespace codebox::storage {
namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS projects ("
    "  id TEXT PRIMARY KEY,"
    "  name TEXT NOT NULL,"
    "  description TEXT,"
    "  language TEXT NOT NULL CHECK (language IN ('python', 'javascript', 'ruby')),"
    "  created_at TEXT NOT NULL,"
    "  updated_at TEXT NOT NULL,"
    "  owner_id TEXT NOT NULL,"
    "  UNIQUE (owner_id, name)"
    ");"
    "CREATE TABLE IF NOT EXISTS files ("
    "  id TEXT PRIMARY KEY,"
    "  project_id TEXT NOT NULL,"
    "  path TEXT NOT NULL,"
    "  content TEXT NOT NULL,"
    "  created_at TEXT NOT NULL,"
    "  updated_at TEXT NOT NULL,"
    "  FOREIGN KEY (project_id) REFERENCES projects(id) ON DELETE CASCADE,"
    "  UNIQUE (project_id, path)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_projects_owner ON projects(owner_id);"
    "CREATE INDEX IF NOT EXISTS idx_files_project ON files(project_id);";

std::string SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

void Exec(sqlite3* db, const std::string& sql) {
    char* error = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        throw StorageError("sqlite: " + message);
    }
}

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
    return Statement(stmt);
}

void BindText(const Statement& stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
}

// Runs a write statement to completion and finalizes it, translating
// constraint violations into the storage error contract.
void StepWrite(sqlite3* db, Statement stmt, const std::string& subject) {
    const int rc = sqlite3_step(stmt.get());
    const int extended = sqlite3_extended_errcode(db);
    const std::string message = sqlite3_errmsg(db);
    stmt.reset();
    if (rc == SQLITE_DONE) {
        return;
    }
    if (extended == SQLITE_CONSTRAINT_FOREIGNKEY) {
        throw NotFoundError(subject + ": referenced project not found");
    }
    if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        throw DuplicateError(subject + " already exists");
    }
    throw StorageError(subject + ": " + message);
}

utils::TimePoint ReadTime(sqlite3_stmt* stmt, int column) {
    return utils::ParseIsoUtc(SafeText(sqlite3_column_text(stmt, column))).value_or(utils::TimePoint{});
}

Project ReadProject(sqlite3_stmt* stmt) {
    Project project{};
    project.id = SafeText(sqlite3_column_text(stmt, 0));
    project.name = SafeText(sqlite3_column_text(stmt, 1));
    if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
        project.description = SafeText(sqlite3_column_text(stmt, 2));
    }
    try {
        project.language = LanguageFromString(SafeText(sqlite3_column_text(stmt, 3)));
    } catch (const std::invalid_argument& ex) {
        throw StorageError("Corrupt project row " + project.id + ": " + ex.what());
    }
    project.created_at = ReadTime(stmt, 4);
    project.updated_at = ReadTime(stmt, 5);
    project.owner_id = SafeText(sqlite3_column_text(stmt, 6));
    return project;
}

File ReadFile(sqlite3_stmt* stmt) {
    File file{};
    file.id = SafeText(sqlite3_column_text(stmt, 0));
    file.project_id = SafeText(sqlite3_column_text(stmt, 1));
    file.path = SafeText(sqlite3_column_text(stmt, 2));
    file.content = SafeText(sqlite3_column_text(stmt, 3));
    file.created_at = ReadTime(stmt, 4);
    file.updated_at = ReadTime(stmt, 5);
    return file;
}

// Steps a single-row query. False when there is no row.
bool StepRow(sqlite3* db, const Statement& stmt) {
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StorageError(std::string("sqlite read failed: ") + sqlite3_errmsg(db));
}

constexpr const char* kProjectColumns =
    "SELECT id, name, description, language, created_at, updated_at, owner_id FROM projects ";
constexpr const char* kFileColumns =
    "SELECT id, project_id, path, content, created_at, updated_at FROM files ";

}  // namespace

SqliteDatabase::SqliteDatabase(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open " + db_path_.string() + ": " + message);
    }
    sqlite3_extended_result_codes(db_, 1);
    try {
        EnsureSchema();
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    utils::Log(utils::LogLevel::kDebug, "storage", "opened database", {{"path", db_path_.string()}});
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteDatabase::EnsureSchema() {
    Exec(db_, "PRAGMA foreign_keys = ON;");
    Exec(db_, kSchema);
}

SqliteProjectStorage::SqliteProjectStorage(std::shared_ptr<SqliteDatabase> database)
    : database_(std::move(database)) {}

Project SqliteProjectStorage::CreateProject(const Project& project) {
    std::lock_guard<std::mutex> lock(database_->Mutex());
    auto* db = database_->Handle();
    auto stmt = Prepare(db,
        "INSERT INTO projects(id, name, description, language, created_at, updated_at, owner_id) "
        "VALUES(?, ?, ?, ?, ?, ?, ?);");
    BindText(stmt, 1, project.id);
    BindText(stmt, 2, project.name);
    if (project.description.has_value()) {
        BindText(stmt, 3, *project.description);
    } else {
        sqlite3_bind_null(stmt.get(), 3);
    }
    BindText(stmt, 4, LanguageToString(project.language));
    BindText(stmt, 5, utils::FormatIsoUtc(project.created_at));
    BindText(stmt, 6, utils::FormatIsoUtc(project.updated_at));
    BindText(stmt, 7, project.owner_id);
    StepWrite(db, std::move(stmt), "Project " + project.id);
    return project;
}

Project SqliteProjectStorage::GetProject(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(database_->Mutex());
    auto stmt = Prepare(database_->Handle(), std::string(kProjectColumns) + "WHERE id = ?;");
    BindText(stmt, 1, project_id);
    if (!StepRow(database_->Handle(), stmt)) {
        throw NotFoundError("Project " + project_id + " not found");
    }
    return ReadProject(stmt.get());
}

std::vector<Project> SqliteProjectStorage::ListProjects(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(database_->Mutex());
    auto stmt = Prepare(database_->Handle(),
        std::string(kProjectColumns) + "WHERE owner_id = ? ORDER BY created_at ASC;");
    BindText(stmt, 1, owner_id);
    std::vector<Project> projects;
    while (StepRow(database_->Handle(), stmt)) {
        projects.push_back(ReadProject(stmt.get()));
    }
    return projects;
}

void SqliteProjectStorage::DeleteProject(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(database_->Mutex());
    auto* db = database_->Handle();
    auto stmt = Prepare(db, "DELETE FROM projects WHERE id = ?;");
    BindText(stmt, 1, project_id);
    StepWrite(db, std::move(stmt), "Project " + project_id);
    if (sqlite3_changes(db) == 0) {
        throw NotFoundError("Project " + project_id + " not found");
    }
}

SqliteFileStorage::SqliteFileStorage(std::shared_ptr<SqliteDatabase> database)
    : database_(std::move(database)) {}

File SqliteFileStorage::SaveFile(const File& file) {
    if (utils::Trim(file.path).empty()) {
        throw std::invalid_argument("Path cannot be empty");
    }
    std::lock_guard<std::mutex> lock(database_->Mutex());
    auto* db = database_->Handle();
    auto stmt = Prepare(db,
        "INSERT INTO files(id, project_id, path, content, created_at, updated_at) "
        "VALUES(?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET path=excluded.path, content=excluded.content, "
        "updated_at=excluded.updated_at;");
    BindText(stmt, 1, file.id);
    BindText(stmt, 2, file.project_id);
    BindText(stmt, 3, file.path);
    BindText(stmt, 4, file.content);
    BindText(stmt, 5, utils::FormatIsoUtc(file.created_at));
    BindText(stmt, 6, utils::FormatIsoUtc(file.updated_at));
    StepWrite(db, std::move(stmt), "File " + file.path);
    return file;
}

File SqliteFileStorage::GetFile(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(database_->Mutex());
    auto stmt = Prepare(database_->Handle(), std::string(kFileColumns) + "WHERE id = ?;");
    BindText(stmt, 1, file_id);
    if (!StepRow(database_->Handle(), stmt)) {
        throw NotFoundError("File " + file_id + " not found");
    }
    return ReadFile(stmt.get());
}

std::vector<File> SqliteFileStorage::ListFiles(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(database_->Mutex());
    auto stmt = Prepare(database_->Handle(),
        std::string(kFileColumns) + "WHERE project_id = ? ORDER BY path ASC;");
    BindText(stmt, 1, project_id);
    std::vector<File> files;
    while (StepRow(database_->Handle(), stmt)) {
        files.push_back(ReadFile(stmt.get()));
    }
    return files;
}

void SqliteFileStorage::DeleteFile(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(database_->Mutex());
    auto* db = database_->Handle();
    auto stmt = Prepare(db, "DELETE FROM files WHERE id = ?;");
    BindText(stmt, 1, file_id);
    StepWrite(db, std::move(stmt), "File " + file_id);
    if (sqlite3_changes(db) == 0) {
        throw NotFoundError("File " + file_id + " not found");
    }
}

}  // namespace codebox::storage
