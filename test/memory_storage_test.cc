#include <gtest/gtest.h>

#include <future>

#include "storage/memory_storage.hpp"
#include "storage_contract.hpp"

using codebox::storage::MemoryFileStorage;
using codebox::storage::MemoryProjectStorage;

// NOLINTNEXTLINE
TEST(memory_storage, project_contract) {
    MemoryProjectStorage projects;
    codebox::test::CheckProjectContract(projects);
}

// NOLINTNEXTLINE
TEST(memory_storage, file_contract) {
    MemoryFileStorage files;
    codebox::test::CheckFileContract(files);
}

// NOLINTNEXTLINE
TEST(memory_storage, same_path_in_other_project) {
    MemoryFileStorage files;
    files.SaveFile(codebox::test::MakeFile("p1", "main.py", "a"));
    EXPECT_NO_THROW(files.SaveFile(codebox::test::MakeFile("p2", "main.py", "b")));
    EXPECT_EQ(files.ListFiles("p2").at(0).content, "b");
}

// NOLINTNEXTLINE
TEST(memory_storage, concurrent_saves) {
    MemoryFileStorage files;
    std::vector<std::future<void>> writers;
    for (int i = 0; i < 8; ++i) {
        writers.push_back(std::async(std::launch::async, [&files, i]() {
            for (int j = 0; j < 25; ++j) {
                files.SaveFile(codebox::test::MakeFile(
                    "p1", "f" + std::to_string(i) + "_" + std::to_string(j) + ".py", "x"));
            }
        }));
    }
    for (auto& writer : writers) {
        writer.get();
    }
    EXPECT_EQ(files.ListFiles("p1").size(), 200u);
}
