#pragma once

#include <optional>
#include <string>

#include "utils/common.hpp"

namespace codebox::storage {

enum class Language {
    Python,
    JavaScript,
    Ruby
};

std::string LanguageToString(Language language);

// Throws std::invalid_argument for names outside the fixed set.
Language LanguageFromString(const std::string& value);

struct Project {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    Language language = Language::Python;
    std::string owner_id;
    utils::TimePoint created_at{};
    utils::TimePoint updated_at{};
};

struct File {
    std::string id;
    std::string project_id;
    // Relative to the project root.
    std::string path;
    std::string content;
    utils::TimePoint created_at{};
    utils::TimePoint updated_at{};
};

}  // namespace codebox::storage
