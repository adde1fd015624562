#include "storage/storage_types.hpp"

#include <stdexcept>

namespace codebox::storage {

std::string LanguageToString(Language language) {
    switch (language) {
        case Language::Python:
            return "python";
        case Language::JavaScript:
            return "javascript";
        case Language::Ruby:
            return "ruby";
    }
    return "python";
}

Language LanguageFromString(const std::string& value) {
    if (value == "python") {
        return Language::Python;
    }
    if (value == "javascript") {
        return Language::JavaScript;
    }
    if (value == "ruby") {
        return Language::Ruby;
    }
    throw std::invalid_argument("Unsupported language: " + value);
}

}  // namespace codebox::storage
