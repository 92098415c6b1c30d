#pragma once

#include <optional>
#include <string>

namespace codeexec::session {

// Closed set: adding a language means adding an enumerator and its executor.
enum class Language {
    kPython,
    kBash
};

inline const char* ToString(Language language) {
    switch (language) {
        case Language::kPython: return "python";
        case Language::kBash: return "bash";
    }
    return "python";
}

inline std::optional<Language> ParseLanguage(const std::string& name) {
    if (name == "python") {
        return Language::kPython;
    }
    if (name == "bash") {
        return Language::kBash;
    }
    return std::nullopt;
}

struct SessionInfo {
    std::string id;
    Language language = Language::kPython;
    std::string created_at;
};

}  // namespace codeexec::session
