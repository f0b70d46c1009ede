#include "specir/core/name_sanitizer.hpp"

#include "specir/core/schema_store.hpp"

#include <array>
#include <cctype>
#include <set>
#include <vector>

namespace specir::openapi {

namespace {

constexpr std::array<std::string_view, 35> kReservedWords = {
    "false",  "none",     "true",  "and",    "as",     "assert", "async", "await", "break",
    "class",  "continue", "def",   "del",    "elif",   "else",   "except", "finally", "for",
    "from",   "global",   "if",    "import", "in",     "is",     "lambda", "nonlocal", "not",
    "or",     "pass",     "raise", "return", "try",    "while",  "with",  "yield"};

bool is_alnum(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}
bool is_upper(char c) noexcept {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}
bool is_lower(char c) noexcept {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}
bool is_digit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string to_lower(std::string_view sv) {
    std::string out(sv);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Word split used for module names: acronym runs, Capitalized words, lowercase runs and digits.
std::vector<std::string_view> split_words(std::string_view raw) {
    std::vector<std::string_view> words;
    size_t i = 0;
    while (i < raw.size()) {
        char c = raw[i];
        if (is_upper(c)) {
            size_t j = i;
            while (j < raw.size() && is_upper(raw[j])) {
                ++j;
            }
            const bool lower_follows = j < raw.size() && is_lower(raw[j]);
            if (lower_follows && j - i > 1) {
                words.push_back(raw.substr(i, j - 1 - i));
                i = j - 1;
                continue;
            }
            if (lower_follows) {
                size_t k = j;
                while (k < raw.size() && is_lower(raw[k])) {
                    ++k;
                }
                words.push_back(raw.substr(i, k - i));
                i = k;
                continue;
            }
            words.push_back(raw.substr(i, j - i));
            i = j;
        } else if (is_lower(c)) {
            size_t j = i;
            while (j < raw.size() && is_lower(raw[j])) {
                ++j;
            }
            words.push_back(raw.substr(i, j - i));
            i = j;
        } else if (is_digit(c)) {
            size_t j = i;
            while (j < raw.size() && is_digit(raw[j])) {
                ++j;
            }
            words.push_back(raw.substr(i, j - i));
            i = j;
        } else {
            ++i;
        }
    }
    return words;
}

} // namespace

bool is_reserved_word(std::string_view word) noexcept {
    for (auto kw : kReservedWords) {
        if (kw == word) {
            return true;
        }
    }
    return false;
}

std::string capitalize_first(std::string_view word) {
    std::string out(word);
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

std::string sanitize_class_name(std::string_view raw) {
    std::string cls;
    cls.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size()) {
        if (!is_alnum(raw[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < raw.size() && is_alnum(raw[j])) {
            ++j;
        }
        cls += capitalize_first(raw.substr(i, j - i));
        i = j;
    }
    if (cls.empty()) {
        return "Model";
    }
    if (is_digit(cls.front())) {
        cls.insert(cls.begin(), '_');
    }
    if (is_reserved_word(to_lower(cls))) {
        cls += '_';
    }
    return cls;
}

std::string sanitize_module_name(std::string_view raw) {
    std::string module;
    for (auto word : split_words(raw)) {
        if (!module.empty()) {
            module += '_';
        }
        module += to_lower(word);
    }
    if (module.empty()) {
        return "model";
    }
    if (is_digit(module.front())) {
        module.insert(module.begin(), '_');
    }
    if (is_reserved_word(module)) {
        module += '_';
    }
    return module;
}

std::string sanitize_method_name(std::string_view raw) {
    std::string cleaned;
    cleaned.reserve(raw.size() + 8);
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '{' || c == '}') {
            continue;
        }
        if (is_upper(c) && !cleaned.empty()) {
            char prev = cleaned.back();
            const bool after_lower = is_lower(prev) || is_digit(prev);
            const bool acronym_end =
                is_upper(prev) && i + 1 < raw.size() && is_lower(raw[i + 1]);
            if (after_lower || acronym_end) {
                cleaned += '_';
            }
        }
        cleaned += is_alnum(c) ? c : '_';
    }
    std::string out;
    for (char c : cleaned) {
        if (c == '_' && (out.empty() || out.back() == '_')) {
            continue;
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    while (!out.empty() && out.back() == '_') {
        out.pop_back();
    }
    if (!out.empty() && is_digit(out.front())) {
        out.insert(out.begin(), '_');
    }
    if (is_reserved_word(out)) {
        out += '_';
    }
    return out;
}

std::string sanitize_identifier(std::string_view name) {
    std::string id;
    id.reserve(name.size() + 2);
    for (char c : name) {
        id.push_back(is_alnum(c) || c == '_' ? c : '_');
    }
    if (id.empty() || is_digit(id.front())) {
        id.insert(id.begin(), '_');
    }
    return id;
}

std::string to_snake_case(std::string_view id) {
    std::string out;
    out.reserve(id.size() + 4);
    for (char c : id) {
        if (is_upper(c) && !out.empty()) {
            out += '_';
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

void finalize_generation_names(schema_store& store) {
    std::set<std::string, std::less<>> used_names;
    std::set<std::string, std::less<>> used_stems;
    for (const auto& [name, s] : store) {
        if (s->generation_name) {
            used_names.insert(*s->generation_name);
        }
        if (s->final_module_stem) {
            used_stems.insert(*s->final_module_stem);
        }
    }

    auto unique_in = [](std::set<std::string, std::less<>>& used, const std::string& base) {
        std::string candidate = base;
        int idx = 1;
        while (used.contains(candidate)) {
            candidate = base + std::to_string(++idx);
        }
        used.insert(candidate);
        return candidate;
    };

    for (const auto& [name, s] : store) {
        if (s->generation_name) {
            continue;
        }
        std::string generation = unique_in(used_names, sanitize_class_name(name));
        std::string stem = unique_in(used_stems, sanitize_module_name(generation));
        s->assign_generation_name(std::move(generation), std::move(stem));
    }
}

} // namespace specir::openapi
