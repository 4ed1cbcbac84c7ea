#include "codegen/naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace schemaport::naming {

namespace {

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_word(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u < 0x80 && (std::isalnum(u) != 0 || c == '_');
}

// Each run of characters outside [A-Za-z0-9_] becomes one underscore
std::string identifier_chars(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    bool in_run = false;
    for (const char c : name) {
        if (is_word(c)) {
            out += c;
            in_run = false;
        } else if (!in_run) {
            out += '_';
            in_run = true;
        }
    }
    return out;
}

std::string lead_with_letter(std::string name) {
    if (!name.empty() && is_digit(name.front())) {
        name.insert(name.begin(), '_');
    }
    return name;
}

// Hard keywords only; soft keywords (match, case, type) are valid attribute names
constexpr std::array<std::string_view, 35> kKeywords = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield",
};

} // anonymous namespace

std::string snake_case(std::string_view raw) {
    const std::string cleaned = identifier_chars(raw);
    const std::string_view name = cleaned;
    std::string out;
    out.reserve(name.size() + 4);

    size_t i = 0;
    while (i < name.size()) {
        const char c = name[i];
        const bool has_next = i + 1 < name.size();
        if (has_next && (is_lower(c) || is_digit(c)) && is_upper(name[i + 1])) {
            out += c;
            out += '_';
            out += name[i + 1];
            i += 2;
        } else if (i + 2 < name.size() && is_upper(c) && is_upper(name[i + 1]) && is_lower(name[i + 2])) {
            out += c;
            out += '_';
            out += name[i + 1];
            out += name[i + 2];
            i += 3;
        } else {
            out += c;
            ++i;
        }
    }

    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lead_with_letter(std::move(out));
}

std::string pascal_case(std::string_view raw) {
    const std::string cleaned = identifier_chars(raw);
    const std::string_view name = cleaned;
    std::string out;
    out.reserve(name.size());

    size_t start = 0;
    while (start <= name.size()) {
        size_t end = name.find('_', start);
        if (end == std::string_view::npos) end = name.size();
        const auto word = name.substr(start, end - start);
        if (!word.empty()) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(word.front())));
            out.append(word.substr(1));
        }
        start = end + 1;
    }
    return lead_with_letter(std::move(out));
}

bool is_python_keyword(std::string_view name) {
    return std::find(kKeywords.begin(), kKeywords.end(), name) != kKeywords.end();
}

std::string attribute_name(std::string_view name) {
    std::string attr = snake_case(name);
    if (is_python_keyword(attr)) {
        attr += '_';
    }
    return attr;
}

std::string pluralize(std::string_view name) {
    std::string out(name);
    if (out.empty()) return out;

    const char last = static_cast<char>(std::tolower(static_cast<unsigned char>(out.back())));
    if (last == 's' || last == 'x' || last == 'z' || out.ends_with("ch") || out.ends_with("sh")) {
        out += "es";
    } else if (last == 'y' && out.size() > 1 &&
               std::string_view("aeiou").find(static_cast<char>(
                   std::tolower(static_cast<unsigned char>(out[out.size() - 2])))) == std::string_view::npos) {
        out.back() = 'i';
        out += "es";
    } else {
        out += 's';
    }
    return out;
}

} // namespace schemaport::naming
