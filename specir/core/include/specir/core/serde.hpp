#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace specir::serde {

inline std::string_view trim_view(std::string_view sv) noexcept {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

struct json_cursor {
    const char* ptr;
    const char* end;
    const char* start;

    json_cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}

    bool eof() const noexcept { return ptr >= end; }

    size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    void skip_ws() noexcept {
        while (!eof() && std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
    }

    char peek() noexcept {
        skip_ws();
        return eof() ? '\0' : *ptr;
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool consume_literal(std::string_view lit) noexcept {
        skip_ws();
        if (static_cast<size_t>(end - ptr) < lit.size() ||
            std::string_view(ptr, lit.size()) != lit) {
            return false;
        }
        ptr += lit.size();
        return true;
    }

    // Returns the raw (still escaped) contents between the quotes.
    std::optional<std::string_view> string() noexcept {
        skip_ws();
        if (eof() || *ptr != '\"') {
            return std::nullopt;
        }
        ++ptr;
        const char* str_start = ptr;
        while (!eof() && *ptr != '\"') {
            if (*ptr == '\\' && (ptr + 1) < end) {
                ptr += 2;
                continue;
            }
            ++ptr;
        }
        if (eof()) {
            return std::nullopt;
        }
        const char* stop = ptr;
        ++ptr;
        return std::string_view(str_start, static_cast<size_t>(stop - str_start));
    }

    bool try_object_start() noexcept { return consume('{'); }
    bool try_object_end() noexcept { return consume('}'); }
    bool try_array_start() noexcept { return consume('['); }
    bool try_array_end() noexcept { return consume(']'); }
    bool try_comma() noexcept { return consume(','); }
};

inline void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::string unescape_json_string(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\' || i + 1 >= raw.size()) {
            out.push_back(c);
            continue;
        }
        char e = raw[++i];
        switch (e) {
        case 'n':
            out.push_back('\n');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'u': {
            if (i + 4 >= raw.size()) {
                out.push_back('u');
                break;
            }
            unsigned cp = 0;
            bool ok = true;
            for (size_t k = 1; k <= 4; ++k) {
                char h = raw[i + k];
                cp <<= 4;
                if (h >= '0' && h <= '9') {
                    cp |= static_cast<unsigned>(h - '0');
                } else if (h >= 'a' && h <= 'f') {
                    cp |= static_cast<unsigned>(h - 'a' + 10);
                } else if (h >= 'A' && h <= 'F') {
                    cp |= static_cast<unsigned>(h - 'A' + 10);
                } else {
                    ok = false;
                }
            }
            if (!ok) {
                out.push_back('u');
                break;
            }
            i += 4;
            append_utf8(out, cp);
            break;
        }
        default:
            out.push_back(e);
            break;
        }
    }
    return out;
}

inline bool is_bool_literal(std::string_view sv) noexcept {
    return sv == "true" || sv == "false";
}
inline bool is_null_literal(std::string_view sv) noexcept {
    return sv == "null" || sv == "~";
}

inline bool is_number_literal(std::string_view sv) noexcept {
    if (sv.empty()) {
        return false;
    }
    size_t i = 0;
    if (sv[i] == '-' || sv[i] == '+') {
        ++i;
    }
    bool digits = false;
    bool dot = false;
    bool exp = false;
    for (; i < sv.size(); ++i) {
        char c = sv[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits = true;
        } else if (c == '.' && !dot && !exp) {
            dot = true;
        } else if ((c == 'e' || c == 'E') && digits && !exp) {
            exp = true;
            digits = false;
            if (i + 1 < sv.size() && (sv[i + 1] == '-' || sv[i + 1] == '+')) {
                ++i;
            }
        } else {
            return false;
        }
    }
    // Leading zeros ("007") are YAML strings, not numbers.
    std::string_view body = (sv.front() == '-' || sv.front() == '+') ? sv.substr(1) : sv;
    if (body.size() > 1 && body[0] == '0' && std::isdigit(static_cast<unsigned char>(body[1]))) {
        return false;
    }
    return digits;
}

struct yaml_node {
    enum class kind { scalar, object, array };

    kind k{kind::scalar};
    std::string scalar;
    bool quoted = false;
    std::vector<std::pair<std::string, std::unique_ptr<yaml_node>>> object;
    std::vector<std::unique_ptr<yaml_node>> array;

    static yaml_node scalar_node(std::string value, bool is_quoted = false) {
        yaml_node n;
        n.k = kind::scalar;
        n.scalar = std::move(value);
        n.quoted = is_quoted;
        return n;
    }

    static yaml_node object_node() {
        yaml_node n;
        n.k = kind::object;
        return n;
    }

    static yaml_node array_node() {
        yaml_node n;
        n.k = kind::array;
        return n;
    }
};

inline std::string escape_json_string(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

inline void emit_json(const yaml_node& n, std::string& out);

inline void emit_scalar(const yaml_node& n, std::string& out) {
    std::string_view sv = trim_view(n.scalar);
    if (!n.quoted) {
        if (is_bool_literal(sv)) {
            out.append(sv);
            return;
        }
        if (is_null_literal(sv)) {
            out.append("null");
            return;
        }
        if (is_number_literal(sv)) {
            if (sv.front() == '+') {
                sv.remove_prefix(1);
            }
            out.append(sv);
            return;
        }
    }
    out.push_back('\"');
    out.append(escape_json_string(sv));
    out.push_back('\"');
}

inline void emit_json(const yaml_node& n, std::string& out) {
    switch (n.k) {
    case yaml_node::kind::scalar:
        emit_scalar(n, out);
        break;
    case yaml_node::kind::object: {
        out.push_back('{');
        for (size_t i = 0; i < n.object.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            const auto& kv = n.object[i];
            out.push_back('\"');
            out.append(escape_json_string(kv.first));
            out.push_back('\"');
            out.push_back(':');
            emit_json(*kv.second, out);
        }
        out.push_back('}');
        break;
    }
    case yaml_node::kind::array: {
        out.push_back('[');
        for (size_t i = 0; i < n.array.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            emit_json(*n.array[i], out);
        }
        out.push_back(']');
        break;
    }
    }
}

struct yaml_diagnostic {
    size_t line = 0;
    std::string message;
};

inline void set_yaml_error(yaml_diagnostic* diag, size_t line, std::string_view message) {
    if (!diag || !diag->message.empty()) {
        return;
    }
    diag->line = line;
    diag->message.assign(message.begin(), message.end());
}

// Mirrors the JSON decoder's nesting limit.
inline constexpr int kMaxYamlDepth = 512;

struct yaml_line {
    int indent;
    std::string_view content;
    size_t number;
};

inline std::vector<yaml_line> tokenize_yaml(std::string_view text) {
    std::vector<yaml_line> lines;
    size_t pos = 0;
    size_t number = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;
        ++number;
        if (line.empty()) {
            continue;
        }
        int indent = 0;
        for (char c : line) {
            if (c == ' ') {
                ++indent;
            } else {
                break;
            }
        }
        std::string_view content = trim_view(line.substr(static_cast<size_t>(indent)));
        if (content.empty() || content.front() == '#' || content == "---") {
            continue;
        }
        lines.push_back({indent, content, number});
    }
    return lines;
}

inline bool is_quoted(std::string_view sv) noexcept {
    return sv.size() >= 2 && ((sv.front() == '\"' && sv.back() == '\"') ||
                              (sv.front() == '\'' && sv.back() == '\''));
}

inline std::string unquote(std::string_view sv) {
    sv = trim_view(sv);
    if (!is_quoted(sv)) {
        return std::string(sv);
    }
    if (sv.front() == '\"') {
        return unescape_json_string(sv.substr(1, sv.size() - 2));
    }
    std::string out;
    auto inner = sv.substr(1, sv.size() - 2);
    for (size_t i = 0; i < inner.size(); ++i) {
        out.push_back(inner[i]);
        if (inner[i] == '\'' && i + 1 < inner.size() && inner[i + 1] == '\'') {
            ++i;
        }
    }
    return out;
}

inline yaml_node make_scalar(std::string_view raw) {
    auto trimmed = trim_view(raw);
    if (is_quoted(trimmed)) {
        return yaml_node::scalar_node(unquote(trimmed), true);
    }
    return yaml_node::scalar_node(std::string(trimmed));
}

// Finds the key/value separator of a mapping line, ignoring colons inside quotes.
inline size_t find_mapping_colon(std::string_view content) noexcept {
    bool in_single = false;
    bool in_double = false;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (c == ':' && !in_single && !in_double &&
                   (i + 1 == content.size() || content[i + 1] == ' ')) {
            return i;
        }
    }
    return std::string_view::npos;
}

inline std::vector<std::string_view> split_top_level(std::string_view input,
                                                     char delimiter = ',') noexcept {
    std::vector<std::string_view> parts;
    size_t start = 0;
    int depth = 0;
    bool in_single = false;
    bool in_double = false;

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '\'' && !in_double) {
            in_single = !in_single;
        } else if (c == '\"' && !in_single) {
            in_double = !in_double;
        } else if (!in_single && !in_double) {
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
            } else if (c == delimiter && depth == 0) {
                parts.push_back(trim_view(input.substr(start, i - start)));
                start = i + 1;
            }
        }
    }

    auto tail = trim_view(input.substr(start));
    if (!tail.empty()) {
        parts.push_back(tail);
    }
    return parts;
}

inline yaml_node parse_yaml_block(const std::vector<yaml_line>& lines,
                                  size_t& idx,
                                  int indent,
                                  yaml_diagnostic* diag,
                                  int depth);

inline yaml_node
parse_inline_map(std::string_view value, yaml_diagnostic* diag, size_t line_no, int depth);
inline yaml_node
parse_inline_sequence(std::string_view value, yaml_diagnostic* diag, size_t line_no, int depth);

inline yaml_node
parse_inline_value(std::string_view value, yaml_diagnostic* diag, size_t line_no, int depth) {
    auto trimmed = trim_view(value);
    if (trimmed.empty()) {
        return yaml_node::scalar_node("");
    }
    const bool is_map = trimmed.front() == '{' && trimmed.back() == '}';
    const bool is_sequence = trimmed.front() == '[' && trimmed.back() == ']';
    if ((is_map || is_sequence) && depth >= kMaxYamlDepth) {
        set_yaml_error(diag, line_no, "nesting too deep");
        return yaml_node::scalar_node("null");
    }
    if (is_map) {
        return parse_inline_map(trimmed, diag, line_no, depth + 1);
    }
    if (is_sequence) {
        return parse_inline_sequence(trimmed, diag, line_no, depth + 1);
    }
    return make_scalar(trimmed);
}

inline yaml_node
parse_inline_map(std::string_view value, yaml_diagnostic* diag, size_t line_no, int depth) {
    yaml_node obj = yaml_node::object_node();
    auto inner = trim_view(value.substr(1, value.size() - 2));
    std::unordered_set<std::string> seen;
    for (auto part : split_top_level(inner)) {
        if (part.empty()) {
            continue;
        }
        auto colon = find_mapping_colon(part);
        if (colon == std::string_view::npos) {
            colon = part.find(':');
        }
        if (colon == std::string_view::npos) {
            set_yaml_error(diag, line_no, "expected 'key: value' in inline map");
            continue;
        }
        auto key = unquote(part.substr(0, colon));
        auto val = trim_view(part.substr(colon + 1));
        if (seen.contains(key)) {
            set_yaml_error(diag, line_no, std::string("duplicate key '") + key + "' in inline map");
            continue;
        }
        seen.insert(key);
        obj.object.emplace_back(
            std::move(key), std::make_unique<yaml_node>(parse_inline_value(val, diag, line_no, depth)));
    }
    return obj;
}

inline yaml_node
parse_inline_sequence(std::string_view value, yaml_diagnostic* diag, size_t line_no, int depth) {
    yaml_node arr = yaml_node::array_node();
    auto inner = trim_view(value.substr(1, value.size() - 2));
    for (auto part : split_top_level(inner)) {
        if (part.empty()) {
            continue;
        }
        arr.array.push_back(
            std::make_unique<yaml_node>(parse_inline_value(part, diag, line_no, depth)));
    }
    return arr;
}

inline bool is_block_scalar_indicator(std::string_view value) noexcept {
    return value == "|" || value == ">" || value == "|-" || value == ">-" || value == "|+" ||
           value == ">+";
}

// Collects the more-indented lines following a '|' or '>' indicator.
inline yaml_node parse_block_scalar(std::string_view indicator,
                                    const std::vector<yaml_line>& lines,
                                    size_t& idx,
                                    int indent) {
    const bool folded = indicator.front() == '>';
    std::string text;
    while (idx < lines.size() && lines[idx].indent > indent) {
        if (!text.empty()) {
            text.push_back(folded ? ' ' : '\n');
        }
        text.append(lines[idx].content);
        ++idx;
    }
    return yaml_node::scalar_node(std::move(text), true);
}

inline yaml_node parse_yaml_value(std::string_view value,
                                  const std::vector<yaml_line>& lines,
                                  size_t& idx,
                                  int indent,
                                  yaml_diagnostic* diag,
                                  size_t line_no,
                                  int depth) {
    auto trimmed_val = trim_view(value);
    if (trimmed_val.empty()) {
        if (idx < lines.size() && lines[idx].indent > indent) {
            return parse_yaml_block(lines, idx, lines[idx].indent, diag, depth + 1);
        }
        // "key: -" style sequences may sit at the same indent as the key.
        if (idx < lines.size() && lines[idx].indent == indent &&
            lines[idx].content.starts_with("- ")) {
            return parse_yaml_block(lines, idx, indent, diag, depth + 1);
        }
        return yaml_node::scalar_node("null");
    }
    if (is_block_scalar_indicator(trimmed_val)) {
        return parse_block_scalar(trimmed_val, lines, idx, indent);
    }
    if ((trimmed_val.front() == '{' && trimmed_val.back() == '}') ||
        (trimmed_val.front() == '[' && trimmed_val.back() == ']')) {
        return parse_inline_value(trimmed_val, diag, line_no, depth);
    }
    return make_scalar(trimmed_val);
}

inline yaml_node parse_yaml_block(const std::vector<yaml_line>& lines,
                                  size_t& idx,
                                  int indent,
                                  yaml_diagnostic* diag,
                                  int depth) {
    if (depth > kMaxYamlDepth) {
        set_yaml_error(diag, idx < lines.size() ? lines[idx].number : 0, "nesting too deep");
        while (idx < lines.size() && lines[idx].indent >= indent) {
            ++idx;
        }
        return yaml_node::scalar_node("null");
    }
    yaml_node node = yaml_node::object_node();
    std::unordered_set<std::string> seen_keys;
    bool started = false;

    while (idx < lines.size()) {
        const auto& ln = lines[idx];
        if (ln.indent < indent) {
            break;
        }
        if (ln.indent > indent) {
            ++idx;
            continue;
        }

        std::string_view content = ln.content;
        const bool is_item = content == "-" || content.starts_with("- ");
        if (started && is_item != (node.k == yaml_node::kind::array)) {
            // A sibling key after a sequence that shares its parent's indent.
            break;
        }
        started = true;

        if (is_item) {
            node.k = yaml_node::kind::array;
            std::string_view item = content.size() > 1 ? trim_view(content.substr(2)) : "";
            size_t line_no = ln.number;
            ++idx;

            if (item.empty()) {
                if (idx < lines.size() && lines[idx].indent > indent) {
                    node.array.push_back(std::make_unique<yaml_node>(
                        parse_yaml_block(lines, idx, lines[idx].indent, diag, depth + 1)));
                } else {
                    node.array.push_back(
                        std::make_unique<yaml_node>(yaml_node::scalar_node("null")));
                }
                continue;
            }

            auto colon_pos = find_mapping_colon(item);
            if (colon_pos != std::string_view::npos && item.front() != '{' &&
                item.front() != '[') {
                // The item's keys continue at the column after "- ".
                const int item_indent = indent + 2;
                std::string key = unquote(item.substr(0, colon_pos));
                std::string_view val = trim_view(item.substr(colon_pos + 1));
                yaml_node obj = yaml_node::object_node();
                yaml_node parsed_val =
                    parse_yaml_value(val, lines, idx, item_indent, diag, line_no, depth + 1);
                obj.object.emplace_back(std::move(key),
                                        std::make_unique<yaml_node>(std::move(parsed_val)));
                if (idx < lines.size() && lines[idx].indent > indent) {
                    yaml_node extra =
                        parse_yaml_block(lines, idx, lines[idx].indent, diag, depth + 1);
                    if (extra.k == yaml_node::kind::object) {
                        for (auto& kv : extra.object) {
                            obj.object.emplace_back(std::move(kv.first), std::move(kv.second));
                        }
                    }
                }
                node.array.push_back(std::make_unique<yaml_node>(std::move(obj)));
            } else {
                node.array.push_back(
                    std::make_unique<yaml_node>(parse_inline_value(item, diag, line_no, depth)));
            }
        } else {
            auto colon_pos = find_mapping_colon(content);
            if (colon_pos == std::string_view::npos) {
                set_yaml_error(diag, ln.number, "expected 'key: value'");
                ++idx;
                continue;
            }
            std::string key = unquote(content.substr(0, colon_pos));
            std::string_view val = trim_view(content.substr(colon_pos + 1));
            size_t line_no = ln.number;
            ++idx;

            yaml_node child = parse_yaml_value(val, lines, idx, indent, diag, line_no, depth);
            if (seen_keys.contains(key)) {
                set_yaml_error(diag, line_no, std::string("duplicate key '") + key + "'");
                continue;
            }
            seen_keys.insert(key);
            node.object.emplace_back(std::move(key), std::make_unique<yaml_node>(std::move(child)));
        }
    }

    return node;
}

inline std::optional<std::string> yaml_to_json(std::string_view text,
                                               std::string* error = nullptr) {
    auto lines = tokenize_yaml(text);
    if (lines.empty()) {
        return std::nullopt;
    }
    size_t idx = 0;
    yaml_diagnostic diag;
    yaml_node root = parse_yaml_block(lines, idx, lines.front().indent, &diag, 0);
    if (diag.message.empty() && idx < lines.size()) {
        set_yaml_error(&diag, lines[idx].number, "content after document root");
    }
    if (!diag.message.empty()) {
        if (error) {
            *error = "line " + std::to_string(diag.line == 0 ? 1 : diag.line) + ": " + diag.message;
        }
        return std::nullopt;
    }
    std::string out;
    emit_json(root, out);
    return out;
}

} // namespace specir::serde
