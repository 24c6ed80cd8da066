#include <algorithm>
#include <runlib/config_file.hh>
#include <runlib/file_contents.hh>

using std::string;
using std::string_view;

namespace {

constexpr bool is_space(char c) noexcept {
    return (c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\v' or c == '\f');
}

constexpr bool is_cntrl(char c) noexcept {
    auto uc = static_cast<unsigned char>(c);
    return (uc < 32 or uc == 127);
}

constexpr bool is_xdigit(char c) noexcept {
    return ((c >= '0' and c <= '9') or (c >= 'a' and c <= 'f') or (c >= 'A' and c <= 'F'));
}

constexpr int hex2dec(char c) noexcept {
    return (c < 'A' ? c - '0' : 10 + c - (c >= 'a' ? 'a' : 'A'));
}

// Checks whether character is one of these [a-zA-Z0-9\-_.]
constexpr bool is_name(char c) noexcept {
    return ((c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
            c == '-' or c == '_' or c == '.');
}

} // namespace

void ConfigFile::load_config_from_file(FilePath pathname, bool load_all) {
    load_config_from_string(get_file_contents(pathname), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    for (auto& [name, var] : vars_) {
        var.unset();
    }

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    // Checks whether c is a white-space but not a newline
    auto is_ws = [](char c) { return (c != '\n' and is_space(c)); };
    auto skip_ws = [&] {
        while (is_ws(config[pos])) {
            ++pos;
        }
    };
    auto skip_comment = [&] {
        while (config[pos] != '\n') {
            ++pos;
        }
    };

    auto throw_parse_error = [&](auto&&... args) {
        auto line_beg = config.rfind('\n', pos == 0 ? 0 : pos - 1);
        line_beg = (line_beg == string::npos or pos == 0 ? 0 : line_beg + 1);
        auto line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        throw ParseError(line, pos - line_beg + 1, args...);
    };

    auto extract_value = [&](bool is_in_array) {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            while (config[++pos] != '\n') {
                if (config[pos] == '\'') {
                    if (config[pos + 1] != '\'') { // Safe, newline is at the end of every line
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            while (config[++pos] != '\n') {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }
                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '?': res += '?'; continue;
                case '\\': res += '\\'; continue;
                case '0': res += '\0'; continue;
                case 't': res += '\t'; continue;
                case 'a': res += '\a'; continue;
                case 'b': res += '\b'; continue;
                case 'f': res += '\f'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'v': res += '\v'; continue;
                case 'x':
                    // pos will not go out of the buffer (guard = newline)
                    if (not is_xdigit(config[++pos])) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    if (not is_xdigit(config[++pos])) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    res += static_cast<char>(
                        (hex2dec(config[pos - 1]) << 4) + hex2dec(config[pos])
                    );
                    continue;
                default: throw_parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // String literal
        if (config[pos] == '[' or (is_in_array and (config[pos] == ',' or config[pos] == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", config[pos], '`');
        }

        size_t end = pos + 1;
        while (config[end] != '\n' and config[end] != '#' and
               (not is_in_array or (config[end] != ']' and config[end] != ',')))
        {
            ++end;
        }
        // Remove white-spaces from ending
        while (is_space(config[end - 1])) {
            --end;
        }
        res = config.substr(pos, end - pos);
        pos = end;
        return res;
    };

    Variable ignored;
    while (pos < config.size()) {
        skip_ws();
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        if (config[pos] == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        // Variable name
        size_t name_beg = pos;
        while (is_name(config[pos])) {
            ++pos;
        }
        if (pos == name_beg) {
            throw_parse_error("Invalid or missing variable's name");
        }
        auto name = string_view{config}.substr(name_beg, pos - name_beg);

        // Assignment operator
        skip_ws();
        if (config[pos] == '\n' or config[pos] == '#') {
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[pos], '`');
        }
        ++pos;
        skip_ws();

        // Value
        Variable* varp = &ignored;
        if (load_all) {
            varp = &vars_[string{name}];
        } else if (auto it = vars_.find(name); it != vars_.end()) {
            varp = &it->second;
        }
        Variable& var = *varp;
        var.unset();
        var.flag_ = Variable::SET;

        if (config[pos] != '[') {
            if (config[pos] != '\n' and config[pos] != '#') {
                var.str_ = extract_value(false);
            }
        } else {
            var.flag_ |= Variable::ARRAY;
            ++pos; // Skip [
            for (;;) {
                while (pos < config.size() and is_space(config[pos])) {
                    ++pos;
                }
                if (pos == config.size()) {
                    --pos; // Point at the last newline
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[pos] == ',') {
                    ++pos;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip_ws();
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                    continue;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }
                throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
            }
        }

        // After the value
        skip_ws();
        if (config[pos] == '#') {
            skip_comment();
        }
        if (config[pos] != '\n') {
            throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
        }
        ++pos;
    }
}

bool ConfigFile::is_string_literal(string_view str) noexcept {
    if (str.empty()) {
        return false;
    }

    // Special check on the first and last character
    if (str[0] == '[' or str[0] == '\'' or str[0] == '"' or is_space(str[0]) or
        is_space(str.back()))
    {
        return false;
    }

    return std::none_of(str.begin(), str.end(), [](char c) {
        return (c == '\n' or c == ']' or c == ',' or c == '#');
    });
}

string ConfigFile::escape_to_single_quoted_string(string_view str) {
    string res{'\''};
    res.reserve(str.size() + 2);
    for (char c : str) {
        res += c;
        if (c == '\'') {
            res += '\'';
        }
    }
    return (res += '\'');
}

string ConfigFile::escape_to_double_quoted_string(string_view str) {
    string res{'"'};
    res.reserve(str.size() + 2);
    for (char c : str) {
        switch (c) {
        case '\\': res += "\\\\"; break;
        case '\0': res += "\\0"; break;
        case '"': res += "\\\""; break;
        case '\a': res += "\\a"; break;
        case '\b': res += "\\b"; break;
        case '\f': res += "\\f"; break;
        case '\n': res += "\\n"; break;
        case '\r': res += "\\r"; break;
        case '\t': res += "\\t"; break;
        case '\v': res += "\\v"; break;
        default:
            if (is_cntrl(c)) {
                res += "\\x";
                res += dec2hex(static_cast<unsigned char>(c) >> 4);
                res += dec2hex(static_cast<unsigned char>(c) & 15);
            } else {
                res += c;
            }
        }
    }
    return (res += '"');
}

string ConfigFile::escape_string(string_view str) {
    if (std::any_of(str.begin(), str.end(), [](char c) { return (c == '\'' or is_cntrl(c)); })) {
        return escape_to_double_quoted_string(str);
    }

    if (is_string_literal(str)) {
        return string{str};
    }

    return escape_to_single_quoted_string(str);
}
