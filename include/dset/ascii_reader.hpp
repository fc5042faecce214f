#pragma once

#include <cctype>
#include <cstdlib>
#include <istream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace dset {

// =============================================================================
// ASCII Reader - key-based lookup, missing fields return false
// =============================================================================
//
// Fields are located by name within the enclosing group, so their order in
// the text does not matter. Lines starting with '#' are comments. Braces
// inside quoted strings are not structural.
//
// =============================================================================

class ascii_reader {
public:
    explicit ascii_reader(std::istream& is) : is_(is) {}

    // --- Name context ---

    void begin_named(const char* name) {
        pending_name_ = name;
    }

    // --- Scalars (return false if field missing) ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    auto read(T& value) -> bool {
        if (!locate_value()) return false;
        value = read_number<T>();
        return true;
    }

    auto read(std::string& value) -> bool {
        if (pending_name_) {
            if (!locate_value()) return false;
        } else {
            skip_ws();
            if (peek() != '"') return false;
        }
        value = read_quoted_string();
        return true;
    }

    // --- Arrays ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    auto read(std::vector<T>& value) -> bool {
        if (!locate_value()) return false;
        expect('[');
        value.clear();
        skip_ws();
        if (peek() != ']') {
            while (true) {
                value.push_back(read_number<T>());
                skip_ws();
                if (peek() == ',') { get(); continue; }
                if (peek() == ']') break;
                throw std::runtime_error("expected ',' or ']'");
            }
        }
        expect(']');
        return true;
    }

    // --- Groups ---

    auto begin_group() -> bool {
        if (pending_name_) {
            if (!seek_field(pending_name_)) {
                pending_name_ = nullptr;
                return false;
            }
            pending_name_ = nullptr;
        } else {
            skip_ws();
            if (peek() != '{') return false;
        }
        expect('{');
        group_stack_.push_back(is_.tellg());
        return true;
    }

    void end_group() {
        skip_to_group_end();
        expect('}');
        if (!group_stack_.empty()) {
            group_stack_.pop_back();
        }
    }

    auto begin_list() -> bool { return begin_group(); }
    void end_list() { end_group(); }

    // --- Query ---

    auto has_field(const char* name) -> bool {
        auto pos = is_.tellg();
        bool found = seek_field(name);
        is_.clear();
        is_.seekg(pos);
        return found;
    }

    auto count_items(const char* name) -> std::size_t {
        auto pos = is_.tellg();
        if (!seek_field(name)) {
            is_.clear();
            is_.seekg(pos);
            return 0;
        }
        expect('{');

        std::size_t count = 0;
        int depth = 0;
        while (is_) {
            skip_ws();
            char c = peek();
            if (c == '{') {
                get();
                if (depth == 0) count++;
                depth++;
            } else if (c == '}') {
                if (depth == 0) break;
                get();
                depth--;
            } else if (c == '"') {
                read_quoted_string();
            } else if (c == std::char_traits<char>::eof()) {
                break;
            } else {
                get();
            }
        }
        is_.clear();
        is_.seekg(pos);
        return count;
    }

private:
    std::istream& is_;
    std::vector<std::streampos> group_stack_;
    const char* pending_name_ = nullptr;

    auto peek() -> char { return static_cast<char>(is_.peek()); }
    auto get() -> char { return static_cast<char>(is_.get()); }

    // Position the stream after "name =" if a name is pending
    auto locate_value() -> bool {
        if (pending_name_) {
            if (!seek_field(pending_name_)) {
                pending_name_ = nullptr;
                return false;
            }
            pending_name_ = nullptr;
            expect('=');
        }
        return true;
    }

    void skip_ws() {
        while (is_) {
            while (is_ && std::isspace(static_cast<unsigned char>(peek()))) get();
            if (peek() == '#') {
                while (is_ && get() != '\n') {}
            } else {
                break;
            }
        }
    }

    void expect(char c) {
        skip_ws();
        if (get() != c) {
            throw std::runtime_error(std::string("expected '") + c + "'");
        }
    }

    auto read_identifier() -> std::string {
        std::string s;
        while (is_ && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
            s += get();
        }
        return s;
    }

    template<typename T>
    auto read_number() -> T {
        skip_ws();
        std::string token;
        while (is_) {
            char c = peek();
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+') {
                token += get();
            } else {
                break;
            }
        }
        if (token.empty()) {
            throw std::runtime_error("expected a number");
        }
        if constexpr (std::is_floating_point_v<T>) {
            char* end = nullptr;
            T value;
            if constexpr (std::is_same_v<T, float>) {
                value = std::strtof(token.c_str(), &end);
            } else if constexpr (std::is_same_v<T, double>) {
                value = std::strtod(token.c_str(), &end);
            } else {
                value = std::strtold(token.c_str(), &end);
            }
            if (end != token.c_str() + token.size()) {
                throw std::runtime_error("failed to parse number: " + token);
            }
            return value;
        } else {
            // Widen so that single-byte integers are not read as characters
            using wide_t = std::conditional_t<std::is_signed_v<T>, long long, unsigned long long>;
            wide_t value;
            std::istringstream iss(token);
            iss >> value;
            if (iss.fail() || !iss.eof()) {
                throw std::runtime_error("failed to parse number: " + token);
            }
            return static_cast<T>(value);
        }
    }

    auto read_quoted_string() -> std::string {
        skip_ws();
        expect('"');
        std::string result;
        while (is_) {
            char c = get();
            if (c == '"') break;
            if (c == '\\') {
                char next = get();
                switch (next) {
                    case '\\': result += '\\'; break;
                    case '"':  result += '"'; break;
                    case 'n':  result += '\n'; break;
                    case 't':  result += '\t'; break;
                    case 'r':  result += '\r'; break;
                    default:   result += next; break;
                }
            } else {
                result += c;
            }
        }
        if (!is_) {
            throw std::runtime_error("unterminated string");
        }
        return result;
    }

    // Seek to a field by name within the current group
    auto seek_field(const char* name) -> bool {
        auto start = group_stack_.empty() ? std::streampos(0) : group_stack_.back();
        is_.clear();
        is_.seekg(start);

        int depth = 0;
        while (is_) {
            skip_ws();
            char c = peek();

            if (c == '}') {
                if (depth == 0) return false;
                get();
                depth--;
            } else if (c == '{') {
                get();
                depth++;
            } else if (c == '"') {
                read_quoted_string();
            } else if (c == std::char_traits<char>::eof()) {
                return false;
            } else if (depth == 0 && (std::isalpha(static_cast<unsigned char>(c)) || c == '_')) {
                auto id = read_identifier();
                if (id == name) {
                    skip_ws();
                    return true;
                }
                skip_field_value();
            } else {
                get();
            }
        }
        return false;
    }

    void skip_field_value() {
        skip_ws();
        char c = peek();
        if (c == '=') {
            get();
            skip_ws();
            c = peek();
            if (c == '"') {
                read_quoted_string();
            } else if (c == '[') {
                skip_bracketed();
            } else {
                while (is_ && !std::isspace(static_cast<unsigned char>(peek())) && peek() != '}' && peek() != '{') {
                    get();
                }
            }
        } else if (c == '{') {
            skip_braced();
        }
    }

    void skip_bracketed() {
        expect('[');
        int depth = 1;
        while (is_ && depth > 0) {
            char c = get();
            if (c == '[') depth++;
            else if (c == ']') depth--;
        }
    }

    void skip_braced() {
        expect('{');
        int depth = 1;
        while (is_ && depth > 0) {
            skip_ws();
            if (peek() == '"') {
                read_quoted_string();
                continue;
            }
            char c = get();
            if (c == '{') depth++;
            else if (c == '}') depth--;
        }
    }

    void skip_to_group_end() {
        int depth = 0;
        while (is_) {
            skip_ws();
            char c = peek();
            if (c == '{') {
                get();
                depth++;
            } else if (c == '}') {
                if (depth == 0) return;
                get();
                depth--;
            } else if (c == '"') {
                read_quoted_string();
            } else if (c == std::char_traits<char>::eof()) {
                return;
            } else {
                get();
            }
        }
    }
};

} // namespace dset
