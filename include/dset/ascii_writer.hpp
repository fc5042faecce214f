#pragma once

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace dset {

// =============================================================================
// ASCII Writer - writes key-based format
// =============================================================================
//
//   name = 1.5
//   label = "energy"
//   range = [0.0, 0.5, 1.0]
//   group {
//       ...
//   }
//
// Floating point values carry enough digits to read back bit-exact; nan and
// infinities are spelled out.
//
// =============================================================================

class ascii_writer {
public:
    explicit ascii_writer(std::ostream& os, int indent_size = 4)
        : os_(os), indent_size_(indent_size), indent_level_(0) {}

    // --- Name context ---

    void begin_named(const char* name) {
        pending_name_ = name;
    }

    // --- Scalars ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    void write(const T& value) {
        write_prefix(" = ");
        os_ << format_value(value) << "\n";
    }

    void write(const std::string& value) {
        write_prefix(" = ");
        os_ << "\"" << escape(value) << "\"\n";
    }

    void write(const char* value) {
        write(std::string(value));
    }

    // --- Arrays ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    void write(const std::vector<T>& value) {
        write_prefix(" = ");
        os_ << "[";
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (i > 0) os_ << ", ";
            os_ << format_value(value[i]);
        }
        os_ << "]\n";
    }

    // --- Groups ---

    void begin_group() {
        write_prefix(" ");
        os_ << "{\n";
        indent_level_++;
    }

    void end_group() {
        indent_level_--;
        write_indent();
        os_ << "}\n";
    }

    void begin_list() { begin_group(); }
    void end_list() { end_group(); }

private:
    std::ostream& os_;
    int indent_size_;
    int indent_level_;
    const char* pending_name_ = nullptr;

    void write_indent() {
        for (int i = 0; i < indent_level_ * indent_size_; ++i) {
            os_ << ' ';
        }
    }

    void write_prefix(const char* separator) {
        write_indent();
        if (pending_name_) {
            os_ << pending_name_ << separator;
            pending_name_ = nullptr;
        }
    }

    template<typename T>
    static auto format_value(const T& value) -> std::string {
        if constexpr (std::is_floating_point_v<T>) {
            if (std::isnan(value)) return "nan";
            if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<T>::max_digits10) << value;
            auto s = oss.str();
            if (s.find('.') == std::string::npos && s.find('e') == std::string::npos) {
                s += ".0";
            }
            return s;
        } else if constexpr (std::is_same_v<T, bool>) {
            return value ? "1" : "0";
        } else {
            return std::to_string(value);
        }
    }

    static auto escape(const std::string& s) -> std::string {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '\\': result += "\\\\"; break;
                case '"':  result += "\\\""; break;
                case '\n': result += "\\n"; break;
                case '\t': result += "\\t"; break;
                case '\r': result += "\\r"; break;
                default:   result += c; break;
            }
        }
        return result;
    }
};

} // namespace dset
