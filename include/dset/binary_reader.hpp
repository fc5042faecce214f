#pragma once

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include "binary_writer.hpp"

namespace dset {

// =============================================================================
// Binary Reader - key-based lookup, missing fields return false
// =============================================================================
//
// Reads the format produced by binary_writer. Within a group, fields are
// found by scanning names, so their order does not matter; list items are
// consumed in sequence. Leaving a group or list positions the stream after
// its last entry regardless of which fields were read.
//
// =============================================================================

class binary_reader {
public:
    explicit binary_reader(std::istream& is, bool skip_header = false)
        : is_(is), header_read_(skip_header), base_position_(is.tellg()) {}

    // --- Name context ---

    void begin_named(const char* name) {
        pending_name_ = name;
    }

    // --- Scalars ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    auto read(T& value) -> bool {
        if (!locate_value()) return false;
        uint8_t type_tag = read_type_tag();
        if (type_tag == binary_format::TYPE_FLOAT64) {
            value = read_element<T>(binary_format::ELEM_FLOAT64);
        } else if (type_tag == binary_format::TYPE_INT32) {
            value = read_element<T>(binary_format::ELEM_INT32);
        } else if (type_tag == binary_format::TYPE_INT64) {
            value = read_element<T>(binary_format::ELEM_INT64);
        } else if (type_tag == binary_format::TYPE_FLOATX) {
            value = read_element<T>(binary_format::ELEM_FLOATX);
        } else {
            throw std::runtime_error("Expected scalar type");
        }
        return true;
    }

    auto read(std::string& value) -> bool {
        if (!locate_value()) return false;
        uint8_t type_tag = read_type_tag();
        if (type_tag != binary_format::TYPE_STRING) {
            throw std::runtime_error("Expected string type");
        }
        value = read_string_data();
        return true;
    }

    // --- Arrays ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    auto read(std::vector<T>& value) -> bool {
        if (!locate_value()) return false;
        uint8_t type_tag = read_type_tag();
        if (type_tag != binary_format::TYPE_ARRAY) {
            throw std::runtime_error("Expected array type");
        }
        uint8_t elem_tag = read_type_tag();
        uint64_t count;
        read_raw(count);
        value.resize(count);
        for (auto& elem : value) {
            elem = read_element<T>(elem_tag);
        }
        return true;
    }

    // --- Groups ---

    auto begin_group() -> bool {
        return begin_container(binary_format::TYPE_GROUP, false);
    }

    auto begin_list() -> bool {
        return begin_container(binary_format::TYPE_LIST, true);
    }

    void end_group() {
        if (group_stack_.empty()) {
            return;
        }
        auto info = group_stack_.back();
        group_stack_.pop_back();

        is_.clear();
        is_.seekg(info.start);
        for (uint64_t i = 0; i < info.count; ++i) {
            if (!info.is_list) {
                read_name();
            }
            skip_field_value(read_type_tag());
        }
    }

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
        uint8_t type_tag = read_type_tag();
        if (type_tag != binary_format::TYPE_LIST && type_tag != binary_format::TYPE_GROUP) {
            is_.seekg(pos);
            return 0;
        }
        uint64_t count;
        read_raw(count);
        is_.seekg(pos);
        return static_cast<std::size_t>(count);
    }

private:
    std::istream& is_;
    const char* pending_name_ = nullptr;

    struct group_info_t {
        std::streampos start;
        uint64_t count;
        uint64_t remaining;
        bool is_list;
    };
    std::vector<group_info_t> group_stack_;
    bool header_read_ = false;
    std::streampos base_position_ = 0;

    // Seek a pending name, or take the next item of the enclosing list
    auto locate_value() -> bool {
        if (pending_name_) {
            auto found = seek_field(pending_name_);
            pending_name_ = nullptr;
            return found;
        }
        if (!group_stack_.empty() && group_stack_.back().is_list) {
            if (group_stack_.back().remaining == 0) {
                return false;
            }
            group_stack_.back().remaining--;
        } else if (group_stack_.empty()) {
            ensure_header();
        }
        return true;
    }

    auto begin_container(uint8_t expected_tag, bool is_list) -> bool {
        auto pos = is_.tellg();
        auto in_list = !pending_name_ && !group_stack_.empty() && group_stack_.back().is_list;
        if (!locate_value()) return false;

        uint8_t type_tag = read_type_tag();
        if (type_tag != expected_tag) {
            if (in_list) {
                group_stack_.back().remaining++;
            }
            is_.seekg(pos);
            return false;
        }
        uint64_t count;
        read_raw(count);
        group_stack_.push_back({is_.tellg(), count, count, is_list});
        return true;
    }

    void ensure_header() {
        if (header_read_) return;
        is_.seekg(base_position_);
        char magic[sizeof(binary_format::MAGIC)];
        is_.read(magic, sizeof(magic));
        if (!is_ || std::string_view(magic, sizeof(magic)) != std::string_view(binary_format::MAGIC, sizeof(magic))) {
            throw std::runtime_error("Invalid binary archive: bad magic number");
        }
        uint8_t version;
        read_raw(version);
        if (version != binary_format::VERSION) {
            throw std::runtime_error("Unsupported binary archive version: " + std::to_string(version));
        }
        header_read_ = true;
    }

    auto read_type_tag() -> uint8_t {
        uint8_t tag;
        read_raw(tag);
        return tag;
    }

    auto read_name() -> std::string {
        return read_string_data();
    }

    auto read_string_data() -> std::string {
        uint64_t length;
        read_raw(length);
        std::string value(length, '\0');
        if (length > 0) {
            is_.read(value.data(), static_cast<std::streamsize>(length));
            if (!is_) {
                throw std::runtime_error("Failed to read string data");
            }
        }
        return value;
    }

    template<typename T>
    void read_raw(T& value) {
        is_.read(reinterpret_cast<char*>(&value), sizeof(T));
        if (!is_) {
            throw std::runtime_error("Failed to read data from binary archive");
        }
    }

    template<typename T>
    auto read_element(uint8_t elem_tag) -> T {
        if (elem_tag == binary_format::ELEM_FLOAT64) {
            double v;
            read_raw(v);
            return static_cast<T>(v);
        } else if (elem_tag == binary_format::ELEM_INT32) {
            int32_t v;
            read_raw(v);
            return static_cast<T>(v);
        } else if (elem_tag == binary_format::ELEM_INT64) {
            int64_t v;
            read_raw(v);
            return static_cast<T>(v);
        } else if (elem_tag == binary_format::ELEM_FLOATX) {
            long double v;
            read_raw(v);
            return static_cast<T>(v);
        }
        throw std::runtime_error("Unknown element type tag");
    }

    void skip_field_value(uint8_t type_tag) {
        if (type_tag == binary_format::TYPE_FLOAT64 || type_tag == binary_format::TYPE_INT64) {
            is_.seekg(8, std::ios::cur);
        } else if (type_tag == binary_format::TYPE_INT32) {
            is_.seekg(4, std::ios::cur);
        } else if (type_tag == binary_format::TYPE_FLOATX) {
            is_.seekg(sizeof(long double), std::ios::cur);
        } else if (type_tag == binary_format::TYPE_STRING) {
            uint64_t len;
            read_raw(len);
            is_.seekg(static_cast<std::streamoff>(len), std::ios::cur);
        } else if (type_tag == binary_format::TYPE_ARRAY) {
            uint8_t elem_tag;
            read_raw(elem_tag);
            uint64_t count;
            read_raw(count);
            auto elem_size = binary_format::element_size(elem_tag);
            is_.seekg(static_cast<std::streamoff>(count * elem_size), std::ios::cur);
        } else if (type_tag == binary_format::TYPE_GROUP) {
            uint64_t field_count;
            read_raw(field_count);
            for (uint64_t i = 0; i < field_count; ++i) {
                read_name();
                skip_field_value(read_type_tag());
            }
        } else if (type_tag == binary_format::TYPE_LIST) {
            uint64_t item_count;
            read_raw(item_count);
            for (uint64_t i = 0; i < item_count; ++i) {
                skip_field_value(read_type_tag());
            }
        } else {
            throw std::runtime_error("Unknown type tag in binary archive");
        }
    }

    // Seek to a field by name within the current group
    auto seek_field(const char* name) -> bool {
        ensure_header();

        // A list has no named entries
        if (!group_stack_.empty() && group_stack_.back().is_list) {
            return false;
        }

        auto start = group_stack_.empty()
            ? base_position_ + std::streamoff(sizeof(binary_format::MAGIC) + sizeof(binary_format::VERSION))
            : group_stack_.back().start;
        is_.clear();
        is_.seekg(start);

        if (group_stack_.empty()) {
            // Root level: scan named fields until the end of the stream
            while (is_.peek() != std::char_traits<char>::eof()) {
                if (read_name() == name) return true;
                skip_field_value(read_type_tag());
            }
            is_.clear();
            return false;
        }

        for (uint64_t i = 0; i < group_stack_.back().count; ++i) {
            if (read_name() == name) return true;
            skip_field_value(read_type_tag());
        }
        return false;
    }
};

} // namespace dset
