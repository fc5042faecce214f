#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dset {

// =============================================================================
// Binary Format Type Tags
// =============================================================================

namespace binary_format {
    // Leading bytes of every archive, independent of host byte order
    constexpr char MAGIC[4] = {'D', 'S', 'E', 'T'};
    constexpr uint8_t VERSION = 1;

    // Type tags
    constexpr uint8_t TYPE_INT32   = 0x01;
    constexpr uint8_t TYPE_INT64   = 0x02;
    constexpr uint8_t TYPE_FLOAT64 = 0x03;
    constexpr uint8_t TYPE_STRING  = 0x04;
    constexpr uint8_t TYPE_ARRAY   = 0x05;
    constexpr uint8_t TYPE_GROUP   = 0x06;
    constexpr uint8_t TYPE_LIST    = 0x07;
    constexpr uint8_t TYPE_FLOATX  = 0x08;

    // Element type tags for arrays
    constexpr uint8_t ELEM_INT32   = 0x01;
    constexpr uint8_t ELEM_INT64   = 0x02;
    constexpr uint8_t ELEM_FLOAT64 = 0x03;
    constexpr uint8_t ELEM_FLOATX  = 0x04;   // long double, sizeof(long double) raw bytes

    template<typename T>
    constexpr uint8_t element_type_tag() {
        if constexpr (std::is_same_v<T, long double>) {
            return ELEM_FLOATX;
        } else if constexpr (std::is_floating_point_v<T>) {
            return ELEM_FLOAT64;
        } else if constexpr (sizeof(T) < 4 || (sizeof(T) == 4 && std::is_signed_v<T>)) {
            return ELEM_INT32;
        } else {
            return ELEM_INT64;
        }
    }

    // Size in bytes of one array element with the given tag
    constexpr auto element_size(uint8_t elem_tag) -> std::size_t {
        switch (elem_tag) {
            case ELEM_INT32: return 4;
            case ELEM_FLOATX: return sizeof(long double);
            default: return 8;
        }
    }

    // Whether a byte string starts with the archive header
    inline auto has_magic(std::string_view bytes) -> bool {
        return bytes.size() >= sizeof(MAGIC) + sizeof(VERSION)
            && bytes.substr(0, sizeof(MAGIC)) == std::string_view(MAGIC, sizeof(MAGIC));
    }
}

// =============================================================================
// Binary Writer (Self-Describing Format)
// =============================================================================
//
// Binary format specification:
// - Header: the four bytes "DSET" + uint8 version
// - Field name: uint64 length prefix + UTF-8 bytes
// - Scalars: name + type tag (1 byte) + value (as int32/int64/float64)
// - Strings: name + type tag + uint64 length + UTF-8 bytes
// - Arrays: name + type tag + element type tag + uint64 count + elements
// - Groups: name + type tag + uint64 field count + fields
// - Lists: name + type tag + uint64 item count + items (anonymous values)
//
// Values are widened to the 32 or 64 bit tag that holds them exactly;
// unsigned 32 bit integers travel as int64. long double has its own tag and
// is stored in the host's native representation.
// Multi-byte values are written in host byte order.
//
// =============================================================================

class binary_writer {
public:
    explicit binary_writer(std::ostream& os, bool skip_header = false)
        : os_(os), header_written_(skip_header) {}

    // --- Name context ---

    void begin_named(const char* name) {
        pending_name_ = name;
    }

    // --- Scalars ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    void write(const T& value) {
        ensure_header();
        write_pending_name();
        write_type_tag(scalar_tag(binary_format::element_type_tag<T>()));
        write_element(value);
    }

    // --- Strings ---

    void write(const std::string& value) {
        ensure_header();
        write_pending_name();
        write_type_tag(binary_format::TYPE_STRING);

        uint64_t length = value.size();
        write_raw(length);
        if (length > 0) {
            os_.write(value.data(), static_cast<std::streamsize>(length));
        }
    }

    void write(const char* value) {
        write(std::string(value));
    }

    // --- Arrays ---

    template<typename T>
        requires std::is_arithmetic_v<T>
    void write(const std::vector<T>& value) {
        ensure_header();
        write_pending_name();
        write_type_tag(binary_format::TYPE_ARRAY);
        write_type_tag(binary_format::element_type_tag<T>());

        uint64_t count = value.size();
        write_raw(count);

        for (const auto& elem : value) {
            write_element(elem);
        }
    }

    // --- Groups and lists ---

    void begin_group() {
        begin_container(binary_format::TYPE_GROUP);
    }

    void begin_list() {
        begin_container(binary_format::TYPE_LIST);
    }

    void end_list() {
        end_group();
    }

    void end_group() {
        if (group_positions_.empty()) {
            return;
        }

        std::streampos pos = group_positions_.back();
        group_positions_.pop_back();

        uint64_t count = field_counts_.back();
        field_counts_.pop_back();

        // Backfill the count
        std::streampos current_pos = os_.tellp();
        os_.seekp(pos);
        write_raw(count);
        os_.seekp(current_pos);
    }

private:
    std::ostream& os_;
    bool header_written_;
    std::vector<std::streampos> group_positions_;
    std::vector<uint64_t> field_counts_;
    const char* pending_name_ = nullptr;

    static constexpr auto scalar_tag(uint8_t elem_tag) -> uint8_t {
        switch (elem_tag) {
            case binary_format::ELEM_INT32: return binary_format::TYPE_INT32;
            case binary_format::ELEM_INT64: return binary_format::TYPE_INT64;
            case binary_format::ELEM_FLOATX: return binary_format::TYPE_FLOATX;
            default: return binary_format::TYPE_FLOAT64;
        }
    }

    void begin_container(uint8_t tag) {
        ensure_header();
        write_pending_name();
        write_type_tag(tag);

        // Save position for count backfill
        group_positions_.push_back(os_.tellp());
        uint64_t placeholder = 0;
        write_raw(placeholder);
        field_counts_.push_back(0);
    }

    void ensure_header() {
        if (!header_written_) {
            os_.write(binary_format::MAGIC, sizeof(binary_format::MAGIC));
            write_raw(binary_format::VERSION);
            header_written_ = true;
        }
    }

    // Named fields and anonymous list items both count toward the parent
    void write_pending_name() {
        if (pending_name_) {
            write_name(pending_name_);
            pending_name_ = nullptr;
        }
        if (!field_counts_.empty()) {
            field_counts_.back()++;
        }
    }

    void write_name(const char* name) {
        uint64_t length = std::strlen(name);
        write_raw(length);
        if (length > 0) {
            os_.write(name, static_cast<std::streamsize>(length));
        }
    }

    void write_type_tag(uint8_t tag) {
        write_raw(tag);
    }

    template<typename T>
    void write_raw(const T& value) {
        os_.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    template<typename T>
    void write_element(const T& value) {
        constexpr auto tag = binary_format::element_type_tag<T>();
        if constexpr (tag == binary_format::ELEM_FLOATX) {
            long double v = value;
            write_raw(v);
        } else if constexpr (tag == binary_format::ELEM_FLOAT64) {
            double v = static_cast<double>(value);
            write_raw(v);
        } else if constexpr (tag == binary_format::ELEM_INT32) {
            int32_t v = static_cast<int32_t>(value);
            write_raw(v);
        } else {
            int64_t v = static_cast<int64_t>(value);
            write_raw(v);
        }
    }
};

} // namespace dset
