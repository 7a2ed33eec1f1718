#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace modgraph::support {

// Canonical byte encoding of modgraph values for cache keys.
// Integers are big-endian; strings and sequences are length-prefixed, so two
// encodings are equal only if the encoded values are equal.
class KeyWriter {
public:
    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_bool(bool value);
    void write_string(std::string_view str);
    void write_strings(const std::vector<std::string>& values);
    // Marks an absent optional value; a present one is written as 1 + value.
    void write_absent();
    void write_present();

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::string_view view() const;
    size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

} // namespace modgraph::support
