#include <modgraph/support/key_writer.h>
#include <limits>
#include <stdexcept>

namespace modgraph::support {

void KeyWriter::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void KeyWriter::write_u32(uint32_t value) {
    buffer_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void KeyWriter::write_bool(bool value) {
    write_u8(value ? 1 : 0);
}

void KeyWriter::write_string(std::string_view str) {
    if (str.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("KeyWriter: string too long for a cache key");
    }
    write_u32(static_cast<uint32_t>(str.size()));
    const auto* bytes = reinterpret_cast<const uint8_t*>(str.data());
    buffer_.insert(buffer_.end(), bytes, bytes + str.size());
}

void KeyWriter::write_strings(const std::vector<std::string>& values) {
    write_u32(static_cast<uint32_t>(values.size()));
    for (const auto& value : values) {
        write_string(value);
    }
}

void KeyWriter::write_absent() {
    write_u8(0);
}

void KeyWriter::write_present() {
    write_u8(1);
}

std::string_view KeyWriter::view() const {
    return std::string_view(reinterpret_cast<const char*>(buffer_.data()), buffer_.size());
}

} // namespace modgraph::support
