#include "encoding.h"

namespace core {

ByteWriter& ByteWriter::write_u64(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        data_.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
    return *this;
}

ByteWriter& ByteWriter::write_string(const std::string& value) {
    write_u64(value.size());
    data_.insert(data_.end(), value.begin(), value.end());
    return *this;
}

ByteWriter& ByteWriter::write_bytes(std::span<const uint8_t> value) {
    write_u64(value.size());
    return write_raw(value);
}

ByteWriter& ByteWriter::write_raw(std::span<const uint8_t> value) {
    data_.insert(data_.end(), value.begin(), value.end());
    return *this;
}

std::optional<uint64_t> ByteReader::read_u64() {
    if (data_.size() - offset_ < 8) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data_[offset_ + i]) << (i * 8);
    }
    offset_ += 8;
    return value;
}

std::optional<std::string> ByteReader::read_string() {
    auto len = read_u64();
    if (!len || data_.size() - offset_ < *len) {
        return std::nullopt;
    }

    std::string result(reinterpret_cast<const char*>(data_.data() + offset_), *len);
    offset_ += *len;
    return result;
}

} // namespace core
