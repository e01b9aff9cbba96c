#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace core {

/**
 * Append-only little-endian byte encoder.
 * Strings and byte runs are length-prefixed so that concatenations
 * of different fields can never collide.
 */
class ByteWriter {
public:
    ByteWriter& write_u64(uint64_t value);
    ByteWriter& write_string(const std::string& value);
    ByteWriter& write_bytes(std::span<const uint8_t> value);

    /**
     * Raw bytes without a length prefix (fixed-size fields)
     */
    ByteWriter& write_raw(std::span<const uint8_t> value);

    [[nodiscard]] const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> take() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
};

/**
 * Reader for data produced by ByteWriter.
 * Every read returns nullopt on truncated input.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    std::optional<uint64_t> read_u64();
    std::optional<std::string> read_string();

    [[nodiscard]] bool at_end() const { return offset_ == data_.size(); }

private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
};

} // namespace core
