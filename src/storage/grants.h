#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace storage {

/**
 * Table-level permission bits
 */
enum class Access : uint8_t {
    None = 0,
    Read = 1 << 0,
    Insert = 1 << 1,
    Update = 1 << 2,
    Delete = 1 << 3
};

constexpr Access operator|(Access a, Access b) {
    return static_cast<Access>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr bool has_access(Access granted, Access wanted) {
    return (static_cast<uint8_t>(granted) & static_cast<uint8_t>(wanted)) != 0;
}

/**
 * Set of table permissions carried by one connection.
 *
 * Installed as the SQLite authorizer, so a statement that touches a table
 * outside the grant fails to prepare. This is the credential boundary
 * between components: the identity side has no grant to read ballot tokens
 * and the ballot side has no grant to read voters.
 */
class Grants {
public:
    explicit Grants(std::string profile_name) : profile_name_(std::move(profile_name)) {}

    Grants& allow(const std::string& table, Access access);

    [[nodiscard]] bool permits(const std::string& table, Access access) const;

    [[nodiscard]] const std::string& profile_name() const { return profile_name_; }

private:
    std::string profile_name_;
    std::map<std::string, Access> tables_;
};

/**
 * SQLite authorizer callback; user data must point at a Grants
 */
int authorize(void* user_data, int action, const char* arg1, const char* arg2,
              const char* database, const char* trigger_or_view);

} // namespace storage
