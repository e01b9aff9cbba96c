#include "grants.h"

#include <sqlite3.h>

#include <cstring>

namespace storage {

Grants& Grants::allow(const std::string& table, Access access) {
    auto& granted = tables_[table];
    granted = granted | access;
    return *this;
}

bool Grants::permits(const std::string& table, Access access) const {
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return false;
    }
    return has_access(it->second, access);
}

int authorize(void* user_data, int action, const char* arg1, const char* /*arg2*/,
              const char* /*database*/, const char* trigger_or_view) {
    const auto* grants = static_cast<const Grants*>(user_data);

    auto table_check = [&](Access access) {
        if (arg1 == nullptr) {
            return SQLITE_DENY;
        }
        // SQLite's own bookkeeping tables
        if (std::strncmp(arg1, "sqlite_", 7) == 0 && access == Access::Read) {
            return SQLITE_OK;
        }
        return grants->permits(arg1, access) ? SQLITE_OK : SQLITE_DENY;
    };

    switch (action) {
        case SQLITE_READ:
            // Column reads inside schema-defined triggers (OLD./NEW. guards)
            if (trigger_or_view != nullptr) {
                return SQLITE_OK;
            }
            return table_check(Access::Read);
        case SQLITE_INSERT:
            return table_check(Access::Insert);
        case SQLITE_UPDATE:
            return table_check(Access::Update);
        case SQLITE_DELETE:
            return table_check(Access::Delete);
        case SQLITE_SELECT:
        case SQLITE_FUNCTION:
        case SQLITE_TRANSACTION:
        case SQLITE_SAVEPOINT:
            return SQLITE_OK;
        default:
            // DDL, ATTACH/DETACH, PRAGMA and everything else
            return SQLITE_DENY;
    }
}

} // namespace storage
