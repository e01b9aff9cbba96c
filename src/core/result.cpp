#include "result.h"

namespace core {

const char* error_to_string(Error error) {
    switch (error) {
        case Error::InvalidToken: return "Invalid token";
        case Error::Expired: return "Token expired";
        case Error::AlreadyUsed: return "Token already used";
        case Error::AlreadyVoted: return "Already voted";
        case Error::ChainBroken: return "Audit chain broken";
        case Error::StorageUnavailable: return "Storage unavailable";
        case Error::ElectionNotFound: return "Election not found";
        case Error::ElectionNotOpen: return "Election is not open";
        case Error::ElectionNotClosed: return "Election is not closed";
        case Error::InvalidArgument: return "Invalid argument";
        default: return "Unknown error";
    }
}

} // namespace core
