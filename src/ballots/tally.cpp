#include "tally.h"
#include "../core/log.h"

#include <map>

namespace ballots {

core::Result<TallyResult> count_ballots(TallyCursor& cursor, const crypto::ElectionKeypair& keypair) {
    TallyResult result;

    std::map<std::string, size_t> index;
    for (const auto& option : cursor.options()) {
        index.emplace(option, result.counts.size());
        result.counts.emplace_back(option, 0);
    }

    cursor.restart();
    while (true) {
        auto ballot = cursor.next();
        if (!ballot) {
            return ballot.failure();
        }
        if (!*ballot) {
            break;
        }

        ++result.total;
        auto plaintext = keypair.open((*ballot)->encrypted_choice);
        if (!plaintext) {
            ++result.undecryptable;
            continue;
        }

        auto it = index.find(std::string(plaintext->begin(), plaintext->end()));
        if (it == index.end()) {
            ++result.invalid;
            continue;
        }
        ++result.counts[it->second].second;
    }

    core::get_logger("ballots")->info("counted {} ballots: {} invalid, {} undecryptable",
                                      result.total, result.invalid, result.undecryptable);
    return result;
}

} // namespace ballots
