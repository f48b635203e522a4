// =============================================================================
// journal.cpp - Undo Log
// =============================================================================

#include "dsc/journal.hpp"
#include "dsc/log.hpp"

#include <exception>

namespace dsc {

void Journal::record(Undo undo) {
    entries_.push_back(Entry{std::move(undo), std::string(), Compensation()});
}

void Journal::compensate(std::string what, Compensation call) {
    entries_.push_back(Entry{Undo(), std::move(what), std::move(call)});
}

void Journal::commit() {
    entries_.clear();
}

size_t Journal::revert() {
    size_t failed = 0;

    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->undo) {
            it->undo();
            continue;
        }

        // A compensation that throws must not stop the remaining ledger undos
        bool ok = false;
        try {
            ok = it->compensation();
        } catch (const std::exception& e) {
            log::logger()->critical("compensation '{}' threw: {}", it->what, e.what());
        }
        if (!ok) {
            ++failed;
            log::logger()->critical("compensation '{}' failed; collaborator state diverges from ledger",
                                    it->what);
        }
    }

    entries_.clear();
    return failed;
}

} // namespace dsc
