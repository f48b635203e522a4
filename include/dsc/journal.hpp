#ifndef DSC_JOURNAL_HPP
#define DSC_JOURNAL_HPP

#include <functional>
#include <string>
#include <vector>

namespace dsc {

// =============================================================================
// Journal - Per-Operation Undo Log
// =============================================================================

// Ledger writes record the value they overwrote; successful collaborator calls
// record a compensating call. revert() replays entries newest-first.
class Journal {
public:
    using Undo = std::function<void()>;
    using Compensation = std::function<bool()>;

    Journal() = default;

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    void record(Undo undo);
    void compensate(std::string what, Compensation call);

    // Discard all entries; changes become permanent
    void commit();

    // Undo everything recorded since construction or the last commit.
    // Returns the number of compensations that failed.
    size_t revert();

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        Undo undo;
        std::string what;
        Compensation compensation;
    };
    std::vector<Entry> entries_;
};

} // namespace dsc

#endif // DSC_JOURNAL_HPP
