#ifndef HOTSTRING_PRIORITY_H
#define HOTSTRING_PRIORITY_H

#include <hotstring/rule.h>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace hotstring {

// Collects rule pairs that only the abbreviation text and rule id could
// order. Each pair is reported once.
class ConflictLog {
public:
    void report(const Rule& winner, const Rule& loser);

    const std::vector<std::string>& messages() const { return messages_; }
    bool empty() const { return messages_.empty(); }
    void clear();

private:
    std::set<std::pair<size_t, size_t>> seen_;
    std::vector<std::string> messages_;
};

// The preferred of two candidates; either may be null
const Rule* bestOf(const Rule* current, const Rule* candidate, ConflictLog* conflicts);

// The preferred rule of a list, or null when it is empty
const Rule* bestOf(const std::vector<const Rule*>& candidates, ConflictLog* conflicts);

} // namespace hotstring

#endif // HOTSTRING_PRIORITY_H
