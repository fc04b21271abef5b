#ifndef HOTSTRING_COUNTER_H
#define HOTSTRING_COUNTER_H

#include <cstdint>

namespace hotstring {

// Issues dense ids starting at 1
class Counter {
public:
    Counter() : last_(0) {}

    uint32_t next() { return ++last_; }
    uint32_t last() const { return last_; }

private:
    uint32_t last_;
};

} // namespace hotstring

#endif // HOTSTRING_COUNTER_H
