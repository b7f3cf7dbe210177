#include "skip_stack.hpp"

#include <stdexcept>
#include <string>
#include <utility>

void SkipStack::push(int depth, SkipConnection skip) {
    if (popped_ != 0 || depth != pushed_ || depth >= kPoolDepth) {
        throw std::logic_error(
            "Skip push at depth " + std::to_string(depth) + " out of order (expected " +
            std::to_string(pushed_) + ")");
    }
    slots_[depth] = std::move(skip);
    ++pushed_;
}

SkipConnection const& SkipStack::pop(int depth) {
    int const expected = pushed_ - 1 - popped_;
    if (expected < 0 || depth != expected) {
        throw std::logic_error(
            "Skip pop at depth " + std::to_string(depth) + " out of order (expected " +
            std::to_string(expected) + ")");
    }
    ++popped_;
    return slots_[depth];
}
