// ndflow kernel: bounded line copies over NDJSON streams
#pragma once

#include <cstddef>
#include <deque>
#include <istream>
#include <ostream>
#include <string>
#include <utility>

namespace nf {

// Copy `in` to `out` unchanged; returns the number of lines seen.
std::size_t copy_lines(std::istream& in, std::ostream& out);

// Copy at most `n` lines, then stop reading.
std::size_t head_lines(std::istream& in, std::ostream& out, std::size_t n);

// Consume `in` entirely and write its last `n` lines.
std::size_t tail_lines(std::istream& in, std::ostream& out, std::size_t n);

// Fixed-capacity ring of the most recent lines.
class LineRing {
public:
    explicit LineRing(std::size_t capacity) : capacity_(capacity) {}

    void push(std::string line) {
        if (capacity_ == 0) return;
        if (lines_.size() == capacity_) lines_.pop_front();
        lines_.push_back(std::move(line));
    }
    const std::deque<std::string>& lines() const { return lines_; }

private:
    std::size_t capacity_;
    std::deque<std::string> lines_;
};

}  // namespace nf
