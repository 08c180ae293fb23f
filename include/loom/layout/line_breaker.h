#pragma once
#include <memory>
#include <string_view>
#include <vector>

namespace loom::layout {

struct BreakOpportunity {
    size_t offset;   // byte offset into the UTF-8 text; a line may end here
    bool mandatory;  // hard break (line feed, paragraph separator, ...)
};

// UAX #14 line break opportunities from ICU's line BreakIterator. Latin text
// gets opportunities after spaces, CJK between ideographs. Not thread-safe:
// each layout pass owns its own instance.
class LineBreaker {
public:
    LineBreaker();
    ~LineBreaker();

    LineBreaker(const LineBreaker&) = delete;
    LineBreaker& operator=(const LineBreaker&) = delete;

    // Opportunities in increasing offset order. The end of the text is always
    // the last entry; offset 0 never appears.
    std::vector<BreakOpportunity> opportunities(std::string_view utf8);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace loom::layout
