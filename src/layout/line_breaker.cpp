#include <loom/layout/line_breaker.h>
#include <stdexcept>
#include <string>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/ubrk.h>
#include <unicode/utext.h>

namespace loom::layout {

struct LineBreaker::Impl {
    std::unique_ptr<icu::BreakIterator> iterator;
};

LineBreaker::LineBreaker() : impl_(std::make_unique<Impl>()) {
    UErrorCode status = U_ZERO_ERROR;
    impl_->iterator.reset(icu::BreakIterator::createLineInstance(icu::Locale::getRoot(), status));
    if (U_FAILURE(status) || !impl_->iterator) {
        throw std::runtime_error(std::string("ICU line break iterator unavailable: ") +
                                 u_errorName(status));
    }
}

LineBreaker::~LineBreaker() = default;

std::vector<BreakOpportunity> LineBreaker::opportunities(std::string_view utf8) {
    std::vector<BreakOpportunity> result;
    if (utf8.empty()) {
        return result;
    }

    UErrorCode status = U_ZERO_ERROR;
    UText utext = UTEXT_INITIALIZER;
    utext_openUTF8(&utext, utf8.data(), static_cast<int64_t>(utf8.size()), &status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("utext_openUTF8 failed: ") + u_errorName(status));
    }

    auto& iterator = *impl_->iterator;
    // The iterator keeps its own shallow clone of the UText; the bytes must
    // outlive the loop below, the UText itself does not.
    iterator.setText(&utext, status);
    utext_close(&utext);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("BreakIterator::setText failed: ") + u_errorName(status));
    }

    // With UTF-8 UText the iterator reports native (byte) indices.
    for (int32_t boundary = iterator.next(); boundary != icu::BreakIterator::DONE;
         boundary = iterator.next()) {
        int32_t status_tag = iterator.getRuleStatus();
        bool hard = status_tag >= UBRK_LINE_HARD && status_tag < UBRK_LINE_HARD_LIMIT;
        result.push_back({static_cast<size_t>(boundary), hard});
    }

    if (result.empty() || result.back().offset != utf8.size()) {
        result.push_back({utf8.size(), false});
    }
    return result;
}

} // namespace loom::layout
