#include "Utf8.hpp"

#include <vector>

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/ustring.h>

bool isValidUtf8(const std::string& text) {
    if (text.empty()) {
        return true;
    }

    // UTF-16 never needs more code units than the UTF-8 source has bytes.
    std::vector<UChar> buffer(text.size());
    int32_t length = 0;
    UErrorCode status = U_ZERO_ERROR;
    u_strFromUTF8(buffer.data(), static_cast<int32_t>(buffer.size()), &length, text.data(),
                  static_cast<int32_t>(text.size()), &status);
    return U_SUCCESS(status);
}

namespace {
bool normalizeWith(const icu::Normalizer2* normalizer, UErrorCode status, const std::string& text, std::string& out) {
    if (U_FAILURE(status) || normalizer == nullptr || !isValidUtf8(text)) {
        return false;
    }

    const icu::UnicodeString normalized = normalizer->normalize(icu::UnicodeString::fromUTF8(text), status);
    if (U_FAILURE(status)) {
        return false;
    }

    out.clear();
    normalized.toUTF8String(out);
    return true;
}
} // namespace

bool toNfc(const std::string& text, std::string& out) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFCInstance(status);
    return normalizeWith(normalizer, status, text, out);
}

bool toNfd(const std::string& text, std::string& out) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFDInstance(status);
    return normalizeWith(normalizer, status, text, out);
}
