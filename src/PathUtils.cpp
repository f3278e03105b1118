#include "PathUtils.hpp"

#include <algorithm>
#include <cctype>

#include <unicode/locid.h>
#include <unicode/unistr.h>

#include "Utf8.hpp"

std::string normalizeSeparators(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

void splitStem(const std::string& baseName, std::string& stem, std::string& extension) {
    const std::size_t lastDot = baseName.rfind('.');
    // A leading dot marks a hidden name, not an extension.
    if (lastDot == std::string::npos || lastDot == 0) {
        stem = baseName;
        extension.clear();
        return;
    }

    stem = baseName.substr(0, lastDot);
    extension = baseName.substr(lastDot);
}

PathParts decomposePath(const std::string& path, bool isDirectory) {
    std::string working = normalizeSeparators(path);
    if (isDirectory) {
        while (!working.empty() && working.back() == '/') {
            working.pop_back();
        }
    }

    PathParts parts;
    const std::size_t lastSlash = working.rfind('/');
    if (lastSlash == std::string::npos) {
        parts.baseName = working;
    } else {
        parts.parentPath = working.substr(0, lastSlash + 1);
        parts.baseName = working.substr(lastSlash + 1);
    }

    if (isDirectory) {
        parts.stem = parts.baseName;
    } else {
        splitStem(parts.baseName, parts.stem, parts.extension);
    }
    return parts;
}

std::vector<std::string> pathSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        if (slash > start) {
            segments.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return segments;
}

std::string sanitizePath(const std::string& path) {
    std::string result;
    for (const auto& segment : pathSegments(normalizeSeparators(path))) {
        if (segment == "." || segment == "..") {
            continue;
        }
        if (!result.empty()) {
            result += '/';
        }
        result += segment;
    }
    return result;
}

std::string normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    return toLowerUtf8(extension);
}

namespace {
std::string asciiCaseMap(std::string text, bool upper) {
    std::transform(text.begin(), text.end(), text.begin(), [upper](unsigned char ch) {
        return static_cast<char>(upper ? std::toupper(ch) : std::tolower(ch));
    });
    return text;
}
} // namespace

std::string toLowerUtf8(const std::string& text) {
    // ICU would turn malformed bytes into U+FFFD; keep them intact instead.
    if (!isValidUtf8(text)) {
        return asciiCaseMap(text, false);
    }

    std::string result;
    icu::UnicodeString::fromUTF8(text).toLower(icu::Locale::getRoot()).toUTF8String(result);
    return result;
}

std::string toUpperUtf8(const std::string& text) {
    if (!isValidUtf8(text)) {
        return asciiCaseMap(text, true);
    }

    std::string result;
    icu::UnicodeString::fromUTF8(text).toUpper(icu::Locale::getRoot()).toUTF8String(result);
    return result;
}
