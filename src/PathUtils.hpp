#ifndef PATH_UTILS_HPP
#define PATH_UTILS_HPP

#include <string>
#include <vector>

// Decomposed view of one archive path. Directories carry no extension.
struct PathParts {
    std::string parentPath; // includes the trailing '/', empty for top-level entries
    std::string baseName;   // last segment without any trailing '/'
    std::string stem;
    std::string extension;  // includes the leading '.', empty when absent
};

// Convert every '\' into '/'.
std::string normalizeSeparators(std::string path);

// Split a path at its last '/'. A trailing '/' on directories is dropped first.
PathParts decomposePath(const std::string& path, bool isDirectory);

// Split a file name into stem and extension at the last '.', ignoring a dot at position 0.
void splitStem(const std::string& baseName, std::string& stem, std::string& extension);

// Non-empty segments of a '/'-separated path.
std::vector<std::string> pathSegments(const std::string& path);

// Rebuild a path from its segments, dropping empty, "." and ".." segments.
std::string sanitizePath(const std::string& path);

// Normalize an extension filter (trim whitespace, enforce dot prefix, lower-case).
std::string normalizeExtension(std::string extension);

// Unicode-aware case mapping of UTF-8 text (root locale).
std::string toLowerUtf8(const std::string& text);
std::string toUpperUtf8(const std::string& text);

#endif
