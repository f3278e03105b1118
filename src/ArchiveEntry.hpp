#ifndef ARCHIVE_ENTRY_HPP
#define ARCHIVE_ENTRY_HPP

#include <cstdint>
#include <string>

// One listed item of an uploaded container. Directories carry a trailing '/'.
struct ArchiveEntry {
    std::string path;
    std::uint64_t size = 0;
    bool isDirectory = false;
};

#endif
