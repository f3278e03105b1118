#ifndef UTF8_HPP
#define UTF8_HPP

#include <string>

// True when the bytes decode as well-formed UTF-8.
bool isValidUtf8(const std::string& text);

// Normalization forms of UTF-8 text. Both return false when the input is not valid UTF-8
// or the normalizer reports an error.
bool toNfc(const std::string& text, std::string& out);
bool toNfd(const std::string& text, std::string& out);

#endif
