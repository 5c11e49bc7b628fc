#pragma once

#include <cstddef>
#include <string>

namespace translate
{

/// UTF-8 to UTF-32 conversion; stops at the first invalid sequence
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// Number of codepoints in a UTF-8 string (invalid bytes count as one each)
std::size_t utf8Length(const std::string& utf8_str);

/// True for empty strings and strings made only of Unicode whitespace
bool isBlank(const std::string& utf8_str);

/// First max_chars codepoints followed by "..." when truncated, for log lines
std::string excerpt(const std::string& utf8_str, std::size_t max_chars = 50);

} // namespace translate
