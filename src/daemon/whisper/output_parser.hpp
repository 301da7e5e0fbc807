#pragma once

#include <string>
#include <string_view>

namespace whisper {

// Plain text from whisper.cpp stdout: a leading "[...]" token (segment
// timestamps, [BLANK_AUDIO]) is stripped from every line, the rest joined
// with single spaces. Empty when nothing but markers was printed.
std::string parse_output(std::string_view output);

} // namespace whisper
