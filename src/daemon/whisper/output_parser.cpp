#include "output_parser.hpp"

#include <cctype>

namespace whisper {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

} // namespace

std::string parse_output(std::string_view output) {
    std::string joined;

    while (!output.empty()) {
        auto eol = output.find('\n');
        auto line = trim(output.substr(0, eol));
        output = eol == std::string_view::npos ? std::string_view{} : output.substr(eol + 1);

        if (line.starts_with('[')) {
            auto close = line.find(']');
            if (close != std::string_view::npos) {
                line = trim(line.substr(close + 1));
            }
        }
        if (line.empty()) continue;

        if (!joined.empty()) joined += ' ';
        joined.append(line);
    }

    // Collapse inner whitespace runs left inside segments.
    std::string text;
    text.reserve(joined.size());
    bool in_space = false;
    for (char c : joined) {
        if (is_space(c)) {
            in_space = true;
            continue;
        }
        if (in_space && !text.empty()) text += ' ';
        in_space = false;
        text += c;
    }
    return text;
}

} // namespace whisper
