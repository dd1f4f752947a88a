#include "qrelay/common/utils.h"

std::vector<std::string_view> qrelay::utils::split_by(std::string_view str, char delim) {
    std::vector<std::string_view> out;
    size_t seek = 0;
    while (seek <= str.length()) {
        size_t end = str.find(delim, seek);
        if (end == std::string_view::npos) {
            end = str.length();
        }
        if (std::string_view s = trim(str.substr(seek, end - seek)); !s.empty()) {
            out.push_back(s);
        }
        seek = end + 1;
    }
    return out;
}
