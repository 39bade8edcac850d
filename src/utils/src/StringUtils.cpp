#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

std::string StringUtils::to_upper(const std::string& str) {
    std::string upper_str = str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return upper_str;
}

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

void StringUtils::remove_all_spaces(std::string& str) {
    str.erase(std::remove_if(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); }),
        str.end());
}

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        trim(item);
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}
