#pragma once

#include <string>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);
    static void trim(std::string& str);
    static std::string trimmed(std::string str);

    static bool equals_ignore_case(const std::string& lhs, const std::string& rhs);
    static bool contains_ignore_case(const std::string& haystack, const std::string& needle);

    // Splits on every occurrence of delimiter, keeping empty fields
    static std::vector<std::string> split(const std::string& str, char delimiter);
};
