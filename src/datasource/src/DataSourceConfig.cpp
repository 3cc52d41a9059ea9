#include "DataSourceConfig.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace {

constexpr const char* MASK = "******";
constexpr const char* PASSWORD_KEY = "password";

bool is_key_boundary(const std::string& text, size_t pos) {
    if (pos == 0) return true;
    const char prev = text[pos - 1];
    return std::isspace(static_cast<unsigned char>(prev)) || prev == '?' || prev == '&' || prev == ';';
}

void mask_userinfo(std::string& url) {
    const size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return;
    }
    const size_t authority = scheme_end + 3;
    const size_t query = url.find('?', authority);
    const size_t at = query == std::string::npos ? url.rfind('@') : url.rfind('@', query);
    if (at == std::string::npos || at < authority) {
        return;
    }
    const size_t colon = url.find(':', authority);
    if (colon == std::string::npos || colon > at) {
        return;
    }
    url.replace(colon + 1, at - colon - 1, MASK);
}

void mask_password_values(std::string& url) {
    const std::string lower = StringUtils::to_lower(url);
    std::string result;
    size_t copied = 0;
    size_t pos = 0;
    const size_t key_len = std::char_traits<char>::length(PASSWORD_KEY);

    while ((pos = lower.find(PASSWORD_KEY, pos)) != std::string::npos) {
        size_t cursor = pos + key_len;
        if (!is_key_boundary(lower, pos)) {
            pos = cursor;
            continue;
        }
        while (cursor < url.size() && url[cursor] == ' ') cursor++;
        if (cursor >= url.size() || url[cursor] != '=') {
            pos = cursor;
            continue;
        }
        cursor++;
        while (cursor < url.size() && url[cursor] == ' ') cursor++;

        size_t value_end = cursor;
        if (value_end < url.size() && url[value_end] == '\'') {
            // Quoted conninfo value, backslash escapes the next character
            value_end++;
            while (value_end < url.size() && url[value_end] != '\'') {
                if (url[value_end] == '\\') value_end++;
                value_end++;
            }
            if (value_end < url.size()) value_end++;
        } else {
            while (value_end < url.size() && url[value_end] != '&' &&
                   !std::isspace(static_cast<unsigned char>(url[value_end]))) {
                value_end++;
            }
        }
        value_end = std::min(value_end, url.size());

        result.append(url, copied, cursor - copied);
        result.append(MASK);
        copied = value_end;
        pos = value_end;
    }

    if (copied > 0) {
        result.append(url, copied, std::string::npos);
        url = std::move(result);
    }
}

}

std::string mask_url_credentials(const std::string& url) {
    std::string masked = url;
    mask_password_values(masked);
    mask_userinfo(masked);
    return masked;
}

std::string DataSourceConfig::get_data_source_info() const {
    return std::string(database_type_to_string(type)) + "(" + mask_url_credentials(url) + ")";
}
