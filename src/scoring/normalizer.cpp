#include "evalbox/scoring/normalizer.hpp"
#include <boost/algorithm/string.hpp>

namespace evalbox {
using namespace std;

const set<string> SENTINEL_VALUES = {"n/a", "na", "none", "null", "error"};

// 与 isspace 一致的空白字符
static bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

string strict_collapse(const string &text) {
    string result;
    bool pending_space = false;
    for (char c : text) {
        if (is_blank(c)) {
            pending_space = !result.empty();
        } else {
            if (pending_space) result += ' ';
            pending_space = false;
            result += c;
        }
    }
    boost::algorithm::to_lower(result);
    return result;
}

string strict_collapse(const vector<string> &lines) {
    return strict_collapse(boost::algorithm::join(lines, "\n"));
}

string light_trim(const optional<string> &text) {
    if (!text) return "";
    string result = boost::algorithm::trim_copy_if(*text, is_blank);
    boost::algorithm::to_lower(result);
    if (SENTINEL_VALUES.count(result)) return "";
    return result;
}

bool is_empty_or_error(const optional<string> &text) {
    return light_trim(text).empty();
}

bool contains_normalized(const string &haystack, const string &needle) {
    string pattern = strict_collapse(needle);
    if (pattern.empty()) return false;
    return strict_collapse(haystack).find(pattern) != string::npos;
}

}  // namespace evalbox
