#include "string_util.h"

using std::string;
using std::vector;

/* length of the valid UTF-8 sequence starting at bytes[i], or 0 */
static size_t utf8_sequence_length(const string &bytes, size_t i)
{
    unsigned char lead = bytes[i];
    size_t len;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead < 0x80) return 1;
    else if (lead >= 0xC2 && lead <= 0xDF) len = 2;
    else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    }
    else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    }
    else return 0;

    if (i + len > bytes.size()) return 0;
    /* only the first continuation byte has a narrowed range */
    unsigned char first = bytes[i + 1];
    if (first < lo || first > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        unsigned char c = bytes[i + k];
        if (c < 0x80 || c > 0xBF) return 0;
    }
    return len;
}

string lossy_text(const string &bytes)
{
    static const string kReplacement = "\xEF\xBF\xBD";
    string result;
    result.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            result += kReplacement;
            ++i;
        }
        else {
            result.append(bytes, i, len);
            i += len;
        }
    }
    return result;
}

string quote_args(const vector<string> &args)
{
    string result;
    for (const string &arg : args) {
        if (!result.empty()) result += ' ';
        result += '"' + arg + '"';
    }
    return result;
}

bool starts_with(const string &s, const string &prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const string &haystack, const string &needle)
{
    return haystack.find(needle) != string::npos;
}
