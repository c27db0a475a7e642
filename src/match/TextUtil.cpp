#include "match/TextUtil.hpp"
#include <algorithm>
#include <cctype>

namespace textutil {

std::string normalize_key(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true; // swallows leading whitespace

    for (unsigned char ch : s) {
        if (std::isspace(ch)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(ch)));
        prev_space = false;
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::set<std::string> normalize_set(const std::vector<std::string>& items) {
    std::set<std::string> out;
    for (const auto& it : items) {
        std::string k = normalize_key(it);
        if (!k.empty()) out.insert(std::move(k));
    }
    return out;
}

size_t edit_distance(const std::string& a, const std::string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    // two-row DP, row over b
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            const size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            const size_t del = prev[j] + 1;
            const size_t ins = cur[j - 1] + 1;
            cur[j] = std::min({sub, del, ins});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

double similarity(const std::string& a, const std::string& b) {
    const size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;

    const double d = static_cast<double>(edit_distance(a, b));
    const double s = 1.0 - d / static_cast<double>(longest);
    if (s < 0.0) return 0.0;
    return s;
}

}
