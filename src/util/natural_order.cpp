#include "util/natural_order.hpp"

#include <cctype>
#include <climits>

namespace imgjoin {

namespace {

bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

int Weight(char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isdigit(uc)) return 0;
    if (std::isalpha(uc)) return uc;
    if (c == '~') return -1;
    return uc + UCHAR_MAX + 1;
}

int Sign(int v) { return (v > 0) - (v < 0); }

int CompareRuns(std::string_view a, std::string_view b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() || j < b.size()) {
        int first_diff = 0;

        while ((i < a.size() && !IsDigit(a[i])) || (j < b.size() && !IsDigit(b[j]))) {
            const int wa = (i < a.size()) ? Weight(a[i]) : 0;
            const int wb = (j < b.size()) ? Weight(b[j]) : 0;
            if (wa != wb) return Sign(wa - wb);
            ++i;
            ++j;
        }

        while (i < a.size() && a[i] == '0') ++i;
        while (j < b.size() && b[j] == '0') ++j;

        while (i < a.size() && j < b.size() && IsDigit(a[i]) && IsDigit(b[j])) {
            if (first_diff == 0) first_diff = a[i] - b[j];
            ++i;
            ++j;
        }
        // a longer digit run is the larger number
        if (i < a.size() && IsDigit(a[i])) return 1;
        if (j < b.size() && IsDigit(b[j])) return -1;
        if (first_diff != 0) return Sign(first_diff);
    }
    return 0;
}

} // namespace

int NaturalOrder::Compare(std::string_view lhs, std::string_view rhs) {
    if (lhs == rhs)
        return 0;

    const int c = CompareRuns(lhs, rhs);
    if (c != 0)
        return c;

    // Equal up to zero padding ("part01" vs "part1"): keep the order total.
    return lhs < rhs ? -1 : 1;
}

} // namespace imgjoin
