#pragma once

#include <string_view>

namespace imgjoin {

// Version-aware ordering of file names, compatible with `sort -V` for
// chunk suffixes: digit runs compare numerically, other characters compare
// with letters before punctuation and '~' before everything.
class NaturalOrder {
public:
    static int Compare(std::string_view lhs, std::string_view rhs);
    static bool Less(std::string_view lhs, std::string_view rhs) { return Compare(lhs, rhs) < 0; }
};

} // namespace imgjoin
