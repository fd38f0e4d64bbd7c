#include <hjkl/common.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace hjkl {

std::string_view trim(std::string_view str)
{
    auto is_space = [](char c){ return std::isspace((unsigned char)c) != 0; };
    auto start = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), std::make_reverse_iterator(start), is_space).base();
    return std::string_view(start, end);
}

} // namespace hjkl
