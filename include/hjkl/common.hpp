#pragma once

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace hjkl {

using StringViewPair = std::pair<std::string_view, std::string_view>;
using StringPair = std::pair<std::string, std::string>;

// Helper function to create a literal span
template <typename T>
std::span<T> span(std::initializer_list<T> contiguous)
{
    return std::span((T*)contiguous.begin(), contiguous.size());
}

// Helper function for surrounding whitespace
std::string_view trim(std::string_view text);

}
