#ifndef FORKLIFT_UTILS_HPP
#define FORKLIFT_UTILS_HPP

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

template<typename Function>
struct Defer {
    Defer(Function function)
        : m_function(std::move(function))
    {
    }
    Defer(Defer const&) = delete;
    ~Defer()
    {
        m_function();
    }
    Function m_function;
};

// Whole-string numeric parse, std::nullopt on any leftover character
template<typename T>
auto ParseNumber(std::string_view text) -> std::optional<T>
{
    T value {};
    auto const* end = text.data() + text.size();
    auto [ptr, error_code] = std::from_chars(text.data(), end, value);
    if (error_code != std::errc {} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

#endif
