#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace caret {
    /* vendors */
    using Json = nlohmann::ordered_json;

    /* smart pointers */
    template<typename T>
    using Box = std::unique_ptr<T>;

    template<typename T>
    using Ref = std::reference_wrapper<T>;

    /* containers */
    template<typename T>
    using Vec = std::vector<T>;

    template<typename K, typename V>
    using Map = std::unordered_map<K, V>;

    /* monads */
    template<typename T, typename E>
    using Result = std::expected<T, E>;

    template<typename T>
    using Option = std::optional<T>;

    /* handles */
    using FileId = uint32_t;

    inline auto to_lower_str(std::string_view str) -> std::string {
        std::string result(str);
        std::ranges::transform(result, result.begin(), [](unsigned char ch) {
            return std::tolower(ch);
        });
        return result;
    }

    // number of decimal digits in `n`, zero for zero
    constexpr auto count_digits(size_t n) -> size_t {
        size_t count = 0;
        while (n != 0) {
            ++count;
            n /= 10;
        }
        return count;
    }
}  // namespace caret
