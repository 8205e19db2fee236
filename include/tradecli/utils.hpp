#ifndef TRADECLI_UTILS_HPP
#define TRADECLI_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tradecli::utils {

// join({"a","b"}, ", ", "'") -> "'a', 'b'"
inline std::string join(const std::vector<std::string>& items, std::string_view sep, std::string_view quote = {}) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out.append(sep);
        out.append(quote);
        out.append(items[i]);
        out.append(quote);
    }
    return out;
}

} // namespace tradecli::utils

#endif // TRADECLI_UTILS_HPP
