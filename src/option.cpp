#include "tradecli/option.hpp"

#include <sstream>
#include <type_traits>

namespace tradecli {

std::string toString(const OptionValue& v) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "None";
            } else if constexpr (std::is_same_v<T, bool>) {
                return x ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int>) {
                return std::to_string(x);
            } else if constexpr (std::is_same_v<T, double>) {
                std::ostringstream oss;
                oss << x;
                return oss.str();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return x;
            } else {
                std::string out = "[";
                for (std::size_t i = 0; i < x.size(); ++i) {
                    if (i) out += ", ";
                    out += x[i];
                }
                out += "]";
                return out;
            }
        },
        v);
}

} // namespace tradecli
