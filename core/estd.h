#ifndef LINEAGE_ESTD_H_
#define LINEAGE_ESTD_H_

#include <algorithm>
#include <functional>
#include <numeric>
#include <ranges>

// estd contains extensions to std that probably should have been there
namespace estd {

// Debug support (we try very hard not to use conditional compilation)
#ifndef NDEBUG
inline constexpr bool is_debug_enabled = true;
#else
inline constexpr bool is_debug_enabled = false;
#endif

// The usual visitor helper for std::visit over several lambdas
template<typename... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts> overloaded(Ts...) -> overloaded<Ts...>;

namespace ranges {

template<typename Range>
auto sum(Range& r) { return std::accumulate(std::ranges::begin(r), std::ranges::end(r), 0.0, std::plus{}); }

}  // namespace ranges

}  // namespace estd

#endif // LINEAGE_ESTD_H_
