#pragma once

#include <algorithm>
#include <type_traits>
#include <iterator>
#include <utility>

namespace knnw {
struct seq_t  { explicit constexpr seq_t(int)  {} };
struct fast_t { explicit constexpr fast_t(int) {} };

inline constexpr seq_t  seq{0};
inline constexpr fast_t fast{0};

// Small threshold to avoid threading tiny batches; one element is one
// instance weighting call, which is far heavier than a scalar op
#ifndef KNNW_OMP_MIN_N
#  define KNNW_OMP_MIN_N  256
#endif

// Helpers: detect random-access iterators
template<class It>
using is_random_access_it = std::bool_constant<
  std::is_base_of_v<std::random_access_iterator_tag,
    typename std::iterator_traits<It>::iterator_category>
>;

// -------- transform --------
// fn must not throw when the parallel branch is taken
template<class PolicyTag, class InIt, class OutIt, class Fn>
inline OutIt transform(PolicyTag, InIt first, InIt last, OutIt out, Fn&& fn) {
  const auto n = std::distance(first, last);
#if defined(_OPENMP)
  if constexpr (!std::is_same_v<PolicyTag, seq_t> &&
                is_random_access_it<InIt>::value && is_random_access_it<OutIt>::value) {
    if (n >= static_cast<decltype(n)>(KNNW_OMP_MIN_N)) {
      #pragma omp parallel for schedule(dynamic, 16)
      for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i) {
        *(out + i) = fn(*(first + i));
      }
      return out + n;
    }
  }
#endif
  return std::transform(first, last, out, std::forward<Fn>(fn));
}

} // namespace knnw

// Project-wide default, override per-call with knnw::seq / knnw::fast
#if defined(_WIN32)
#  define KNNW_EXEC_POLICY knnw::seq
#else
#  define KNNW_EXEC_POLICY knnw::fast
#endif
