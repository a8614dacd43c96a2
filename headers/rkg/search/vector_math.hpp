#ifndef RKG_SEARCH_VECTOR_MATH_HPP
#define RKG_SEARCH_VECTOR_MATH_HPP

#include <cmath>
#include <vector>

namespace rkg::search {

    using Vector = std::vector<double>;

    [[nodiscard]] inline double magnitude(const Vector& v) noexcept {
        double sum = 0.0;
        for (const double x : v) {
            sum += x * x;
        }
        return std::sqrt(sum);
    }

    /**
     * Scales v to unit length. A zero vector is left as is.
     */
    inline void l2_normalize(Vector& v) noexcept {
        const double m = magnitude(v);
        if (m > 0.0) {
            for (double& x : v) {
                x /= m;
            }
        }
    }

    /**
     * Cosine of the angle between a and b. 0 when the lengths differ or
     * either vector is zero.
     */
    [[nodiscard]] inline double cosine_similarity(const Vector& a, const Vector& b) noexcept {
        if (a.size() != b.size()) {
            return 0.0;
        }

        double dot = 0.0;
        double norm_a = 0.0;
        double norm_b = 0.0;
        for (std::size_t i = 0; i < a.size(); ++i) {
            dot += a[i] * b[i];
            norm_a += a[i] * a[i];
            norm_b += b[i] * b[i];
        }

        const double denominator = std::sqrt(norm_a) * std::sqrt(norm_b);
        if (denominator == 0.0) {
            return 0.0;
        }
        return dot / denominator;
    }

}  // namespace rkg::search

#endif  // RKG_SEARCH_VECTOR_MATH_HPP
