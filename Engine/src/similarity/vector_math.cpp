#include <similarity/vector_math.hpp>

namespace Coalesce {

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;

    auto va = as_eigen(a);
    auto vb = as_eigen(b);
    const double na = va.norm();
    const double nb = vb.norm();
    if (na < MIN_VECTOR_MAGNITUDE || nb < MIN_VECTOR_MAGNITUDE) return 0.0;

    return va.dot(vb) / (na * nb);
}

Eigen::VectorXd unit_vector(const std::vector<double>& v) {
    Eigen::VectorXd out = as_eigen(v);
    const double n = out.norm();
    if (n >= MIN_VECTOR_MAGNITUDE) out /= n;
    return out;
}

} // namespace Coalesce
