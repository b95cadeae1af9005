/*
  Simplex-constrained minimizer.

  Convergence test (both methods): x is a KKT point of min f over the simplex
  iff x == P(x - grad f(x)). The infinity norm of the difference is compared
  against tolerance * (1 + max(1, total) + max|grad f|).

  Active-set Newton (objective supplies a Hessian):
    Variables held at zero form the working set W; the rest are free (F).
    Each iteration solves
         [ H_FF  1 ] [ d ]   [ -g_F ]
         [ 1'    0 ] [ mu] = [  0   ]
    with Eigen's complete orthogonal decomposition.
    - Consistent system: d is the Newton step on F. Take the largest
      feasible step up to 1; a blocking variable joins W. When the step is
      blocked, the projection of x_F + d onto the face is tried as well and
      kept if cheaper, with every variable it zeroes joining W. After a full
      step x minimizes f on the face, and the held variable whose gradient
      lies most below the free-set level is released.
    - Inconsistent system (H_FF singular, e.g. congestion-free paths or paths
      whose edges are covered by others): the least-squares residual lies in
      the null space { H d = 0, 1'd = 0 } and points downhill with zero
      curvature. It is followed until a variable hits zero.
    When neither step makes progress a projected-gradient step is taken and
    W is rebuilt from the zero pattern.

  Projected gradient (no Hessian):
    d = P(x - s*g) - x with a Barzilai-Borwein step s and Armijo
    back-tracking along x + t*d, then optionally the same free-set Newton
    step with a Hessian estimated by forward differences of the gradient.
*/
#include "trafficeq/core/simplex_minimizer.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace trafficeq::core {

namespace {

bool all_finite(std::span<const double> v) {
  return std::all_of(v.begin(), v.end(), [](double d){ return std::isfinite(d); });
}

double max_abs(std::span<const double> v) {
  double m = 0.0;
  for (double d : v) m = std::max(m, std::abs(d));
  return m;
}

// Gradient via the user callable, or central differences of value().
void eval_gradient(const SimplexObjective& obj, std::span<const double> x, std::span<double> g) {
  if (obj.gradient) {
    obj.gradient(x, g);
    return;
  }
  std::vector<double> xp(x.begin(), x.end());
  for (std::size_t i = 0; i < x.size(); ++i) {
    const double h = 1e-6 * std::max(1.0, std::abs(x[i]));
    xp[i] = x[i] + h;
    const double fp = obj.value(xp);
    xp[i] = x[i] - h;
    const double fm = obj.value(xp);
    xp[i] = x[i];
    g[i] = (fp - fm) / (2.0 * h);
  }
}

// ||x - P(x - g)||_inf
double stationarity(std::span<const double> x, std::span<const double> g, double total) {
  std::vector<double> y(x.size());
  for (std::size_t i = 0; i < x.size(); ++i) y[i] = x[i] - g[i];
  auto p = project_onto_simplex(y, total);
  double m = 0.0;
  for (std::size_t i = 0; i < x.size(); ++i) m = std::max(m, std::abs(x[i] - p[i]));
  return m;
}

double convergence_threshold(std::span<const double> g, double total, const SolverOptions& opts) {
  return opts.tolerance * (1.0 + std::max(1.0, total) + max_abs(g));
}

struct FreeStep {
  Eigen::VectorXd d;
  bool newton {true};   // false: zero-curvature descent direction
  bool valid {false};
};

// Equality-constrained step on the free variables given H_FF and g_F.
FreeStep solve_free_kkt(const Eigen::MatrixXd& H, const Eigen::VectorXd& g) {
  const Eigen::Index m = H.rows();
  Eigen::MatrixXd K = Eigen::MatrixXd::Zero(m + 1, m + 1);
  K.topLeftCorner(m, m) = H;
  K.block(0, m, m, 1).setOnes();
  K.block(m, 0, 1, m).setOnes();
  Eigen::VectorXd rhs(m + 1);
  rhs.head(m) = -g;
  rhs(m) = 0.0;

  FreeStep s;
  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(K);
  const Eigen::VectorXd z = cod.solve(rhs);
  if (!z.allFinite()) return s;
  const Eigen::VectorXd r = rhs - K * z;
  if (r.norm() <= 1e-9 * (rhs.norm() + K.norm() * z.norm())) {
    s.d = z.head(m);
    s.newton = true;
  } else {
    // r is orthogonal to range(K), i.e. in null(K): H d = 0 and 1'd = 0.
    // r'rhs = |r|^2 > 0, so g'd < 0.
    s.d = r.head(m);
    s.d.array() -= s.d.mean();
    s.newton = false;
    if (!(g.dot(s.d) < 0.0)) return s;
  }
  s.valid = s.d.allFinite();
  return s;
}

// Largest t <= t_max keeping x[free] + t*d >= 0. blocking receives the
// limiting variable, or x.size() when t_max itself limits.
double ratio_test(const std::vector<double>& x, const std::vector<std::size_t>& free,
                  const Eigen::VectorXd& d, double t_max, std::size_t& blocking) {
  blocking = x.size();
  for (std::size_t r = 0; r < free.size(); ++r) {
    const double dr = d(static_cast<Eigen::Index>(r));
    if (dr < 0.0) {
      const double lim = x[free[r]] / -dr;
      if (lim < t_max) {
        t_max = lim;
        blocking = free[r];
      }
    }
  }
  return t_max;
}

// Gradient projection with Armijo back-tracking along x + t*(P(x - step*g) - x).
bool projected_gradient_step(const SimplexObjective& obj, std::vector<double>& x, double& f,
                             std::span<const double> g, double total, double step,
                             const SolverOptions& opts) {
  const std::size_t n = x.size();
  std::vector<double> y(n);
  for (std::size_t i = 0; i < n; ++i) y[i] = x[i] - step * g[i];
  const auto p = project_onto_simplex(y, total);
  double slope = 0.0;
  for (std::size_t i = 0; i < n; ++i) slope += g[i] * (p[i] - x[i]);
  if (!(slope < 0.0)) return false;

  std::vector<double> trial(n);
  double t = 1.0;
  for (int k = 0; k < 60; ++k, t *= 0.5) {
    for (std::size_t i = 0; i < n; ++i) trial[i] = x[i] + t * (p[i] - x[i]);
    const double ft = obj.value(trial);
    if (std::isfinite(ft) && ft <= f + opts.armijo * t * slope) {
      x.swap(trial);
      f = ft;
      return true;
    }
  }
  return false;
}

double gradient_scale_step(std::span<const double> g, double total) {
  return std::max(1.0, total) / std::max(max_abs(g), std::numeric_limits<double>::min());
}

// Newton step on the free variables with a finite-difference Hessian.
// Returns true and updates x/f when the step was feasible and non-increasing.
bool newton_polish(const SimplexObjective& obj, std::vector<double>& x, double& f,
                   std::span<const double> g, double total) {
  const std::size_t n = x.size();
  const double active_tol = 1e-14 * std::max(1.0, total);
  std::vector<std::size_t> free;
  for (std::size_t i = 0; i < n; ++i) if (x[i] > active_tol) free.push_back(i);
  const auto m = static_cast<Eigen::Index>(free.size());
  if (m == 0) return false;

  // Hessian columns on the free set from gradient differences.
  const double h = 1e-5 * std::max(1.0, total);
  Eigen::MatrixXd H(m, m);
  Eigen::VectorXd gF(m);
  std::vector<double> xp(x);
  std::vector<double> gp(n);
  for (Eigen::Index c = 0; c < m; ++c) {
    const std::size_t j = free[static_cast<std::size_t>(c)];
    gF(c) = g[j];
    xp[j] = x[j] + h;
    eval_gradient(obj, xp, gp);
    xp[j] = x[j];
    for (Eigen::Index r = 0; r < m; ++r) {
      const std::size_t i = free[static_cast<std::size_t>(r)];
      H(r, c) = (gp[i] - g[i]) / h;
    }
  }
  if (!H.allFinite()) return false;
  H = 0.5 * (H + H.transpose()).eval();

  const FreeStep s = solve_free_kkt(H, gF);
  if (!s.valid) return false;
  std::size_t blocking = n;
  const double t = ratio_test(x, free, s.d,
                              s.newton ? 1.0 : std::numeric_limits<double>::infinity(), blocking);
  if (!(t > 0.0) || !std::isfinite(t)) return false;

  std::vector<double> xn(x);
  for (Eigen::Index r = 0; r < m; ++r) {
    const std::size_t i = free[static_cast<std::size_t>(r)];
    xn[i] = std::max(0.0, x[i] + t * s.d(r));
  }
  if (blocking < n) xn[blocking] = 0.0;
  const double fn = obj.value(xn);
  if (!std::isfinite(fn) || fn > f) return false;
  x.swap(xn);
  f = fn;
  return true;
}

void minimize_active_set(const SimplexObjective& objective, MinimizeResult& res, double f,
                         double total, const SolverOptions& opts) {
  std::vector<double>& x = res.x;
  const std::size_t n = x.size();
  const double flow_scale = std::max(1.0, total);
  std::vector<double> g(n);
  std::vector<double> hess(n * n);
  std::vector<double> trial(n);
  std::vector<unsigned char> at_zero(n);  // working set
  for (std::size_t i = 0; i < n; ++i) at_zero[i] = x[i] <= 0.0;
  bool at_face_min = false;
  std::size_t released = n;

  for (int it = 0;; ++it) {
    eval_gradient(objective, x, g);
    if (!all_finite(g)) break;
    res.iterations = it;
    res.value = f;

    const double threshold = convergence_threshold(g, total, opts);
    if (stationarity(x, g, total) <= threshold) {
      res.converged = true;
      return;
    }
    if (it >= opts.max_iterations) break;

    std::vector<std::size_t> free;
    for (std::size_t i = 0; i < n; ++i) if (!at_zero[i]) free.push_back(i);

    // At a face minimum with nothing to release only a projected-gradient
    // step can still make progress.
    bool try_newton = !free.empty();
    if (at_face_min && !free.empty()) {
      at_face_min = false;
      try_newton = false;
      // Free gradients share one level here; a held variable below it
      // would lower the cost by taking flow.
      double level = 0.0;
      for (auto i : free) level += g[i];
      level /= static_cast<double>(free.size());
      std::size_t best = n;
      double best_gap = -threshold;
      for (std::size_t i = 0; i < n; ++i) {
        if (at_zero[i] && g[i] - level < best_gap) {
          best_gap = g[i] - level;
          best = i;
        }
      }
      if (best < n) {
        at_zero[best] = 0;
        released = best;
        continue;
      }
    }

    bool moved = false;
    if (try_newton) {
      objective.hessian(x, hess);
      const auto m = static_cast<Eigen::Index>(free.size());
      Eigen::MatrixXd H(m, m);
      Eigen::VectorXd gF(m);
      for (Eigen::Index r = 0; r < m; ++r) {
        const std::size_t i = free[static_cast<std::size_t>(r)];
        gF(r) = g[i];
        for (Eigen::Index c = 0; c < m; ++c) {
          H(r, c) = hess[i * n + free[static_cast<std::size_t>(c)]];
        }
      }
      if (!H.allFinite()) break;
      H = 0.5 * (H + H.transpose()).eval();

      const FreeStep s = solve_free_kkt(H, gF);
      if (s.valid && s.newton && s.d.lpNorm<Eigen::Infinity>() <= 1e-12 * flow_scale) {
        at_face_min = true;
        continue;
      }
      if (s.valid) {
        std::size_t blocking = n;
        const double t_max = ratio_test(x, free, s.d,
                                        s.newton ? 1.0 : std::numeric_limits<double>::infinity(),
                                        blocking);
        if (std::isfinite(t_max) && t_max <= 0.0) {
          // Degenerate: a free variable sitting at zero would go negative.
          if (blocking < n && blocking != released) {
            at_zero[blocking] = 1;
            x[blocking] = 0.0;
            moved = true;
          }
        } else if (std::isfinite(t_max)) {
          const double slope = gF.dot(s.d);
          const double noise = 64.0 * std::numeric_limits<double>::epsilon() *
                               std::max(1.0, std::abs(f));
          if (s.newton && blocking < n) {
            // Projecting the full Newton step onto the face can zero several
            // variables at once; keep it when it beats stopping at the first.
            std::vector<double> y_free(free.size());
            for (std::size_t r = 0; r < free.size(); ++r) {
              y_free[r] = x[free[r]] + s.d(static_cast<Eigen::Index>(r));
            }
            const auto p_free = project_onto_simplex(y_free, total);
            std::vector<double> projected(x);
            for (std::size_t r = 0; r < free.size(); ++r) projected[free[r]] = p_free[r];
            const double f_projected = objective.value(projected);

            trial = x;
            for (Eigen::Index r = 0; r < m; ++r) {
              const std::size_t i = free[static_cast<std::size_t>(r)];
              trial[i] = std::max(0.0, x[i] + t_max * s.d(r));
            }
            trial[blocking] = 0.0;
            const double f_stop = objective.value(trial);

            if (std::isfinite(f_projected) && f_projected < f && f_projected < f_stop) {
              x.swap(projected);
              f = f_projected;
              moved = true;
              for (auto i : free) if (x[i] <= 0.0) at_zero[i] = 1;
            } else if (std::isfinite(f_stop) && f_stop <= f + noise) {
              x.swap(trial);
              f = f_stop;
              moved = true;
              at_zero[blocking] = 1;
            }
          }
          double t = t_max;
          for (int k = 0; k < 60 && !moved && slope < 0.0; ++k, t *= 0.5) {
            trial = x;
            for (Eigen::Index r = 0; r < m; ++r) {
              const std::size_t i = free[static_cast<std::size_t>(r)];
              trial[i] = std::max(0.0, x[i] + t * s.d(r));
            }
            const bool full = t == t_max;
            if (full && blocking < n) trial[blocking] = 0.0;
            const double ft = objective.value(trial);
            if (std::isfinite(ft) && ft <= f + opts.armijo * t * slope + noise) {
              x.swap(trial);
              f = ft;
              moved = true;
              if (full && blocking < n) at_zero[blocking] = 1;
              else if (full && s.newton) at_face_min = true;
            }
          }
        }
      }
    }
    released = n;

    if (!moved) {
      if (!projected_gradient_step(objective, x, f, g, total, gradient_scale_step(g, total), opts)) {
        break;
      }
      for (std::size_t i = 0; i < n; ++i) at_zero[i] = x[i] <= 0.0;
      at_face_min = false;
    }
  }
  res.value = f;
}

void minimize_projected_gradient(const SimplexObjective& objective, MinimizeResult& res, double f,
                                 double total, const SolverOptions& opts) {
  std::vector<double>& x = res.x;
  const std::size_t n = x.size();
  std::vector<double> g(n);
  std::vector<double> g_prev(n);
  std::vector<double> x_prev(n);
  double step = 0.0;
  bool have_prev = false;

  for (int it = 0;; ++it) {
    eval_gradient(objective, x, g);
    if (!all_finite(g)) break;
    res.iterations = it;
    res.value = f;

    if (stationarity(x, g, total) <= convergence_threshold(g, total, opts)) {
      res.converged = true;
      return;
    }
    if (it >= opts.max_iterations) break;

    // Barzilai-Borwein step length from the last accepted move.
    if (have_prev) {
      double sx = 0.0;
      double sy = 0.0;
      for (std::size_t i = 0; i < n; ++i) {
        const double dx = x[i] - x_prev[i];
        const double dg = g[i] - g_prev[i];
        sx += dx * dx;
        sy += dx * dg;
      }
      if (sy > 0.0 && sx > 0.0) step = sx / sy;
    }
    if (!(step > 0.0) || !std::isfinite(step)) step = gradient_scale_step(g, total);

    x_prev = x;
    g_prev = g;
    have_prev = true;
    bool moved = projected_gradient_step(objective, x, f, g, total, step, opts);

    if (opts.newton_polish) {
      eval_gradient(objective, x, g);
      if (all_finite(g) && newton_polish(objective, x, f, g, total)) moved = true;
    }
    if (!moved) {
      // No descent available from either step; the next stationarity test
      // decides, with one more BB scale reset.
      step = 0.0;
      have_prev = false;
    }
  }
  res.value = f;
}

} // namespace

std::vector<double> project_onto_simplex(std::span<const double> y, double total) {
  const std::size_t n = y.size();
  std::vector<double> out(n, 0.0);
  if (n == 0 || total <= 0.0) return out;
  // Sort-based projection: find threshold theta with sum(max(y - theta, 0)) == total.
  std::vector<double> u(y.begin(), y.end());
  std::sort(u.begin(), u.end(), std::greater<double>());
  double cumsum = 0.0;
  double theta = 0.0;
  for (std::size_t j = 0; j < n; ++j) {
    cumsum += u[j];
    const double cand = (cumsum - total) / static_cast<double>(j + 1);
    if (u[j] - cand > 0.0) theta = cand;
  }
  for (std::size_t i = 0; i < n; ++i) out[i] = std::max(y[i] - theta, 0.0);
  return out;
}

MinimizeResult minimize_on_simplex(const SimplexObjective& objective,
                                   std::span<const double> x0,
                                   double total,
                                   const SolverOptions& opts) {
  MinimizeResult res;
  res.x = project_onto_simplex(x0, total);
  if (x0.empty()) {
    res.converged = true;
    return res;
  }
  if (!objective.value) return res;

  const double f = objective.value(res.x);
  if (!std::isfinite(f)) return res;

  if (objective.hessian) {
    minimize_active_set(objective, res, f, total, opts);
  } else {
    minimize_projected_gradient(objective, res, f, total, opts);
  }
  return res;
}

} // namespace trafficeq::core
