// Implementation of study sizing helpers.

#include "design/task_planner.h"

#include <algorithm>

namespace iped {

namespace {

constexpr int kSmallStudyTaskCap = 24;
constexpr int kFallbackTasks = 8;

}  // namespace

uint64_t binomial(int n, int k) {
  if (k < 0 || n < 0 || k > n) return 0;
  k = std::min(k, n - k);
  uint64_t result = 1;
  for (int idx = 1; idx <= k; ++idx) {
    // Exact at every step: result * (n - k + idx) is divisible by idx.
    result = result * static_cast<uint64_t>(n - k + idx) / static_cast<uint64_t>(idx);
  }
  return result;
}

uint64_t visibleCapacity(int num_elements, int min_active, int max_active) {
  int lo = std::max(min_active, 0);
  int hi = std::min(max_active, num_elements);
  uint64_t total = 0;
  for (int k = lo; k <= hi; ++k) {
    total += binomial(num_elements, k);
  }
  return total;
}

int recommendTasksPerRespondent(int num_elements) {
  if (num_elements < 4) return kFallbackTasks;

  int k = num_elements <= 8 ? 2 : 3;
  uint64_t half = binomial(num_elements, k) / 2;
  uint64_t tasks = std::max<uint64_t>(1, half);
  return static_cast<int>(std::min<uint64_t>(kSmallStudyTaskCap, tasks));
}

}  // namespace iped
