// Implementation of the balance scheduler.

#include "design/balance_scheduler.h"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <limits>
#include <system_error>
#include <thread>
#include <utility>

#include "core/rng_util.h"

namespace iped {

std::thread launchThread(std::function<void()> work) {
  return std::thread(std::move(work));
}

size_t runOnWorkers(size_t extra_threads, const std::function<void()>& work,
                    const ThreadLauncher& launch) {
  std::vector<std::thread> workers;
  workers.reserve(extra_threads);
  for (size_t idx = 0; idx < extra_threads; ++idx) {
    try {
      workers.push_back(launch(work));
    } catch (const std::system_error& err) {
      std::fprintf(stderr, "[schedule] started %zu of %zu worker threads: %s\n", workers.size(),
                   extra_threads, err.what());
      break;
    }
  }
  work();
  for (auto& thread : workers) {
    thread.join();
  }
  return workers.size() + 1;
}

BalanceScheduler::BalanceScheduler(const CandidatePool& pool, int tasks_per_respondent)
    : pool_(pool), tasks_per_respondent_(tasks_per_respondent) {}

std::vector<int> BalanceScheduler::planActiveLevels(uint32_t respondent_index,
                                                    std::mt19937& rng) const {
  const int num_levels = pool_.maxActive() - pool_.minActive() + 1;
  std::vector<int> levels;
  levels.reserve(static_cast<size_t>(tasks_per_respondent_));
  for (int slot = 0; slot < tasks_per_respondent_; ++slot) {
    int offset = static_cast<int>((static_cast<uint32_t>(slot) + respondent_index) %
                                  static_cast<uint32_t>(num_levels));
    levels.push_back(pool_.minActive() + offset);
  }
  rng::shuffleInPlace(rng, levels);
  return levels;
}

namespace {

/// Score of one candidate; smaller is better, compared field by field.
struct CandidateScore {
  int64_t study_max = std::numeric_limits<int64_t>::max();
  int64_t study_spread = std::numeric_limits<int64_t>::max();
  int64_t own_max = std::numeric_limits<int64_t>::max();

  bool operator<(const CandidateScore& other) const {
    if (study_max != other.study_max) return study_max < other.study_max;
    if (study_spread != other.study_spread) return study_spread < other.study_spread;
    return own_max < other.own_max;
  }
  bool operator==(const CandidateScore& other) const {
    return study_max == other.study_max && study_spread == other.study_spread &&
           own_max == other.own_max;
  }
  bool studyBetterThan(const CandidateScore& other) const {
    if (study_max != other.study_max) return study_max < other.study_max;
    return study_spread < other.study_spread;
  }
};

/// Collects the best-scoring candidates whose used flag equals want_used.
CandidateScore collectBest(const std::vector<CandidateTask>& candidates,
                           const std::vector<bool>& level_used, bool want_used,
                           const ExposureTally& combined, const ExposureTally& own,
                           std::vector<size_t>& ties) {
  CandidateScore best;
  ties.clear();
  for (size_t idx = 0; idx < candidates.size(); ++idx) {
    if (level_used[idx] != want_used) continue;
    ElementMask mask = candidates[idx].mask;
    CandidateScore score;
    score.study_max = combined.scaledMaxDeviationWith(mask);
    score.study_spread = combined.scaledSquaredDeviationWith(mask);
    score.own_max = own.scaledMaxDeviationWith(mask);

    if (score < best) {
      best = score;
      ties.clear();
      ties.push_back(idx);
    } else if (score == best) {
      ties.push_back(idx);
    }
  }
  return best;
}

}  // namespace

RespondentSchedule BalanceScheduler::scheduleRespondent(uint32_t respondent_index,
                                                        const ExposureTally& study_tally,
                                                        std::mt19937& rng,
                                                        double exposure_tolerance) const {
  RespondentSchedule schedule;
  schedule.delta = ExposureTally(pool_.numElements());
  schedule.tasks.reserve(static_cast<size_t>(tasks_per_respondent_));

  // Study tally as seen by this respondent, including its own picks.
  ExposureTally combined = study_tally;

  const int min_active = pool_.minActive();
  const int num_levels = pool_.maxActive() - min_active + 1;
  const double num_elements = static_cast<double>(pool_.numElements());
  std::vector<std::vector<bool>> used(static_cast<size_t>(num_levels));
  std::vector<size_t> used_count(static_cast<size_t>(num_levels), 0);
  for (int k = min_active; k <= pool_.maxActive(); ++k) {
    used[static_cast<size_t>(k - min_active)].assign(pool_.level(k).size(), false);
  }

  std::vector<int> levels = planActiveLevels(respondent_index, rng);
  std::vector<size_t> ties;
  std::vector<size_t> used_ties;

  for (size_t slot = 0; slot < levels.size(); ++slot) {
    const int level = levels[slot];
    const auto& candidates = pool_.level(level);
    auto& level_used = used[static_cast<size_t>(level - min_active)];
    size_t& level_used_count = used_count[static_cast<size_t>(level - min_active)];

    // Level exhausted for this respondent: reopen it.
    if (level_used_count == candidates.size()) {
      std::fill(level_used.begin(), level_used.end(), false);
      level_used_count = 0;
    }

    CandidateScore best =
        collectBest(candidates, level_used, false, combined, schedule.delta, ties);

    // Last slot: repeat a used task if every unused one leaves the study
    // tally out of tolerance and the repeat is strictly better for it.
    bool repeat = false;
    if (slot + 1 == levels.size() && level_used_count > 0) {
      double allowed = std::max(
          exposure_tolerance * static_cast<double>(combined.total() + level), num_elements);
      if (static_cast<double>(best.study_max) > allowed + 1e-9) {
        CandidateScore best_used =
            collectBest(candidates, level_used, true, combined, schedule.delta, used_ties);
        if (best_used.studyBetterThan(best)) {
          ties.swap(used_ties);
          repeat = true;
        }
      }
    }

    size_t pick = ties.size() == 1 ? ties.front() : ties[rng::selectRandomIndex(rng, ties)];
    if (!repeat) {
      level_used[pick] = true;
      ++level_used_count;
    }

    ElementMask chosen = candidates[pick].mask;
    schedule.tasks.push_back(chosen);
    schedule.delta.add(chosen);
    combined.add(chosen);
  }

  return schedule;
}

ScheduleResult BalanceScheduler::scheduleStudy(const ScheduleOptions& options) const {
  ScheduleResult result;
  const size_t num_respondents = static_cast<size_t>(std::max(0, options.num_respondents));
  const size_t batch_size = static_cast<size_t>(std::max(1, options.batch_size));
  const size_t num_threads = static_cast<size_t>(std::max(1, options.num_threads));

  SharedExposureTally shared(pool_.numElements());
  result.respondents.resize(num_respondents);

  for (size_t begin = 0; begin < num_respondents; begin += batch_size) {
    if (options.deadline && std::chrono::steady_clock::now() > *options.deadline) {
      result.timed_out = true;
      result.error = DesignError::InfeasibleDesign;
      result.error_message = "generation timed out after " + std::to_string(begin) + " of " +
                             std::to_string(num_respondents) + " respondents";
      result.respondents.clear();
      return result;
    }

    const size_t end = std::min(num_respondents, begin + batch_size);
    const ExposureTally snapshot = shared.snapshot();
    std::vector<RespondentSchedule> batch(end - begin);

    auto scheduleOne = [&](size_t respondent) {
      std::mt19937 respondent_rng(
          rng::splitmix32(options.seed, static_cast<uint32_t>(respondent)));
      batch[respondent - begin] =
          scheduleRespondent(static_cast<uint32_t>(respondent), snapshot, respondent_rng,
                             options.exposure_tolerance);
    };

    const size_t worker_count = std::min(num_threads, end - begin);
    if (worker_count <= 1) {
      for (size_t respondent = begin; respondent < end; ++respondent) {
        scheduleOne(respondent);
      }
    } else {
      std::atomic<size_t> next{begin};
      runOnWorkers(worker_count - 1, [&]() {
        for (size_t respondent = next.fetch_add(1); respondent < end;
             respondent = next.fetch_add(1)) {
          scheduleOne(respondent);
        }
      });
    }

    // Merge in respondent order so the tally never depends on thread timing.
    for (size_t offset = 0; offset < batch.size(); ++offset) {
      shared.merge(batch[offset].delta);
      result.respondents[begin + offset] = std::move(batch[offset].tasks);
    }
  }

  result.study_tally = shared.snapshot();
  if (!result.study_tally.withinTolerance(options.exposure_tolerance)) {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "max exposure deviation %.2f exceeds allowed %.2f (mean %.2f)",
                  result.study_tally.maxAbsDeviation(),
                  result.study_tally.allowedDeviation(options.exposure_tolerance),
                  result.study_tally.mean());
    result.error = DesignError::InfeasibleBalance;
    result.error_message = buf;
    return result;
  }

  result.success = true;
  return result;
}

}  // namespace iped
