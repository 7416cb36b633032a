// Balance scheduler: greedy per-respondent task selection that keeps
// element exposure even within each respondent and across the study.

#ifndef IPED_DESIGN_BALANCE_SCHEDULER_H
#define IPED_DESIGN_BALANCE_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "core/basic_types.h"
#include "design/candidate_pool.h"
#include "design/exposure_tally.h"

namespace iped {

/// @brief Tasks chosen for one respondent plus the exposures they add.
struct RespondentSchedule {
  std::vector<ElementMask> tasks;
  ExposureTally delta;
};

/// @brief Study-level scheduling controls.
struct ScheduleOptions {
  int num_respondents = 1;
  uint32_t seed = 1;                 ///< Resolved seed (never 0).
  double exposure_tolerance = kDefaultExposureTolerance;
  int num_threads = 1;               ///< Worker threads (>= 1).
  int batch_size = 1;                ///< Respondents sharing one tally snapshot (>= 1).
  /// Checked between batches; expiry aborts with no partial output.
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

/// @brief Outcome of BalanceScheduler::scheduleStudy().
struct ScheduleResult {
  std::vector<std::vector<ElementMask>> respondents;
  ExposureTally study_tally;
  bool success = false;
  bool timed_out = false;
  DesignError error = DesignError::None;
  std::string error_message;
};

/// Starts one thread running work.
using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

/// @brief Default ThreadLauncher: a plain std::thread.
std::thread launchThread(std::function<void()> work);

/// @brief Run work on the calling thread and on up to extra_threads more.
///
/// work must pull its items from a shared counter so that any subset of the
/// threads can finish it. If launching a thread throws std::system_error,
/// no further threads are started; the ones already running and the caller
/// complete the work and are joined before returning.
///
/// @param extra_threads Threads to start besides the caller.
/// @param work Work loop run by every thread.
/// @param launch Thread launcher.
/// @return Threads that ran work, the caller included.
size_t runOnWorkers(size_t extra_threads, const std::function<void()>& work,
                    const ThreadLauncher& launch = launchThread);

/// @brief Greedy exposure-balancing scheduler over a frozen candidate pool.
///
/// For each task slot the scheduler scores every candidate of the slot's
/// target active level that the respondent has not used yet:
///   1. scaled max deviation of the study tally after adding the candidate,
///   2. scaled sum of squared deviations of the study tally,
///   3. scaled max deviation of the respondent's own tally.
/// The lexicographically smallest score wins; ties are broken by a draw from
/// the respondent's generator. Once a level's candidates are all used by a
/// respondent, the level is reopened.
///
/// Repeats otherwise happen only in the respondent's last slot, when every
/// unused candidate leaves the study tally outside the exposure tolerance
/// and a used one scores strictly better on the study keys.
///
/// The scheduler only reads the pool; scheduleRespondent() is safe to call
/// concurrently. The pool must outlive the scheduler.
class BalanceScheduler {
 public:
  BalanceScheduler(const CandidatePool& pool, int tasks_per_respondent);

  /// @brief Target active count for each task slot of one respondent.
  ///
  /// Levels cycle through [min_active, max_active] starting at an offset of
  /// respondent_index, then the order is shuffled with rng.
  ///
  /// @param respondent_index Zero-based respondent index.
  /// @param rng Respondent generator.
  /// @return One level per task slot.
  std::vector<int> planActiveLevels(uint32_t respondent_index, std::mt19937& rng) const;

  /// @brief Choose all tasks for one respondent.
  /// @param respondent_index Zero-based respondent index.
  /// @param study_tally Study-wide exposures visible to this respondent.
  /// @param rng Respondent generator (seeded per respondent).
  /// @param exposure_tolerance Tolerance that decides when a last-slot repeat is allowed.
  /// @return Selected masks and the respondent's exposure delta.
  RespondentSchedule scheduleRespondent(uint32_t respondent_index,
                                        const ExposureTally& study_tally, std::mt19937& rng,
                                        double exposure_tolerance =
                                            kDefaultExposureTolerance) const;

  /// @brief Schedule every respondent of the study.
  ///
  /// Respondents are processed in batches of options.batch_size. Each batch
  /// sees the study tally as of the batch start; deltas are merged in
  /// respondent order afterwards, so the output depends on (seed,
  /// batch_size) and not on num_threads. Fails with InfeasibleBalance if the
  /// final tally is outside the tolerance, or InfeasibleDesign on timeout.
  ///
  /// @param options Study-level controls.
  /// @return Per-respondent task masks and the final study tally.
  ScheduleResult scheduleStudy(const ScheduleOptions& options) const;

  int tasksPerRespondent() const { return tasks_per_respondent_; }

 private:
  const CandidatePool& pool_;
  int tasks_per_respondent_;
};

}  // namespace iped

#endif  // IPED_DESIGN_BALANCE_SCHEDULER_H
