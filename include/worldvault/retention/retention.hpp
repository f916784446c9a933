#pragma once

/** \file retention.hpp
 *  \brief Size-budget eviction across all worlds with a per-world floor.
 *
 * Deterministic ordering policy:
 * - Candidates are ordered by creation time ascending (oldest first)
 * - Ties on creation time are broken by archive name ascending, then world id
 *
 * Selection is a repeatable priority pick, not a one-shot sort: a world is a
 * candidate only while it holds more than min_keep_per_world backups, and it
 * drops out of the candidate set the moment it reaches the floor. Eviction
 * stops as soon as the aggregate fits the budget or no candidate is left.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

#include "worldvault/backup/repository.hpp"
#include "worldvault/error.hpp"

namespace worldvault::retention {

inline constexpr std::uint64_t kDefaultMaxAggregateBytes = 5ull << 30;
inline constexpr std::size_t kDefaultMinKeepPerWorld = 3;

struct RetentionPolicy {
  std::uint64_t max_aggregate_bytes{kDefaultMaxAggregateBytes};
  std::size_t min_keep_per_world{kDefaultMinKeepPerWorld};
};

/** Outcome of planning alone; no filesystem access involved. */
struct EvictionPlan {
  std::vector<backup::Backup> victims;   // in deletion order
  std::uint64_t projected_bytes{};       // aggregate after all victims are gone
  bool budget_still_exceeded{false};
};

struct EvictionReport {
  std::vector<backup::Backup> deleted;   // in deletion order, includes already-absent victims
  std::size_t already_absent{};          // victims removed out-of-band before we got to them
  std::uint64_t final_aggregate_bytes{};
  bool budget_still_exceeded{false};
  std::optional<core::error> aborted;    // set when a delete failed and the pass stopped early
};

/** Pure planner over an inventory snapshot. */
[[nodiscard]] EvictionPlan plan_evictions(const backup::Inventory& inventory, const RetentionPolicy& policy);

class RetentionManager {
public:
  explicit RetentionManager(backup::BackupRepository repository);

  /**
   * Rescan, plan and delete. Fails only when the inventory cannot be read; a
   * failed delete (other than "already gone") ends the pass early and is
   * reported through EvictionReport::aborted together with the progress made.
   */
  [[nodiscard]] auto enforce(const RetentionPolicy& policy) const
      -> std::expected<EvictionReport, core::error>;

  /**
   * Delete the victims of `plan` in order, starting from `aggregate_bytes`
   * (the inventory total the plan was computed from). Victims already gone
   * count as deleted and are tallied in already_absent.
   */
  [[nodiscard]] EvictionReport apply(const EvictionPlan& plan, std::uint64_t aggregate_bytes,
                                     const RetentionPolicy& policy) const;

private:
  backup::BackupRepository repository_;
};

} // namespace worldvault::retention
