#include "worldvault/retention/retention.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace worldvault::retention {

RetentionManager::RetentionManager(backup::BackupRepository repository)
    : repository_(std::move(repository)) {}

auto RetentionManager::enforce(const RetentionPolicy& policy) const
    -> std::expected<EvictionReport, core::error> {
  auto inv = repository_.inventory();
  if (!inv) {
    spdlog::error("retention: inventory failed, nothing evicted: {}", inv.error().message);
    return std::unexpected(inv.error());
  }
  return apply(plan_evictions(*inv, policy), inv->total_bytes, policy);
}

EvictionReport RetentionManager::apply(const EvictionPlan& plan, std::uint64_t aggregate_bytes,
                                       const RetentionPolicy& policy) const {
  EvictionReport report{};
  report.final_aggregate_bytes = aggregate_bytes;
  for (const auto& victim : plan.victims) {
    auto rx = repository_.remove(victim);
    if (!rx) {
      spdlog::error("retention: eviction pass stopped after {} deletions: {}", report.deleted.size(), rx.error().message);
      report.aborted = rx.error();
      break;
    }
    if (!*rx) ++report.already_absent;
    report.final_aggregate_bytes -= std::min(report.final_aggregate_bytes, victim.size_bytes);
    report.deleted.push_back(victim);
  }
  report.budget_still_exceeded = report.final_aggregate_bytes > policy.max_aggregate_bytes;

  if (!report.deleted.empty()) {
    spdlog::info("retention: evicted {} backup(s), aggregate now {} of {} bytes",
                 report.deleted.size(), report.final_aggregate_bytes, policy.max_aggregate_bytes);
  }
  if (report.budget_still_exceeded) {
    spdlog::warn("retention: {} bytes still exceeds the {} byte budget with a floor of {} per world; "
                 "raise the limit or free space manually",
                 report.final_aggregate_bytes, policy.max_aggregate_bytes, policy.min_keep_per_world);
  }
  return report;
}

} // namespace worldvault::retention
