#include "worldvault/retention/retention.hpp"

#include <algorithm>
#include <queue>
#include <string>

namespace worldvault::retention {

namespace {

// Head of one world's oldest-first backup list.
struct Cursor {
  const std::string* world_id{};
  const std::vector<backup::Backup>* backups{};
  std::size_t next{};
  std::size_t remaining{};

  const backup::Backup& head() const { return (*backups)[next]; }
};

// Min-heap order: the globally oldest head surfaces first.
struct LaterHead {
  bool operator()(const Cursor& a, const Cursor& b) const {
    const auto& x = a.head(); const auto& y = b.head();
    if (x.created != y.created) return x.created > y.created;
    if (x.archive_name != y.archive_name) return x.archive_name > y.archive_name;
    return *a.world_id > *b.world_id;
  }
};

} // namespace

EvictionPlan plan_evictions(const backup::Inventory& inventory, const RetentionPolicy& policy) {
  EvictionPlan plan{};
  plan.projected_bytes = inventory.total_bytes;

  std::priority_queue<Cursor, std::vector<Cursor>, LaterHead> eligible;
  for (const auto& [id, backups] : inventory.by_world) {
    if (backups.size() > policy.min_keep_per_world) {
      eligible.push(Cursor{&id, &backups, 0, backups.size()});
    }
  }

  while (plan.projected_bytes > policy.max_aggregate_bytes && !eligible.empty()) {
    Cursor c = eligible.top();
    eligible.pop();
    const auto& victim = c.head();
    plan.projected_bytes -= std::min(plan.projected_bytes, victim.size_bytes);
    plan.victims.push_back(victim);
    ++c.next;
    --c.remaining;
    if (c.remaining > policy.min_keep_per_world) eligible.push(c);
  }
  plan.budget_still_exceeded = plan.projected_bytes > policy.max_aggregate_bytes;
  return plan;
}

} // namespace worldvault::retention
