/**
 * One scheduler tick of a periodic backup shell
 *
 * This example demonstrates:
 * - Loading configuration from a YAML file plus environment overrides
 * - Backing up every discovered world once
 * - Reading the retention outcome that follows each backup
 *
 * Usage: backup_tick [config.yaml]
 */

#include <worldvault/worldvault.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    using namespace worldvault;

    auto cfg = config::default_config();
    if (argc > 1) {
        auto loaded = config::load_config(argv[1]);
        if (!loaded) {
            spdlog::error("backup_tick: {} ({})", loaded.error().message, core::to_string(loaded.error().code));
            return 1;
        }
        cfg = std::move(*loaded);
    }
    if (auto ex = config::apply_env_overrides(cfg); !ex) {
        spdlog::error("backup_tick: {}", ex.error().message);
        return 1;
    }

    auto svc = BackupService::open(cfg);
    if (!svc) {
        spdlog::error("backup_tick: cannot start: {} ({})", svc.error().message, core::to_string(svc.error().code));
        return 1;
    }

    auto worlds = svc->list_worlds();
    if (!worlds) {
        spdlog::error("backup_tick: {}", worlds.error().message);
        return 1;
    }
    if (worlds->empty()) {
        spdlog::info("backup_tick: no worlds under {}", cfg.saves_root.string());
        return 0;
    }

    int failures = 0;
    for (const auto& w : *worlds) {
        auto out = svc->create_backup(w.id);
        if (!out) {
            ++failures;
            spdlog::error("backup_tick: {} failed: {} ({})", w.id, out.error().message, core::to_string(out.error().code));
            continue;
        }
        spdlog::info("backup_tick: {} -> {}", w.id, out->backup.archive_name);
        if (out->eviction_error) {
            spdlog::warn("backup_tick: retention skipped: {}", out->eviction_error->message);
        } else if (out->eviction && out->eviction->budget_still_exceeded) {
            spdlog::warn("backup_tick: storage limit still exceeded ({} bytes)", out->eviction->final_aggregate_bytes);
        }
    }

    if (auto total = svc->aggregate_size()) {
        spdlog::info("backup_tick: {} bytes of backups on disk", *total);
    }
    return failures == 0 ? 0 : 2;
}
