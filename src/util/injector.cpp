#include <envinject/injector.hpp>
#include <envinject/assets.hpp>
#include <envinject/file_io.hpp>
#include <envinject/log.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace envinject {

namespace fs = std::filesystem;

namespace {

struct FileOutcome {
    bool started = false;
    size_t replacements = 0;
    std::optional<InjectError> error;
};

bool past(const Deadline& deadline) {
    return deadline.has_value() && std::chrono::steady_clock::now() >= *deadline;
}

void announce(const SubstitutionSet& set, bool show_values, InjectReport& report) {
    for (const auto& sub : set.entries) {
        if (show_values) {
            log::info("injecting %s=%s", sub.key.c_str(), sub.value.c_str());
        } else {
            log::info("injecting %s", sub.key.c_str());
        }
        report.announced_keys.push_back(sub.key);
    }
}

} // namespace

Result<size_t> rewrite_file(const fs::path& path, const SubstitutionSet& set, bool dry_run) {
    auto contents = read_file(path);
    if (contents.is_err()) return std::move(contents).error();

    std::string& buf = contents.value();
    size_t count = apply_substitutions(buf, set);
    if (count == 0 || dry_run) {
        return Result<size_t>::ok(count);
    }

    ENVINJECT_TRY(write_file_atomic(path, buf));
    return Result<size_t>::ok(count);
}

Result<InjectReport> inject(const fs::path& root_dir,
                            const EnvironmentSnapshot& env,
                            const InjectConfig& config) {
    Deadline deadline;
    if (config.timeout_ms > 0) {
        deadline = std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(config.timeout_ms);
    }
    return inject_until(root_dir, env, config, deadline);
}

Result<InjectReport> inject_until(const fs::path& root_dir,
                                  const EnvironmentSnapshot& env,
                                  const InjectConfig& config,
                                  Deadline deadline) {
    ENVINJECT_TRY(config.validate());

    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        return InjectError(InjectError::Config,
            "asset root does not exist or is not a directory",
            "pass the build output directory with --root", root_dir.string());
    }

    // ---- Substitution set ----
    auto set = derive_substitutions(env, config.prefix,
                                    config.token_prefix, config.token_suffix);
    if (set.empty()) {
        if (config.strict) {
            return InjectError(InjectError::Config,
                "no environment variables start with '" + config.prefix + "'",
                "strict mode requires at least one variable; check the container environment");
        }
        log::info("no environment variables start with '%s', nothing to inject",
                  config.prefix.c_str());
        InjectReport empty;
        empty.dry_run = config.dry_run;
        return Result<InjectReport>::ok(std::move(empty));
    }

    if (config.check_overlap) {
        ENVINJECT_TRY(check_token_overlap(set));
    }

    for (const auto& key : self_referential_keys(set)) {
        log::warn("value of %s contains a placeholder; a second run would rewrite it again",
                  key.c_str());
    }

    // ---- Asset file set ----
    AssetFilter filter;
    filter.extensions = config.extensions;
    filter.exclude = config.exclude;

    auto assets_r = enumerate_assets(root_dir, filter);
    if (assets_r.is_err()) return std::move(assets_r).error();
    const auto& assets = assets_r.value();

    log::debug("%zu asset file(s) under %s", assets.size(), root_dir.string().c_str());

    InjectReport report;
    report.dry_run = config.dry_run;
    announce(set, config.show_values, report);

    // ---- Rewrite ----
    std::vector<FileOutcome> outcomes(assets.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> timed_out{false};

    auto worker = [&]() {
        while (true) {
            if (timed_out.load(std::memory_order_relaxed)) break;
            const size_t i = next.fetch_add(1);
            if (i >= assets.size()) break;
            if (past(deadline)) {
                timed_out.store(true, std::memory_order_relaxed);
                break;
            }

            auto& out = outcomes[i];
            out.started = true;
            auto r = rewrite_file(root_dir / assets[i], set, config.dry_run);
            if (r.is_err()) {
                out.error = std::move(r).error();
                continue;
            }
            out.replacements = r.value();
            if (out.replacements > 0) {
                log::debug("%s: %zu replacement(s)%s", assets[i].c_str(), out.replacements,
                           config.dry_run ? " (dry run)" : "");
            }
        }
    };

    const size_t workers = std::min<size_t>(static_cast<size_t>(config.jobs),
                                            std::max<size_t>(assets.size(), 1));
    if (workers > 1) {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    } else {
        worker();
    }

    // Merge in file order so the report does not depend on scheduling
    for (size_t i = 0; i < assets.size(); ++i) {
        const auto& out = outcomes[i];
        if (!out.started) continue;
        report.files_scanned++;
        if (out.error) {
            log::error("%s", out.error->format().c_str());
            report.io_errors.push_back(*out.error);
            continue;
        }
        if (out.replacements > 0) {
            report.files_modified++;
            report.replacements += out.replacements;
            report.modified_files.push_back(assets[i]);
        }
    }

    if (timed_out.load()) {
        return InjectError(InjectError::Timeout,
            "injection exceeded its time budget after " +
                std::to_string(report.files_scanned) + " of " +
                std::to_string(assets.size()) + " file(s)",
            "raise --timeout or check for a slow or hung filesystem", root_dir.string());
    }

    log::info("%s %zu of %zu file(s), %zu replacement(s)",
              config.dry_run ? "would modify" : "modified",
              report.files_modified, report.files_scanned, report.replacements);

    return Result<InjectReport>::ok(std::move(report));
}

} // namespace envinject
