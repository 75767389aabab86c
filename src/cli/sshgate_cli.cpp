#include "sshgate_cli.hpp"
#include "terminal_prompter.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

static std::unique_ptr<AuthMethodSource> make_method_source(const Config& config,
                                                             platform::CommandRunner& runner,
                                                             const OutputParser& parser,
                                                             const SshClientOptions& opts) {
    if (config.ssh().method_probe == "libssh2")
        return std::make_unique<Libssh2MethodSource>();
    return std::make_unique<SystemSshMethodSource>(runner, parser, opts);
}

static SshClientOptions client_options(const Config& config) {
    SshClientOptions opts;
    opts.binary = config.ssh().binary;
    opts.strict_host_key_checking = config.ssh().strict_host_key_checking;
    return opts;
}

static DiagnosticsTimeouts engine_timeouts(const Config& config) {
    DiagnosticsTimeouts t;
    t.dns_ms = config.timeouts().dns_ms;
    t.port_ms = config.timeouts().port_ms;
    t.method_probe_ms = config.timeouts().method_probe_ms;
    t.auth_ms = config.timeouts().auth_ms;
    return t;
}

Result<TestOptions> parse_test_args(const std::vector<std::string>& args) {
    TestOptions opts;
    for (size_t i = 0; i < args.size(); i++) {
        const auto& a = args[i];
        if (a == "--all") {
            opts.all = true;
        } else if (a == "--non-interactive") {
            opts.non_interactive = true;
        } else if (a == "-q" || a == "--quiet") {
            opts.quiet = true;
        } else if (a == "-i") {
            if (i + 1 >= args.size()) return Result<TestOptions>::Err("-i requires a key path");
            opts.identity_file = args[++i];
        } else if (a == "--max-attempts") {
            if (i + 1 >= args.size()) return Result<TestOptions>::Err("--max-attempts requires a number");
            int n = safe_stoi(args[++i], 0);
            if (n < 1) return Result<TestOptions>::Err("--max-attempts must be at least 1");
            opts.max_attempts = n;
        } else if (!a.empty() && a[0] == '-') {
            return Result<TestOptions>::Err("Unknown option: " + a);
        } else {
            opts.targets.push_back(a);
        }
    }
    if (!opts.all && opts.targets.empty())
        return Result<TestOptions>::Err("No target given (user@host[:port] or --all)");
    return Result<TestOptions>::Ok(opts);
}

SshgateCLI::SshgateCLI(Config config)
    : config_(std::move(config)),
      method_source_(make_method_source(config_, runner_, parser_, client_options(config_))),
      connectivity_(network_),
      methods_(*method_source_),
      authenticator_(runner_, parser_, client_options(config_)),
      keys_(config_.key_dir()),
      cache_(SessionCredentialCache::parse_ttl(config_.cache_ttl())),
      engine_(connectivity_, methods_, authenticator_, keys_, cache_, engine_timeouts(config_)),
      known_(KnownConnections::default_path()) {
    set_sshgate_log_path(config_.log_path());
}

Result<ConnectionTarget> SshgateCLI::resolve_target(const std::string& spec) const {
    auto entry = config_.find_host(spec);
    if (entry) {
        ConnectionTarget target = entry->target;
        known_.apply(target);
        return Result<ConnectionTarget>::Ok(target);
    }
    auto parsed = parse_target(spec);
    if (parsed.is_ok()) known_.apply(parsed.value);
    return parsed;
}

// ── test ────────────────────────────────────────────────────

int SshgateCLI::run_test(const std::vector<std::string>& args) {
    auto parsed = parse_test_args(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Usage: sshgate test <user@host[:port]>... [-i key] [--non-interactive] [--max-attempts N] [-q]");
        return 1;
    }
    const auto& opts = parsed.value;

    std::vector<ConnectionTarget> targets;
    if (opts.all) {
        if (config_.hosts().empty()) {
            std::cout << theme::fail("No hosts configured in " + get_global_config_path().string());
            return 1;
        }
        for (const auto& h : config_.hosts()) {
            ConnectionTarget target = h.target;
            known_.apply(target);
            targets.push_back(target);
        }
    }
    for (const auto& spec : opts.targets) {
        auto t = resolve_target(spec);
        if (t.is_err()) {
            std::cout << theme::fail(t.error);
            return 1;
        }
        targets.push_back(t.value);
    }
    if (!opts.identity_file.empty()) {
        for (auto& t : targets) t.identity_file = opts.identity_file;
    }

    bool interactive = !opts.non_interactive && platform::stdin_is_tty();

    RetryPolicy policy;
    policy.max_attempts = opts.max_attempts > 0 ? opts.max_attempts : config_.retry().max_attempts;
    policy.interactive = interactive;
    policy.backoff = std::chrono::milliseconds(config_.retry().backoff_ms);
    policy.diagnose.suppress_debug_output = opts.quiet;

    auto progress = [](const std::string& msg) { std::cout << theme::log(msg) << std::flush; };
    engine_.set_status_callback(progress);

    RetryOrchestrator orchestrator(engine_, cache_,
        [this](const ResolvedConnection& rc) { return known_.save(rc); });
    if (!opts.quiet) orchestrator.set_status_callback(progress);

    TerminalPrompter prompter;
    sshgate_log(fmt::format("test: {} target(s), interactive={}, max_attempts={}",
                            targets.size(), interactive, policy.max_attempts));

    auto results = orchestrator.attempt_all(
        targets, interactive ? &prompter : nullptr, policy,
        [](const ConnectionTarget& target) { std::cout << theme::section(target.display()); },
        [this](const ConnectionTarget& target, const AttemptResult& result) {
            print_result(target, result);
            if (result.status == AttemptStatus::Cancelled)
                std::cout << theme::dim("    Cancelled.") << "\n";
        });

    size_t failures = 0;
    for (const auto& r : results) {
        if (!r.success) failures++;
    }
    size_t skipped = targets.size() - results.size();

    if (targets.size() > 1) {
        std::cout << theme::divider();
        std::cout << theme::kv("Targets", std::to_string(targets.size()));
        std::cout << theme::kv("Failed", std::to_string(failures));
        if (skipped > 0) std::cout << theme::kv("Skipped", std::to_string(skipped));
    }
    std::cout << "\n";
    return failures == 0 && skipped == 0 ? 0 : 1;
}

void SshgateCLI::print_result(const ConnectionTarget& target, const AttemptResult& result) const {
    if (result.diagnostics) {
        const auto& d = *result.diagnostics;
        const auto& c = d.connectivity;
        std::cout << "\n";
        std::cout << theme::stage("DNS", c.dns_ok);
        if (c.dns_ok) std::cout << theme::stage("Port " + std::to_string(target.port), c.port_ok,
                                                format_elapsed(c.duration_ms));
        if (d.auth_strategy) {
            const auto& s = *d.auth_strategy;
            std::cout << theme::kv("Methods", s.methods.empty()
                                                   ? std::string("unknown")
                                                   : fmt::format("{}", fmt::join(s.methods, ", ")));
            if (!s.server_banner.empty()) std::cout << theme::kv("Server", s.server_banner);
            std::cout << theme::kv("Strategy", AuthMethodProbe::describe(s));
        }
        if (d.auth_result.tested()) {
            std::string note;
            if (d.auth_result.success && d.auth_result.method) {
                note = to_string(*d.auth_result.method);
                if (d.auth_result.key_path) note += " " + *d.auth_result.key_path;
            }
            std::cout << theme::stage("Auth", d.auth_result.success, note);
        }
        std::cout << "\n";
    }

    if (result.success) {
        std::cout << theme::ok(fmt::format("Connected to {} (attempt {})", target.display(), result.attempts));
        return;
    }

    std::cout << theme::fail(fmt::format("{} [{}]", target.display(), to_string(result.status)));
    std::string msg = result.error_message;
    if (msg.empty() && result.diagnostics) msg = result.diagnostics->detailed_message;
    std::istringstream lines(msg);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) std::cout << theme::dim("    " + line) << "\n";
    }
}

// ── methods ─────────────────────────────────────────────────

int SshgateCLI::run_methods(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: sshgate methods <user@host[:port]>");
        return 1;
    }
    auto t = resolve_target(args[0]);
    if (t.is_err()) {
        std::cout << theme::fail(t.error);
        return 1;
    }
    const auto& target = t.value;

    std::cout << theme::section(target.display());
    auto conn = connectivity_.probe(target.host, target.port,
                                    config_.timeouts().dns_ms, config_.timeouts().port_ms);
    if (!conn.success()) {
        std::cout << theme::fail(compose_message(conn.detail->message, conn.detail->suggestions));
        return 1;
    }

    auto strategy = methods_.detect(target, config_.timeouts().method_probe_ms, keys_.has_keys());
    if (strategy.methods.empty()) {
        std::cout << theme::fail("Server did not report its authentication methods");
        return 1;
    }
    std::cout << theme::kv("Methods", fmt::format("{}", fmt::join(strategy.methods, ", ")));
    if (!strategy.server_banner.empty()) std::cout << theme::kv("Server", strategy.server_banner);
    std::cout << theme::kv("Strategy", AuthMethodProbe::describe(strategy));
    std::cout << theme::kv("Local keys", keys_.has_keys() ? "yes" : "none");
    std::cout << "\n";
    return 0;
}
