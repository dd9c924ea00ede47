/*
 * Copyright (C) 2014-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <functional>
#include <fmt/ranges.h>

#include <seastar/core/abort_source.hh>
#include <seastar/core/app-template.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/distributed.hh>
#include <seastar/core/loop.hh>
#include <seastar/core/reactor.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/thread.hh>
#include <seastar/util/defer.hh>
#include <seastar/util/file.hh>

#include "db/config.hh"
#include "gms/inet_address.hh"
#include "log.hh"
#include "replica/file_store.hh"
#include "streaming/stream_event_handler.hh"
#include "streaming/stream_exception.hh"
#include "streaming/stream_manager.hh"
#include "streaming/stream_plan.hh"
#include "streaming/stream_server.hh"

namespace bpo = boost::program_options;

static logging::logger startlog("init");

class stop_signal {
    bool _caught = false;
    condition_variable _cond;
    sharded<abort_source> _abort_sources;
    future<> _broadcasts_to_abort_sources_done = make_ready_future<>();
private:
    void signaled() {
        if (_caught) {
            return;
        }
        _caught = true;
        _cond.broadcast();
        _broadcasts_to_abort_sources_done = _broadcasts_to_abort_sources_done.then([this] {
            return _abort_sources.invoke_on_all(&abort_source::request_abort);
        });
    }
public:
    stop_signal() {
        _abort_sources.start().get();
        engine().handle_signal(SIGINT, [this] { signaled(); });
        engine().handle_signal(SIGTERM, [this] { signaled(); });
    }
    ~stop_signal() {
        // There's no way to unregister a handler yet, so register a no-op handler instead.
        engine().handle_signal(SIGINT, [] {});
        engine().handle_signal(SIGTERM, [] {});
        _broadcasts_to_abort_sources_done.get();
        _abort_sources.stop().get();
    }
    future<> wait() {
        return _cond.wait([this] { return _caught; });
    }
    bool stopping() const {
        return _caught;
    }
    abort_source& as_local_abort_source() { return _abort_sources.local(); }
};

static sstring config_file_name(const bpo::variables_map& opts) {
    if (opts.contains("options-file")) {
        return opts["options-file"].as<sstring>();
    }
    return db::config::get_conf_sub("bulkstream.yaml").string();
}

static void log_config_error(const sstring& opt, const sstring& msg, std::optional<utils::config_file::value_status> status) {
    auto level = logging::log_level::warn;
    if (status.value_or(utils::config_file::value_status::Invalid) != utils::config_file::value_status::Invalid) {
        level = logging::log_level::error;
    }
    startlog.log(level, "{} : {}", msg, opt);
}

static future<>
read_config(const bpo::variables_map& opts, db::config& cfg) {
    auto file = config_file_name(opts);
    if (!opts.contains("options-file") && !co_await file_exists(file)) {
        startlog.info("No configuration file at {}, using defaults", file);
        co_return;
    }
    std::exception_ptr ex;
    try {
        co_await cfg.read_from_file(file, log_config_error);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        startlog.error("Could not read configuration file {}: {}", file, ex);
        std::rethrow_exception(ex);
    }
}

// Handles SIGHUP, using it to trigger re-reading of the live values of the
// configuration file. Should only be constructed on shard 0.
class sighup_handler {
    const bpo::variables_map& _opts;
    db::config& _cfg;
    condition_variable _cond;
    bool _pending = false; // if asked to reread while already reading
    bool _stopping = false;
    future<> _done = do_work();  // Launch main work loop, capture completion future
public:
    // Installs the signal handler. Must call stop() (and wait for it) before destruction.
    sighup_handler(const bpo::variables_map& opts, db::config& cfg) : _opts(opts), _cfg(cfg) {
        startlog.info("installing SIGHUP handler");
        engine().handle_signal(SIGHUP, [this] { reread_config(); });
    }
private:
    void reread_config() {
        if (_stopping) {
            return;
        }
        _pending = true;
        _cond.broadcast();
    }
    // Main work loop. Waits for either _stopping or _pending to be raised, and
    // re-reads the configuration file if _pending. Reads never overlap, so an
    // older read can't overwrite the results of a younger one.
    future<> do_work() {
        while (true) {
            co_await _cond.wait([this] { return _pending || _stopping; });
            if (_stopping) {
                co_return;
            }
            _pending = false;
            auto file = config_file_name(_opts);
            try {
                startlog.info("re-reading configuration file {}", file);
                auto yaml = co_await util::read_entire_file_contiguous(std::filesystem::path(file.c_str()));
                auto applied = _cfg.reload_live_values(yaml, log_config_error);
                startlog.info("completed re-reading configuration file, {} live values applied", applied);
            } catch (...) {
                startlog.error("failed to re-read configuration file: {}", std::current_exception());
            }
        }
    }
public:
    // Signals the main work loop to stop, and waits for it (and any in-progress work)
    // to complete. After this is waited for, the object can be destroyed.
    future<> stop() {
        // No way to unregister yet
        engine().handle_signal(SIGHUP, [] {});
        _pending = false;
        _stopping = true;
        _cond.broadcast();
        return std::move(_done);
    }
};

template <typename Func>
static auto defer_verbose_shutdown(const char* what, Func&& func) {
    auto vfunc = [what, func = std::forward<Func>(func)] () mutable noexcept {
        startlog.info("Shutting down {}", what);
        try {
            func();
            startlog.info("Shutting down {} was successful", what);
        } catch (...) {
            startlog.error("Unexpected error shutting down {}: {}: aborting", what, std::current_exception());
            abort();
        }
    };
    return seastar::defer(std::move(vfunc));
}

// Reports what a plan started from the command line does.
class plan_progress_logger : public streaming::stream_event_handler {
public:
    void handle_stream_event(streaming::session_prepared_event event) override {
        startlog.info("[Stream #{}] Session with {} prepared: receiving {} tables, sending {} tables", event.plan_id,
                event.session.peer, event.session.receiving_summaries.size(), event.session.sending_summaries.size());
    }
    void handle_stream_event(streaming::progress_event event) override {
        startlog.debug("[Stream #{}] {}", event.plan_id, event.progress);
    }
    void handle_stream_event(streaming::session_complete_event event) override {
        startlog.info("[Stream #{}] Session with {} {}", event.plan_id, event.peer, event.success ? "completed" : "failed");
    }
};

static std::vector<sstring> option_values(const bpo::variables_map& opts, const char* name) {
    if (!opts.contains(name)) {
        return {};
    }
    return opts[name].as<std::vector<sstring>>();
}

// Runs the plan given on the command line. Returns the process exit code.
static int run_command_line_plan(const bpo::variables_map& opts, streaming::stream_manager& mgr, stop_signal& stop_signal) {
    auto transfer_to = option_values(opts, "transfer-to");
    auto request_from = option_values(opts, "request-from");
    if (!opts.contains("keyspace")) {
        throw std::invalid_argument("--keyspace is required with --transfer-to and --request-from");
    }
    auto keyspace = opts["keyspace"].as<sstring>();
    auto tables = option_values(opts, "tables");
    auto reason = streaming::parse_stream_reason(opts["reason"].as<sstring>());
    auto policy = opts["fail-fast"].as<bool>() ? streaming::failure_policy::fail_fast : streaming::failure_policy::best_effort;

    streaming::stream_plan plan(mgr, opts["description"].as<sstring>(), reason, policy);
    for (auto& peer : transfer_to) {
        plan.transfer_ranges(gms::inet_address::lookup(peer).get(), keyspace, {}, tables);
    }
    for (auto& peer : request_from) {
        plan.request_ranges(gms::inet_address::lookup(peer).get(), keyspace, {}, tables);
    }
    plan_progress_logger progress;
    plan.listeners({&progress});

    auto abort_plan = stop_signal.as_local_abort_source().subscribe([&plan] () noexcept {
        startlog.info("[Stream #{}] Aborting on signal", plan.id());
        plan.abort();
    });
    startlog.info("[Stream #{}] Executing plan: keyspace={} tables={} transfer_to={} request_from={} reason={}",
            plan.id(), keyspace, tables, transfer_to, request_from, reason);
    try {
        auto state = plan.execute().get();
        using dir = streaming::progress_info::direction;
        for (auto& s : state.sessions) {
            startlog.info("[Stream #{}] Session with {}: sent {} files ({} bytes), received {} files ({} bytes)", state.plan_id, s.peer,
                    s.files_done(dir::OUT), s.bytes_done(dir::OUT), s.files_done(dir::IN), s.bytes_done(dir::IN));
        }
        startlog.info("[Stream #{}] Plan completed with {} sessions", state.plan_id, state.sessions.size());
        return 0;
    } catch (const streaming::stream_exception& e) {
        startlog.error("[Stream #{}] {}, failed peers: {}", e.state.plan_id, e.what(), e.state.failed_peers());
        for (auto& s : e.state.sessions) {
            startlog.error("[Stream #{}] Session with {} ended in state {}", e.state.plan_id, s.peer, s.state);
        }
        return 1;
    }
}

int main(int ac, char** av) {
    app_template::config app_cfg;
    app_cfg.name = "bulkstream";
    app_cfg.description =
R"(bulkstream - inter-node bulk file streaming using the seastar framework

Serves streaming sessions from other nodes on listen_address:streaming_port.
With --transfer-to or --request-from, also runs one stream plan for the
tables of --keyspace and exits with its outcome.
)";
    app_cfg.auto_handle_sigint_sigterm = false;
    app_template app(std::move(app_cfg));

    auto cfg = make_lw_shared<db::config>();
    auto init = app.add_options();

    init("options-file", bpo::value<sstring>(), "configuration file (i.e. <BULKSTREAM_HOME>/conf/bulkstream.yaml)");
    init("transfer-to", bpo::value<std::vector<sstring>>()->composing(), "peers to send the files of --keyspace to");
    init("request-from", bpo::value<std::vector<sstring>>()->composing(), "peers to fetch the files of --keyspace from");
    init("keyspace", bpo::value<sstring>(), "keyspace streamed by the plan");
    init("tables", bpo::value<std::vector<sstring>>()->composing(), "tables of --keyspace streamed by the plan, all if not given");
    init("reason", bpo::value<sstring>()->default_value("unspecified"), "reason announced to the peers (bootstrap, decommission, removenode, rebuild, repair, replace, rebalance)");
    init("description", bpo::value<sstring>()->default_value("bulkstream"), "description of the plan");
    init("fail-fast", bpo::bool_switch(), "abort the other sessions of the plan when one fails");
    cfg->add_options(init);

    sharded<replica::file_store> store;
    sharded<streaming::stream_manager> stream_manager;
    sharded<streaming::stream_server> stream_server;

    return app.run(ac, av, [&] () -> future<int> {
        auto&& opts = app.configuration();

        return seastar::async([cfg, &opts, &store, &stream_manager, &stream_server] {
            ::stop_signal stop_signal;
            read_config(opts, *cfg).get();
            logging::apply_settings(cfg->logging_settings(opts));

            ::sighup_handler sighup_handler(opts, *cfg);
            auto stop_sighup_handler = defer_verbose_shutdown("sighup", [&] {
                sighup_handler.stop().get();
            });

            auto listen_address = gms::inet_address::lookup(cfg->listen_address()).get();
            startlog.info("Starting bulkstream on {}:{}, data in {}", listen_address, cfg->streaming_port(), cfg->data_directory());

            store.start(cfg->data_directory()).get();
            auto stop_store = defer_verbose_shutdown("file store", [&store] {
                store.stop().get();
            });
            store.invoke_on_all(&replica::file_store::start).get();

            stream_manager.start(std::ref(*cfg), listen_address,
                    sharded_parameter([&store] { return std::ref(static_cast<streaming::data_source&>(store.local())); }),
                    sharded_parameter([&store] { return std::ref(static_cast<streaming::data_sink&>(store.local())); })).get();
            auto stop_stream_manager = defer_verbose_shutdown("stream manager", [&stream_manager] {
                stream_manager.stop().get();
            });

            stream_server.start(std::ref(stream_manager), listen_address.to_socket_address(cfg->streaming_port())).get();
            auto stop_stream_server = defer_verbose_shutdown("stream server", [&stream_server] {
                stream_server.stop().get();
            });
            stream_server.invoke_on_all(&streaming::stream_server::listen).get();

            if (opts.contains("transfer-to") || opts.contains("request-from")) {
                return run_command_line_plan(opts, stream_manager.local(), stop_signal);
            }
            startlog.info("bulkstream initialization completed.");
            stop_signal.wait().get();
            startlog.info("Signal received; shutting down");
            return 0;
        });
    });
}
