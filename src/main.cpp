/**
 * motus - supervised rclone jobs from the command line
 *
 * Every invocation recovers the job table (jobs whose motus process has
 * exited become interrupted), runs one command and exits. The process that
 * starts a transfer supervises it until it finishes; `stop` from another
 * invocation marks the record and the supervising process ends the transfer.
 */

#include "settings.hpp"
#include "logger.hpp"
#include "errors.hpp"
#include "job_store.hpp"
#include "job_manager.hpp"
#include "process_supervisor.hpp"
#include "rclone_client.hpp"
#include <glib.h>
#include <glib-unix.h>
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace motus;

static const int kExitOk = 0;
static const int kExitFailure = 1;
static const int kExitUsage = 2;

static void print_usage() {
    std::cout << "motus - supervised rclone jobs\n\n"
              << "Usage: motus [--config FILE] [--debug] <command> [args]\n\n"
              << "Commands:\n"
              << "  copy|move|sync|check SRC DST [--copy-links]\n"
              << "  status ID\n"
              << "  list [--status S] [--limit N] [--offset N]\n"
              << "  stop ID\n"
              << "  resume ID\n"
              << "  resync ID\n"
              << "  log ID\n"
              << "  rm ID\n"
              << "  clear\n\n"
              << "List filters: a status name, \"aborted\" or \"resumable\"\n";
}

static void print_view(const JobView& view) {
    const Job& job = view.job;
    std::cout << "Job " << job.job_id << " [" << operation_name(job.operation) << "] "
              << status_name(job.status) << " " << job.progress << "%";
    if (job.exit_status != -1) std::cout << " (exit " << job.exit_status << ")";
    if (job.resumed_by_job_id) std::cout << " resumed by " << job.resumed_by_job_id;
    std::cout << "\n  " << job.source << " -> " << job.destination << "\n";
    if (!job.status_text.empty()) std::cout << job.status_text << "\n";
    if (!job.error_text.empty()) std::cout << "Errors:\n" << job.error_text;
    std::cout.flush();
}

struct FollowContext {
    JobManager* jobs;
    GMainLoop* loop;
    int job_id;
    int exit_code;
    std::string last_text;
    bool done;
    bool interrupted;
};

static gboolean follow_tick(gpointer user_data) {
    auto* ctx = static_cast<FollowContext*>(user_data);
    try {
        JobView view = ctx->jobs->status(ctx->job_id);
        if (view.job.status_text != ctx->last_text) {
            ctx->last_text = view.job.status_text;
            std::cout << view.job.status_text << "\n\n";
            std::cout.flush();
        }
        if (view.finished) {
            print_view(view);
            ctx->exit_code = view.job.status == JobStatus::Completed ? kExitOk : kExitFailure;
            ctx->done = true;
        }
    } catch (const MotusError& e) {
        Logger::error(std::string("[Follow] ") + e.what());
        ctx->exit_code = kExitFailure;
        ctx->done = true;
    }

    if (ctx->done) {
        if (ctx->loop) g_main_loop_quit(ctx->loop);
        return G_SOURCE_REMOVE;
    }
    return G_SOURCE_CONTINUE;
}

static gboolean shutdown_handler_glib(gpointer user_data) {
    auto* ctx = static_cast<FollowContext*>(user_data);
    Logger::info("[Shutdown] Signal received, interrupting jobs...");
    ctx->jobs->shutdown();
    ctx->interrupted = true;
    ctx->exit_code = kExitFailure;
    g_main_loop_quit(ctx->loop);
    return G_SOURCE_CONTINUE;
}

// Print progress until the job finishes; SIGINT/SIGTERM interrupt it
static int follow_job(JobManager& jobs, int job_id) {
    FollowContext ctx{&jobs, nullptr, job_id, kExitFailure, "", false, false};

    follow_tick(&ctx);
    if (ctx.done) {
        return ctx.exit_code;
    }

    ctx.loop = g_main_loop_new(nullptr, FALSE);
    guint sigint = g_unix_signal_add(SIGINT, shutdown_handler_glib, &ctx);
    guint sigterm = g_unix_signal_add(SIGTERM, shutdown_handler_glib, &ctx);
    guint tick = g_timeout_add(1000, follow_tick, &ctx);

    g_main_loop_run(ctx.loop);

    if (!ctx.done) g_source_remove(tick);
    g_source_remove(sigint);
    g_source_remove(sigterm);
    g_main_loop_unref(ctx.loop);

    if (ctx.interrupted) {
        std::cerr << "Job " << job_id << " interrupted\n";
    }
    return ctx.exit_code;
}

static int run_command(const std::vector<std::string>& args, const Settings& settings);

static bool parse_id(const std::string& text, int& id) {
    try {
        size_t used = 0;
        id = std::stoi(text, &used);
        return used == text.size() && id > 0;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    std::string config_path;
    bool debug_mode = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--debug") {
            debug_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return kExitOk;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return kExitUsage;
    }

    Settings settings(config_path);
    settings.load();
    settings.ensure_directories();

    LogLevel level = debug_mode ? LogLevel::DEBUG : Logger::parse_level(settings.get_log_level());
    Logger::init(level, settings.get_log_file());

    int code = run_command(args, settings);
    Logger::shutdown();
    return code;
}

static int run_command(const std::vector<std::string>& args, const Settings& settings) {
    const std::string command = args[0];

    try {
        SqliteJobStore store(settings.get_database_path());
        RcloneClient rclone(settings);
        ProcessSupervisor supervisor(settings.get_poll_interval_ms(), settings.get_error_text_limit());
        JobManager jobs(store, rclone, supervisor, settings.get_poll_interval_ms());
        jobs.initialize();

        if (command == "copy" || command == "move" || command == "sync" || command == "check") {
            std::vector<std::string> paths;
            bool copy_links = false;
            for (size_t i = 1; i < args.size(); ++i) {
                if (args[i] == "--copy-links") copy_links = true;
                else paths.push_back(args[i]);
            }
            if (paths.size() != 2) {
                print_usage();
                return kExitUsage;
            }

            rclone.verify();
            int job_id = jobs.start(parse_operation(command), paths[0], paths[1], copy_links);
            std::cout << "Started job " << job_id << "\n";
            return follow_job(jobs, job_id);
        }

        if (command == "list") {
            std::string filter;
            int limit = 100;
            int offset = 0;
            for (size_t i = 1; i < args.size(); ++i) {
                if (i + 1 >= args.size()) {
                    print_usage();
                    return kExitUsage;
                }
                if (args[i] == "--status") filter = args[++i];
                else if (args[i] == "--limit" && parse_id(args[i + 1], limit)) ++i;
                else if (args[i] == "--offset") offset = std::max(0, std::atoi(args[++i].c_str()));
                else {
                    print_usage();
                    return kExitUsage;
                }
            }
            for (const auto& view : jobs.list(filter, limit, offset)) {
                const Job& job = view.job;
                std::printf("%6d  %-6s %-11s %3d%%  %s -> %s\n", job.job_id, operation_name(job.operation),
                            status_name(job.status), job.progress, job.source.c_str(), job.destination.c_str());
            }
            return kExitOk;
        }

        if (command == "clear") {
            std::vector<int> removed = jobs.clear_stopped();
            std::cout << "Removed " << removed.size() << " jobs\n";
            return kExitOk;
        }

        int job_id = 0;
        if (args.size() != 2 || !parse_id(args[1], job_id)) {
            print_usage();
            return kExitUsage;
        }

        if (command == "status") {
            print_view(jobs.status(job_id));
            return kExitOk;
        }
        if (command == "stop") {
            if (!jobs.stop(job_id)) std::cout << "Job " << job_id << " already finished\n";
            print_view(jobs.status(job_id));
            return kExitOk;
        }
        if (command == "resume" || command == "resync") {
            rclone.verify();
            int new_id = command == "resume" ? jobs.resume(job_id) : jobs.resync(job_id);
            std::cout << "Started job " << new_id << "\n";
            return follow_job(jobs, new_id);
        }
        if (command == "log") {
            std::cout << jobs.log_text(job_id);
            return kExitOk;
        }
        if (command == "rm") {
            if (!jobs.remove(job_id)) {
                std::cerr << "Job " << job_id << " not found\n";
                return kExitFailure;
            }
            return kExitOk;
        }

        print_usage();
        return kExitUsage;
    } catch (const MotusError& e) {
        Logger::error(std::string("[Main] ") + error_kind_name(e.kind()) + ": " + e.what());
        std::cerr << "error: " << error_kind_name(e.kind()) << ": " << e.what() << "\n";
        return kExitFailure;
    }
}
