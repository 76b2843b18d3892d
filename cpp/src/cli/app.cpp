#include "snap/cli/app.hpp"
#include "snap/cli/commands.hpp"
#include "snap/core/log.hpp"
#include "snap/ingest/adapter.hpp"
#include "snap/ingest/sqlite_queue.hpp"
#include "snap/ingest/worker.hpp"
#include "snap/lifecycle/orchestrator.hpp"
#include "snap/security/id.hpp"
#include "snap/store/sqlite_store.hpp"
#include "snap/store/sweeper.hpp"

#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace snap::cli {

using namespace snap::core;
using snap::lifecycle::LifecycleError;
using snap::lifecycle::LifecycleResult;

namespace {
    constexpr u32 kMaxOptions = 32;
    constexpr u32 kMaxPositionals = 8;

    constexpr OptionSpec kGlobalOptions[] = {
        {OptionId::Db, OptionType::String, "db", 'd'},
        {OptionId::LogLevel, OptionType::String, "log-level", 'l'},
        {OptionId::Help, OptionType::Flag, "help", 'h'},
    };

    constexpr OptionSpec kCommandOptions[] = {
        {OptionId::Prompt, OptionType::String, "prompt", 'p'},
        {OptionId::Answer, OptionType::String, "answer", 'a'},
        {OptionId::ExpireIn, OptionType::I64, "expire-in", 'e'},
        {OptionId::BaseLink, OptionType::String, "base-link", 'b'},
        {OptionId::ReplyTo, OptionType::String, "reply-to", 'r'},
        {OptionId::Max, OptionType::I64, "max", 'n'},
    };

    constexpr CommandSpec kCommands[] = {
        {CommandId::Help, "help"},
        {CommandId::Submit, "submit"},
        {CommandId::Access, "access"},
        {CommandId::Enqueue, "enqueue"},
        {CommandId::Drain, "drain"},
        {CommandId::Sweep, "sweep"},
        {CommandId::Stats, "stats"},
    };

    struct CommandArgs {
        ParsedOption buf[kMaxOptions]{};
        const char* pos_buf[kMaxPositionals]{};
        ParsedOptions opts{buf, 0, kMaxOptions};
        Positionals pos{pos_buf, 0, kMaxPositionals};

        CommandArgs() = default;
        CommandArgs(const CommandArgs&) = delete;
        CommandArgs& operator=(const CommandArgs&) = delete;

        [[nodiscard]] const char* str(OptionId id) const noexcept {
            const ParsedOption* o = find_option(opts, id);
            return o ? o->value.str : nullptr;
        }
    };

    // Store, queue and the services on top, opened for one command.
    struct Runtime {
        snap::store::SqliteSecretStore store;
        snap::ingest::SqliteMessageQueue queue;
        snap::lifecycle::Orchestrator orchestrator;

        explicit Runtime(const snap::config::Config& cfg)
            : store(cfg.store), queue(cfg.ingest.queue_name), orchestrator(store, cfg.lifecycle) {}
    };

    // Prints each reply as "<reply_to>\t<link>" or "<reply_to>\terror\t<message>".
    class StreamReplySink final : public snap::ingest::ReplySink {
    public:
        explicit StreamReplySink(std::FILE* out) noexcept : out_(out) {}

        [[nodiscard]] Status deliver(const snap::ingest::Reply& reply) noexcept override {
            int rc = 0;
            if (reply.error == LifecycleError::None) {
                rc = std::fprintf(out_, "%s\t%s\n", reply.reply_to.c_str(), reply.link.c_str());
            } else {
                rc = std::fprintf(out_, "%s\terror\t%s\n", reply.reply_to.c_str(), reply.message.c_str());
            }
            if (rc < 0) {
                return make_status(StatusDomain::Cli, StatusCode::Io);
            }
            return ok_status();
        }

    private:
        std::FILE* out_;
    };

    [[nodiscard]] Status read_all(std::FILE* in, std::string* out) {
        out->clear();
        char buf[4096];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), in)) > 0) {
            out->append(buf, n);
        }
        if (std::ferror(in)) {
            return make_status(StatusDomain::Cli, StatusCode::Io);
        }
        if (!out->empty() && out->back() == '\n') {
            out->pop_back();
        }
        return ok_status();
    }

    [[nodiscard]] Status seconds_to_ms(i64 seconds, DurationMs* out) noexcept {
        constexpr i64 kLimit = std::numeric_limits<i64>::max() / kMillisPerSecond;
        if (seconds > kLimit || seconds < -kLimit) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *out = seconds * kMillisPerSecond;
        return ok_status();
    }

    void print_lifecycle_error(std::FILE* err, const char* context, const LifecycleResult& r) {
        if (r.error == LifecycleError::ValidationFailed && r.cause.domain == StatusDomain::Core) {
            std::fprintf(err, "error: %s: %s (%s)\n", context,
                         snap::lifecycle::lifecycle_error_name(r.error),
                         invalid_reason_name(static_cast<InvalidReason>(r.cause.aux)));
            return;
        }
        std::fprintf(err, "error: %s: %s\n", context, snap::lifecycle::lifecycle_error_name(r.error));
        if (r.error == LifecycleError::StorageFailure) {
            print_status_error(err, context, r.cause);
        }
    }

    [[nodiscard]] Status parse_command_args(const CliArgs& args, CommandArgs* out) noexcept {
        u32 consumed = 0;
        return parse_options(args, kCommandOptions, sizeof(kCommandOptions) / sizeof(kCommandOptions[0]),
                             &out->opts, &out->pos, &consumed);
    }

    // Shared by submit and enqueue: text operand plus challenge and TTL options.
    [[nodiscard]] bool read_secret_fields(const CommandArgs& a, const CliIo& io, const char* context,
                                          snap::lifecycle::SubmitRequest* out) {
        if (a.pos.len != 1) {
            std::fprintf(io.err, "error: %s: expected exactly one <text|->\n", context);
            return false;
        }
        if (std::strcmp(a.pos.data[0], "-") == 0) {
            const Status s = read_all(io.in, &out->text);
            if (!is_ok(s)) {
                print_status_error(io.err, context, s);
                return false;
            }
        } else {
            out->text = a.pos.data[0];
        }

        if (const char* p = a.str(OptionId::Prompt)) out->prompt = std::string(p);
        if (const char* ans = a.str(OptionId::Answer)) out->answer = std::string(ans);

        if (const ParsedOption* e = find_option(a.opts, OptionId::ExpireIn)) {
            DurationMs ms = 0;
            if (!is_ok(seconds_to_ms(e->value.i64v, &ms))) {
                std::fprintf(io.err, "error: %s: --expire-in out of range\n", context);
                return false;
            }
            out->expire_in = ms;
        }
        return true;
    }

    [[nodiscard]] bool open_runtime(Runtime* rt, const snap::config::Config& cfg, const CliIo& io) {
        Status s = rt->store.open(cfg.db);
        if (!is_ok(s)) {
            print_status_error(io.err, "open store", s);
            return false;
        }
        s = rt->queue.open(cfg.db);
        if (!is_ok(s)) {
            print_status_error(io.err, "open queue", s);
            return false;
        }
        return true;
    }

    int cmd_submit(const snap::config::Config& cfg, const CliArgs& args, const CliIo& io) {
        CommandArgs a;
        if (!is_ok(parse_command_args(args, &a))) {
            std::fprintf(io.err, "error: submit: bad arguments\n");
            return kExitError;
        }
        snap::lifecycle::SubmitRequest req;
        if (!read_secret_fields(a, io, "submit", &req)) {
            return kExitError;
        }

        Runtime rt(cfg);
        if (!open_runtime(&rt, cfg, io)) {
            return kExitError;
        }

        SecretId id{};
        const LifecycleResult r = rt.orchestrator.submit(req, &id);
        if (!r.ok()) {
            print_lifecycle_error(io.err, "submit", r);
            return kExitError;
        }
        std::fprintf(io.out, "%s\n", security::secret_id_to_hex(id).c_str());
        return kExitOk;
    }

    int cmd_access(const snap::config::Config& cfg, const CliArgs& args, const CliIo& io) {
        CommandArgs a;
        if (!is_ok(parse_command_args(args, &a)) || a.pos.len != 1) {
            std::fprintf(io.err, "error: access: expected <id> [--answer A]\n");
            return kExitError;
        }

        Runtime rt(cfg);
        if (!open_runtime(&rt, cfg, io)) {
            return kExitError;
        }

        std::optional<std::string_view> answer;
        if (const char* ans = a.str(OptionId::Answer)) {
            answer = std::string_view(ans);
        }

        snap::lifecycle::AccessResult out;
        const LifecycleResult r = rt.orchestrator.access(a.pos.data[0], answer, &out);
        if (!r.ok()) {
            print_lifecycle_error(io.err, "access", r);
            return kExitError;
        }
        if (out.kind == snap::lifecycle::AccessKind::ChallengeRequired) {
            std::fprintf(io.out, "%s\n", out.prompt.c_str());
            return kExitChallenge;
        }
        std::fwrite(out.text.data(), 1, out.text.size(), io.out);
        std::fputc('\n', io.out);
        return kExitOk;
    }

    int cmd_enqueue(const snap::config::Config& cfg, const CliArgs& args, const CliIo& io) {
        CommandArgs a;
        if (!is_ok(parse_command_args(args, &a))) {
            std::fprintf(io.err, "error: enqueue: bad arguments\n");
            return kExitError;
        }
        snap::lifecycle::SubmitRequest req;
        if (!read_secret_fields(a, io, "enqueue", &req)) {
            return kExitError;
        }

        snap::ingest::CreateSecretMessage msg;
        msg.text = std::move(req.text);
        msg.prompt = std::move(req.prompt);
        msg.answer = std::move(req.answer);
        msg.expire_in_ms = req.expire_in;
        if (const char* b = a.str(OptionId::BaseLink)) msg.base_link = b;
        if (const char* r = a.str(OptionId::ReplyTo)) msg.reply_to = r;

        Runtime rt(cfg);
        if (!open_runtime(&rt, cfg, io)) {
            return kExitError;
        }
        StreamReplySink sink(io.out);
        snap::ingest::IngestionAdapter adapter(rt.queue, rt.orchestrator, sink, cfg.ingest);

        const Status s = adapter.enqueue(msg);
        if (!is_ok(s)) {
            print_status_error(io.err, "enqueue", s);
            return kExitError;
        }
        return kExitOk;
    }

    int cmd_drain(const snap::config::Config& cfg, const CliArgs& args, const CliIo& io) {
        CommandArgs a;
        if (!is_ok(parse_command_args(args, &a)) || a.pos.len != 0) {
            std::fprintf(io.err, "error: drain: expected [--max N]\n");
            return kExitError;
        }
        u64 max = 0;
        if (const ParsedOption* m = find_option(a.opts, OptionId::Max)) {
            if (m->value.i64v < 0) {
                std::fprintf(io.err, "error: drain: --max must not be negative\n");
                return kExitError;
            }
            max = static_cast<u64>(m->value.i64v);
        }

        Runtime rt(cfg);
        if (!open_runtime(&rt, cfg, io)) {
            return kExitError;
        }
        StreamReplySink sink(io.out);
        snap::ingest::IngestionAdapter adapter(rt.queue, rt.orchestrator, sink, cfg.ingest);
        snap::ingest::IngestionWorker worker(adapter, cfg.ingest.poll_interval);

        u64 handled = 0;
        const Status s = worker.drain(max, &handled);
        const snap::ingest::IngestStats st = adapter.stats();
        std::fprintf(io.err, "drained %llu (created %llu, rejected %llu, dead-lettered %llu)\n",
                     static_cast<unsigned long long>(handled),
                     static_cast<unsigned long long>(st.created),
                     static_cast<unsigned long long>(st.rejected),
                     static_cast<unsigned long long>(st.dead_lettered));
        if (!is_ok(s)) {
            print_status_error(io.err, "drain", s);
            return kExitError;
        }
        return kExitOk;
    }

    int cmd_sweep(const snap::config::Config& cfg, const CliIo& io) {
        Runtime rt(cfg);
        if (!open_runtime(&rt, cfg, io)) {
            return kExitError;
        }
        snap::store::Sweeper sweeper(rt.store, cfg.sweep_interval);
        u64 removed = 0;
        const Status s = sweeper.sweep_once(&removed);
        if (!is_ok(s)) {
            print_status_error(io.err, "sweep", s);
            return kExitError;
        }
        std::fprintf(io.out, "%llu\n", static_cast<unsigned long long>(removed));
        return kExitOk;
    }

    int cmd_stats(const snap::config::Config& cfg, const CliIo& io) {
        Runtime rt(cfg);
        if (!open_runtime(&rt, cfg, io)) {
            return kExitError;
        }
        snap::ingest::SqliteMessageQueue poison(rt.queue.poison_name());
        Status s = poison.open(cfg.db);
        if (!is_ok(s)) {
            print_status_error(io.err, "open poison queue", s);
            return kExitError;
        }

        u64 live = 0;
        u64 rows = 0;
        u64 depth = 0;
        u64 dead = 0;
        s = rt.store.count(&live);
        if (is_ok(s)) s = rt.store.stored_rows(&rows);
        if (is_ok(s)) s = rt.queue.depth(&depth);
        if (is_ok(s)) s = poison.depth(&dead);
        if (!is_ok(s)) {
            print_status_error(io.err, "stats", s);
            return kExitError;
        }

        std::fprintf(io.out, "secrets=%llu\nexpired_unswept=%llu\nqueue=%llu\npoison=%llu\n",
                     static_cast<unsigned long long>(live),
                     static_cast<unsigned long long>(rows - live),
                     static_cast<unsigned long long>(depth),
                     static_cast<unsigned long long>(dead));
        return kExitOk;
    }
} // namespace

void print_usage(std::FILE* out) {
    std::fprintf(out,
        "usage: snap [--db PATH] [--log-level LEVEL] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  submit [--prompt P --answer A] [--expire-in SECONDS] <text|->\n"
        "                     Store a one-time secret and print its id\n"
        "  access <id> [--answer A]\n"
        "                     Reveal a secret; prints the prompt and exits 2 if challenged\n"
        "  enqueue [--prompt P --answer A] [--expire-in S] [--base-link URL] [--reply-to TOKEN] <text|->\n"
        "                     Queue a secret for asynchronous creation\n"
        "  drain [--max N]    Process queued requests and print their replies\n"
        "  sweep              Delete expired secrets and print how many\n"
        "  stats              Print live secrets and queue depth\n"
        "  help               Show this text\n");
}

void print_status_error(std::FILE* err, const char* context, Status s) {
    std::fprintf(err,
                 "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
                 context,
                 status_code_name(s.code),
                 static_cast<unsigned>(s.code),
                 status_domain_name(s.domain),
                 static_cast<unsigned>(s.domain),
                 s.aux);
}

int run(const CliArgs& args, const snap::config::Config& base, const CliIo& io) {
    snap::config::Config cfg = base;

    ParsedOption buf[kMaxOptions]{};
    ParsedOptions opts{buf, 0, kMaxOptions};
    u32 consumed = 0;
    Status s = parse_options(args, kGlobalOptions, sizeof(kGlobalOptions) / sizeof(kGlobalOptions[0]),
                             &opts, nullptr, &consumed);
    if (!is_ok(s)) {
        std::fprintf(io.err, "error: bad global option\n");
        print_usage(io.err);
        return kExitError;
    }

    if (find_option(opts, OptionId::Help) != nullptr) {
        print_usage(io.out);
        return kExitOk;
    }
    if (const ParsedOption* d = find_option(opts, OptionId::Db)) {
        cfg.db.path = d->value.str;
    }
    if (const ParsedOption* l = find_option(opts, OptionId::LogLevel)) {
        if (!log_level_from_string(l->value.str, &cfg.log.level)) {
            std::fprintf(io.err, "error: unknown log level '%s'\n", l->value.str);
            return kExitError;
        }
    }
    LogRegistry::init(cfg.log);

    const CliArgs rest{args.argv + consumed, args.argc - consumed};
    if (rest.argc == 0) {
        print_usage(io.err);
        return kExitError;
    }

    CommandInvocation inv{};
    u32 used = 0;
    s = parse_command(rest, kCommands, sizeof(kCommands) / sizeof(kCommands[0]), &inv, &used);
    if (!is_ok(s)) {
        std::fprintf(io.err, "error: unknown command '%s'\n", rest.argv[0] ? rest.argv[0] : "");
        print_usage(io.err);
        return kExitError;
    }

    switch (inv.id) {
        case CommandId::Help:
            print_usage(io.out);
            return kExitOk;
        case CommandId::Submit:
            return cmd_submit(cfg, inv.args, io);
        case CommandId::Access:
            return cmd_access(cfg, inv.args, io);
        case CommandId::Enqueue:
            return cmd_enqueue(cfg, inv.args, io);
        case CommandId::Drain:
            return cmd_drain(cfg, inv.args, io);
        case CommandId::Sweep:
            return cmd_sweep(cfg, io);
        case CommandId::Stats:
            return cmd_stats(cfg, io);
        case CommandId::None:
            break;
    }
    return kExitError;
}

} // namespace snap::cli
