#include "fastlist/aws/credentials.hpp"
#include "fastlist/engine/aggregator.hpp"
#include "fastlist/engine/channel.hpp"
#include "fastlist/engine/key_filter.hpp"
#include "fastlist/engine/key_space_hints.hpp"
#include "fastlist/engine/lister.hpp"
#include "fastlist/engine/monitor.hpp"
#include "fastlist/engine/record.hpp"
#include "fastlist/engine/run_state.hpp"
#include "fastlist/engine/s3_listing_client.hpp"
#include "fastlist/engine/sinks.hpp"
#include "fastlist/engine/task_context.hpp"
#include "fastlist/log.hpp"

#include <boost/asio/co_spawn.hpp> // IWYU pragma: keep
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace fastlist;

namespace {

enum class Mode : std::uint8_t { LIST, DIFF };

enum class OutputFormat : std::uint8_t { PLAIN, JSON };

constexpr int exit_ok = 0;
constexpr int exit_fatal = 1;
constexpr int exit_cancelled = 2;

struct Options {
    Mode mode{};
    std::string bucket;
    std::optional<std::string> region;
    std::optional<std::string> target_bucket;
    std::optional<std::string> target_region;
    std::string prefix;
    std::size_t threads{};
    std::size_t concurrency{};
    std::optional<std::string> ks_file;
    std::optional<std::string> filter;
    std::optional<std::string> log_file;
    std::optional<std::string> endpoint;
    bool force_path_style{};
    std::optional<std::string> output_file;
    OutputFormat output_format{};
    std::optional<std::string> output_ks_file;
    std::optional<std::string> access_key_file;
    std::optional<std::string> secret_access_key_file;
    unsigned max_retries{};
    std::size_t request_timeout_seconds{};
    std::size_t stats_interval_seconds{};
};

[[nodiscard]] std::optional<std::string> optional_arg(const boost::program_options::variables_map &varmap,
                                                      const char *name) {
    if (!varmap.contains(name)) {
        return std::nullopt;
    }
    return varmap[name].as<std::string>();
}

// "<region>_<bucket>" or "<bucket>"
[[nodiscard]] std::string bucket_label(const std::string &bucket, const std::optional<std::string> &region) {
    return region.has_value() ? std::format("{}_{}", *region, bucket) : bucket;
}

[[nodiscard]] std::string run_label(const Options &options) {
    std::string ret = bucket_label(options.bucket, options.region);
    if (options.mode == Mode::DIFF) {
        ret += '_';
        ret += bucket_label(options.target_bucket.value(), options.target_region);
    }
    return ret;
}

// Throws boost::program_options::error or std::invalid_argument.
[[nodiscard]] Options parse_opts(int argc, char **argv, const std::string &timestamp) {
    Options ret;

    std::string mode;
    std::string output_format;
    bool log_to_file = false;

    boost::program_options::options_description descr{"Options"};
    // clang-format off
    descr.add_options()
        ("help,h", "print this help")
        ("mode", boost::program_options::value<std::string>(&mode)->required(), "list or diff")
        ("bucket,b", boost::program_options::value<std::string>(&ret.bucket)->required(), "S3 bucket name (left side when diffing)")
        ("region,r", boost::program_options::value<std::string>(), "bucket region, defaults to AWS_REGION, AWS_DEFAULT_REGION or us-east-1")
        ("target-bucket", boost::program_options::value<std::string>(), "right side bucket, diff mode only")
        ("target-region", boost::program_options::value<std::string>(), "right side bucket region")
        ("prefix,p", boost::program_options::value<std::string>(&ret.prefix)->default_value("/"), "only list keys below this prefix, / for the whole bucket")
        ("threads,t", boost::program_options::value<std::size_t>(&ret.threads)->default_value(10), "worker threads")
        ("concurrency,c", boost::program_options::value<std::size_t>(&ret.concurrency)->default_value(100), "concurrent list requests per bucket")
        ("ks-file", boost::program_options::value<std::string>(), "key space hints file, defaults to <region>_<bucket>_ks_hints.input")
        ("filter,f", boost::program_options::value<std::string>(), "only output keys matching prefix:<p>, suffix:<s>, glob:<pattern> or <pattern>")
        ("log", boost::program_options::bool_switch(&log_to_file), "log to fastlist_<datetime>.log instead of stderr")
        ("output-log-file", boost::program_options::value<std::string>(), "log to this file instead of stderr")
        ("endpoint-url", boost::program_options::value<std::string>(), "custom endpoint URL, including protocol and (if required) port. implies path-style addressing")
        ("force-path-style", boost::program_options::bool_switch(&ret.force_path_style), "use path-style addressing")
        ("output-file,o", boost::program_options::value<std::string>(), "path to output file")
        ("output-format", boost::program_options::value<std::string>(&output_format)->default_value("json"), "plain or json")
        ("output-ks-file", boost::program_options::value<std::string>(), "key space sample output, list mode only")
        ("access-key-file", boost::program_options::value<std::string>(), "path to access key file, defaults to AWS_ACCESS_KEY_ID")
        ("secret-access-key-file", boost::program_options::value<std::string>(), "path to secret key file, defaults to AWS_SECRET_ACCESS_KEY")
        ("max-retries", boost::program_options::value<unsigned>(&ret.max_retries)->default_value(5), "attempts per list request before its range is skipped")
        ("request-timeout", boost::program_options::value<std::size_t>(&ret.request_timeout_seconds)->default_value(30), "timeout of a single list request in seconds")
        ("stats-interval", boost::program_options::value<std::size_t>(&ret.stats_interval_seconds)->default_value(1), "progress report interval in seconds")
    ;
    // clang-format on
    boost::program_options::positional_options_description positional;
    positional.add("mode", 1);

    boost::program_options::variables_map varmap;
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv).options(descr).positional(positional).run(),
        varmap);
    if (varmap.contains("help")) {
        std::println("usage: fastlist list|diff --bucket BUCKET [options]\n"
                     "list all objects in a S3 bucket, or the difference between two buckets\n"
                     "output order is not stable\n");
        std::cout << descr << '\n';
        std::exit(exit_ok);
    }
    boost::program_options::notify(varmap);

    if (mode == "list") {
        ret.mode = Mode::LIST;
    } else if (mode == "diff") {
        ret.mode = Mode::DIFF;
    } else {
        throw std::invalid_argument{std::format("invalid mode '{}'. Must be 'list' or 'diff'.", mode)};
    }

    if (output_format == "plain") {
        ret.output_format = OutputFormat::PLAIN;
    } else if (output_format == "json") {
        ret.output_format = OutputFormat::JSON;
    } else {
        throw std::invalid_argument{
            std::format("invalid output format '{}'. Must be 'plain' or 'json'.", output_format)};
    }

    ret.region = optional_arg(varmap, "region");
    ret.target_bucket = optional_arg(varmap, "target-bucket");
    ret.target_region = optional_arg(varmap, "target-region");
    ret.ks_file = optional_arg(varmap, "ks-file");
    ret.filter = optional_arg(varmap, "filter");
    ret.endpoint = optional_arg(varmap, "endpoint-url");
    ret.output_file = optional_arg(varmap, "output-file");
    ret.output_ks_file = optional_arg(varmap, "output-ks-file");
    ret.access_key_file = optional_arg(varmap, "access-key-file");
    ret.secret_access_key_file = optional_arg(varmap, "secret-access-key-file");

    if (ret.mode == Mode::DIFF && !ret.target_bucket.has_value()) {
        throw std::invalid_argument{"diff mode requires --target-bucket"};
    }
    if (ret.mode == Mode::LIST && ret.target_bucket.has_value()) {
        throw std::invalid_argument{"--target-bucket is only valid in diff mode"};
    }
    if (ret.mode == Mode::DIFF && ret.output_ks_file.has_value()) {
        throw std::invalid_argument{"--output-ks-file is only valid in list mode"};
    }
    if (ret.access_key_file.has_value() != ret.secret_access_key_file.has_value()) {
        throw std::invalid_argument{"--access-key-file and --secret-access-key-file must be given together"};
    }
    if (ret.threads == 0 || ret.concurrency == 0 || ret.max_retries == 0) {
        throw std::invalid_argument{"--threads, --concurrency and --max-retries must be at least 1"};
    }
    if (ret.request_timeout_seconds == 0 || ret.stats_interval_seconds == 0) {
        throw std::invalid_argument{"--request-timeout and --stats-interval must be at least 1"};
    }

    if (ret.prefix == "/") {
        ret.prefix.clear();
    }

    if (auto log_file = optional_arg(varmap, "output-log-file"); log_file.has_value()) {
        ret.log_file = std::move(log_file);
    } else if (log_to_file) {
        ret.log_file = std::format("fastlist_{}.log", timestamp);
    }

    const std::string label = run_label(ret);
    if (!ret.output_file.has_value()) {
        ret.output_file =
            std::format("{}_{}.{}", label, timestamp, ret.output_format == OutputFormat::JSON ? "jsonl" : "txt");
    }
    if (ret.mode == Mode::LIST && !ret.output_ks_file.has_value()) {
        ret.output_ks_file = std::format("{}_{}.ks", label, timestamp);
    }

    return ret;
}

[[nodiscard]] std::string run_timestamp() {
    return std::format("{:%Y%m%dT%H%M%SZ}", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}

[[nodiscard]] log::Level level_from_environment() {
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char *value = std::getenv("FASTLIST_LOG");
    if (value == nullptr) {
        return log::Level::INFO;
    }
    const auto level = log::parse_level(value);
    if (!level.has_value()) {
        std::println(std::cerr, "ignoring unknown FASTLIST_LOG level '{}'", value);
    }
    return level.value_or(log::Level::INFO);
}

// Throws std::runtime_error if neither files nor environment provide credentials.
[[nodiscard]] aws::Credentials load_credentials(const Options &options) {
    if (options.access_key_file.has_value()) {
        return aws::credentials_from_files(*options.access_key_file, options.secret_access_key_file.value());
    }
    auto ret = aws::credentials_from_environment();
    if (!ret.has_value()) {
        throw std::runtime_error{"no credentials: set AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY or pass "
                                 "--access-key-file and --secret-access-key-file"};
    }
    return std::move(*ret);
}

[[nodiscard]] engine::KeySpaceHints load_hints(const Options &options) {
    const std::filesystem::path path =
        options.ks_file.value_or(std::format("{}_ks_hints.input", bucket_label(options.bucket, options.region)));
    auto prefixes = engine::load_hints_file(path);
    engine::KeySpaceHints ret{prefixes};
    if (!prefixes.empty()) {
        log::info("loaded {} key space hints from {}, {} initial ranges", prefixes.size(), path.string(),
                  ret.size());
    }
    return ret;
}

void wait_for_signal(boost::asio::signal_set &signals, std::shared_ptr<engine::RunState> state) {
    signals.async_wait([&signals, state](const boost::system::error_code &error, int signal_number) {
        // cancelled once the run is over
        if (error) {
            return;
        }
        if (state->request_quit()) {
            log::warn("received signal {}, shutting down", signal_number);
        } else {
            log::info("received signal {}, already shutting down", signal_number);
        }
        wait_for_signal(signals, state);
    });
}

// Completion handler for a top-level task. Keeps the task object alive until the coroutine is done.
template <typename Task>
[[nodiscard]] auto on_task_exit(std::string task, std::shared_ptr<Task> keep_alive,
                                std::shared_ptr<engine::RunState> state) {
    return [task = std::move(task), keep_alive = std::move(keep_alive),
            state = std::move(state)](const std::exception_ptr &error) {
        if (!error) {
            return;
        }
        state->report_fatal();
        state->request_quit();
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &err) {
            log::error("{} failed: {}", task, err.what());
        }
    };
}

[[nodiscard]] int run(const Options &options) {
    const aws::Credentials credentials = load_credentials(options);
    const engine::KeySpaceHints hints = load_hints(options);

    std::shared_ptr<const engine::KeyFilter> filter;
    if (options.filter.has_value()) {
        filter = std::make_shared<const engine::KeyFilter>(engine::KeyFilter::compile(*options.filter));
    }

    std::vector<std::shared_ptr<engine::RecordSink>> sinks;
    if (options.output_format == OutputFormat::JSON) {
        sinks.push_back(std::make_shared<engine::JsonSink>(engine::open_output(*options.output_file)));
    } else {
        sinks.push_back(std::make_shared<engine::PlainSink>(engine::open_output(*options.output_file)));
    }
    log::info("writing results to {}", *options.output_file);
    if (options.output_ks_file.has_value()) {
        sinks.push_back(std::make_shared<engine::KeySpaceSampler>(engine::open_output(*options.output_ks_file)));
        log::info("writing key space sample to {}", *options.output_ks_file);
    }

    const std::size_t listers = options.mode == Mode::DIFF ? 2 : 1;
    const auto state = std::make_shared<engine::RunState>(listers + 1);
    const auto channel = std::make_shared<engine::RecordChannel>();

    const engine::ListerConfig lister_config{
        .prefix = options.prefix,
        .concurrency = options.concurrency,
        .filter = filter,
        .retry = {.max_attempts = options.max_retries},
    };
    const auto timeout = std::chrono::seconds{options.request_timeout_seconds};

    std::vector<std::shared_ptr<engine::Lister>> sides;
    auto add_side = [&](const std::string &bucket, const std::optional<std::string> &region,
                        engine::Direction direction) {
        engine::TaskContext context{.bucket = bucket,
                                    .region = region,
                                    .endpoint = options.endpoint,
                                    .path_style = options.force_path_style,
                                    .direction = direction,
                                    .sender = channel->make_sender(),
                                    .state = state};
        auto client = engine::make_s3_listing_client(context, credentials, timeout);
        sides.push_back(engine::Lister::create(std::move(context), lister_config, hints, std::move(client)));
    };
    add_side(options.bucket, options.region, engine::Direction::Left);
    if (options.mode == Mode::DIFF) {
        add_side(options.target_bucket.value(),
                 options.target_region.has_value() ? options.target_region : options.region,
                 engine::Direction::Right);
    }

    const auto aggregator = std::make_shared<engine::Aggregator>(
        channel, state,
        engine::AggregatorConfig{.mode = options.mode == Mode::DIFF ? engine::AggregationMode::Diff
                                                                    : engine::AggregationMode::List},
        std::move(sinks));

    boost::asio::thread_pool pool{options.threads};

    const auto signal_strand = boost::asio::make_strand(pool);
    boost::asio::signal_set signals{signal_strand, SIGINT, SIGTERM};
    wait_for_signal(signals, state);

    const auto monitor = std::make_shared<engine::Monitor>(
        state, std::chrono::seconds{options.stats_interval_seconds}, [&signals, &signal_strand]() {
            boost::asio::post(signal_strand, [&signals]() { signals.cancel(); });
        });

    for (const auto &side : sides) {
        side->start(pool.get_executor());
    }
    boost::asio::co_spawn(pool, aggregator->run(), on_task_exit("aggregator", aggregator, state));
    boost::asio::co_spawn(pool, monitor->run(), on_task_exit("monitor", monitor, state));

    pool.join();

    for (const auto &side : sides) {
        log::info("{} bucket {}: {}", engine::to_string(side->direction()), side->bucket(),
                  engine::to_string(side->outcome()));
    }
    log::info("{}", engine::Monitor::format_report(state->snapshot(), 0));

    if (state->fatal) {
        return exit_fatal;
    }
    if (state->quit_requested()) {
        log::warn("run incomplete");
        return exit_cancelled;
    }
    return exit_ok;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    const std::string timestamp = run_timestamp();

    Options options;
    try {
        options = parse_opts(argc, argv, timestamp);
    } catch (const boost::program_options::error &err) {
        std::println(std::cerr, "{}\nsee fastlist --help", err.what());
        return exit_fatal;
    } catch (const std::invalid_argument &err) {
        std::println(std::cerr, "{}\nsee fastlist --help", err.what());
        return exit_fatal;
    }

    try {
        log::init(level_from_environment(), options.log_file);
    } catch (const std::runtime_error &err) {
        std::println(std::cerr, "{}", err.what());
        return exit_fatal;
    }

    try {
        return run(options);
    } catch (const std::exception &err) {
        log::error("{}", err.what());
        return exit_fatal;
    }
}
