#include <abnormal.hpp>
#include <core/configuration.hpp>
#include <core/session.hpp>
#include <hosts/editor.hpp>
#include <hosts/system.hpp>
#include <log/monitor.hpp>
#include <rule/domain.hpp>
#include <rule/duration.hpp>

#include <boost/asio.hpp>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace net = boost::asio;
namespace core = hlk::core;
namespace hosts = hlk::hosts;
namespace rule = hlk::rule;
namespace nlog = hlk::log;
namespace abnormal = hlk::abnormal;

namespace
{
    constexpr std::string_view default_domains_file = "distractions.txt";
    constexpr std::string_view default_duration = "30s";

    constexpr int exit_failure = 1;
    constexpr int exit_usage = 2;

    struct arguments
    {
        std::string file;
        std::vector<std::string> domains;
        std::string time;
        std::string config;
        std::string hosts;
        bool verbose = false;
        bool help = false;
    };

    void print_usage(std::ostream& out)
    {
        out << "Block distracting websites for a specified duration.\n\n"
            << "usage: hosts-lock [options]\n"
            << "  -f, --file <path>      file with websites to block, one per line (default: distractions.txt)\n"
            << "  -d, --domain <name>    website to block, may be repeated\n"
            << "  -t, --time <duration>  duration to block, e.g. 10s, 45m, 2h, 1d (default: 30s)\n"
            << "  -c, --config <path>    JSON configuration file\n"
            << "      --hosts <path>     hosts file to edit\n"
            << "  -v, --verbose          enable verbose logging\n"
            << "  -h, --help             show this message\n";
    }

    /**
     * @brief 解析命令行参数
     * @param error 解析失败时写入错误描述
     * @return 解析是否成功
     */
    bool parse_arguments(const int argc, char* argv[], arguments& args, std::string& error)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            auto value = [&](std::string& out) -> bool
            {
                if (i + 1 >= argc)
                {
                    error = "missing value for " + std::string(arg);
                    return false;
                }
                out = argv[++i];
                return true;
            };

            if (arg == "-h" || arg == "--help")
            {
                args.help = true;
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                args.verbose = true;
            }
            else if (arg == "-f" || arg == "--file")
            {
                if (!value(args.file)) return false;
            }
            else if (arg == "-t" || arg == "--time")
            {
                if (!value(args.time)) return false;
            }
            else if (arg == "-c" || arg == "--config")
            {
                if (!value(args.config)) return false;
            }
            else if (arg == "--hosts")
            {
                if (!value(args.hosts)) return false;
            }
            else if (arg == "-d" || arg == "--domain")
            {
                std::string domain;
                if (!value(domain)) return false;
                args.domains.push_back(std::move(domain));
            }
            else
            {
                error = "unknown option " + std::string(arg);
                return false;
            }
        }
        return true;
    }

    net::awaitable<void> configure_log(nlog::coroutine_log& log, const core::log_settings& logging, const bool verbose)
    {
        co_await log.set_console_level_threshold(verbose ? nlog::level::debug : logging.level);
        co_await log.set_file_level_threshold(verbose ? nlog::level::debug : logging.level);
        co_await log.set_time_offset(logging.time_offset);
        if (!logging.directory.empty())
        {
            co_await log.set_max_file_size(logging.max_file_size);
            co_await log.set_max_archive_count(logging.max_archive_count);
            co_await log.set_file_name(logging.file);
            co_await log.set_output_directory(logging.directory);
        }
    }

    /**
     * @brief 读取配置、校验输入并运行一次屏蔽会话
     */
    net::awaitable<void> block(const arguments& args, net::io_context& ioc, nlog::coroutine_log& log)
    {
        core::settings conf;
        if (!args.config.empty())
        {
            core::configuration configuration;
            configuration.load(args.config);
            conf = configuration.extract();
        }
        co_await configure_log(log, conf.logging, args.verbose);

        if (!args.hosts.empty())
        {
            conf.hosts.path = args.hosts;
        }

        // 命令行参数优先于配置文件
        std::vector<std::string> raw = conf.domains;
        raw.insert(raw.end(), args.domains.begin(), args.domains.end());
        std::string file = args.file.empty() ? conf.domains_file : args.file;
        if (file.empty() && raw.empty())
        {
            file = default_domains_file;
        }
        if (!file.empty())
        {
            const auto listed = rule::load_domains(file);
            raw.insert(raw.end(), listed.begin(), listed.end());
            co_await log.console_write_line(nlog::level::debug,
                "loaded " + std::to_string(listed.size()) + " entries from " + file);
        }

        std::string_view time = default_duration;
        if (!args.time.empty())
        {
            time = args.time;
        }
        else if (!conf.duration.empty())
        {
            time = conf.duration;
        }
        const auto duration = rule::parse_duration(time);

        auto normalized = rule::normalize(raw);
        for (const auto& [entry, reason] : normalized.rejected)
        {
            co_await log.write_line(nlog::level::warn, "skipping invalid domain '" + entry + "': " + reason);
        }
        if (normalized.domains.empty())
        {
            throw abnormal::configuration_error("no valid domains to block");
        }

        hosts::editor editor(conf.hosts, log);
        core::session session(ioc, editor, std::move(normalized.domains), duration, hosts::has_privilege, log);
        co_await session.run();
    }

    net::awaitable<int> async_main(const arguments args, net::io_context& ioc, nlog::coroutine_log& log)
    {
        std::string failure;
        try
        {
            co_await block(args, ioc, log);
        }
        catch (const abnormal::exception& e)
        {
            failure = e.dump();
        }
        catch (const std::exception& e)
        {
            failure = e.what();
        }

        if (!failure.empty())
        {
            co_await log.write_line(nlog::level::error, "Error: " + failure);
        }
        co_await log.shutdown();
        co_return failure.empty() ? 0 : exit_failure;
    }
}

int main(int argc, char* argv[])
{
    arguments args;
    if (std::string error; !parse_arguments(argc, argv, args, error))
    {
        std::cerr << "hosts-lock: " << error << "\n\n";
        print_usage(std::cerr);
        return exit_usage;
    }
    if (args.help)
    {
        print_usage(std::cout);
        return 0;
    }

    int exit_code = exit_failure;
    try
    {
        net::io_context ioc(1);
        nlog::coroutine_log log(ioc.get_executor());

        net::co_spawn(ioc, async_main(args, ioc, log),
            [&exit_code](const std::exception_ptr& ep, const int code)
            {
                if (ep)
                {
                    std::rethrow_exception(ep);
                }
                exit_code = code;
            });

        ioc.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "hosts-lock: " << e.what() << std::endl;
        return exit_failure;
    }

    return exit_code;
}
