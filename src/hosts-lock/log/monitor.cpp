#include <log/monitor.hpp>
#include <abnormal/configuration.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <cstdio>
#include <iostream>
#include <vector>

namespace hlk::log
{
    namespace
    {
        /**
         * @brief 按 strftime 格式输出 UTC 时间
         */
        std::string format_time(const std::chrono::system_clock::time_point tp, const char* pattern)
        {
            const std::time_t t = std::chrono::system_clock::to_time_t(tp);
            std::tm tm{};
#ifdef _WIN32
            gmtime_s(&tm, &t);
#else
            gmtime_r(&t, &tm);
#endif
            char buf[64]{};
            const std::size_t n = std::strftime(buf, sizeof(buf), pattern, &tm);
            return {buf, n};
        }
    }

    level parse_level(const std::string_view name)
    {
        std::string lowered(name);
        std::ranges::transform(lowered, lowered.begin(),
            [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "debug") return level::debug;
        if (lowered == "info") return level::info;
        if (lowered == "warn" || lowered == "warning") return level::warn;
        if (lowered == "error") return level::error;
        if (lowered == "fatal") return level::fatal;
        throw abnormal::configuration_error("unknown log level: " + std::string(name));
    }

    coroutine_log::coroutine_log(const asio::any_io_executor& executor)
        : serial_exec(asio::make_strand(executor))
    {
    }

    asio::awaitable<void> coroutine_log::set_output_directory(const std::string& directory_name)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        file_context = context{};
        root_directory = directory_name;
        if (!root_directory.empty() && !fs::exists(root_directory))
        {
            std::error_code ec;
            fs::create_directories(root_directory, ec);
        }
    }

    asio::awaitable<void> coroutine_log::set_file_name(const std::string& name)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        file_context = context{};
        file_name = name;
    }

    asio::awaitable<void> coroutine_log::set_max_file_size(const std::size_t size)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        max_file_size = size;
    }

    asio::awaitable<void> coroutine_log::set_time_offset(const std::chrono::minutes offset)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        time_offset = offset;
    }

    asio::awaitable<void> coroutine_log::set_file_level_threshold(const level threshold)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        file_level_threshold = threshold;
    }

    asio::awaitable<void> coroutine_log::set_console_level_threshold(const level threshold)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        console_level_threshold = threshold;
    }

    asio::awaitable<void> coroutine_log::set_max_archive_count(const std::size_t count)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        max_archive_count = count;
    }

    asio::awaitable<void> coroutine_log::shutdown()
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        if (file_context.handle)
        {
            file_context.handle->close();
        }
        file_context = context{};
    }

    std::string coroutine_log::to_string(const level& log_level)
    {
        static constexpr std::array<std::string_view, 5> names{"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
        const auto index = static_cast<std::size_t>(log_level);
        return index < names.size() ? std::string(names[index]) : std::string();
    }

    asio::awaitable<std::size_t> coroutine_log::console_write_line(
        const level& log_level,
        const std::string& data)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        if (static_cast<int>(log_level) < static_cast<int>(console_level_threshold))
        {
            co_return 0;
        }
        const std::string log_str = prefix(log_level) + data + "\n";
        std::cout.write(log_str.data(), static_cast<std::streamsize>(log_str.size()));
        std::cout.flush();
        co_return log_str.size();
    }

    asio::awaitable<std::size_t> coroutine_log::file_write_line(
        const level& log_level,
        const std::string& data)
    {
        co_await asio::dispatch(serial_exec, asio::use_awaitable);
        if (root_directory.empty() ||
            static_cast<int>(log_level) < static_cast<int>(file_level_threshold))
        {
            co_return 0;
        }

        if (!file_context.handle || !file_context.handle->is_open())
        {
            if (!open_file())
            {
                co_return 0;
            }
        }

        const std::string log_str = prefix(log_level) + data + "\n";
        if (file_context.current_size + log_str.size() > max_file_size)
        {
            rotate_file();
            if (!file_context.handle)
            {
                co_return 0;
            }
        }

        file_context.handle->write(log_str.data(), static_cast<std::streamsize>(log_str.size()));
        file_context.handle->flush();
        if (!*file_context.handle)
        {
            file_context = context{}; // 写入失败，下次重新打开
            co_return 0;
        }

        file_context.current_size += log_str.size();
        co_return log_str.size();
    }

    asio::awaitable<void> coroutine_log::write_line(const level log_level, const std::string& data)
    {
        co_await console_write_line(log_level, data);
        co_await file_write_line(log_level, data);
    }

    asio::awaitable<void> coroutine_log::try_write_line(const level log_level, const std::string& data)
    {
        bool failed = false;
        std::string reason;
        try
        {
            co_await write_line(log_level, data);
        }
        catch (const std::exception& e)
        {
            failed = true;
            reason = e.what();
        }

        if (failed)
        {
            std::cerr << "[" << to_string(log_level) << "] " << data
                << " (log output failed: " << reason << ")" << std::endl;
        }
    }

    std::string coroutine_log::prefix(const level log_level) const
    {
        const auto now = std::chrono::system_clock::now() + time_offset;
        const auto ms = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
        const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(ms);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ms - secs).count();

        char frac[8]{};
        std::snprintf(frac, sizeof(frac), ".%03d", static_cast<int>(millis));
        return "[" + format_time(secs, "%Y-%m-%d %H:%M:%S") + frac + "][" + to_string(log_level) + "] ";
    }

    bool coroutine_log::open_file()
    {
        const fs::path target_path = root_directory / file_name;
        std::error_code ec;
        if (!fs::exists(target_path.parent_path(), ec))
        {   // 如果目录不存在，尝试创建
            fs::create_directories(target_path.parent_path(), ec);
        }

        auto handle = std::make_unique<std::ofstream>(target_path, std::ios::out | std::ios::app);
        if (!handle->is_open())
        {
            return false;
        }

        file_context.handle = std::move(handle);
        const auto size = fs::file_size(target_path, ec);
        file_context.current_size = ec ? 0 : static_cast<std::size_t>(size);
        return true;
    }

    void coroutine_log::rotate_file()
    {
        const fs::path target_path = root_directory / file_name;
        file_context.handle->close();

        // 生成归档文件名（保持扩展名在末尾）
        const auto timestamp_str = format_time(std::chrono::system_clock::now() + time_offset, "%Y%m%d_%H%M%S");
        const fs::path archive_path = target_path.parent_path()
            / (target_path.stem().string() + "-" + timestamp_str + target_path.extension().string());

        std::error_code ec;
        fs::rename(target_path, archive_path, ec);
        // 归档保留策略清理
        cleanup_old_archives(target_path);

        auto handle = std::make_unique<std::ofstream>(target_path, std::ios::out | std::ios::trunc);
        if (!handle->is_open())
        {   // 滚动失败，放弃文件句柄
            file_context = context{};
            return;
        }
        file_context.handle = std::move(handle);
        file_context.current_size = 0;
    }

    void coroutine_log::cleanup_old_archives(const fs::path& target_path) const
    {
        if (max_archive_count == 0)
        {
            return;
        }

        // 归档名为 <stem>-YYYYMMDD_HHMMSS<ext>，时间戳定长，文件名顺序即归档先后
        const std::string head = target_path.stem().string() + "-";
        const std::string tail = target_path.extension().string();
        std::vector<fs::path> archives;
        std::error_code ec;
        for (fs::directory_iterator it(target_path.parent_path(), ec), end; !ec && it != end; it.increment(ec))
        {
            const std::string name = it->path().filename().string();
            if (name.size() > head.size() + tail.size() && name.starts_with(head) && name.ends_with(tail)
                && it->is_regular_file(ec))
            {
                archives.push_back(it->path());
            }
        }
        if (archives.size() <= max_archive_count)
        {
            return;
        }

        std::ranges::sort(archives);
        std::for_each_n(archives.begin(), archives.size() - max_archive_count, [](const fs::path& archive)
        {
            std::error_code ignored;
            fs::remove(archive, ignored);
        });
    }
}
