#pragma once
#include <string>
#include <string_view>
#include <chrono>
#include <fstream>
#include <memory>
#include <filesystem>

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>


namespace hlk::log
{
    /**
     * @brief 日志级别
     * @note 日志级别从低到高分别为 debug, info, warn, error, fatal
     */
    enum class level
    {
        debug,
        info,
        warn,
        error,
        fatal,
    };

    /**
     * @brief 将配置中的级别名称转换为日志级别
     * @param name 级别名称，不区分大小写，如 "info"、"WARN"
     * @throws abnormal::configuration_error 名称无法识别时抛出
     */
    level parse_level(std::string_view name);

    namespace asio = boost::asio;
    namespace fs = std::filesystem;
    class coroutine_log
    {
        struct context
        {
            std::unique_ptr<std::ofstream> handle;
            std::size_t current_size = 0;
        };
    public:
        explicit coroutine_log(const asio::any_io_executor& executor);

        /**
         * @brief 设置日志输出目录
         * @param directory_name 日志输出目录的路径，空字符串表示关闭文件日志
         */
        asio::awaitable<void> set_output_directory(const std::string& directory_name);

        /**
         * @brief 设置日志文件名
         * @param file_name 相对输出目录的文件名
         */
        asio::awaitable<void> set_file_name(const std::string& file_name);

        /**
         * @brief 设置日志文件的最大大小，超过该大小则创建新的日志文件
         * @param size 日志文件的最大大小，单位为字节
         */
        asio::awaitable<void> set_max_file_size(std::size_t size);

        /**
         * @brief 设置时间偏移，用于日志中的时间戳
         * @param offset 相对 UTC 的时间偏移量
         */
        asio::awaitable<void> set_time_offset(std::chrono::minutes offset);

        asio::awaitable<void> set_file_level_threshold(level threshold);

        asio::awaitable<void> set_console_level_threshold(level threshold);

        /**
         * @brief 设置日志文件最大归档数量，超过该数量则删除最旧的日志文件
         * @param count 最大归档数量，0 表示不限制
         */
        asio::awaitable<void> set_max_archive_count(std::size_t count);

        /**
         * @brief 关闭已打开的文件句柄
         */
        asio::awaitable<void> shutdown();

        static std::string to_string(const level& log_level);

        /**
         * @brief 将日志消息输出到控制台，并在末尾添加换行符
         * @param log_level 日志级别
         * @param data 日志消息
         * @return 写入的字节数
         * @note 如果日志级别低于 console_level_threshold，则不输出
         */
        auto console_write_line(const level& log_level, const std::string& data)
        -> asio::awaitable<std::size_t>;

        /**
         * @brief 将日志消息追加到日志文件，并在末尾添加换行符
         * @param log_level 日志级别
         * @param data 日志消息
         * @return 写入的字节数
         * @note 未设置输出目录或级别低于 file_level_threshold 时不输出；
         *       文件超过 max_file_size 时先归档再写入
         */
        auto file_write_line(const level& log_level, const std::string& data)
        -> asio::awaitable<std::size_t>;

        /**
         * @brief 同时写入控制台和日志文件
         */
        asio::awaitable<void> write_line(level log_level, const std::string& data);

        /**
         * @brief 与 write_line 相同，但输出失败时改写到 std::cerr，不向调用方抛出
         * @note 用于清理与恢复路径，这些路径上日志失败不能打断后续步骤
         */
        asio::awaitable<void> try_write_line(level log_level, const std::string& data);

    private:
        asio::strand<asio::any_io_executor> serial_exec;
        context file_context;

        // 配置项
        fs::path root_directory;
        std::string file_name = "hosts-lock.log";
        std::chrono::minutes time_offset{0};
        std::size_t max_archive_count = 0; // 0 表示不限制归档个数
        level file_level_threshold = level::debug;
        level console_level_threshold = level::info;
        std::size_t max_file_size = 10 * 1024 * 1024; // 10MB

    private:

        /**
         * @brief 构建日志行前缀
         *
         * @return std::string 形如 "[YYYY-MM-DD HH:MM:SS.mmm][LEVEL] "
         */
        std::string prefix(level log_level) const;

        bool open_file();

        void rotate_file();

        /**
         * @brief 清理旧归档文件
         */
        void cleanup_old_archives(const fs::path& target_path) const;
    };
}
