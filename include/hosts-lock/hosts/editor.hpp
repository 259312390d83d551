#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio.hpp>
#include <abnormal/hosts.hpp>
#include <hosts/system.hpp>
#include <log/monitor.hpp>
#include <rule/domain.hpp>

namespace hlk::hosts
{
    namespace net = boost::asio;

    /**
     * @brief hosts 编辑器配置
     */
    struct options
    {
        std::filesystem::path path{default_hosts_path};
        std::string address = "127.0.0.1";
        std::string marker = "# Website blocks added by hosts-lock";
    };

    /**
     * @brief hosts 文件编辑器
     * @details 在 hosts 文件末尾维护一个由标记行开头的屏蔽块，每个域名一行 `<address> <domain>`。
     * 每次修改都读取整个文件、过滤、再整体写回，文件中最多只存在一个屏蔽块。
     * @note 过滤按子串匹配：任何包含目标域名或标记的行都会被删除
     */
    class editor
    {
    public:
        explicit editor(options opts, log::coroutine_log &log, cache_flusher flusher = flush_cache);

        /**
         * @brief 写入屏蔽块
         * @details 先清除旧的屏蔽块和涉及这些域名的行，再追加标记行与映射行
         * @param domains 要屏蔽的域名集合
         * @throws abnormal::hosts_error 读写失败时抛出，操作类型为 `operation::apply`
         * @note 文件写入成功后不再抛出：刷新缓存与日志失败只记录警告
         */
        net::awaitable<void> apply(const rule::domain_set &domains);

        /**
         * @brief 移除屏蔽块
         * @param domains 之前屏蔽的域名集合
         * @throws abnormal::hosts_error 读写失败时抛出，操作类型为 `operation::remove`
         */
        net::awaitable<void> remove(const rule::domain_set &domains);

        /**
         * @brief 检查 hosts 文件中是否存在标记行
         */
        [[nodiscard]] bool contains_block() const;

        [[nodiscard]] const options &settings() const noexcept { return options_; }

    private:
        /**
         * @brief 读取、过滤并整体写回 hosts 文件
         * @return 被删除的原有行数
         */
        std::size_t rewrite(const rule::domain_set &domains, operation op) const;

        /**
         * @brief 写入之后的收尾：记录日志并刷新 DNS 缓存，均不抛出
         */
        net::awaitable<void> settle(std::size_t dropped);

        [[nodiscard]] std::vector<std::string> read_lines(operation op) const;

        void write_lines(const std::vector<std::string> &lines, operation op) const;

        net::awaitable<void> refresh_cache();

        options options_;
        log::coroutine_log &log_;
        cache_flusher flusher_;
    };
}
