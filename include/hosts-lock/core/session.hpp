#pragma once

#include <chrono>
#include <string_view>

#include <utility>
#include <boost/asio.hpp>
#include <hosts/editor.hpp>
#include <hosts/system.hpp>
#include <log/monitor.hpp>
#include <rule/domain.hpp>
#include <rule/duration.hpp>

namespace hlk::core
{
    namespace net = boost::asio;

    /**
     * @brief 会话状态
     * @note idle -> blocking -> restored，restored 为终态
     */
    enum class state
    {
        idle,
        blocking,
        restored,
    };

    [[nodiscard]] std::string_view to_string(state value) noexcept;

    /**
     * @brief 一次屏蔽会话
     * @details 权限检查 -> 写入屏蔽块 -> 等待（可被信号或 `stop()` 打断）-> 移除屏蔽块。
     * 离开 blocking 状态的每条路径（超时、中断、等待期间的异常）都会恰好执行一次恢复。
     */
    class session
    {
    public:
        session(net::io_context &ioc, hosts::editor &editor, rule::domain_set domains,
                rule::minutes duration, hosts::privilege_probe probe, log::coroutine_log &log);

        /**
         * @brief 运行会话直至恢复完成
         * @throws abnormal::permission_denied 权限不足，未做任何修改
         * @throws abnormal::hosts_error 写入失败（无需恢复）或恢复失败（屏蔽可能仍然有效）
         * @note 只能调用一次
         */
        net::awaitable<void> run();

        /**
         * @brief 请求提前结束等待并进入恢复流程
         * @note 线程安全，可以在 `run()` 之前调用
         */
        void stop();

        [[nodiscard]] state current() const noexcept { return state_; }

        /**
         * @brief 等待是否被信号或 `stop()` 提前结束
         */
        [[nodiscard]] bool interrupted() const noexcept { return interrupted_; }

        [[nodiscard]] std::chrono::system_clock::time_point started_at() const noexcept { return started_at_; }

        [[nodiscard]] std::chrono::system_clock::time_point ends_at() const noexcept { return ends_at_; }

    private:
        net::awaitable<void> wait();

        net::awaitable<void> restore();

        void on_signal(int signal_number);

        hosts::editor &editor_;
        log::coroutine_log &log_;
        hosts::privilege_probe probe_;
        rule::domain_set domains_;
        rule::minutes duration_;

        net::steady_timer timer_;
        net::signal_set signals_;

        state state_ = state::idle;
        bool started_ = false;
        bool stop_requested_ = false;
        bool interrupted_ = false;
        int signal_number_ = 0;
        std::chrono::system_clock::time_point started_at_{};
        std::chrono::system_clock::time_point ends_at_{};
    };
}
