#include <core/session.hpp>
#include <abnormal/permission.hpp>
#include <abnormal/hosts.hpp>
#include <csignal>
#include <ctime>
#include <exception>
#include <stdexcept>

namespace hlk::core
{
    namespace
    {
        std::string local_clock(const std::chrono::system_clock::time_point tp)
        {
            const std::time_t t = std::chrono::system_clock::to_time_t(tp);
            std::tm tm{};
#ifdef _WIN32
            localtime_s(&tm, &t);
#else
            localtime_r(&t, &tm);
#endif
            char buf[32]{};
            const std::size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
            return {buf, n};
        }

        /**
         * @brief 离开作用域时取消信号等待，否则挂起的 async_wait 会让 io_context 无法退出
         */
        struct signal_guard
        {
            net::signal_set &signals;

            ~signal_guard()
            {
                boost::system::error_code ec;
                signals.cancel(ec);
            }
        };

        std::string signal_name(const int signal_number)
        {
            switch (signal_number)
            {
                case SIGINT:
                    return "SIGINT";
                case SIGTERM:
                    return "SIGTERM";
                default:
                    return "signal " + std::to_string(signal_number);
            }
        }
    }

    std::string_view to_string(const state value) noexcept
    {
        switch (value)
        {
            case state::idle:
                return "idle";
            case state::blocking:
                return "blocking";
            case state::restored:
                return "restored";
            default:
                return "";
        }
    }

    session::session(net::io_context &ioc, hosts::editor &editor, rule::domain_set domains,
                     const rule::minutes duration, hosts::privilege_probe probe, log::coroutine_log &log)
        : editor_(editor),
          log_(log),
          probe_(std::move(probe)),
          domains_(std::move(domains)),
          duration_(duration),
          timer_(ioc),
          signals_(ioc, SIGINT, SIGTERM)
    {
    }

    net::awaitable<void> session::run()
    {
        if (started_)
        {
            throw std::logic_error("session already ran");
        }
        started_ = true;
        const signal_guard guard{signals_};

        // 1. 权限检查：失败时保持 idle，不做任何修改
        if (!probe_ || !probe_())
        {
            throw abnormal::permission_denied(
                "administrative privileges required to edit " + editor_.settings().path.string());
        }

        // 2. 写文件之前就开始监听信号，写入期间收到的信号同样会让等待立即结束
        signals_.async_wait([this](const boost::system::error_code &ec, const int signal_number)
        {
            if (!ec)
            {
                on_signal(signal_number);
            }
        });

        // 3. 写入屏蔽块：apply 只在写入完成之前抛出，此时无需恢复，直接向上抛出
        co_await editor_.apply(domains_);

        state_ = state::blocking;
        started_at_ = std::chrono::system_clock::now();
        ends_at_ = started_at_ + rule::clamp_to<std::chrono::system_clock>(duration_);

        // 4. 等待；等待期间的任何异常都先记下，恢复之后再抛出
        std::exception_ptr failure;
        try
        {
            co_await log_.write_line(log::level::info,
                "blocking " + std::to_string(domains_.size()) + " domains for " + rule::to_string(duration_)
                + " until " + local_clock(ends_at_));
            co_await wait();
        }
        catch (...)
        {
            failure = std::current_exception();
        }
        if (failure)
        {
            co_await log_.try_write_line(log::level::error, "blocking interrupted by an unexpected error, restoring");
        }

        // 5. 恢复
        co_await restore();

        if (failure)
        {
            std::rethrow_exception(failure);
        }
    }

    void session::stop()
    {
        net::post(timer_.get_executor(), [this]
        {
            stop_requested_ = true;
            timer_.cancel();
        });
    }

    net::awaitable<void> session::wait()
    {
        if (!stop_requested_)
        {
            timer_.expires_after(rule::clamp_to<std::chrono::steady_clock>(duration_));
            boost::system::error_code ec;
            co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec && ec != net::error::operation_aborted)
            {
                throw boost::system::system_error(ec);
            }
        }

        if (!stop_requested_)
        {
            co_await log_.write_line(log::level::info, "block duration elapsed");
            co_return;
        }

        interrupted_ = true;
        if (signal_number_ != 0)
        {
            co_await log_.write_line(log::level::info,
                "received " + signal_name(signal_number_) + ", cleaning up...");
        }
        else
        {
            co_await log_.write_line(log::level::info, "blocking interrupted, cleaning up...");
        }
    }

    net::awaitable<void> session::restore()
    {
        std::exception_ptr failure;
        std::string reason;
        try
        {
            co_await editor_.remove(domains_);
        }
        catch (const abnormal::hosts_error &e)
        {
            failure = std::current_exception();
            reason = e.dump();
        }

        if (failure)
        {
            // 恢复失败是唯一无法自动补救的情况，状态保持 blocking
            co_await log_.try_write_line(log::level::fatal,
                "unblock failed - blocks may still be active: " + reason);
            std::rethrow_exception(failure);
        }

        state_ = state::restored;
        co_await log_.try_write_line(log::level::info, "websites unblocked");
    }

    void session::on_signal(const int signal_number)
    {
        signal_number_ = signal_number;
        stop_requested_ = true;
        timer_.cancel();
    }
}
