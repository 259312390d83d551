#include <hosts/editor.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace hlk::hosts
{
    namespace
    {
        std::string last_error()
        {
            return std::strerror(errno);
        }
    }

    editor::editor(options opts, log::coroutine_log &log, cache_flusher flusher)
        : options_(std::move(opts)), log_(log), flusher_(std::move(flusher))
    {
    }

    net::awaitable<void> editor::apply(const rule::domain_set &domains)
    {
        const auto dropped = rewrite(domains, operation::apply);
        // 文件已写入，之后的步骤失败也不能让调用方误以为屏蔽块不存在
        co_await settle(dropped);
        co_await log_.try_write_line(log::level::info,
            "blocked " + std::to_string(domains.size()) + " domains in " + options_.path.string());
    }

    net::awaitable<void> editor::remove(const rule::domain_set &domains)
    {
        const auto dropped = rewrite(domains, operation::remove);
        co_await settle(dropped);
        co_await log_.try_write_line(log::level::info,
            "removed block for " + std::to_string(domains.size()) + " domains from " + options_.path.string());
    }

    bool editor::contains_block() const
    {
        const auto lines = read_lines(operation::remove);
        return std::ranges::any_of(lines, [this](const std::string &line)
        {
            return line.find(options_.marker) != std::string::npos;
        });
    }

    std::size_t editor::rewrite(const rule::domain_set &domains, const operation op) const
    {
        auto lines = read_lines(op);

        // 无论 apply 还是 remove，都先删除旧的屏蔽块，保证重复执行不会叠加。
        // 标记行之后紧邻的 `<address> ...` 行属于旧屏蔽块（可能来自另一组域名），一并删除
        const std::string mapping_prefix = options_.address + " ";
        std::vector<std::string> kept;
        kept.reserve(lines.size());
        bool inside_block = false;
        for (auto &line : lines)
        {
            if (line.find(options_.marker) != std::string::npos)
            {
                inside_block = true;
                continue;
            }
            if (inside_block && line.starts_with(mapping_prefix))
            {
                continue;
            }
            inside_block = false;

            const bool targeted = std::ranges::any_of(domains, [&line](const std::string &domain)
            {
                return line.find(domain) != std::string::npos;
            });
            if (!targeted)
            {
                kept.push_back(std::move(line));
            }
        }
        const std::size_t dropped = lines.size() - kept.size();

        if (op == operation::apply)
        {
            kept.push_back(options_.marker);
            for (const auto &domain : domains)
            {
                kept.push_back(options_.address + " " + domain);
            }
        }

        write_lines(kept, op);
        return dropped;
    }

    std::vector<std::string> editor::read_lines(const operation op) const
    {
        std::error_code ec;
        if (!std::filesystem::exists(options_.path, ec))
        {
            throw abnormal::hosts_error(op, "hosts file not found at " + options_.path.string());
        }
        if (!std::filesystem::is_regular_file(options_.path, ec))
        {
            throw abnormal::hosts_error(op, "hosts path " + options_.path.string() + " is not a regular file");
        }

        std::ifstream in(options_.path, std::ios::binary);
        if (!in.is_open())
        {
            throw abnormal::hosts_error(op, "unable to read " + options_.path.string() + " (" + last_error() + ")");
        }

        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }
        if (in.bad())
        {
            throw abnormal::hosts_error(op, "error while reading " + options_.path.string());
        }
        return lines;
    }

    void editor::write_lines(const std::vector<std::string> &lines, const operation op) const
    {
        std::ostringstream buffer;
        for (const auto &line : lines)
        {
            buffer << line << '\n';
        }
        const std::string content = buffer.str();

        // 原地截断重写，保留文件的 inode、属主与权限
        std::ofstream out(options_.path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw abnormal::hosts_error(op, "unable to write " + options_.path.string() + " (" + last_error() + ")");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (out.fail())
        {
            throw abnormal::hosts_error(op, "error while writing " + options_.path.string());
        }
    }

    net::awaitable<void> editor::settle(const std::size_t dropped)
    {
        co_await log_.try_write_line(log::level::debug,
            "dropped " + std::to_string(dropped) + " existing lines from " + options_.path.string());
        co_await refresh_cache();
    }

    net::awaitable<void> editor::refresh_cache()
    {
        if (!flusher_)
        {
            co_return;
        }

        bool flushed = false;
        std::string reason = "command failed";
        try
        {
            flushed = flusher_();
        }
        catch (const std::exception &e)
        {
            reason = e.what();
        }
        catch (...)
        {
            reason = "unknown error";
        }

        if (flushed)
        {
            co_await log_.try_write_line(log::level::debug, "DNS cache flushed");
        }
        else
        {
            co_await log_.try_write_line(log::level::warn, "could not flush DNS cache: " + reason);
            co_await log_.try_write_line(log::level::info,
                "you may need to restart your browser for changes to take effect");
        }
    }
}
