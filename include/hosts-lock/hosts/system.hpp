#pragma once

#include <functional>
#include <string_view>

namespace hlk::hosts
{
    /**
     * @brief 权限探测：返回当前进程能否修改 hosts 文件
     */
    using privilege_probe = std::function<bool()>;

    /**
     * @brief 刷新本地域名解析缓存，返回是否成功
     */
    using cache_flusher = std::function<bool()>;

#ifdef _WIN32
    constexpr std::string_view default_hosts_path = R"(C:\Windows\System32\drivers\etc\hosts)";
#else
    constexpr std::string_view default_hosts_path = "/etc/hosts";
#endif

    /**
     * @brief 检查管理员权限
     * @note POSIX 下检查有效用户是否为 root，Windows 下通过 `net session` 判断
     */
    bool has_privilege();

    /**
     * @brief 刷新系统 DNS 缓存
     * @details 依次尝试当前平台的刷新命令，任一成功即返回 `true`
     */
    bool flush_cache();
}
