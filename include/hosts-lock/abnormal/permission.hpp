#pragma once

#include "deviant.hpp"

namespace hlk::abnormal
{
    /**
     * @brief 权限不足，无法修改 hosts 文件
     */
    class permission_denied : public exception
    {
    public:
        // loc 放在最后一个参数并给默认值，这样抛出时就不用手动传了
        explicit permission_denied(const std::string& msg,
                                   const std::source_location& loc = std::source_location::current())
            : exception(loc, msg)
        {}

    protected:
        std::string_view type_name() const noexcept override { return "PERMISSION"; }
    };
}
