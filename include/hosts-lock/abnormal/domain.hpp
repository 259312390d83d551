#pragma once

#include "deviant.hpp"

namespace hlk::abnormal
{
    /**
     * @brief 域名语法不合法
     * @note 非致命，由 `rule::normalize` 捕获后转为警告
     */
    class invalid_domain : public exception
    {
    public:
        explicit invalid_domain(const std::string& msg,
                                const std::source_location& loc = std::source_location::current())
            : exception(loc, msg)
        {}

    protected:
        std::string_view type_name() const noexcept override { return "DOMAIN"; }
    };
}
