#pragma once

#include "deviant.hpp"

namespace hlk::hosts
{
    /**
     * @brief hosts 文件操作类型
     */
    enum class operation
    {
        apply,
        remove,
    };

    [[nodiscard]] constexpr std::string_view to_string(const operation op) noexcept
    {
        return op == operation::apply ? "apply" : "remove";
    }
}

namespace hlk::abnormal
{
    /**
     * @brief hosts 文件读写失败
     * @note 携带失败时正在进行的操作 (apply / remove)
     */
    class hosts_error : public exception
    {
    public:
        explicit hosts_error(const hosts::operation op, const std::string& msg,
                             const std::source_location& loc = std::source_location::current())
            : exception(loc, std::string(hosts::to_string(op)) + ": " + msg)
            , operation_(op)
        {}

        [[nodiscard]] hosts::operation operation() const noexcept { return operation_; }

    protected:
        std::string_view type_name() const noexcept override { return "HOSTS"; }

    private:
        hosts::operation operation_;
    };
}
