#pragma once

#include "deviant.hpp"

namespace hlk::abnormal
{
    /**
     * @brief 时长字符串格式错误
     */
    class invalid_format : public exception
    {
    public:
        explicit invalid_format(const std::string& msg,
                                const std::source_location& loc = std::source_location::current())
            : exception(loc, msg)
        {}

    protected:
        std::string_view type_name() const noexcept override { return "FORMAT"; }
    };
}
