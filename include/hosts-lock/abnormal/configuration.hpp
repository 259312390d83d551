#pragma once

#include "deviant.hpp"

namespace hlk::abnormal
{
    class configuration_error : public exception
    {
    public:
        explicit configuration_error(const std::string& msg,
                                     const std::source_location& loc = std::source_location::current())
            : exception(loc, msg)
        {}

    protected:
        std::string_view type_name() const noexcept override { return "CONFIG"; }
    };
}
