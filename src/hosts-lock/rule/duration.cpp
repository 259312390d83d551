#include <rule/duration.hpp>
#include <abnormal/format.hpp>
#include <cctype>
#include <charconv>
#include <cstdint>

namespace hlk::rule
{
    namespace
    {
        const std::string usage_hint =
            "use a plain number for minutes (e.g. '30') or a number with a unit: '45s', '30m', '2h', '1d'";

        /**
         * @brief 单位对应的秒数
         * @return 未知单位返回 0
         * @note 先换算成整数秒再除以 60，保证 "60s" 与 "1m" 得到完全相同的值
         */
        std::uint64_t unit_seconds(const char unit)
        {
            switch (std::tolower(static_cast<unsigned char>(unit)))
            {
                case 's':
                    return 1;
                case 'm':
                    return 60;
                case 'h':
                    return 3600;
                case 'd':
                    return 86400;
                default:
                    return 0;
            }
        }
    }

    minutes parse_duration(const std::string_view input)
    {
        if (input.empty())
        {
            throw abnormal::invalid_format("empty duration, " + usage_hint);
        }

        std::string_view digits = input;
        std::uint64_t factor = 60;
        if (!std::isdigit(static_cast<unsigned char>(input.back())))
        {
            factor = unit_seconds(input.back());
            if (factor == 0)
            {
                throw abnormal::invalid_format("unknown unit in '" + std::string(input) + "', " + usage_hint);
            }
            digits.remove_suffix(1);
        }

        // 只接受纯数字：负号、小数点、空白都属于格式错误
        if (digits.empty())
        {
            throw abnormal::invalid_format("missing magnitude in '" + std::string(input) + "', " + usage_hint);
        }
        for (const char c : digits)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                throw abnormal::invalid_format("invalid duration '" + std::string(input) + "', " + usage_hint);
            }
        }

        std::uint64_t magnitude = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude);
        if (ec != std::errc{} || ptr != digits.data() + digits.size())
        {
            throw abnormal::invalid_format("duration out of range: '" + std::string(input) + "'");
        }

        return minutes(static_cast<double>(magnitude) * static_cast<double>(factor) / 60.0);
    }

    std::string to_string(const minutes value)
    {
        const auto bounded = clamp_to<std::chrono::steady_clock>(value);
        auto total = static_cast<std::uint64_t>(std::chrono::round<std::chrono::seconds>(bounded).count());
        if (total == 0)
        {
            return "0s";
        }

        const std::uint64_t days = total / 86400;
        total %= 86400;
        const std::uint64_t hours = total / 3600;
        total %= 3600;
        const std::uint64_t mins = total / 60;
        const std::uint64_t secs = total % 60;

        std::string out;
        auto append = [&out](const std::uint64_t n, const char unit)
        {
            if (n == 0)
            {
                return;
            }
            if (!out.empty())
            {
                out += ' ';
            }
            out += std::to_string(n);
            out += unit;
        };
        append(days, 'd');
        append(hours, 'h');
        append(mins, 'm');
        append(secs, 's');
        return out;
    }
}
