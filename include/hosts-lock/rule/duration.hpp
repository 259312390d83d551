#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace hlk::rule
{
    /**
     * @brief 以分钟为单位的浮点时长，保留秒级精度
     */
    using minutes = std::chrono::duration<double, std::ratio<60>>;

    /**
     * @brief 解析时长字符串
     * @details 格式为 `<整数>[s|m|h|d]`，单位不区分大小写，省略单位时按分钟计算
     * @param input 时长字符串，如 "45s"、"30"、"2h"
     * @return `minutes` 对应的分钟数，如 "45s" 返回 0.75
     * @throws abnormal::invalid_format 格式不正确时抛出
     */
    minutes parse_duration(std::string_view input);

    /**
     * @brief 将时长限制在时钟可表示范围的一半以内，避免转换溢出
     * @tparam Clock 目标时钟，如 `std::chrono::steady_clock`
     */
    template <typename Clock>
    typename Clock::duration clamp_to(const minutes value)
    {
        constexpr auto longest = std::chrono::duration_cast<minutes>(Clock::duration::max()) / 2;
        const minutes bounded = value < longest ? value : longest;
        return std::chrono::duration_cast<typename Clock::duration>(bounded < minutes::zero() ? minutes::zero() : bounded);
    }

    /**
     * @brief 将时长转换为便于阅读的形式，如 "1h 30m"、"45s"
     * @note 超出计时器范围的时长按 `clamp_to<steady_clock>` 的上限显示
     */
    std::string to_string(minutes value);
}
