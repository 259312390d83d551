#include <rule/duration.hpp>
#include <abnormal/format.hpp>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace rule = hlk::rule;
namespace abnormal = hlk::abnormal;

void test_units()
{
    std::cout << "=== 开始单位换算测试 ===" << std::endl;

    assert(rule::parse_duration("2h").count() == 120.0);
    assert(rule::parse_duration("45s").count() == 0.75);
    assert(rule::parse_duration("30").count() == 30.0);
    assert(rule::parse_duration("30m").count() == 30.0);
    assert(rule::parse_duration("1d").count() == 1440.0);
    assert(rule::parse_duration("0").count() == 0.0);

    // 单位不区分大小写
    assert(rule::parse_duration("2H") == rule::parse_duration("2h"));
    assert(rule::parse_duration("10S") == rule::parse_duration("10s"));

    std::cout << "单位换算测试通过！" << std::endl;
}

void test_equivalent_units()
{
    std::cout << "=== 开始等价时长测试 ===" << std::endl;

    assert(rule::parse_duration("60s") == rule::parse_duration("1m"));
    assert(rule::parse_duration("120m") == rule::parse_duration("2h"));
    assert(rule::parse_duration("3600s") == rule::parse_duration("1h"));
    assert(rule::parse_duration("24h") == rule::parse_duration("1d"));
    assert(rule::parse_duration("1440") == rule::parse_duration("1d"));
    assert(rule::parse_duration("90s") == rule::minutes(1.5));

    std::cout << "等价时长测试通过！" << std::endl;
}

void test_invalid_format()
{
    std::cout << "=== 开始格式错误测试 ===" << std::endl;

    const std::vector<std::string> invalid{
        "abc", "", "-5", "-5m", "1.5m", "1.5", "10x", "5w", " 5", "5 ", "m", "5mm", "1h30m",
        "99999999999999999999999",
    };
    for (const auto& input : invalid)
    {
        bool thrown = false;
        try
        {
            (void)rule::parse_duration(input);
        }
        catch (const abnormal::invalid_format& e)
        {
            thrown = true;
            assert(std::string(e.what()).size() > 0);
        }
        assert(thrown);
    }

    std::cout << "格式错误测试通过！" << std::endl;
}

void test_to_string()
{
    std::cout << "=== 开始时长显示测试 ===" << std::endl;

    assert(rule::to_string(rule::parse_duration("45s")) == "45s");
    assert(rule::to_string(rule::parse_duration("90m")) == "1h 30m");
    assert(rule::to_string(rule::parse_duration("1d")) == "1d");
    assert(rule::to_string(rule::parse_duration("3661s")) == "1h 1m 1s");
    assert(rule::to_string(rule::minutes(0)) == "0s");

    // 超出计时器范围的时长按上限显示，不会溢出成随机数字
    const auto longest = rule::to_string(rule::parse_duration("18446744073709551615d"));
    assert(longest == rule::to_string(rule::parse_duration("999999999999d")));
    assert(longest == rule::to_string(rule::parse_duration("18446744073709551615")));
    assert(longest.starts_with("53375d "));

    std::cout << "时长显示测试通过！" << std::endl;
}

int main()
{
    test_units();
    test_equivalent_units();
    test_invalid_format();
    test_to_string();
    std::cout << "所有时长测试通过！" << std::endl;
    return 0;
}
