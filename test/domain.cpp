#include <rule/domain.hpp>
#include <abnormal/domain.hpp>
#include <abnormal/configuration.hpp>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace rule = hlk::rule;
namespace abnormal = hlk::abnormal;
namespace fs = std::filesystem;

/**
 * @brief 测试单个域名的校验与小写化
 */
void test_canonical()
{
    std::cout << "=== 开始域名校验测试 ===" << std::endl;

    assert(rule::canonical("example.com") == "example.com");
    assert(rule::canonical("  Example.COM\t") == "example.com");
    assert(rule::canonical("a-b.co.uk") == "a-b.co.uk");
    assert(rule::canonical("123.com") == "123.com");
    assert(rule::canonical("x.y.z.example.org") == "x.y.z.example.org");

    const std::vector<std::string> invalid{
        "", "   ", "localhost", "not a domain", "-bad.com", "bad-.com",
        "a..com", ".example.com", "example.com.", "example.c", "example.c0m",
        "1.2.3.4", "exa_mple.com", "http://example.com", std::string(64, 'a') + ".com",
    };
    for (const auto& entry : invalid)
    {
        bool thrown = false;
        try
        {
            (void)rule::canonical(entry);
        }
        catch (const abnormal::invalid_domain& e)
        {
            thrown = true;
            assert(!e.dump().empty());
        }
        assert(thrown);
    }

    // 单个标签最长 63 个字符
    const std::string longest = std::string(63, 'a') + ".com";
    assert(rule::canonical(longest) == longest);

    std::cout << "域名校验测试通过！" << std::endl;
}

/**
 * @brief 测试 `www.` 变体展开
 */
void test_www_expansion()
{
    std::cout << "=== 开始 www 展开测试 ===" << std::endl;

    const auto bare = rule::normalize(std::vector<std::string>{"example.com"});
    assert(bare.rejected.empty());
    assert(bare.domains == (rule::domain_set{"example.com", "www.example.com"}));

    // 已经带 www. 前缀的不再展开，也不会反推出裸域名
    const auto prefixed = rule::normalize(std::vector<std::string>{"www.example.com"});
    assert(prefixed.domains == (rule::domain_set{"www.example.com"}));

    const auto sub = rule::normalize(std::vector<std::string>{"news.ycombinator.com"});
    assert(sub.domains.contains("www.news.ycombinator.com"));

    std::cout << "www 展开测试通过！" << std::endl;
}

/**
 * @brief 测试非法条目被跳过并记录
 */
void test_rejected_entries()
{
    std::cout << "=== 开始非法条目测试 ===" << std::endl;

    const auto result = rule::normalize(std::vector<std::string>{"not a domain", "valid.com"});
    assert(result.domains == (rule::domain_set{"valid.com", "www.valid.com"}));
    assert(result.rejected.size() == 1);
    assert(result.rejected.front().entry == "not a domain");
    assert(!result.rejected.front().reason.empty());

    const auto nothing = rule::normalize(std::vector<std::string>{"???", "", "localhost"});
    assert(nothing.domains.empty());
    assert(nothing.rejected.size() == 3);

    const auto empty = rule::normalize(std::vector<std::string>{});
    assert(empty.domains.empty());
    assert(empty.rejected.empty());

    std::cout << "非法条目测试通过！" << std::endl;
}

/**
 * @brief 测试去重与幂等性
 */
void test_idempotent()
{
    std::cout << "=== 开始幂等性测试 ===" << std::endl;

    const auto duplicated = rule::normalize(std::vector<std::string>{
        "Example.com", "example.com", "www.example.com", " EXAMPLE.com "});
    assert(duplicated.domains.size() == 2);

    const std::vector<std::vector<std::string>> samples{
        {"example.com"},
        {"www.reddit.com", "reddit.com", "youtube.com"},
        {"a.io", "b.io", "www.c.io", "not valid", "news.ycombinator.com"},
    };
    for (const auto& sample : samples)
    {
        const auto once = rule::normalize(sample);
        const auto twice = rule::normalize(once.domains);
        assert(twice.domains == once.domains);
        assert(twice.rejected.empty());
    }

    std::cout << "幂等性测试通过！" << std::endl;
}

/**
 * @brief 测试从文件读取域名列表
 */
void test_load_domains()
{
    std::cout << "=== 开始域名列表读取测试 ===" << std::endl;

    const fs::path path = fs::temp_directory_path() /
        ("hosts-lock-domains-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".txt");
    {
        std::ofstream out(path);
        out << "# distractions\n"
            << "\n"
            << "reddit.com\n"
            << "   youtube.com   \n"
            << "  # indented comment\n"
            << "news.ycombinator.com\r\n";
    }

    const auto domains = rule::load_domains(path);
    assert(domains == (std::vector<std::string>{"reddit.com", "youtube.com", "news.ycombinator.com"}));
    fs::remove(path);

    bool thrown = false;
    try
    {
        (void)rule::load_domains(path);
    }
    catch (const abnormal::configuration_error&)
    {
        thrown = true;
    }
    assert(thrown);

    std::cout << "域名列表读取测试通过！" << std::endl;
}

int main()
{
    test_canonical();
    test_www_expansion();
    test_rejected_entries();
    test_idempotent();
    test_load_domains();
    std::cout << "所有域名测试通过！" << std::endl;
    return 0;
}
