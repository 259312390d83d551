#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>


namespace hlk::rule
{
    /**
     * @brief 域名集合
     * @note 有序集合，写入 hosts 的条目顺序在多次运行之间保持稳定
     */
    using domain_set = std::set<std::string>;

    /**
     * @brief 被丢弃的输入条目
     */
    struct rejection
    {
        std::string entry;  // 原始输入
        std::string reason; // 拒绝原因
    };

    /**
     * @brief 规范化结果
     */
    struct normalization
    {
        domain_set domains;
        std::vector<rejection> rejected;
    };

    /**
     * @brief 校验单个域名并返回其小写形式
     * @param raw 原始输入，两端空白会被去除
     * @return 规范化后的域名
     * @throws abnormal::invalid_domain 不符合主机名语法时抛出
     */
    std::string canonical(std::string_view raw);

    /**
     * @brief 校验并展开域名列表
     * @details 非法条目被记录到 `rejected` 中，其余条目连同 `www.` 变体一起放入集合
     * @param raw 原始域名列表
     * @return `normalization` 规范化后的集合与被拒绝的条目
     */
    normalization normalize(const std::vector<std::string>& raw);

    normalization normalize(const domain_set& raw);

    /**
     * @brief 从文件读取域名列表
     * @details 每行一个域名，空行和以 `#` 开头的行会被忽略
     * @param path 域名列表文件路径
     * @throws abnormal::configuration_error 文件不存在或无法读取时抛出
     */
    std::vector<std::string> load_domains(const std::filesystem::path& path);
}
