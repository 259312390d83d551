#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include <hosts/editor.hpp>
#include <log/monitor.hpp>

namespace hlk::core
{
    /**
     * @brief 日志相关配置
     */
    struct log_settings
    {
        log::level level = log::level::info;
        std::string directory;                      // 为空时不写日志文件
        std::string file = "hosts-lock.log";
        std::size_t max_file_size = 1024 * 1024;
        std::size_t max_archive_count = 5;
        std::chrono::minutes time_offset{0};
    };

    /**
     * @brief 从配置文件中提取出的运行参数，未配置的项使用默认值
     */
    struct settings
    {
        hosts::options hosts;
        std::string domains_file;
        std::vector<std::string> domains;
        std::string duration;
        log_settings logging;
    };

    class configuration
    {
    public:
        configuration() = default;

        /**
         * @brief 加载配置文件
         * @param file_path 配置文件路径
         * @throws abnormal::configuration_error 文件不存在或 JSON 格式错误
         */
        void load(const std::string& file_path);

        /**
         * @brief 获取根 JSON 对象
         */
        [[nodiscard]] const boost::property_tree::ptree& data() const
        {
            return root_;
        }

        /**
         * @brief 解析运行参数
         * @throws abnormal::configuration_error 字段类型错误或日志级别无法识别
         */
        [[nodiscard]] settings extract() const;

    private:
        boost::property_tree::ptree root_;
    };
}
