#include <core/configuration.hpp>
#include <abnormal/configuration.hpp>
#include <filesystem>
#include <boost/property_tree/json_parser.hpp>

namespace hlk::core
{
    void configuration::load(const std::string& file_path)
    {
        if (!std::filesystem::exists(file_path))
        {
            throw abnormal::configuration_error("configuration file not found: " + file_path);
        }
        try
        {
            boost::property_tree::read_json(file_path, root_);
        }
        catch (const boost::property_tree::ptree_error& e)
        {
            throw abnormal::configuration_error(std::string("failed to parse configuration: ") + e.what());
        }
    }

    settings configuration::extract() const
    {
        settings result;
        try
        {
            result.hosts.path = root_.get<std::string>("hosts.path", result.hosts.path.string());
            result.hosts.address = root_.get<std::string>("hosts.address", result.hosts.address);
            result.hosts.marker = root_.get<std::string>("hosts.marker", result.hosts.marker);

            result.domains_file = root_.get<std::string>("block.file", "");
            result.duration = root_.get<std::string>("block.duration", "");
            if (const auto domains = root_.get_child_optional("block.domains"))
            {
                for (const auto& child : *domains)
                {
                    result.domains.push_back(child.second.get_value<std::string>());
                }
            }

            auto& logging = result.logging;
            if (const auto name = root_.get_optional<std::string>("log.level"))
            {
                logging.level = log::parse_level(*name);
            }
            logging.directory = root_.get<std::string>("log.directory", logging.directory);
            logging.file = root_.get<std::string>("log.file", logging.file);
            logging.max_file_size = root_.get<std::size_t>("log.max_file_size", logging.max_file_size);
            logging.max_archive_count = root_.get<std::size_t>("log.max_archive_count", logging.max_archive_count);
            logging.time_offset = std::chrono::minutes(root_.get<int>("log.time_offset", 0));
        }
        catch (const boost::property_tree::ptree_error& e)
        {
            throw abnormal::configuration_error(std::string("invalid configuration value: ") + e.what());
        }

        if (result.hosts.address.empty())
        {
            throw abnormal::configuration_error("hosts.address must not be empty");
        }
        // 标记行写入 hosts 文件，必须是注释
        if (!result.hosts.marker.starts_with('#'))
        {
            throw abnormal::configuration_error("hosts.marker must start with '#'");
        }
        // 标记按子串匹配，只有 '#' 和空白的标记会命中所有注释行
        if (result.hosts.marker.find_first_not_of("# \t") == std::string::npos)
        {
            throw abnormal::configuration_error("hosts.marker must contain text after '#'");
        }
        return result;
    }
}
