#include <rule/domain.hpp>
#include <abnormal/domain.hpp>
#include <abnormal/configuration.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace hlk::rule
{
    namespace
    {
        constexpr std::string_view www_prefix = "www.";
        constexpr std::size_t max_label_length = 63;
        constexpr std::size_t max_domain_length = 253;

        std::string_view trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }

        bool alnum(const char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) != 0;
        }

        /**
         * @brief 校验单个标签：字母数字或连字符，不能以连字符开头或结尾
         */
        bool valid_label(const std::string_view label)
        {
            if (label.empty() || label.size() > max_label_length)
            {
                return false;
            }
            if (!alnum(label.front()) || !alnum(label.back()))
            {
                return false;
            }
            return std::ranges::all_of(label, [](const char c) { return alnum(c) || c == '-'; });
        }

        /**
         * @brief 校验顶级域：纯字母，长度至少为 2
         */
        bool valid_top_level(const std::string_view label)
        {
            return label.size() >= 2 && std::ranges::all_of(label,
                [](const char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; });
        }
    }

    std::string canonical(const std::string_view raw)
    {
        std::string domain(trim(raw));
        std::ranges::transform(domain, domain.begin(),
            [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (domain.empty())
        {
            throw abnormal::invalid_domain("empty domain");
        }
        if (domain.size() > max_domain_length)
        {
            throw abnormal::invalid_domain("domain too long: " + domain);
        }

        // 至少需要一个点：label.tld
        const auto last_dot = domain.rfind('.');
        if (last_dot == std::string::npos)
        {
            throw abnormal::invalid_domain("missing top-level domain: " + domain);
        }
        if (!valid_top_level(std::string_view(domain).substr(last_dot + 1)))
        {
            throw abnormal::invalid_domain("invalid top-level domain: " + domain);
        }

        std::string_view rest = std::string_view(domain).substr(0, last_dot);
        while (true)
        {
            const auto pos = rest.find('.');
            if (!valid_label(rest.substr(0, pos)))
            {
                throw abnormal::invalid_domain("invalid label in: " + domain);
            }
            if (pos == std::string_view::npos)
            {
                break;
            }
            rest.remove_prefix(pos + 1);
        }
        return domain;
    }

    normalization normalize(const std::vector<std::string>& raw)
    {
        normalization result;
        for (const auto& entry : raw)
        {
            std::string domain;
            try
            {
                domain = canonical(entry);
            }
            catch (const abnormal::invalid_domain& e)
            {
                result.rejected.push_back({entry, e.what()});
                continue;
            }

            if (!domain.starts_with(www_prefix))
            {
                result.domains.insert(std::string(www_prefix) + domain);
            }
            result.domains.insert(std::move(domain));
        }
        return result;
    }

    normalization normalize(const domain_set& raw)
    {
        return normalize(std::vector<std::string>(raw.begin(), raw.end()));
    }

    std::vector<std::string> load_domains(const std::filesystem::path& path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw abnormal::configuration_error("domain list not found: " + path.string());
        }

        std::ifstream in(path);
        if (!in.is_open())
        {
            throw abnormal::configuration_error("unable to read domain list: " + path.string());
        }

        std::vector<std::string> domains;
        std::string line;
        while (std::getline(in, line))
        {
            const auto entry = trim(line);
            if (entry.empty() || entry.front() == '#')
            {
                continue;
            }
            domains.emplace_back(entry);
        }
        if (in.bad())
        {
            throw abnormal::configuration_error("error while reading domain list: " + path.string());
        }
        return domains;
    }
}
