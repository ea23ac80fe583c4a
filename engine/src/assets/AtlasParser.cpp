#include "rigview/assets/AtlasParser.hpp"

namespace rigview::assets
{
    namespace
    {
        std::string_view trim(std::string_view line)
        {
            constexpr std::string_view kWhitespace = " \t\r\n\f\v";
            const auto first = line.find_first_not_of(kWhitespace);
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = line.find_last_not_of(kWhitespace);
            return line.substr(first, last - first + 1);
        }

        std::vector<std::string_view> splitTrimmedLines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            size_t start = 0;
            while (start <= text.size())
            {
                const size_t end = text.find('\n', start);
                const size_t len = (end == std::string_view::npos) ? text.size() - start : end - start;
                lines.push_back(trim(text.substr(start, len)));
                if (end == std::string_view::npos)
                {
                    break;
                }
                start = end + 1;
            }
            return lines;
        }
    }

    core::Result<std::vector<std::string>, BindError> extractAtlasPageNames(std::string_view atlasText)
    {
        const auto lines = splitTrimmedLines(atlasText);

        std::vector<std::string> names;
        for (size_t i = 0; i < lines.size(); ++i)
        {
            const auto line = lines[i];
            if (line.empty() || line.find(':') != std::string_view::npos)
            {
                continue;
            }

            std::string_view nextLine;
            for (size_t j = i + 1; j < lines.size(); ++j)
            {
                if (!lines[j].empty())
                {
                    nextLine = lines[j];
                    break;
                }
            }

            if (nextLine.starts_with("size:"))
            {
                names.emplace_back(line);
            }
        }

        if (names.empty())
        {
            return core::Unexpected(BindError::malformedAtlas());
        }
        return names;
    }
}
