#include "rigview/assets/RigFileSet.hpp"
#include "rigview/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace rigview::assets
{
    namespace
    {
        std::string lowerExtension(const std::filesystem::path& p)
        {
            std::string ext = p.extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        core::Result<NamedBlob> readBlob(const std::filesystem::path& path)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(path, ec);
            if (ec)
            {
                return core::Unexpected(fmt::format("Cannot read {}: {}", path.string(), ec.message()));
            }

            std::ifstream file(path, std::ios::binary);
            if (!file)
            {
                return core::Unexpected(fmt::format("Cannot open {}", path.string()));
            }

            Blob bytes(static_cast<size_t>(size));
            if (size > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size)))
            {
                return core::Unexpected(fmt::format("Short read on {}", path.string()));
            }
            return NamedBlob::fromBytes(path.filename().string(), std::move(bytes));
        }
    }

    RigFileSet RigFileSet::fromPaths(const std::vector<std::filesystem::path>& paths)
    {
        RigFileSet set;
        for (const auto& p : paths)
        {
            const auto ext = lowerExtension(p);
            if (ext == ".json" && !set.skeleton)
            {
                set.skeleton = p;
            }
            else if (ext == ".atlas" && !set.atlas)
            {
                set.atlas = p;
            }
            else if (ext == ".png")
            {
                set.images.push_back(p);
            }
        }
        return set;
    }

    std::string RigFileSet::describe() const
    {
        std::string out;
        auto append = [&out](const std::filesystem::path& p)
        {
            if (!out.empty())
            {
                out += ", ";
            }
            out += p.filename().string();
        };

        if (skeleton) append(*skeleton);
        if (atlas) append(*atlas);
        for (const auto& image : images) append(image);
        return out;
    }

    core::Result<RigDescriptor> RigFileSet::read() const
    {
        if (!isComplete())
        {
            return core::Unexpected(std::string(kIncompleteSelectionMessage));
        }

        RigDescriptor descriptor;

        auto skeletonBlob = readBlob(*skeleton);
        if (!skeletonBlob) return core::Unexpected(skeletonBlob.error());
        descriptor.skeleton = std::move(*skeletonBlob);

        auto atlasBlob = readBlob(*atlas);
        if (!atlasBlob) return core::Unexpected(atlasBlob.error());
        descriptor.atlas = std::move(*atlasBlob);

        descriptor.images.reserve(images.size());
        for (const auto& image : images)
        {
            auto imageBlob = readBlob(image);
            if (!imageBlob) return core::Unexpected(imageBlob.error());
            descriptor.images.push_back(std::move(*imageBlob));
        }

        core::Logger::debug("Read rig files: {}", describe());
        return descriptor;
    }
}
