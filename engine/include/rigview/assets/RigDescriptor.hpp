#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rigview::assets
{
    using Blob = std::vector<std::byte>;
    using BlobPtr = std::shared_ptr<const Blob>;

    struct NamedBlob
    {
        std::string name;
        BlobPtr data;

        [[nodiscard]] size_t size() const { return data ? data->size() : 0; }
        [[nodiscard]] bool empty() const { return size() == 0; }

        // Views the bytes as text; valid while the blob is alive.
        [[nodiscard]] std::string_view text() const
        {
            if (!data || data->empty())
            {
                return {};
            }
            return {reinterpret_cast<const char*>(data->data()), data->size()};
        }

        static NamedBlob fromString(std::string name, std::string_view contents);
        static NamedBlob fromBytes(std::string name, Blob bytes);
    };

    // Raw user input for one load request. Not retained after binding.
    struct RigDescriptor
    {
        NamedBlob skeleton;
        NamedBlob atlas;
        std::vector<NamedBlob> images;
    };
}
