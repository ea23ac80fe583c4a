#include "rigview/assets/RigDescriptor.hpp"

#include <cstring>

namespace rigview::assets
{
    NamedBlob NamedBlob::fromString(std::string name, std::string_view contents)
    {
        Blob bytes(contents.size());
        if (!contents.empty())
        {
            std::memcpy(bytes.data(), contents.data(), contents.size());
        }
        return fromBytes(std::move(name), std::move(bytes));
    }

    NamedBlob NamedBlob::fromBytes(std::string name, Blob bytes)
    {
        return {std::move(name), std::make_shared<const Blob>(std::move(bytes))};
    }
}
