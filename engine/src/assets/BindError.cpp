#include "rigview/assets/BindError.hpp"

namespace rigview::assets
{
    BindError BindError::malformedAtlas()
    {
        return {BindErrorCode::MalformedAtlas, "Atlas pages not found. Check the .atlas file.", {}};
    }

    BindError BindError::missing(std::vector<std::string> pages)
    {
        std::string message = "Missing atlas pages: ";
        for (size_t i = 0; i < pages.size(); ++i)
        {
            if (i > 0)
            {
                message += ", ";
            }
            message += pages[i];
        }
        return {BindErrorCode::MissingPages, std::move(message), std::move(pages)};
    }

    BindError BindError::registrationFailure(std::string_view reason)
    {
        return {BindErrorCode::RegistrationFailure, std::string(reason), {}};
    }

    BindError BindError::instantiationFailure(std::string_view reason)
    {
        return {BindErrorCode::InstantiationFailure, std::string(reason), {}};
    }

    BindError BindError::rendererUnavailable()
    {
        return {BindErrorCode::RendererUnavailable, "Renderer is not ready.", {}};
    }
}
