#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rigview::assets
{
    enum class BindErrorCode
    {
        MalformedAtlas,
        MissingPages,
        RegistrationFailure,
        InstantiationFailure,
        RendererUnavailable
    };

    struct BindError
    {
        BindErrorCode code = BindErrorCode::RegistrationFailure;
        std::string message;
        std::vector<std::string> missingPages;

        static BindError malformedAtlas();
        static BindError missing(std::vector<std::string> pages);
        static BindError registrationFailure(std::string_view reason);
        static BindError instantiationFailure(std::string_view reason);
        static BindError rendererUnavailable();
    };

    constexpr std::string_view toString(BindErrorCode code)
    {
        switch (code)
        {
        case BindErrorCode::MalformedAtlas:       return "MalformedAtlas";
        case BindErrorCode::MissingPages:         return "MissingPages";
        case BindErrorCode::RegistrationFailure:  return "RegistrationFailure";
        case BindErrorCode::InstantiationFailure: return "InstantiationFailure";
        case BindErrorCode::RendererUnavailable:  return "RendererUnavailable";
        default:                                  return "Unknown";
        }
    }
}
