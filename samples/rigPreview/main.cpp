#include "rigview/engine.hpp"
#include "rigview/app/ViewerConfig.hpp"
#include "rigview/assets/RigFileLoader.hpp"
#include "rigview/assets/RigFileSet.hpp"
#include "rigview/assets/TransientUriRegistry.hpp"
#include "rigview/core/TaskSystem.hpp"
#include "rigview/core/cvar.hpp"
#include "rigview/headless/HeadlessAssetManager.hpp"
#include "rigview/headless/HeadlessRigRuntime.hpp"
#include "rigview/headless/HeadlessStage.hpp"

#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace rigview;

namespace
{
    struct Options
    {
        bool grid = false;
        bool fill = false;
        bool verbose = false;
        std::optional<std::string> logFile;
        std::optional<float> cellSize;
        std::optional<float> scale;
        std::vector<std::filesystem::path> files;
    };

    void printUsage()
    {
        fmt::print("Usage: rigPreview [--grid] [--fill] [--cell-size N] [--scale S] [--verbose] [--log-file F] skeleton.json rig.atlas page.png...\n");
    }

    std::optional<Options> parseArgs(int argc, char** argv)
    {
        Options options;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            if (arg == "--grid")
            {
                options.grid = true;
            }
            else if (arg == "--fill")
            {
                options.grid = true;
                options.fill = true;
            }
            else if (arg == "--verbose")
            {
                options.verbose = true;
            }
            else if (arg == "--log-file" && i + 1 < argc)
            {
                options.logFile = argv[++i];
            }
            else if ((arg == "--cell-size" || arg == "--scale") && i + 1 < argc)
            {
                float value = 0.0F;
                try
                {
                    value = std::stof(argv[++i]);
                }
                catch (const std::exception&)
                {
                    fmt::print(stderr, "{} expects a number, got '{}'\n", arg, argv[i]);
                    return std::nullopt;
                }
                (arg == "--cell-size" ? options.cellSize : options.scale) = value;
            }
            else if (arg == "-h" || arg == "--help" || arg.starts_with("--"))
            {
                return std::nullopt;
            }
            else
            {
                options.files.emplace_back(arg);
            }
        }
        return options;
    }

    void printSlot(const slots::SlotRecord& record)
    {
        fmt::print("{:>6}  {:<8} {:<18} anim={:<10} skin={:<10} scale={:.2f}{}\n",
                   record.id.label(),
                   slots::SlotStateMachine::stateToString(record.phase()),
                   record.status,
                   record.selectedAnimation.empty() ? "-" : record.selectedAnimation,
                   record.selectedSkin.empty() ? "-" : record.selectedSkin,
                   record.scale,
                   record.error ? "  error: " + *record.error : std::string{});
    }
}

int main(int argc, char** argv)
{
    cpptrace::register_terminate_handler();

    auto options = parseArgs(argc, argv);
    if (!options)
    {
        printUsage();
        return 1;
    }

    core::LogOptions logOptions;
    logOptions.filePath = options->logFile;
    Log::init(logOptions);
    if (options->verbose)
    {
        Log::setLevel(spdlog::level::trace);
    }

    const int applied = core::CVarSystem::loadFromIni("rigview.ini");
    if (applied > 0)
    {
        Log::info("Applied {} settings from rigview.ini", applied);
    }

    core::TaskSystem::init();

    int exitCode = 0;
    {
        assets::TransientUriRegistry uris;
        headless::HeadlessAssetManager assetManager(uris);
        headless::HeadlessRigRuntime runtime(assetManager);
        headless::HeadlessStage stage({1280.0F, 720.0F});

        ViewerSession session(assetManager, runtime, stage, uris);
        session.setMode(options->grid ? PresentationMode::Grid : PresentationMode::Single);
        if (options->cellSize)
        {
            session.setCellSize(*options->cellSize);
        }
        if (options->scale)
        {
            session.setScale(*options->scale);
        }

        const auto files = assets::RigFileSet::fromPaths(options->files);
        if (!files.isComplete())
        {
            session.reportIncompleteSelection();
            exitCode = 1;
        }
        else
        {
            Log::info("Reading {}", files.describe());
            assets::RigFileLoader loader;
            loader.request(files);
            loader.waitAll();

            for (auto& result : loader.consumeCompleted())
            {
                if (!result.descriptor)
                {
                    Log::error("Could not read rig files: {}", result.descriptor.error());
                    exitCode = 1;
                    continue;
                }

                if (options->fill)
                {
                    session.fillEmpty(*result.descriptor, [](const slots::FillSummary& summary)
                    {
                        fmt::print("Filled {} slots ({} failed)\n", summary.bound, summary.failed);
                    });
                }
                else
                {
                    session.load(*result.descriptor);
                }
            }

            // Pump the headless backend until nothing is left in flight.
            while (assetManager.update() > 0)
            {
                session.frame();
            }
            session.frame();
        }

        if (options->grid)
        {
            for (const auto& record : session.registry().gridRecords())
            {
                if (record.phase() != slots::SlotPhase::Empty || record.error)
                {
                    printSlot(record);
                }
            }
        }
        else
        {
            printSlot(session.record(SlotId::single()));
        }
        fmt::print("{} rigs live, {} attached nodes\n", session.arena().boundCount(), stage.childCount());

        const auto& current = session.record(session.currentSlot());
        if (current.phase() == slots::SlotPhase::Failed)
        {
            exitCode = 1;
        }

        session.shutdown();
        assetManager.update();
        Log::info("Shutdown: {} keys registered, {} URIs live", assetManager.registeredCount(), uris.liveCount());
    }

    core::CVarSystem::saveToIni("rigview.ini");
    core::TaskSystem::shutdown();
    Log::shutdown();
    return exitCode;
}
