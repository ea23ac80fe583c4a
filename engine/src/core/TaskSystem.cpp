#include "rigview/core/TaskSystem.hpp"
#include "rigview/core/logger.hpp"

#include <algorithm>

namespace rigview::core
{
    std::unique_ptr<enki::TaskScheduler> TaskSystem::s_ioScheduler;

    void TaskSystem::init()
    {
        init(Config{});
    }

    void TaskSystem::init(const Config& config)
    {
        if (s_ioScheduler)
        {
            return;
        }

        s_ioScheduler = std::make_unique<enki::TaskScheduler>();
        s_ioScheduler->Initialize(std::max<uint32_t>(config.numIoThreads, 1));

        Logger::info("TaskSystem initialized: {} I/O threads.",
                     s_ioScheduler->GetNumTaskThreads());
    }

    void TaskSystem::shutdown()
    {
        if (s_ioScheduler)
        {
            s_ioScheduler->WaitforAllAndShutdown();
            s_ioScheduler.reset();
        }
    }

    bool TaskSystem::isInitialized()
    {
        return s_ioScheduler != nullptr;
    }

    enki::TaskScheduler& TaskSystem::ioScheduler()
    {
        return *s_ioScheduler;
    }
}
