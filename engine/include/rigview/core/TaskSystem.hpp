#pragma once

#include <TaskScheduler.h>
#include <cstdint>
#include <memory>

namespace rigview::core
{
    // Owns the I/O scheduler that blob reads run on. Completions are never
    // applied on worker threads; callers hand results back through a queue.
    class TaskSystem
    {
    public:
        struct Config
        {
            uint32_t numIoThreads = 4;
        };

        static void init();
        static void init(const Config& config);
        static void shutdown();
        static bool isInitialized();
        static enki::TaskScheduler& ioScheduler();

    private:
        static std::unique_ptr<enki::TaskScheduler> s_ioScheduler;
    };
}
