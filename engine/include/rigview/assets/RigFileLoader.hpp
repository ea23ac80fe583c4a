#pragma once

#include "rigview/assets/RigFileSet.hpp"
#include "rigview/core/ThreadSafeQueue.hpp"
#include "rigview/core/result.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace rigview::assets
{
    struct RigFileLoadResult
    {
        uint64_t requestId = 0;
        core::Result<RigDescriptor> descriptor;
    };

    /**
     * @brief Reads rig files on the TaskSystem I/O scheduler.
     *
     * Results are only handed out by consumeCompleted(), which the main thread
     * calls once per frame. Without an initialized TaskSystem the read runs
     * inline inside request().
     */
    class RigFileLoader
    {
    public:
        RigFileLoader();
        ~RigFileLoader();

        RigFileLoader(const RigFileLoader&) = delete;
        RigFileLoader& operator=(const RigFileLoader&) = delete;

        uint64_t request(RigFileSet files);

        std::vector<RigFileLoadResult> consumeCompleted();

        void waitAll();

        size_t inFlight() const;

    private:
        struct FileLoadTask;

        void cleanupTasks();

        core::ThreadSafeQueue<RigFileLoadResult> m_completed;
        std::vector<std::unique_ptr<FileLoadTask>> m_loadingTasks;
        mutable std::mutex m_taskMutex;
        uint64_t m_nextRequestId = 1;
    };
}
