#include "rigview/assets/RigFileLoader.hpp"
#include "rigview/core/TaskSystem.hpp"
#include "rigview/core/logger.hpp"

#include <exception>

namespace rigview::assets
{
    struct RigFileLoader::FileLoadTask : enki::ITaskSet
    {
        RigFileLoader* loader = nullptr;
        uint64_t requestId = 0;
        RigFileSet files;

        void ExecuteRange(enki::TaskSetPartition range, uint32_t threadnum) override;
    };

    void RigFileLoader::FileLoadTask::ExecuteRange(enki::TaskSetPartition, uint32_t)
    {
        RigFileLoadResult result{requestId, {}};
        try
        {
            result.descriptor = files.read();
        }
        catch (const std::exception& e)
        {
            core::Logger::error("RigFileLoader: exception while reading {}: {}", files.describe(), e.what());
            result.descriptor = core::Unexpected(std::string(e.what()));
        }
        loader->m_completed.push(std::move(result));
    }

    RigFileLoader::RigFileLoader() = default;

    RigFileLoader::~RigFileLoader()
    {
        waitAll();
    }

    uint64_t RigFileLoader::request(RigFileSet files)
    {
        const uint64_t id = m_nextRequestId++;

        if (!core::TaskSystem::isInitialized())
        {
            m_completed.push({id, files.read()});
            return id;
        }

        cleanupTasks();

        auto task = std::make_unique<FileLoadTask>();
        task->loader = this;
        task->requestId = id;
        task->files = std::move(files);
        task->m_SetSize = 1;

        core::TaskSystem::ioScheduler().AddTaskSetToPipe(task.get());

        std::scoped_lock lock(m_taskMutex);
        m_loadingTasks.push_back(std::move(task));
        return id;
    }

    std::vector<RigFileLoadResult> RigFileLoader::consumeCompleted()
    {
        auto done = m_completed.drain();
        cleanupTasks();
        return done;
    }

    void RigFileLoader::waitAll()
    {
        if (!core::TaskSystem::isInitialized())
        {
            return;
        }

        std::vector<std::unique_ptr<FileLoadTask>> tasks;
        {
            std::scoped_lock lock(m_taskMutex);
            tasks = std::move(m_loadingTasks);
            m_loadingTasks.clear();
        }

        for (auto& t : tasks)
        {
            core::TaskSystem::ioScheduler().WaitforTask(t.get());
        }
    }

    size_t RigFileLoader::inFlight() const
    {
        std::scoped_lock lock(m_taskMutex);
        size_t count = 0;
        for (const auto& t : m_loadingTasks)
        {
            if (!t->GetIsComplete())
            {
                ++count;
            }
        }
        return count;
    }

    void RigFileLoader::cleanupTasks()
    {
        std::scoped_lock lock(m_taskMutex);
        std::erase_if(m_loadingTasks, [](const auto& t) { return t->GetIsComplete(); });
    }
}
