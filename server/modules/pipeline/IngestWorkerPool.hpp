#pragma once

/**
 * @brief 观测处理线程池
 *
 * 同一监测点固定映射到同一个 EventLoop，观测的同步处理段在该线程上执行，
 * 保证每个监测点单写者；不同监测点在不同线程上并行。
 */
class IngestWorkerPool {
public:
    using EventLoop = trantor::EventLoop;
    using EventLoopThreadPool = trantor::EventLoopThreadPool;

    IngestWorkerPool() = default;
    IngestWorkerPool(const IngestWorkerPool&) = delete;
    IngestWorkerPool& operator=(const IngestWorkerPool&) = delete;

    ~IngestWorkerPool() {
        stop();
    }

    /**
     * @param numThreads 线程数量，0 表示使用 CPU 核心数
     */
    void start(size_t numThreads = 0) {
        if (pool_) {
            LOG_WARN << "[Ingest] Worker pool already started";
            return;
        }

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) {
                numThreads = 4;
            }
        }

        pool_ = std::make_unique<EventLoopThreadPool>(numThreads, "IngestPool");
        pool_->start();
        loops_ = pool_->getLoops();
        LOG_INFO << "[Ingest] Worker pool started with " << numThreads << " threads";
    }

    void stop() {
        if (!pool_) return;
        for (auto* loop : loops_) loop->quit();
        pool_->wait();
        pool_.reset();
        loops_.clear();
        LOG_INFO << "[Ingest] Worker pool stopped";
    }

    bool isStarted() const { return pool_ != nullptr; }

    /**
     * @brief 监测点对应的线程，未启动时返回 nullptr（由调用方在当前线程处理）
     */
    EventLoop* loopFor(const std::string& locationId) const {
        if (loops_.empty()) return nullptr;
        return loops_[std::hash<std::string>{}(locationId) % loops_.size()];
    }

private:
    std::unique_ptr<EventLoopThreadPool> pool_;
    std::vector<EventLoop*> loops_;
};
