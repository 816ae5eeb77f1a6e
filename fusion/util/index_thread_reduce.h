#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "../settings.h"

/*

runs callPerIndex(min, max, threadIdx) over [first, end) in chunks of
stepSize on a fixed set of worker threads and blocks until every chunk is done.

* chunks are handed out in ascending order, so chunk k always covers the same
  indices. callers that write into per-index slots get deterministic output
  regardless of the thread count.
* the first exception thrown by a chunk stops further chunks from starting and
  is rethrown from reduce() on the calling thread.
* a cancel flag, when set, is polled before each chunk. chunks that already
  started finish; reduce() returns false if any chunk was skipped.

numThreads <= 1 runs everything inline on the caller's thread.

*/

namespace scene_fusion {

class IndexThreadReduce {
public:
    explicit IndexThreadReduce(int numThreads = 0)
    {
        if (numThreads <= 0)
            numThreads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
        this->numThreads = numThreads;

        if (numThreads > 1) {
            running = true;
            workers.reserve(numThreads);
            for (int i = 0; i < numThreads; ++i)
                workers.emplace_back(&IndexThreadReduce::workerLoop, this, i);

            if (printThreadingInfo)
                std::printf("IndexThreadReduce: started %d workers\n", numThreads);
        }
    }

    ~IndexThreadReduce()
    {
        {
            std::lock_guard<std::mutex> lock(exMutex);
            running = false;
        }
        todoSignal.notify_all();
        for (std::thread& t : workers)
            t.join();
    }

    IndexThreadReduce(const IndexThreadReduce&) = delete;
    IndexThreadReduce& operator=(const IndexThreadReduce&) = delete;

    int threadCount() const { return numThreads; }

    /** Returns true when every chunk ran, false when the cancel flag skipped some. */
    bool reduce(std::function<void(int, int, int)> callPerIndex, int first, int end,
                int stepSize = 1, const std::atomic<bool>* cancel = nullptr)
    {
        if (stepSize <= 0) stepSize = 1;
        if (end <= first) return true;

        if (workers.empty()) {
            for (int i = first; i < end; i += stepSize) {
                if (cancel != nullptr && cancel->load()) return false;
                callPerIndex(i, std::min(i + stepSize, end), 0);
            }
            return true;
        }

        std::unique_lock<std::mutex> lock(exMutex);

        callPerIndexFn = std::move(callPerIndex);
        nextIndex = first;
        maxIndex = end;
        step = stepSize;
        cancelFlag = cancel;
        skipped = false;
        failure = nullptr;
        busy = 0;

        todoSignal.notify_all();
        doneSignal.wait(lock, [this] { return nextIndex >= maxIndex && busy == 0; });

        callPerIndexFn = nullptr;
        cancelFlag = nullptr;

        if (failure) {
            std::exception_ptr e = failure;
            failure = nullptr;
            std::rethrow_exception(e);
        }
        return !skipped;
    }

private:
    void workerLoop(int idx)
    {
        std::unique_lock<std::mutex> lock(exMutex);
        while (true) {
            todoSignal.wait(lock, [this] { return !running || nextIndex < maxIndex; });
            if (!running) break;

            const int from = nextIndex;
            const int to = std::min(from + step, maxIndex);
            nextIndex = to;

            const bool stop = failure != nullptr || (cancelFlag != nullptr && cancelFlag->load());
            if (stop) {
                if (failure == nullptr) skipped = true;
                if (nextIndex >= maxIndex && busy == 0) doneSignal.notify_all();
                continue;
            }

            ++busy;
            lock.unlock();

            std::exception_ptr err;
            try {
                callPerIndexFn(from, to, idx);
            } catch (...) {
                err = std::current_exception();
            }

            lock.lock();
            if (err && failure == nullptr) failure = err;
            --busy;
            if (nextIndex >= maxIndex && busy == 0) doneSignal.notify_all();
        }
    }

    int numThreads = 1;
    std::vector<std::thread> workers;

    std::mutex exMutex;
    std::condition_variable todoSignal;
    std::condition_variable doneSignal;

    std::function<void(int, int, int)> callPerIndexFn;
    int nextIndex = 0;
    int maxIndex = 0;
    int step = 1;
    int busy = 0;
    bool running = false;
    bool skipped = false;
    const std::atomic<bool>* cancelFlag = nullptr;
    std::exception_ptr failure;
};

}
