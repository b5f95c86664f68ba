#pragma once

/*
    EMBER ШЭЙДИНГ САН

    ФАЙЛ: parallel_for.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: [begin, end) мужийг chunk-уудад хувааж job system дээр ажиллуулаад
            бүгд дуустал хүлээнэ.
*/


#include <algorithm>
#include <condition_variable>
#include <mutex>

#include "ember/job/job_system.hpp"

namespace ember
{
    // count_ нь mtx_-ээр хамгаалагдана: done() mutex-ээ суллахаас өмнө wait() буцахгүй.
    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            count_ += n;
        }

        void done()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (--count_ == 0) cv_.notify_all();
        }

        void wait()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&]() { return count_ == 0; });
        }

    private:
        int count_ = 0;
        std::mutex mtx_{};
        std::condition_variable cv_{};
    };

    template<typename Fn>
    inline void parallel_for_1d(IJobSystem* js, int begin, int end, int min_grain, Fn&& fn)
    {
        if (end <= begin) return;
        const int count = end - begin;
        const int grain = std::max(1, min_grain);
        if (!js || count <= grain)
        {
            fn(begin, end);
            return;
        }

        const int workers = (int)std::max<size_t>(1, js->worker_count());
        const int chunks = std::max(1, std::min(workers * 2, (count + grain - 1) / grain));
        const int chunk_size = (count + chunks - 1) / chunks;

        WaitGroup wg{};
        for (int b = begin; b < end; b += chunk_size)
        {
            const int e = std::min(end, b + chunk_size);
            wg.add(1);
            js->enqueue([b, e, &fn, &wg]() {
                fn(b, e);
                wg.done();
            });
        }
        wg.wait();
    }
}
