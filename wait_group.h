#ifndef NETT_WAIT_GROUP_H
#define NETT_WAIT_GROUP_H

#include <mutex>
#include <cstddef>
#include <stdexcept>
#include <condition_variable>

namespace nett
{

// Counts in-flight tasks; wait() blocks until every one has called done().
class wait_group
{
   public:
    wait_group() = default;
    wait_group(const wait_group&) = delete;
    wait_group& operator=(const wait_group&) = delete;

    void add(const std::size_t n = 1)
    {
        const std::lock_guard<std::mutex> lock(mtx_);
        count_ += n;
    }

    void done()
    {
        {
            const std::lock_guard<std::mutex> lock(mtx_);
            if (count_ == 0)
            {
                throw std::logic_error("wait_group done without matching add");
            }
            --count_;
        }
        cv_.notify_all();
    }

    void wait()
    {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this]() { return count_ == 0; });
    }

    [[nodiscard]] std::size_t pending() const
    {
        const std::lock_guard<std::mutex> lock(mtx_);
        return count_;
    }

   private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::size_t count_ = 0;
};

}    // namespace nett

#endif
