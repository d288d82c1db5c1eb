#ifndef NETT_SCOPED_EXIT_H
#define NETT_SCOPED_EXIT_H

#include <utility>
#include <type_traits>

namespace nett
{

template <typename Callback>
class scoped_exit
{
   public:
    explicit scoped_exit(Callback callback) : callback_(std::move(callback)) {}

    scoped_exit(scoped_exit&& mv) noexcept : callback_(std::move(mv.callback_)), active_(mv.active_) { mv.active_ = false; }

    scoped_exit(const scoped_exit&) = delete;
    scoped_exit& operator=(const scoped_exit&) = delete;
    scoped_exit& operator=(scoped_exit&&) = delete;

    ~scoped_exit()
    {
        if (active_)
        {
            callback_();
        }
    }

   private:
    Callback callback_;
    bool active_ = true;
};

template <typename Callback>
scoped_exit<std::decay_t<Callback>> make_scoped_exit(Callback&& c)
{
    return scoped_exit<std::decay_t<Callback>>(std::forward<Callback>(c));
}

}    // namespace nett

#define NETT_SCOPED_CONCAT_INNER(x, y) x##y
#define NETT_SCOPED_CONCAT(x, y) NETT_SCOPED_CONCAT_INNER(x, y)
#define NETT_SCOPED_UNIQUE_NAME(prefix) NETT_SCOPED_CONCAT(prefix, __LINE__)
#define DEFER(code) auto NETT_SCOPED_UNIQUE_NAME(scoped) = ::nett::make_scoped_exit([&]() { code; })

#endif
