#ifndef KGSS_AT_SCOPE_EXIT_HPP
#define KGSS_AT_SCOPE_EXIT_HPP

#include <utility>

namespace kgss
{
    /// Invokes a callable when the enclosing scope is left, unless released first.
    template <typename Function>
    class at_scope_exit
    {
      public:
        explicit at_scope_exit(Function&& _func)
            : func_{std::forward<Function>(_func)}
            , execute_{true}
        {
        }

        at_scope_exit(const at_scope_exit&) = delete;
        auto operator=(const at_scope_exit&) -> at_scope_exit& = delete;

        ~at_scope_exit()
        {
            if (execute_) {
                func_();
            }
        }

        void release() noexcept
        {
            execute_ = false;
        }

      private:
        Function func_;
        bool execute_;
    }; // class at_scope_exit

    template <typename Function>
    at_scope_exit(Function&&) -> at_scope_exit<Function>;
} // namespace kgss

#endif // KGSS_AT_SCOPE_EXIT_HPP
