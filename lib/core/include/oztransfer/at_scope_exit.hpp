#ifndef OZTRANSFER_AT_SCOPE_EXIT_HPP
#define OZTRANSFER_AT_SCOPE_EXIT_HPP

#include <utility>

namespace oztransfer
{
    template <typename Function>
    class at_scope_exit
    {
    public:
        explicit at_scope_exit(Function&& _func)
            : func_{std::forward<Function>(_func)}
        {
        }

        at_scope_exit(const at_scope_exit&) = delete;
        auto operator=(const at_scope_exit&) -> at_scope_exit& = delete;

        ~at_scope_exit()
        {
            func_();
        }

    private:
        Function func_;
    }; // class at_scope_exit

    template <typename Function>
    at_scope_exit(Function&&) -> at_scope_exit<Function>;
} // namespace oztransfer

#endif // OZTRANSFER_AT_SCOPE_EXIT_HPP
