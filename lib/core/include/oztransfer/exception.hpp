#ifndef OZTRANSFER_EXCEPTION_HPP
#define OZTRANSFER_EXCEPTION_HPP

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace oztransfer
{
    class exception : public std::exception
    {
    public:
        exception(int _code,
                  const std::string& _message,
                  const std::string& _file_name,
                  std::uint32_t _line_number,
                  const std::string& _function_name);

        // Full report including the throw site. Meant for logs.
        auto what() const noexcept -> const char* override;

        // Error name and message stack only. Meant for operators.
        auto client_display_what() const noexcept -> const char*;

        auto code() const noexcept -> int { return code_; }
        auto message_stack() const -> const std::vector<std::string>& { return message_stack_; }
        auto file_name() const -> const std::string& { return file_name_; }
        auto line_number() const noexcept -> std::uint32_t { return line_number_; }
        auto function_name() const -> const std::string& { return function_name_; }

        auto add_message(const std::string& _message) -> void { message_stack_.push_back(_message); }

    private:
        int code_;
        std::vector<std::string> message_stack_;
        std::uint32_t line_number_;
        std::string function_name_;
        std::string file_name_;
        mutable std::string what_;
    }; // class exception
} // namespace oztransfer

#define THROW(_code, _msg) (throw oztransfer::exception(_code, _msg, __FILE__, __LINE__, __PRETTY_FUNCTION__))

#endif // OZTRANSFER_EXCEPTION_HPP
