#include "oztransfer/exception.hpp"

#include "oztransfer/error_codes.hpp"

#include <fmt/format.h>

namespace oztransfer
{
    exception::exception(int _code,
                         const std::string& _message,
                         const std::string& _file_name,
                         std::uint32_t _line_number,
                         const std::string& _function_name)
        : std::exception{}
        , code_{_code}
        , message_stack_{_message}
        , line_number_{_line_number}
        , function_name_{_function_name}
        , file_name_{_file_name}
    {
    } // exception

    auto exception::what() const noexcept -> const char*
    {
        try {
            what_ = fmt::format("oztransfer exception:\n"
                                "    file: {}\n"
                                "    function: {}\n"
                                "    line: {}\n"
                                "    code: {} ({})\n"
                                "    message:\n",
                                file_name_,
                                function_name_,
                                line_number_,
                                code_,
                                error_name(code_));

            for (const auto& entry : message_stack_) {
                what_ += fmt::format("        {}\n", entry);
            }
        }
        catch (...) {
            what_.clear();
        }

        return what_.c_str();
    } // what

    auto exception::client_display_what() const noexcept -> const char*
    {
        try {
            what_ = fmt::format("{}: ", error_name(code_));

            for (const auto& entry : message_stack_) {
                what_ += entry;
                what_ += '\n';
            }
        }
        catch (...) {
            what_.clear();
        }

        return what_.c_str();
    } // client_display_what
} // namespace oztransfer
