#ifndef OZTRANSFER_ERROR_MATCHER_HPP
#define OZTRANSFER_ERROR_MATCHER_HPP

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"

#include <catch2/catch.hpp>
#include <fmt/format.h>

#include <string>

// Matches an oztransfer::exception carrying a specific error code.
class error_code_matcher : public Catch::MatcherBase<oztransfer::exception>
{
    int rhs_;

public:
    explicit error_code_matcher(const int _rhs)
        : rhs_{_rhs}
    {
    }

    bool match(const oztransfer::exception& _lhs) const override
    {
        return _lhs.code() == rhs_;
    }

    std::string describe() const override
    {
        return fmt::format("has error code {} ({})", rhs_, oztransfer::error_name(rhs_));
    }
};

inline auto has_error_code(const int _rhs) -> error_code_matcher
{
    return error_code_matcher{_rhs};
}

#endif // OZTRANSFER_ERROR_MATCHER_HPP
