#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: result.hpp
    MODULE: core
    PURPOSE: Value-or-error return type used instead of exceptions across pass and
             manager boundaries.
*/


#include <string>
#include <utility>

namespace tsaa
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        // Forward this failure into a result of another value type.
        template<typename U>
        Result<U> forward_error(const std::string& prefix = {}) const
        {
            return Result<U>::failure(prefix.empty() ? error : prefix + ": " + error);
        }
    };

    using Status = Result<bool>;

    inline Status status_ok()
    {
        return Status::success(true);
    }

    inline Status status_error(std::string e)
    {
        return Status::failure(std::move(e));
    }
}
