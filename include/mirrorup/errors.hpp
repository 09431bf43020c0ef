#ifndef MIRRORUP_ERRORS_HPP
#define MIRRORUP_ERRORS_HPP

#include <string>

#include <spdlog/spdlog.h>

#include <mirrorup/enums.hpp>

namespace mirrorup
{
    struct MirrorupError
    {
        ErrorLevel level;
        ErrorCode code;
        std::string reason;

        bool is_fatal() const noexcept
        {
            return level == ErrorLevel::FATAL;
        }

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(reason);
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(reason);
                    break;
                default:
                    spdlog::warn(reason);
            }
        }

        static MirrorupError fatal(ErrorCode code, std::string reason)
        {
            return MirrorupError{ ErrorLevel::FATAL, code, std::move(reason) };
        }
    };
}

#endif
