/**
 * @file exceptions.h
 * @brief Exception hierarchy for faults raised by code outside our control.
 *
 * Expected failures travel as Result<T>. Exceptions are what a core or a
 * driver implementation throws when something breaks inside it; the
 * session bridge and the runtime catch them at the boundary and convert
 * them into StepError / DriverRuntimeError results.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace arduplay {

/**
 * @brief Base class for all Arduplay exceptions.
 */
class ArduplayException : public std::runtime_error {
public:
    explicit ArduplayException(const std::string& msg)
        : std::runtime_error(msg)
    {}

    template<typename... Args>
    static std::string format_message(std::format_string<Args...> fmt, Args&&... args) {
        return std::format(fmt, std::forward<Args>(args)...);
    }
};

/**
 * @brief Internal fault of an emulation core.
 *
 * Thrown from ICore implementations (for instance when a libretro entry
 * point reports an impossible state). The core's state is untrustworthy
 * afterwards.
 */
class CoreException : public ArduplayException {
public:
    explicit CoreException(const std::string& msg)
        : ArduplayException("Core fault: " + msg)
    {}
};

/**
 * @brief Fault inside a video, audio or input driver.
 *
 * Carries the driver name so the runtime can attribute the dropped output.
 */
class DriverException : public ArduplayException {
public:
    DriverException(std::string driver, const std::string& msg)
        : ArduplayException(format_message("Driver '{}' fault: {}", driver, msg))
        , driver_(std::move(driver))
    {}

    [[nodiscard]] const std::string& driver() const noexcept { return driver_; }

private:
    std::string driver_;
};

} // namespace arduplay
