#pragma once

#include <optional>
#include <string>

namespace webbridge {

// Host metadata consulted when rendering getUserInfo / getAppVersion replies.
class HostEnvironment {
public:
    virtual ~HostEnvironment() = default;

    virtual std::string user_name() const = 0;
    virtual std::string device_model() const = 0;
    virtual std::string os_version() const = 0;
    virtual std::string device_identifier() const = 0;
    virtual std::string app_version() const = 0;
};

/**
 * Environment backed by uname(2) and the password database.
 * user_name and app_version can be overridden from configuration.
 */
class SystemEnvironment final : public HostEnvironment {
public:
    SystemEnvironment(std::optional<std::string> user_name_override, std::string app_version);

    std::string user_name() const override;
    std::string device_model() const override;
    std::string os_version() const override;
    std::string device_identifier() const override;
    std::string app_version() const override;

private:
    std::optional<std::string> user_name_override_;
    std::string app_version_;
};

} // namespace webbridge
