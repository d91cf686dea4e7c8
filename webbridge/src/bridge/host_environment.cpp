#include "host_environment.hpp"

#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <utility>
#include <vector>

namespace webbridge {

namespace {

struct UnameFields {
    std::string sysname;
    std::string release;
    std::string machine;
};

UnameFields read_uname() {
    utsname info{};
    if (::uname(&info) != 0) {
        return {"unknown", "unknown", "unknown"};
    }
    return {info.sysname, info.release, info.machine};
}

} // namespace

SystemEnvironment::SystemEnvironment(std::optional<std::string> user_name_override, std::string app_version)
    : user_name_override_(std::move(user_name_override)), app_version_(std::move(app_version)) {}

std::string SystemEnvironment::user_name() const {
    if (user_name_override_) {
        return *user_name_override_;
    }
    passwd pw{};
    passwd* result = nullptr;
    std::vector<char> buffer(16384);
    if (::getpwuid_r(::getuid(), &pw, buffer.data(), buffer.size(), &result) == 0 && result) {
        if (pw.pw_gecos) {
            std::string gecos(pw.pw_gecos);
            gecos = gecos.substr(0, gecos.find(','));
            if (!gecos.empty()) {
                return gecos;
            }
        }
        if (pw.pw_name) {
            return pw.pw_name;
        }
    }
    return "unknown";
}

std::string SystemEnvironment::device_model() const {
    return read_uname().sysname;
}

std::string SystemEnvironment::os_version() const {
    return read_uname().release;
}

std::string SystemEnvironment::device_identifier() const {
    return read_uname().machine;
}

std::string SystemEnvironment::app_version() const {
    return app_version_.empty() ? "0" : app_version_;
}

} // namespace webbridge
