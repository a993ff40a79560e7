#include "db/connection_spec.hpp"
#include "core/utils.hpp"

#include <format>

namespace dbaccess {

std::string ConnectionParams::connection_url() const {
    const uint16_t effective_port = port.value_or(default_port(type));

    std::string userinfo;
    if (!user.empty()) {
        userinfo = utils::url_encode(user);
        if (!password.empty()) {
            userinfo += ':';
            userinfo += utils::url_encode(password);
        }
        userinfo += '@';
    }

    // IPv6 literals need brackets to keep the port separator unambiguous
    const bool bracket = host.find(':') != std::string::npos && !host.starts_with('[');
    const std::string authority_host = bracket ? std::format("[{}]", host) : host;

    switch (type) {
        case DatabaseType::POSTGRESQL:
            return std::format("postgres://{}{}:{}/{}",
                userinfo, authority_host, effective_port, utils::url_encode(database));
        case DatabaseType::MONGODB:
            return std::format("mongodb://{}{}:{}/{}",
                userinfo, authority_host, effective_port, utils::url_encode(database));
    }
    throw InvalidArgumentError("Unsupported database type");
}

ConnectionSpec ConnectionParams::to_spec() const {
    ConnectionSpec spec;
    spec.type = type;
    spec.connection_string = connection_url();
    spec.name = name;
    return spec;
}

} // namespace dbaccess
