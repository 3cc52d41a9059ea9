#include "TDengineDsn.hpp"
#include <stdexcept>

TDengineDsn TDengineDsn::parse(const std::string& dsn) {
    TDengineDsn result;

    const size_t protocol_pos = dsn.find("://");
    if (protocol_pos == std::string::npos) {
        throw std::invalid_argument("DSN invalid: missing '://' protocol separator");
    }

    const std::string protocol = dsn.substr(0, protocol_pos);
    if (protocol == "taos") {
        result.protocol_type = ProtocolType::Native;
    } else if (protocol == "taos+ws") {
        result.protocol_type = ProtocolType::WebSocket;
    } else {
        throw std::invalid_argument("DSN invalid: unsupported protocol '" + protocol + "'");
    }

    const std::string post_protocol = dsn.substr(protocol_pos + 3);
    const size_t path_start = post_protocol.find('/');
    const std::string user_host_port = post_protocol.substr(0, path_start);

    // Passwords may contain '@', so split at the last one
    const size_t at_pos = user_host_port.rfind('@');
    std::string host_port;
    if (at_pos != std::string::npos) {
        const std::string user_pass = user_host_port.substr(0, at_pos);
        host_port = user_host_port.substr(at_pos + 1);

        const size_t colon_pos = user_pass.find(':');
        if (colon_pos != std::string::npos) {
            result.user = user_pass.substr(0, colon_pos);
            result.password = user_pass.substr(colon_pos + 1);
        } else {
            result.user = user_pass;
            result.password.clear();
        }
    } else {
        host_port = user_host_port;
    }

    const size_t colon_pos = host_port.find(':');
    const std::string host = host_port.substr(0, colon_pos);
    if (!host.empty()) {
        result.host = host;
    }
    if (colon_pos != std::string::npos) {
        const std::string port_str = host_port.substr(colon_pos + 1);
        size_t parsed = 0;
        int port = 0;
        try {
            port = std::stoi(port_str, &parsed);
        } catch (const std::exception& e) {
            throw std::invalid_argument("Port parse error: " + std::string(e.what()));
        }
        if (parsed != port_str.size() || port <= 0 || port > 65535) {
            throw std::invalid_argument("Invalid port number: " + port_str);
        }
        result.port = port;
    } else {
        result.port = result.protocol_type == ProtocolType::Native ? 6030 : 6041;
    }

    if (path_start != std::string::npos) {
        result.database = post_protocol.substr(path_start + 1);
        const size_t query_pos = result.database.find('?');
        if (query_pos != std::string::npos) {
            result.database.erase(query_pos);
        }
    }

    return result;
}

const char* TDengineDsn::driver_type() const {
    return protocol_type == ProtocolType::Native ? "native" : "websocket";
}
