#include "ssh_connection.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace tman {

namespace {

bool has_blank_or_control(const std::string& value) {
    return std::ranges::any_of(value, [](const unsigned char c) {
        return std::isspace(c) || std::iscntrl(c);
    });
}

} // namespace

std::string ssh_target_error(const std::string& host, const std::string& user) {
    if (host.starts_with('-')) {
        return "Host must not start with '-'";
    }
    if (has_blank_or_control(host) || host.find('@') != std::string::npos) {
        return "Host must not contain spaces or '@'";
    }
    if (user.starts_with('-')) {
        return "Username must not start with '-'";
    }
    if (has_blank_or_control(user)) {
        return "Username must not contain spaces";
    }
    return {};
}

ValidationResult SshConnection::validate() const {
    ValidationResult result;
    if (trim(name).empty()) {
        result.error = "Connection name is required";
        return result;
    }
    if (trim(host).empty()) {
        result.error = "Host is required";
        return result;
    }
    if (trim(user).empty()) {
        result.error = "Username is required";
        return result;
    }
    if (auto error = ssh_target_error(host, user); !error.empty()) {
        result.error = std::move(error);
        return result;
    }
    if (port < 1 || port > 65535) {
        result.error = "Invalid port: Port must be between 1 and 65535";
        return result;
    }
    if (!key_file.empty()) {
        std::error_code ec;
        if (!fs::exists(expand_home(key_file), ec)) {
            result.warning = std::format("SSH key file does not exist: {}", key_file);
        }
    }
    result.valid = true;
    return result;
}

std::string SshConnection::display_string() const {
    return std::format("{} ({}@{}:{})", name, user, host, port);
}

std::vector<std::string> build_ssh_args(const SshConnection& conn,
                                        const SshOptions& options,
                                        const SshMode mode,
                                        const std::vector<std::string>& remote_command) {
    std::vector<std::string> args;
    args.push_back(options.program.empty() ? "ssh" : options.program);

    if (!conn.key_file.empty()) {
        const std::string key = expand_home(conn.key_file);
        std::error_code ec;
        if (fs::exists(key, ec)) {
            args.push_back("-i");
            args.push_back(key);
        }
    }
    if (conn.port != 22) {
        args.push_back("-p");
        args.push_back(std::to_string(conn.port));
    }

    if (!options.strict_host_key_checking.empty()) {
        args.push_back("-o");
        args.push_back("StrictHostKeyChecking=" + options.strict_host_key_checking);
    }
    if (options.connect_timeout > 0) {
        args.push_back("-o");
        args.push_back(std::format("ConnectTimeout={}", options.connect_timeout));
    }

    switch (mode) {
        case SshMode::Interactive:
            args.push_back("-t");
            break;
        case SshMode::Embedded:
            args.push_back("-T");
            args.push_back("-o");
            args.push_back("BatchMode=yes");
            break;
        case SshMode::Test:
            args.push_back("-o");
            args.push_back("BatchMode=yes");
            break;
    }

    args.push_back(conn.target());
    args.insert(args.end(), remote_command.begin(), remote_command.end());
    return args;
}

bool parse_port(const std::string& text, int& port, std::string& error) {
    const std::string value = trim(text);
    if (value.empty()) {
        port = 22;
        return true;
    }
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        error = "Port must be a number";
        return false;
    }
    if (parsed < 1 || parsed > 65535) {
        error = "Invalid port: Port must be between 1 and 65535";
        return false;
    }
    port = parsed;
    return true;
}

} // namespace tman
