#pragma once

#include "domain/LedgerValidationError.hpp"
#include "settings/ConfigFile.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace navledger::settings {

/**
 * @brief Параметры подключения к PostgreSQL
 *
 * Источники, как у LedgerSettings: значения по умолчанию, секция
 * "database" файла конфигурации, переменные окружения NAVLEDGER_DB_*.
 *
 * Ключи секции / переменные окружения:
 * - host / NAVLEDGER_DB_HOST ("localhost")
 * - port / NAVLEDGER_DB_PORT (5432)
 * - name / NAVLEDGER_DB_NAME ("daily_accounting")
 * - user / NAVLEDGER_DB_USER ("navledger")
 * - password / NAVLEDGER_DB_PASSWORD ("navledger")
 * - connect_timeout / NAVLEDGER_DB_CONNECT_TIMEOUT (10 секунд, 0 - без ограничения)
 */
class DbSettings {
public:
    DbSettings() = default;

    static DbSettings load() {
        DbSettings settings;
        if (auto config = readConfigFile()) {
            settings.apply(*config);
        }
        settings.applyEnvironment();
        return settings;
    }

    /**
     * @param config Документ конфигурации целиком; используется секция "database"
     */
    static DbSettings fromJson(const nlohmann::json& config) {
        DbSettings settings;
        settings.apply(config);
        return settings;
    }

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    const std::string& getName() const { return name_; }
    const std::string& getUser() const { return user_; }
    const std::string& getPassword() const { return password_; }
    int getConnectTimeout() const { return connectTimeout_; }

    /**
     * @brief Строка подключения libpq в формате keyword=value
     *
     * Значения в одинарных кавычках, ' и \ экранируются.
     */
    std::string getConnectionString() const {
        std::string conn = "host=" + quote(host_)
                         + " port=" + std::to_string(port_)
                         + " dbname=" + quote(name_)
                         + " user=" + quote(user_)
                         + " password=" + quote(password_);
        if (connectTimeout_ > 0) {
            conn += " connect_timeout=" + std::to_string(connectTimeout_);
        }
        return conn;
    }

private:
    std::string host_ = "localhost";
    int port_ = 5432;
    std::string name_ = "daily_accounting";
    std::string user_ = "navledger";
    std::string password_ = "navledger";
    int connectTimeout_ = 10;

    void apply(const nlohmann::json& config) {
        if (!config.is_object() || !config.contains("database")) {
            return;
        }
        const auto& db = config.at("database");
        host_ = db.value("host", host_);
        setPort(db.value("port", port_));
        name_ = db.value("name", name_);
        user_ = db.value("user", user_);
        password_ = db.value("password", password_);
        setConnectTimeout(db.value("connect_timeout", connectTimeout_));
    }

    void applyEnvironment() {
        if (const char* val = std::getenv("NAVLEDGER_DB_HOST")) {
            host_ = val;
        }
        if (const char* val = std::getenv("NAVLEDGER_DB_PORT")) {
            setPort(parseInt("NAVLEDGER_DB_PORT", val));
        }
        if (const char* val = std::getenv("NAVLEDGER_DB_NAME")) {
            name_ = val;
        }
        if (const char* val = std::getenv("NAVLEDGER_DB_USER")) {
            user_ = val;
        }
        if (const char* val = std::getenv("NAVLEDGER_DB_PASSWORD")) {
            password_ = val;
        }
        if (const char* val = std::getenv("NAVLEDGER_DB_CONNECT_TIMEOUT")) {
            setConnectTimeout(parseInt("NAVLEDGER_DB_CONNECT_TIMEOUT", val));
        }
    }

    void setPort(int port) {
        if (port < 1 || port > 65535) {
            throw domain::LedgerValidationError("Invalid database port: " + std::to_string(port));
        }
        port_ = port;
    }

    void setConnectTimeout(int seconds) {
        if (seconds < 0) {
            throw domain::LedgerValidationError("Invalid connect_timeout: " + std::to_string(seconds));
        }
        connectTimeout_ = seconds;
    }

    static int parseInt(const std::string& name, const std::string& value) {
        size_t consumed = 0;
        int result = 0;
        try {
            result = std::stoi(value, &consumed);
        } catch (const std::logic_error&) {
            throw domain::LedgerValidationError("Invalid " + name + ": " + value);
        }
        if (consumed != value.size()) {
            throw domain::LedgerValidationError("Invalid " + name + ": " + value);
        }
        return result;
    }

    static std::string quote(const std::string& value) {
        std::string quoted = "'";
        for (char c : value) {
            if (c == '\'' || c == '\\') {
                quoted += '\\';
            }
            quoted += c;
        }
        return quoted + "'";
    }
};

} // namespace navledger::settings
