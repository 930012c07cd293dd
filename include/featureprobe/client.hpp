/*!
 * @file client.hpp
 * @brief Public API Interface for Client operations
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include <featureprobe/config.hpp>
#include <featureprobe/error.hpp>
#include <featureprobe/export.hpp>
#include <featureprobe/user.hpp>
#include <featureprobe/value.hpp>
#include <featureprobe/variations.hpp>

namespace fp {

class Store;
class Synchronizer;
class EventRecorder;
struct EvalDetail;

class Client;
using ClientOrError = std::variant<std::unique_ptr<Client>, Error>;

/**
 * @brief Evaluates toggles against a locally synchronized snapshot.
 *
 * Every accessor is safe to call from any number of threads. None of them
 * perform network I/O or fail: an unknown toggle, a snapshot that has not yet
 * arrived, a malformed serve or a value of the wrong kind all produce the
 * supplied default, and the detail accessors explain why in `reason`.
 */
class FP_EXPORT Client {
public:
    /**
     * @brief Build a client and start synchronizing.
     *
     * Blocks for up to `Config::startWait` when `Config::waitFirstResp` is
     * set. If that wait times out, a client that is not yet initialized is
     * returned and serves defaults until data arrives.
     */
    static ClientOrError init(Config config);

    /**
     * @brief A client for unit tests of calling code. Each entry becomes an
     * enabled toggle serving its value to everyone. Nothing is synchronized
     * and no events are sent.
     */
    static std::unique_ptr<Client> forTest(const std::map<std::string, Value> &toggles);

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    /** @brief Calls `close`. */
    ~Client();

    bool boolValue(const std::string &toggle, const User &user, bool defaultValue);
    std::string stringValue(const std::string &toggle, const User &user, const std::string &defaultValue);
    double numberValue(const std::string &toggle, const User &user, double defaultValue);
    nlohmann::json jsonValue(const std::string &toggle, const User &user, const nlohmann::json &defaultValue);

    BoolDetail boolDetail(const std::string &toggle, const User &user, bool defaultValue);
    StringDetail stringDetail(const std::string &toggle, const User &user, const std::string &defaultValue);
    NumberDetail numberDetail(const std::string &toggle, const User &user, double defaultValue);
    JsonDetail jsonDetail(const std::string &toggle, const User &user, const nlohmann::json &defaultValue);

    /** @brief True once a snapshot has been received. */
    bool initialized() const;

    /**
     * @brief Stop synchronizing, drop the snapshot and deliver any pending
     * events. Blocks until the final delivery attempt completes or times out.
     * Safe to call more than once.
     */
    void close();

    const Config &config() const;

private:
    Client(Config config,
           std::shared_ptr<Store> store,
           std::unique_ptr<Synchronizer> synchronizer,
           std::unique_ptr<EventRecorder> recorder);

    EvalDetail genericDetail(const std::string &toggle, const User &user, const Value &defaultValue);

    Config m_config;
    std::shared_ptr<Store> m_store;
    std::unique_ptr<Synchronizer> m_synchronizer;
    std::unique_ptr<EventRecorder> m_recorder;
};

} // namespace fp
